#include "CertificateStore.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>

#include <iostream>
#include <stdexcept>
#include <utility>

namespace {
struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free(bio); }
};

using BioPtr = std::unique_ptr<BIO, BioDeleter>;

std::string LastOpenSslError() {
    const unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown OpenSSL error";
    }
    char buffer[256] = {};
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return buffer;
}
} // namespace

ClientCertificate::ClientCertificate(X509Ptr certificate, EvpPkeyPtr privateKey)
    : certificate_(std::move(certificate)),
      privateKey_(std::move(privateKey)) {
    if (!certificate_ || !privateKey_) {
        throw std::invalid_argument("Client certificate requires both a certificate and a private key");
    }
}

std::string ClientCertificate::Subject() const {
    char buffer[512] = {};
    X509_NAME_oneline(X509_get_subject_name(certificate_.get()), buffer, sizeof(buffer));
    return buffer;
}

std::chrono::system_clock::time_point ClientCertificate::NotAfter() const {
    const ASN1_TIME* notAfter = X509_get0_notAfter(certificate_.get());
    int days = 0;
    int seconds = 0;
    // Difference from the epoch (nullptr would mean "now").
    ASN1_TIME* epoch = ASN1_TIME_set(nullptr, 0);
    const bool ok = epoch != nullptr && ASN1_TIME_diff(&days, &seconds, epoch, notAfter) == 1;
    ASN1_TIME_free(epoch);
    if (!ok) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::time_point{} + std::chrono::hours(24) * days + std::chrono::seconds(seconds);
}

bool ClientCertificate::NeedsRenewal(int thresholdDays, std::chrono::system_clock::time_point now) const {
    return NotAfter() - now <= std::chrono::hours(24) * thresholdDays;
}

FileCertificateStore::FileCertificateStore(std::string certificatePath, std::string privateKeyPath)
    : certificatePath_(std::move(certificatePath)),
      privateKeyPath_(std::move(privateKeyPath)) {}

std::unique_ptr<ClientCertificate> FileCertificateStore::GetClientCertificate() {
    if (certificatePath_.empty()) {
        return nullptr;
    }

    BioPtr certificateBio(BIO_new_file(certificatePath_.c_str(), "r"));
    if (!certificateBio) {
        std::cerr << "[ControlPlane] [WARN] Client certificate file is not readable" << std::endl;
        return nullptr;
    }
    X509Ptr certificate(PEM_read_bio_X509(certificateBio.get(), nullptr, nullptr, nullptr));
    if (!certificate) {
        std::cerr << "[ControlPlane] [WARN] Client certificate could not be parsed: " << LastOpenSslError() << std::endl;
        return nullptr;
    }

    const std::string& keyPath = privateKeyPath_.empty() ? certificatePath_ : privateKeyPath_;
    BioPtr keyBio(BIO_new_file(keyPath.c_str(), "r"));
    if (!keyBio) {
        std::cerr << "[ControlPlane] [WARN] Client private key file is not readable" << std::endl;
        return nullptr;
    }
    EvpPkeyPtr key(PEM_read_bio_PrivateKey(keyBio.get(), nullptr, nullptr, nullptr));
    if (!key) {
        std::cerr << "[ControlPlane] [WARN] Client private key could not be parsed: " << LastOpenSslError() << std::endl;
        return nullptr;
    }

    if (X509_check_private_key(certificate.get(), key.get()) != 1) {
        std::cerr << "[ControlPlane] [WARN] Client private key does not match the certificate" << std::endl;
        return nullptr;
    }

    return std::make_unique<ClientCertificate>(std::move(certificate), std::move(key));
}
