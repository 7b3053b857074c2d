#pragma once

#include <openssl/evp.h>
#include <openssl/x509.h>

#include <chrono>
#include <memory>
#include <string>

struct X509Deleter {
    void operator()(X509* certificate) const { X509_free(certificate); }
};

struct EvpPkeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};

using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;

// A client certificate with its private key. Owns both OpenSSL handles; consumers that need
// them beyond this object's lifetime take their own reference.
class ClientCertificate {
public:
    ClientCertificate(X509Ptr certificate, EvpPkeyPtr privateKey);

    ClientCertificate(const ClientCertificate&) = delete;
    ClientCertificate& operator=(const ClientCertificate&) = delete;

    X509* Certificate() const { return certificate_.get(); }
    EVP_PKEY* PrivateKey() const { return privateKey_.get(); }

    std::string Subject() const;
    std::chrono::system_clock::time_point NotAfter() const;
    bool NeedsRenewal(int thresholdDays, std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

private:
    X509Ptr certificate_;
    EvpPkeyPtr privateKey_;
};

class CertificateStore {
public:
    virtual ~CertificateStore() = default;

    // Returns nullptr when no certificate is provisioned. The caller owns the result.
    virtual std::unique_ptr<ClientCertificate> GetClientCertificate() = 0;
};

// Reads a PEM certificate and PEM private key from disk on every call, so a renewed pair is
// picked up by the next Connect.
class FileCertificateStore : public CertificateStore {
public:
    FileCertificateStore(std::string certificatePath, std::string privateKeyPath);

    std::unique_ptr<ClientCertificate> GetClientCertificate() override;

private:
    std::string certificatePath_;
    std::string privateKeyPath_;
};
