#include "Uuid.hpp"

#include <openssl/rand.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace {
int HexValue(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return ch - 'a' + 10;
    }
    if (ch >= 'A' && ch <= 'F') {
        return ch - 'A' + 10;
    }
    return -1;
}

void FillRandom(uint8_t* data, size_t size) {
    if (RAND_bytes(data, static_cast<int>(size)) != 1) {
        throw std::runtime_error("RAND_bytes failed to produce UUID entropy");
    }
}
} // namespace

Uuid::Uuid(const std::array<uint8_t, 16>& bytes)
    : bytes_(bytes) {}

std::optional<Uuid> Uuid::Parse(const std::string& text) {
    std::string value = text;
    if (value.size() == 38 && value.front() == '{' && value.back() == '}') {
        value = value.substr(1, 36);
    }

    if (value.size() != 36) {
        return std::nullopt;
    }

    std::array<uint8_t, 16> bytes{};
    size_t byteIndex = 0;
    for (size_t i = 0; i < value.size();) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (value[i] != '-') {
                return std::nullopt;
            }
            ++i;
            continue;
        }

        const int high = HexValue(value[i]);
        const int low = HexValue(value[i + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        bytes[byteIndex++] = static_cast<uint8_t>((high << 4) | low);
        i += 2;
    }

    return Uuid(bytes);
}

Uuid Uuid::Generate() {
    std::array<uint8_t, 16> bytes{};
    FillRandom(bytes.data(), bytes.size());
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);
    return Uuid(bytes);
}

bool Uuid::IsNil() const {
    for (const uint8_t byte : bytes_) {
        if (byte != 0) {
            return false;
        }
    }
    return true;
}

std::string Uuid::ToString() const {
    std::ostringstream out;
    out << std::hex << std::nouppercase << std::setfill('0');
    for (size_t i = 0; i < bytes_.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out << '-';
        }
        out << std::setw(2) << static_cast<int>(bytes_[i]);
    }
    return out.str();
}
