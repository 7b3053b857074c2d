#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

class Uuid {
public:
    Uuid() = default;
    explicit Uuid(const std::array<uint8_t, 16>& bytes);

    // Accepts the canonical 8-4-4-4-12 form, optionally wrapped in braces, in either case.
    static std::optional<Uuid> Parse(const std::string& text);
    // RFC 4122 version 4 from the OpenSSL CSPRNG.
    static Uuid Generate();

    bool IsNil() const;
    std::string ToString() const;
    const std::array<uint8_t, 16>& Bytes() const { return bytes_; }

    bool operator==(const Uuid& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const Uuid& other) const { return bytes_ != other.bytes_; }
    bool operator<(const Uuid& other) const { return bytes_ < other.bytes_; }

private:
    std::array<uint8_t, 16> bytes_{};
};

namespace std {
template <>
struct hash<Uuid> {
    size_t operator()(const Uuid& uuid) const noexcept {
        size_t seed = 0;
        for (const uint8_t byte : uuid.Bytes()) {
            seed ^= static_cast<size_t>(byte) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        }
        return seed;
    }
};
} // namespace std
