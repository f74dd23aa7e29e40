#include "Fingerprint.hpp"
#include <bitset>
#include <cctype>
#include <cstring>
#include <stdexcept>

namespace card_identifier::hashing {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower >= 'a' && lower <= 'f') return 10 + (lower - 'a');
    return -1;
}

} // namespace

Fingerprint Fingerprint::fromBits(const std::vector<bool>& bits) {
    std::vector<uint8_t> bytes((bits.size() + 7) / 8, 0);
    for (size_t i = 0; i < bits.size(); ++i) {
        if (bits[i]) {
            bytes[i / 8] |= static_cast<uint8_t>(0x80u >> (i % 8));
        }
    }
    return Fingerprint(std::move(bytes), static_cast<int>(bits.size()));
}

Fingerprint Fingerprint::fromHex(const std::string& hex) {
    if (hex.empty()) {
        throw std::invalid_argument("Empty fingerprint hex string");
    }

    std::vector<uint8_t> bytes((hex.size() + 1) / 2, 0);
    for (size_t i = 0; i < hex.size(); ++i) {
        const int value = hexValue(hex[i]);
        if (value < 0) {
            throw std::invalid_argument("Invalid hex digit in fingerprint: " + hex);
        }
        // Even digits fill the high nibble
        bytes[i / 2] |= static_cast<uint8_t>(i % 2 == 0 ? value << 4 : value);
    }
    return Fingerprint(std::move(bytes), static_cast<int>(hex.size() * 4));
}

std::string Fingerprint::toHex() const {
    static const char* digits = "0123456789abcdef";
    const size_t nibbles = (static_cast<size_t>(bits_) + 3) / 4;
    std::string hex;
    hex.reserve(nibbles);
    for (size_t i = 0; i < nibbles; ++i) {
        const uint8_t byte = bytes_[i / 2];
        hex.push_back(digits[i % 2 == 0 ? (byte >> 4) & 0x0F : byte & 0x0F]);
    }
    return hex;
}

bool Fingerprint::bit(int index) const {
    if (index < 0 || index >= bits_) {
        throw std::out_of_range("Fingerprint bit index out of range: " + std::to_string(index));
    }
    return (bytes_[static_cast<size_t>(index) / 8] & (0x80u >> (index % 8))) != 0;
}

int Fingerprint::hamming(const Fingerprint& other) const {
    if (bits_ != other.bits_) {
        throw std::invalid_argument("Fingerprint width mismatch: " + std::to_string(bits_) +
                                    " vs " + std::to_string(other.bits_));
    }
    return hammingDistance(bytes_.data(), other.bytes_.data(), bytes_.size());
}

int hammingDistance(const uint8_t* a, const uint8_t* b, size_t n) {
    int distance = 0;
    size_t i = 0;
    for (; i + sizeof(uint64_t) <= n; i += sizeof(uint64_t)) {
        uint64_t wa = 0;
        uint64_t wb = 0;
        std::memcpy(&wa, a + i, sizeof(uint64_t));
        std::memcpy(&wb, b + i, sizeof(uint64_t));
        distance += static_cast<int>(std::bitset<64>(wa ^ wb).count());
    }
    for (; i < n; ++i) {
        distance += static_cast<int>(std::bitset<8>(static_cast<uint8_t>(a[i] ^ b[i])).count());
    }
    return distance;
}

} // namespace card_identifier::hashing
