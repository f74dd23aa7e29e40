#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace card_identifier::hashing {

/**
 * @brief Fixed-width binary fingerprint produced by a perceptual hash
 *
 * Bits are packed most-significant first: bit i lives in byte i / 8 at
 * position 7 - (i % 8). The hex form is the packed bytes written with
 * ceil(bits / 4) digits, which makes "00FF" a 16-bit fingerprint whose
 * last eight bits are set.
 */
class Fingerprint {
public:
    Fingerprint() = default;

    /**
     * @brief Pack a row-major bit sequence
     */
    static Fingerprint fromBits(const std::vector<bool>& bits);

    /**
     * @brief Parse a hex string (case-insensitive, no prefix)
     * @throws std::invalid_argument on an empty string or a non-hex digit
     */
    static Fingerprint fromHex(const std::string& hex);

    std::string toHex() const;

    int bits() const { return bits_; }
    bool empty() const { return bits_ == 0; }
    const std::vector<uint8_t>& bytes() const { return bytes_; }
    bool bit(int index) const;

    /**
     * @brief Number of differing bits
     * @throws std::invalid_argument if the widths differ
     */
    int hamming(const Fingerprint& other) const;

    bool operator==(const Fingerprint& other) const {
        return bits_ == other.bits_ && bytes_ == other.bytes_;
    }
    bool operator!=(const Fingerprint& other) const { return !(*this == other); }

private:
    Fingerprint(std::vector<uint8_t> bytes, int bits) : bytes_(std::move(bytes)), bits_(bits) {}

    std::vector<uint8_t> bytes_;
    int bits_ = 0;
};

/**
 * @brief Popcount of a XOR b over n packed bytes
 */
int hammingDistance(const uint8_t* a, const uint8_t* b, size_t n);

} // namespace card_identifier::hashing
