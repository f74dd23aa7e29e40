#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace card_identifier::batch {

/**
 * @brief Thrown when paired mode receives an odd number of scans
 */
class BatchSizeError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief One physical card: the front scan is identified, the back rides along
 */
struct ScanPair {
    std::size_t scan_id = 0;             // zero-based pair index
    std::string front;
    std::optional<std::string> back;
};

class ScanPairer {
public:
    /**
     * @brief Group scans positionally: front, back, front, back, ...
     *
     * Unpaired mode gives every scan its own pair without a back.
     * @throws BatchSizeError in paired mode with an odd count
     */
    static std::vector<ScanPair> pair(const std::vector<std::string>& scans, bool paired);
};

} // namespace card_identifier::batch
