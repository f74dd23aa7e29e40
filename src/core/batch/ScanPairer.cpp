#include "ScanPairer.hpp"

namespace card_identifier::batch {

std::vector<ScanPair> ScanPairer::pair(const std::vector<std::string>& scans, bool paired) {
    std::vector<ScanPair> pairs;

    if (!paired) {
        pairs.reserve(scans.size());
        for (std::size_t i = 0; i < scans.size(); ++i) {
            pairs.push_back({i, scans[i], std::nullopt});
        }
        return pairs;
    }

    if (scans.size() % 2 != 0) {
        throw BatchSizeError("Paired front/back mode needs an even number of scans, got " +
                             std::to_string(scans.size()));
    }

    pairs.reserve(scans.size() / 2);
    for (std::size_t i = 0; i < scans.size(); i += 2) {
        pairs.push_back({i / 2, scans[i], scans[i + 1]});
    }
    return pairs;
}

} // namespace card_identifier::batch
