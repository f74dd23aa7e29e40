#pragma once

#include "interfaces/ICatalogClient.hpp"
#include <string>

namespace card_identifier::enrichment {

/**
 * @brief Reads full card documents exported from the catalog API
 *
 * Expects one <card_id>.json per card in a directory, shaped like the API's
 * card object: "variants" with normal/reverse/holo/firstEdition/wPromo
 * flags and "set" with "cardCount" {"total", "official"}.
 */
class FileCatalogClient : public ICatalogClient {
public:
    explicit FileCatalogClient(std::string directory);

    std::optional<CardDetails> fetchCardDetails(const std::string& card_id) override;

    std::string name() const override { return "file:" + directory_; }

    /**
     * @brief Parse one card document
     * @return std::nullopt when it carries neither variants nor a set count
     * @throws std::runtime_error on malformed content
     */
    static std::optional<CardDetails> parseDocument(const std::string& content);

private:
    std::string directory_;
};

} // namespace card_identifier::enrichment
