#include "FileCatalogClient.hpp"
#include "card_identifier/logging.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace card_identifier::enrichment {

namespace {

bool flag(const YAML::Node& node, const char* key) {
    return node[key] && node[key].as<bool>();
}

std::optional<CardDetails> parseNode(const YAML::Node& root) {
    if (!root || !root.IsMap()) {
        throw std::runtime_error("card document is not an object");
    }

    CardDetails details;
    if (const auto variants = root["variants"]; variants && variants.IsMap()) {
        CardVariants parsed;
        parsed.normal = flag(variants, "normal");
        parsed.reverse = flag(variants, "reverse");
        parsed.holo = flag(variants, "holo");
        parsed.first_edition = flag(variants, "firstEdition");
        parsed.w_promo = flag(variants, "wPromo");
        details.variants = parsed;
    }

    if (const auto set = root["set"]; set && set.IsMap()) {
        if (const auto count = set["cardCount"]; count && count.IsMap()) {
            if (count["total"] && !count["total"].IsNull()) {
                details.set_total = count["total"].as<int>();
            } else if (count["official"] && !count["official"].IsNull()) {
                details.set_total = count["official"].as<int>();
            }
        }
    }

    if (!details.variants && !details.set_total) {
        return std::nullopt;
    }
    return details;
}

} // namespace

FileCatalogClient::FileCatalogClient(std::string directory) : directory_(std::move(directory)) {}

std::optional<CardDetails> FileCatalogClient::parseDocument(const std::string& content) {
    try {
        return parseNode(YAML::Load(content));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Malformed card document: ") + e.what());
    }
}

std::optional<CardDetails> FileCatalogClient::fetchCardDetails(const std::string& card_id) {
    if (card_id.empty() || card_id.find('/') != std::string::npos || card_id.find("..") != std::string::npos) {
        LOG_WARNING("Refusing catalog lookup for card id '" + card_id + "'");
        return std::nullopt;
    }

    const std::string path = directory_ + "/" + card_id + ".json";
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        return parseDocument(buffer.str());
    } catch (const std::runtime_error& e) {
        LOG_WARNING(path + ": " + e.what());
        return std::nullopt;
    }
}

} // namespace card_identifier::enrichment
