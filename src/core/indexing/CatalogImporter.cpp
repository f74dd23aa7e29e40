#include "CatalogImporter.hpp"
#include "card_identifier/logging.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace card_identifier::indexing {

namespace {

std::string scalar(const YAML::Node& node, const char* key) {
    const auto value = node[key];
    if (!value || !value.IsScalar()) {
        return "";
    }
    return value.as<std::string>();
}

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string imageUrlFor(const std::string& base) {
    if (base.empty() || endsWith(base, ".png") || endsWith(base, ".jpg") || endsWith(base, ".webp")) {
        return base;
    }
    return base + "/high.png";
}

Card parseCard(const YAML::Node& record) {
    Card card;
    card.id = scalar(record, "id");
    card.name = scalar(record, "name");
    card.number = scalar(record, "localId");
    if (card.number.empty()) {
        card.number = scalar(record, "number");
    }
    card.rarity = scalar(record, "rarity");
    card.category = scalar(record, "category");
    card.image_url = imageUrlFor(scalar(record, "image"));
    card.local_image_path = scalar(record, "local_image_path");

    if (const auto hp = record["hp"]; hp && hp.IsScalar()) {
        try {
            card.hp = std::stoi(hp.as<std::string>());
        } catch (const std::exception&) {
            LOG_DEBUG("Ignoring non-numeric hp for " + card.id);
        }
    }

    if (const auto types = record["types"]; types && types.IsSequence()) {
        for (const auto& type : types) {
            card.types.push_back(type.as<std::string>());
        }
    }

    if (const auto set = record["set"]; set) {
        if (set.IsMap()) {
            card.set_id = scalar(set, "id");
            card.set_name = scalar(set, "name");
            if (const auto serie = set["serie"]; serie && serie.IsMap()) {
                card.series = scalar(serie, "name");
            }
        } else if (set.IsScalar()) {
            card.set_id = set.as<std::string>();
        }
    }
    if (card.set_id.empty()) {
        card.set_id = scalar(record, "set_id");
    }
    return card;
}

} // namespace

CatalogImporter::CatalogImporter(std::string image_dir) : image_dir_(std::move(image_dir)) {}

std::string CatalogImporter::resolveLocalImage(const std::string& card_id) const {
    if (image_dir_.empty()) {
        return "";
    }
    for (const char* extension : {".png", ".jpg", ".jpeg"}) {
        const std::filesystem::path candidate = std::filesystem::path(image_dir_) / (card_id + extension);
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return candidate.string();
        }
    }
    return "";
}

std::vector<Card> CatalogImporter::parse(const std::string& content, ImportStats* stats) const {
    YAML::Node root;
    try {
        root = YAML::Load(content);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Malformed catalog document: ") + e.what());
    }

    if (root.IsNull()) {
        return {};
    }
    YAML::Node records = root;
    if (root.IsMap() && root["cards"]) {
        records = root["cards"];
    }
    if (!records.IsSequence()) {
        throw std::runtime_error("Catalog document must be a list of cards or a map with a 'cards' list");
    }

    std::vector<Card> cards;
    cards.reserve(records.size());
    ImportStats local;
    for (const auto& record : records) {
        ++local.records;
        if (!record.IsMap()) {
            ++local.skipped;
            LOG_WARNING("Skipping catalog record #" + std::to_string(local.records) + ": not an object");
            continue;
        }

        Card card;
        try {
            card = parseCard(record);
        } catch (const YAML::Exception& e) {
            ++local.skipped;
            LOG_WARNING("Skipping catalog record #" + std::to_string(local.records) + ": " + e.what());
            continue;
        }
        if (card.id.empty()) {
            ++local.skipped;
            LOG_WARNING("Skipping catalog record #" + std::to_string(local.records) + ": missing id");
            continue;
        }

        if (card.local_image_path.empty()) {
            card.local_image_path = resolveLocalImage(card.id);
        }
        if (!card.local_image_path.empty()) {
            ++local.with_local_image;
        }
        cards.push_back(std::move(card));
    }
    local.imported = static_cast<int>(cards.size());

    if (stats) {
        *stats = local;
    }
    return cards;
}

std::vector<Card> CatalogImporter::parseString(const std::string& content) const {
    return parse(content, nullptr);
}

std::vector<Card> CatalogImporter::parseFile(const std::string& path) const {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open catalog file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseString(buffer.str());
}

ImportStats CatalogImporter::importFile(const database::DatabaseManager& db, const std::string& path) const {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open catalog file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    ImportStats stats;
    const auto cards = parse(buffer.str(), &stats);
    if (!cards.empty() && !db.upsertCards(cards)) {
        throw std::runtime_error("Card store rejected the catalog import from " + path);
    }

    LOG_INFO("Imported " + std::to_string(stats.imported) + " of " + std::to_string(stats.records) +
             " catalog records (" + std::to_string(stats.with_local_image) + " with local images)");
    return stats;
}

} // namespace card_identifier::indexing
