#pragma once

#include "card_identifier/database/DatabaseManager.hpp"
#include "card_identifier/types.hpp"
#include <string>
#include <vector>

namespace card_identifier::indexing {

struct ImportStats {
    int records = 0;
    int imported = 0;
    int skipped = 0;            // records without an id
    int with_local_image = 0;
};

/**
 * @brief Loads catalog card records (catalog API shape) into the card store
 *
 * Input is a JSON or YAML document holding either a list of card objects or
 * a map with a "cards" list. Recognized keys: id, name, localId (or number),
 * rarity, category, hp, types, image, and set as an object {id, name,
 * serie {name}} or a plain set id string.
 *
 * The image field is the catalog's image base URL; "/high.png" is appended
 * unless it already names a file. The local reference image is
 * <image_dir>/<id>.png (or .jpg) when that file exists, unless the record
 * carries an explicit local_image_path.
 */
class CatalogImporter {
public:
    explicit CatalogImporter(std::string image_dir = "");

    /**
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    std::vector<Card> parseFile(const std::string& path) const;

    /**
     * @throws std::runtime_error on malformed content
     */
    std::vector<Card> parseString(const std::string& content) const;

    /**
     * @brief Parse a file and upsert its cards
     * @throws std::runtime_error if the file cannot be read or the store rejects the batch
     */
    ImportStats importFile(const database::DatabaseManager& db, const std::string& path) const;

    const std::string& imageDirectory() const { return image_dir_; }

private:
    std::vector<Card> parse(const std::string& content, ImportStats* stats) const;
    std::string resolveLocalImage(const std::string& card_id) const;

    std::string image_dir_;
};

} // namespace card_identifier::indexing
