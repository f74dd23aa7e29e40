#include <gtest/gtest.h>
#include "src/core/indexing/CatalogImporter.hpp"
#include <filesystem>
#include <fstream>

using card_identifier::database::DatabaseManager;
using card_identifier::indexing::CatalogImporter;

namespace {

const char* kCatalogJson = R"([
    {
        "id": "swsh3-136",
        "localId": "136",
        "name": "Furret",
        "rarity": "Uncommon",
        "category": "Pokemon",
        "hp": 110,
        "types": ["Colorless"],
        "image": "https://assets.example/en/swsh/swsh3/136",
        "set": {"id": "swsh3", "name": "Darkness Ablaze", "serie": {"id": "swsh", "name": "Sword & Shield"}}
    },
    {
        "id": "base1-4",
        "number": "4",
        "name": "Charizard",
        "hp": "120",
        "image": "https://images.example/base1/4.png",
        "set": "base1"
    },
    {"name": "No id at all"},
    "not a record"
])";

} // namespace

TEST(CatalogImporterTest, ParsesCatalogApiShape) {
    const CatalogImporter importer;
    const auto cards = importer.parseString(kCatalogJson);
    ASSERT_EQ(cards.size(), 2u);

    const auto& furret = cards[0];
    EXPECT_EQ(furret.id, "swsh3-136");
    EXPECT_EQ(furret.number, "136");
    EXPECT_EQ(furret.name, "Furret");
    EXPECT_EQ(furret.rarity, "Uncommon");
    EXPECT_EQ(furret.category, "Pokemon");
    EXPECT_EQ(furret.hp, 110);
    EXPECT_EQ(furret.types, (std::vector<std::string>{"Colorless"}));
    EXPECT_EQ(furret.set_id, "swsh3");
    EXPECT_EQ(furret.set_name, "Darkness Ablaze");
    EXPECT_EQ(furret.series, "Sword & Shield");
    EXPECT_EQ(furret.image_url, "https://assets.example/en/swsh/swsh3/136/high.png");

    const auto& charizard = cards[1];
    EXPECT_EQ(charizard.number, "4");
    EXPECT_EQ(charizard.hp, 120);
    EXPECT_EQ(charizard.set_id, "base1");
    EXPECT_EQ(charizard.image_url, "https://images.example/base1/4.png");
}

TEST(CatalogImporterTest, AcceptsCardsMapAndYaml) {
    const CatalogImporter importer;
    const auto cards = importer.parseString(R"(
cards:
  - id: A1-001
    name: Bulbasaur
    set_id: A1
    hp: unknown
)");
    ASSERT_EQ(cards.size(), 1u);
    EXPECT_EQ(cards[0].set_id, "A1");
    EXPECT_FALSE(cards[0].hp.has_value());
}

TEST(CatalogImporterTest, EmptyDocumentHasNoCards) {
    const CatalogImporter importer;
    EXPECT_TRUE(importer.parseString("").empty());
}

TEST(CatalogImporterTest, RejectsMalformedDocuments) {
    const CatalogImporter importer;
    EXPECT_THROW(importer.parseString("[{\"id\": "), std::runtime_error);
    EXPECT_THROW(importer.parseString("just a string"), std::runtime_error);
    EXPECT_THROW(importer.parseFile("does/not/exist.json"), std::runtime_error);
}

class CatalogImportStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = std::filesystem::temp_directory_path() / "card_identifier_import_test";
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir / "images");
        db_path = (dir / "cards.db").string();
        catalog_path = (dir / "catalog.json").string();
        std::ofstream out(catalog_path);
        out << kCatalogJson;
    }
    void TearDown() override {
        std::filesystem::remove_all(dir);
    }

    std::filesystem::path dir;
    std::string db_path;
    std::string catalog_path;
};

TEST_F(CatalogImportStoreTest, ImportWritesCardsAndResolvesLocalImages) {
    std::ofstream(dir / "images" / "base1-4.jpg") << "jpeg bytes";

    DatabaseManager db(db_path, true);
    ASSERT_TRUE(db.isEnabled());

    const CatalogImporter importer((dir / "images").string());
    const auto stats = importer.importFile(db, catalog_path);
    EXPECT_EQ(stats.records, 4);
    EXPECT_EQ(stats.imported, 2);
    EXPECT_EQ(stats.skipped, 2);
    EXPECT_EQ(stats.with_local_image, 1);

    EXPECT_EQ(db.cardCount(), 2);
    const auto charizard = db.getCard("base1-4");
    ASSERT_TRUE(charizard.has_value());
    EXPECT_EQ(charizard->local_image_path, (dir / "images" / "base1-4.jpg").string());
    EXPECT_TRUE(db.getCard("swsh3-136")->local_image_path.empty());
}

TEST_F(CatalogImportStoreTest, ReimportIsIdempotent) {
    DatabaseManager db(db_path, true);
    const CatalogImporter importer;
    importer.importFile(db, catalog_path);
    importer.importFile(db, catalog_path);
    EXPECT_EQ(db.cardCount(), 2);
}

TEST_F(CatalogImportStoreTest, DisabledStoreRejectsImport) {
    DatabaseManager disabled("", false);
    const CatalogImporter importer;
    EXPECT_THROW(importer.importFile(disabled, catalog_path), std::runtime_error);
}
