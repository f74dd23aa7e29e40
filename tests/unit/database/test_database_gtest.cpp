#include <gtest/gtest.h>
#include <filesystem>
#include "card_identifier/database/DatabaseManager.hpp"
#include "support/test_doubles.hpp"

using namespace card_identifier;
using card_identifier::database::DatabaseManager;
using card_identifier::test::makeCard;
using card_identifier::test::makeSignature;

class DatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_db_name = "test_gtest_database.db";
        // Remove existing test database
        if (std::filesystem::exists(test_db_name)) {
            std::filesystem::remove(test_db_name);
        }
    }

    void TearDown() override {
        // Clean up test database
        if (std::filesystem::exists(test_db_name)) {
            std::filesystem::remove(test_db_name);
        }
    }
    std::string test_db_name;
};

TEST_F(DatabaseTest, DisabledDatabase) {
    DatabaseManager db_disabled("", false);
    EXPECT_FALSE(db_disabled.isEnabled()) << "Disabled database should not be enabled";
    EXPECT_TRUE(db_disabled.initializeTables()) << "Initialization is a no-op when disabled";
    EXPECT_FALSE(db_disabled.upsertCards({makeCard("sv1-001", "sv1")}));
    EXPECT_TRUE(db_disabled.getAllCards().empty());
    EXPECT_EQ(db_disabled.cardCount(), -1);
    EXPECT_FALSE(db_disabled.getCachedDetails("sv1-001").has_value());
    EXPECT_TRUE(db_disabled.getStatistics().empty());
}

TEST_F(DatabaseTest, EnabledDatabaseInitialization) {
    DatabaseManager db_enabled(test_db_name, true);
    EXPECT_TRUE(db_enabled.isEnabled()) << "Enabled database should initialize successfully";
    EXPECT_TRUE(db_enabled.initializeTables()) << "Initialization must be repeatable";
    EXPECT_EQ(db_enabled.cardCount(), 0);
}

TEST_F(DatabaseTest, CardRoundTrip) {
    DatabaseManager db(test_db_name, true);
    ASSERT_TRUE(db.isEnabled()) << "Database must be enabled for this test";

    Card card = makeCard("sv3pt5-006", "sv3pt5", "Charizard ex");
    card.set_name = "151";
    card.series = "Scarlet & Violet";
    card.number = "006";
    card.rarity = "Double rare";
    card.category = "Pokemon";
    card.hp = 330;
    card.types = {"Fire", "Dragon"};
    card.image_url = "https://assets.example/sv3pt5/006/high.png";
    card.local_image_path = "images/sv3pt5-006.png";
    ASSERT_TRUE(db.upsertCards({card, makeCard("base1-004", "base1")}));

    const auto loaded = db.getCard("sv3pt5-006");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->name, "Charizard ex");
    EXPECT_EQ(loaded->set_name, "151");
    EXPECT_EQ(loaded->series, "Scarlet & Violet");
    EXPECT_EQ(loaded->number, "006");
    EXPECT_EQ(loaded->hp, 330);
    EXPECT_EQ(loaded->types, (std::vector<std::string>{"Fire", "Dragon"}));
    EXPECT_EQ(loaded->local_image_path, "images/sv3pt5-006.png");

    const auto all = db.getAllCards();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].id, "base1-004") << "Cards come back ordered by id";
    EXPECT_FALSE(all[0].hp.has_value());
    EXPECT_FALSE(db.getCard("missing").has_value());
}

TEST_F(DatabaseTest, HashRowsPerAlgorithmAndRegion) {
    DatabaseManager db(test_db_name, true);
    ASSERT_TRUE(db.isEnabled());
    ASSERT_TRUE(db.upsertCards({makeCard("a-1", "a"), makeCard("a-2", "a")}));

    ASSERT_TRUE(db.upsertHashes({
        makeSignature("a-1", HashAlgorithm::PHASH, "ff00"),
        makeSignature("a-1", HashAlgorithm::DHASH, "0f0f"),
        makeSignature("a-1", HashAlgorithm::PHASH, "00ff", HashRegion::ART_ZONE),
    }));

    const auto phash = db.getHashes("phash");
    ASSERT_EQ(phash.size(), 1u);
    EXPECT_EQ(phash[0].second, "ff00");
    EXPECT_EQ(db.getHashes("phash_art").size(), 1u);

    EXPECT_EQ(db.getAllHashSignatures(HashRegion::FULL_CARD).size(), 2u);
    const auto art = db.getAllHashSignatures(HashRegion::ART_ZONE);
    ASSERT_EQ(art.size(), 1u);
    EXPECT_EQ(art[0].region, HashRegion::ART_ZONE);
    EXPECT_EQ(art[0].hex, "00ff");

    EXPECT_EQ(db.getCardIdsWithoutHashes(), (std::vector<std::string>{"a-2"}));

    // Upserting the same (card, tag) replaces the value
    ASSERT_TRUE(db.upsertHashes({makeSignature("a-1", HashAlgorithm::PHASH, "aaaa")}));
    EXPECT_EQ(db.getHashes("phash")[0].second, "aaaa");
    EXPECT_EQ(db.hashCount(), 3);

    EXPECT_TRUE(db.clearHashes());
    EXPECT_EQ(db.hashCount(), 0);
    EXPECT_EQ(db.getCardIdsWithoutHashes().size(), 2u);
}

TEST_F(DatabaseTest, EmbeddingBlobsRoundTrip) {
    DatabaseManager db(test_db_name, true);
    ASSERT_TRUE(db.isEnabled());
    ASSERT_TRUE(db.upsertCards({makeCard("a-1", "a"), makeCard("a-2", "a")}));
    ASSERT_TRUE(db.upsertEmbeddings({{"a-1", {0.6f, 0.8f, 0.0f}}}));

    const auto embeddings = db.getAllEmbeddings();
    ASSERT_EQ(embeddings.size(), 1u);
    EXPECT_EQ(embeddings[0].card_id, "a-1");
    EXPECT_EQ(embeddings[0].values, (std::vector<float>{0.6f, 0.8f, 0.0f}));
    EXPECT_EQ(db.getCardIdsWithoutEmbeddings(), (std::vector<std::string>{"a-2"}));
    EXPECT_EQ(db.embeddingCount(), 1);

    EXPECT_TRUE(db.clearEmbeddings());
    EXPECT_EQ(db.embeddingCount(), 0);
}

TEST_F(DatabaseTest, DetailsAreCachedOnTheCardRow) {
    DatabaseManager db(test_db_name, true);
    ASSERT_TRUE(db.isEnabled());
    ASSERT_TRUE(db.upsertCards({makeCard("a-1", "a")}));
    EXPECT_FALSE(db.getCachedDetails("a-1").has_value());

    CardDetails details;
    CardVariants variants;
    variants.normal = true;
    variants.holo = true;
    details.variants = variants;
    details.set_total = 165;
    ASSERT_TRUE(db.storeDetails("a-1", details));

    const auto cached = db.getCachedDetails("a-1");
    ASSERT_TRUE(cached.has_value());
    ASSERT_TRUE(cached->variants.has_value());
    EXPECT_TRUE(cached->variants->normal);
    EXPECT_TRUE(cached->variants->holo);
    EXPECT_FALSE(cached->variants->reverse);
    EXPECT_EQ(cached->set_total, 165);

    // Re-importing the catalog keeps the cached columns
    ASSERT_TRUE(db.upsertCards({makeCard("a-1", "a", "Renamed")}));
    EXPECT_TRUE(db.getCachedDetails("a-1").has_value());
    EXPECT_EQ(db.getCard("a-1")->name, "Renamed");

    EXPECT_FALSE(db.storeDetails("unknown", details)) << "No row to attach details to";
}

TEST_F(DatabaseTest, StatisticsCountEveryTable) {
    DatabaseManager db(test_db_name, true);
    ASSERT_TRUE(db.isEnabled());
    ASSERT_TRUE(db.upsertCards({makeCard("a-1", "a"), makeCard("a-2", "a")}));
    ASSERT_TRUE(db.upsertHashes({makeSignature("a-1", HashAlgorithm::PHASH, "ff00")}));
    ASSERT_TRUE(db.upsertEmbeddings({{"a-2", {1.0f}}}));

    const auto stats = db.getStatistics();
    EXPECT_EQ(stats.at("cards"), 2);
    EXPECT_EQ(stats.at("card_hashes"), 1);
    EXPECT_EQ(stats.at("card_embeddings"), 1);
    EXPECT_EQ(stats.at("cards_without_hashes"), 1);
    EXPECT_EQ(stats.at("cards_without_embeddings"), 1);
    EXPECT_EQ(stats.at("cards_with_details"), 0);
}

TEST_F(DatabaseTest, PersistsAcrossConnections) {
    {
        DatabaseManager db(test_db_name, true);
        ASSERT_TRUE(db.upsertCards({makeCard("a-1", "a")}));
    }
    DatabaseManager reopened(test_db_name, true);
    EXPECT_EQ(reopened.cardCount(), 1);
}

TEST(DatabaseBlobTest, EmbeddingBlobIsRawFloat32) {
    const std::vector<float> values = {1.0f, -2.5f};
    const auto blob = database::encodeEmbeddingBlob(values);
    ASSERT_EQ(blob.size(), 8u);

    const auto decoded = database::decodeEmbeddingBlob(blob.data(), blob.size());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, values);

    EXPECT_FALSE(database::decodeEmbeddingBlob(blob.data(), 7).has_value());
    EXPECT_FALSE(database::decodeEmbeddingBlob(nullptr, 0).has_value());
}

TEST(DatabaseBlobTest, VariantFlagsEncodeAsCommaList) {
    CardVariants variants;
    variants.reverse = true;
    variants.first_edition = true;
    EXPECT_EQ(database::encodeVariants(variants), "reverse,firstEdition");

    const auto decoded = database::decodeVariants("holo,bogus,wPromo");
    EXPECT_TRUE(decoded.holo);
    EXPECT_TRUE(decoded.w_promo);
    EXPECT_FALSE(decoded.normal);
}
