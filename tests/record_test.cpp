#include <gtest/gtest.h>
#include "storage/record.hpp"
#include <regex>
#include <set>

using namespace tabula::storage;

TEST(RecordTest, CreateAssignsIdAndEqualTimestamps) {
    Fields data{{"name", "a"}, {"age", 25}};
    Record r = Record::create(data);

    EXPECT_FALSE(r.id.empty());
    EXPECT_EQ(r.data, data);
    EXPECT_EQ(r.created_at, r.updated_at);
    EXPECT_GT(r.created_at, 0u);
}

TEST(RecordTest, IdsAreUuidV4AndUnique) {
    std::regex uuid("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        std::string id = generate_record_id();
        EXPECT_TRUE(std::regex_match(id, uuid)) << id;
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 1000u);
}

TEST(RecordTest, ReplaceOverwritesWholeMap) {
    Record r = Record::create({{"a", 1}, {"b", 2}});
    std::string id = r.id;
    uint64_t created = r.created_at;
    uint64_t updated = r.updated_at;

    r.replace({{"c", 3}});

    EXPECT_EQ(r.data, (Fields{{"c", 3}}));
    EXPECT_EQ(r.data.count("a"), 0u);
    EXPECT_EQ(r.id, id);
    EXPECT_EQ(r.created_at, created);
    EXPECT_GE(r.updated_at, updated);
}

TEST(RecordTest, ReplaceNeverMovesUpdatedBeforeCreated) {
    Record r = Record::create({});
    r.created_at = unix_now() + 3600;  // Created "in the future"
    r.updated_at = r.created_at;

    r.replace({{"x", true}});
    EXPECT_LE(r.created_at, r.updated_at);
}
