#include <gtest/gtest.h>
#include "storage/error.hpp"
#include "storage/store.hpp"
#include "test_util.hpp"
#include <fstream>

using namespace tabula::storage;
namespace fs = std::filesystem;

namespace {

template <typename Fn>
ErrorCode error_code_of(Fn&& fn) {
    try {
        fn();
    } catch (const StoreError& e) {
        return e.code();
    }
    ADD_FAILURE() << "expected StoreError";
    return ErrorCode::IO;
}

} // namespace

class StoreTest : public ::testing::Test {
protected:
    tabula::test::TempDir dir;

    StoreConfig config(std::optional<std::vector<uint8_t>> key = std::nullopt) const {
        StoreConfig c;
        c.data_dir = dir.path() / "data";
        c.encryption_key = std::move(key);
        return c;
    }
};

TEST_F(StoreTest, OpenCreatesDataDirectory) {
    Store store(config());
    EXPECT_TRUE(fs::is_directory(dir.path() / "data"));
    EXPECT_TRUE(store.list_tables().empty());
    EXPECT_FALSE(store.is_encrypted());
}

TEST_F(StoreTest, InsertCreatesTableOnFirstUse) {
    Store store(config());
    std::string id = store.insert("users", {{"name", "a"}});

    EXPECT_TRUE(store.has_table("users"));
    EXPECT_EQ(store.count("users"), 1u);
    EXPECT_EQ(store.find_by_id("users", id)->data.at("name"), Value("a"));
}

TEST_F(StoreTest, PersistenceAcrossReopen) {
    std::string id;
    {
        Store store(config());
        id = store.insert("users", {{"name", "a"}, {"age", 25}});
        store.close();
    }

    EXPECT_TRUE(fs::exists(dir.path() / "data" / "users.db"));

    Store reopened(config());
    auto record = reopened.find_by_id("users", id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->data, (Fields{{"name", "a"}, {"age", 25}}));
    EXPECT_EQ(record->data.at("age").type(), ValueType::INT);
    EXPECT_EQ(record->created_at, record->updated_at);
}

TEST_F(StoreTest, EncryptedPersistenceAndWrongKey) {
    auto key = Crypto::generate_key();
    std::string id;
    with_store(config(key), [&id](Store& store) {
        id = store.insert("secrets", {{"pin", 1234}});
    });

    with_store(config(key), [&id](Store& store) {
        EXPECT_TRUE(store.is_encrypted());
        EXPECT_EQ(store.find_by_id("secrets", id)->data.at("pin"), Value(1234));
    });

    EXPECT_EQ(error_code_of([&] { Store s(config(Crypto::generate_key())); }), ErrorCode::ENCRYPTION);
}

TEST_F(StoreTest, BadKeyLengthFailsOpen) {
    EXPECT_EQ(error_code_of([&] { Store s(config(std::vector<uint8_t>(10, 0))); }), ErrorCode::ENCRYPTION);
}

TEST_F(StoreTest, EmptyTableSurvivesReopen) {
    with_store(config(), [](Store& store) { store.create_table("empty"); });

    EXPECT_TRUE(fs::exists(dir.path() / "data" / "empty.db"));
    Store reopened(config());
    EXPECT_EQ(reopened.list_tables(), std::vector<std::string>{"empty"});
    EXPECT_EQ(reopened.count("empty"), 0u);
}

TEST_F(StoreTest, UnknownTableErrors) {
    Store store(config());
    EXPECT_EQ(error_code_of([&] { store.find_by_id("ghost", "x"); }), ErrorCode::TABLE_NOT_FOUND);
    EXPECT_EQ(error_code_of([&] { store.update("ghost", "x", {}); }), ErrorCode::TABLE_NOT_FOUND);
    EXPECT_EQ(error_code_of([&] { store.erase("ghost", "x"); }), ErrorCode::TABLE_NOT_FOUND);
    EXPECT_EQ(error_code_of([&] { store.count("ghost"); }), ErrorCode::TABLE_NOT_FOUND);
    EXPECT_EQ(error_code_of([&] { store.find_all("ghost"); }), ErrorCode::TABLE_NOT_FOUND);
}

TEST_F(StoreTest, UpdateAndDeleteThroughStore) {
    Store store(config());
    std::string a = store.insert("t", {{"a", 1}, {"b", 2}});
    std::string b = store.insert("t", {{"a", 5}});

    store.update("t", a, {{"c", 3}});
    EXPECT_EQ(store.find_by_id("t", a)->data, (Fields{{"c", 3}}));

    store.erase("t", b);
    EXPECT_EQ(store.count("t"), 1u);
    EXPECT_EQ(error_code_of([&] { store.erase("t", b); }), ErrorCode::RECORD_NOT_FOUND);
}

TEST_F(StoreTest, FindWhereMatchesPredicate) {
    Store store(config());
    store.insert("users", {{"active", true}});
    store.insert("users", {{"active", false}});
    store.insert("users", {{"active", true}});

    auto active = store.find_where("users", [](const Record& r) {
        return r.data.at("active") == Value(true);
    });
    EXPECT_EQ(active.size(), 2u);
}

TEST_F(StoreTest, InvalidTableNameRejected) {
    Store store(config());
    EXPECT_EQ(error_code_of([&] { store.insert("../escape", {}); }), ErrorCode::CONFIG);
    EXPECT_FALSE(fs::exists(dir.path() / "escape.db"));
}

TEST_F(StoreTest, TooDeepValueRejectedAtInsert) {
    Value deep(1);
    for (size_t i = 0; i < kMaxValueDepth; ++i) {
        deep = Value(Value::Array{deep});
    }

    Store store(config());
    EXPECT_EQ(error_code_of([&] { store.insert("t", {{"v", deep}}); }), ErrorCode::SERIALIZATION);
}

TEST_F(StoreTest, DropTableRemovesFile) {
    with_store(config(), [](Store& store) { store.insert("gone", {{"x", 1}}); });
    ASSERT_TRUE(fs::exists(dir.path() / "data" / "gone.db"));

    with_store(config(), [](Store& store) {
        store.drop_table("gone");
        EXPECT_FALSE(store.has_table("gone"));
        store.drop_table("gone");
    });
    EXPECT_FALSE(fs::exists(dir.path() / "data" / "gone.db"));
}

TEST_F(StoreTest, DestructorDoesNotSave) {
    {
        Store store(config());
        store.insert("users", {{"name", "lost"}});
    }
    EXPECT_FALSE(fs::exists(dir.path() / "data" / "users.db"));
}

TEST_F(StoreTest, CloseIsIdempotentAndFinal) {
    Store store(config());
    store.insert("users", {{"n", 1}});
    store.close();
    EXPECT_TRUE(store.is_closed());
    EXPECT_NO_THROW(store.close());

    EXPECT_EQ(error_code_of([&] { store.insert("users", {}); }), ErrorCode::CONFIG);
    EXPECT_EQ(error_code_of([&] { store.count("users"); }), ErrorCode::CONFIG);
}

TEST_F(StoreTest, WithStoreReturnsResultAndSaves) {
    std::string id = with_store(config(), [](Store& store) {
        return store.insert("users", {{"n", 1}});
    });

    Store reopened(config());
    EXPECT_TRUE(reopened.find_by_id("users", id).has_value());
}

TEST_F(StoreTest, WithStoreSkipsSaveWhenFnThrows) {
    EXPECT_THROW(with_store(config(), [](Store& store) {
        store.insert("users", {{"n", 1}});
        throw std::runtime_error("abort");
    }), std::runtime_error);

    EXPECT_FALSE(fs::exists(dir.path() / "data" / "users.db"));
}

TEST_F(StoreTest, CorruptTableFailsWholeOpen) {
    with_store(config(), [](Store& store) { store.insert("good", {{"x", 1}}); });
    {
        std::ofstream out(dir.path() / "data" / "bad.db", std::ios::binary);
        out << "\xc1\xc1\xc1";
    }
    EXPECT_EQ(error_code_of([&] { Store s(config()); }), ErrorCode::SERIALIZATION);
}

TEST_F(StoreTest, StrayFilesAreIgnored) {
    with_store(config(), [](Store& store) { store.insert("users", {{"x", 1}}); });
    {
        std::ofstream(dir.path() / "data" / "users.db.tmp") << "leftover";
        std::ofstream(dir.path() / "data" / "notes.txt") << "hello";
        std::ofstream(dir.path() / "data" / "bad name.db") << "ignored";
    }

    Store store(config());
    EXPECT_EQ(store.list_tables(), std::vector<std::string>{"users"});
}

TEST_F(StoreTest, SaveFailureLeavesStoreOpenAndRetryable) {
    StoreConfig c = config();
    c.max_file_size = 200;

    Store store(c);
    std::string kept = store.insert("ok", {{"x", 1}});
    store.save_all();
    ASSERT_TRUE(fs::exists(dir.path() / "data" / "ok.db"));

    std::string oversized = store.insert("big", {{"payload", std::string(500, 'x')}});
    EXPECT_EQ(error_code_of([&] { store.save_all(); }), ErrorCode::IO);
    EXPECT_FALSE(fs::exists(dir.path() / "data" / "big.db"));

    EXPECT_EQ(error_code_of([&] { store.close(); }), ErrorCode::IO);
    EXPECT_FALSE(store.is_closed());
    EXPECT_EQ(store.count("big"), 1u);

    store.erase("big", oversized);
    EXPECT_NO_THROW(store.close());
    EXPECT_TRUE(store.is_closed());

    Store reopened(c);
    EXPECT_TRUE(reopened.find_by_id("ok", kept).has_value());
    EXPECT_EQ(reopened.count("big"), 0u);
}

TEST_F(StoreTest, SaveAllKeepsTablesSavedBeforeTheFailure) {
    StoreConfig c = config();
    c.max_file_size = 200;

    {
        Store store(c);
        store.insert("ok", {{"x", 1}});
        store.insert("big", {{"payload", std::string(500, 'x')}});
        EXPECT_EQ(error_code_of([&] { store.save_all(); }), ErrorCode::IO);
        // A failed save_all() never leaves a partial snapshot behind
        EXPECT_FALSE(fs::exists(dir.path() / "data" / "big.db"));
        EXPECT_FALSE(fs::exists(dir.path() / "data" / "big.db.tmp"));
        // Dropping the oversized table lets the rest through
        store.drop_table("big");
        store.close();
    }

    Store reopened(c);
    EXPECT_EQ(reopened.list_tables(), std::vector<std::string>{"ok"});
    EXPECT_EQ(reopened.count("ok"), 1u);
}
