#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>
#include <vaxchain/storage/file_store.hpp>

using namespace vaxchain;
using namespace vaxchain::storage;

// Test helper: cleanup storage directory
struct TestStore {
    std::string path;
    FileStore store;

    explicit TestStore(const std::string &name) : path(name + "_store") { cleanup(); }

    ~TestStore() {
        store.close();
        cleanup();
    }

    void cleanup() {
        if (std::filesystem::exists(path)) {
            std::filesystem::remove_all(path);
        }
    }
};

namespace {

    void commitOne(RecordStore &store, const std::string &tx, const std::string &key, const std::string &value) {
        REQUIRE(store.begin(tx, 1000).is_ok());
        REQUIRE(store.put(key, value).is_ok());
        REQUIRE(store.commit().is_ok());
    }

} // namespace

// ===========================================
// Utility function tests
// ===========================================

TEST_CASE("Utility functions") {
    SUBCASE("SHA256 hashing") {
        auto hash = computeSHA256(toBytes("Hello"));
        CHECK(hash.size() == 32);

        auto again = computeSHA256(toBytes("Hello"));
        CHECK(std::equal(hash.begin(), hash.end(), again.begin()));

        auto other = computeSHA256(toBytes("Hello!"));
        CHECK_FALSE(std::equal(hash.begin(), hash.end(), other.begin()));
    }

    SUBCASE("Byte conversion keeps embedded NULs") {
        std::string key("\0IdDoctype\0a\0ITEM\0", 18);
        CHECK(fromBytes(toBytes(key)) == key);
    }
}

// ===========================================
// Lifecycle
// ===========================================

TEST_CASE("Storage lifecycle") {
    TestStore test_store("test_file_lifecycle");

    SUBCASE("Open and close") {
        CHECK(test_store.store.open(test_store.path).is_ok());
        CHECK(test_store.store.isOpen());
        CHECK(std::filesystem::exists(std::filesystem::path(test_store.path) / FileStore::DATA_FILE));

        test_store.store.close();
        CHECK_FALSE(test_store.store.isOpen());
    }

    SUBCASE("Missing directory without create_if_missing") {
        OpenOptions opts;
        opts.create_if_missing = false;
        auto opened = test_store.store.open(test_store.path, opts);
        REQUIRE_FALSE(opened.is_ok());
        CHECK(opened.error().code == ERR_STORE_FAILURE);
    }

    SUBCASE("Operations on a closed store fail") {
        CHECK_FALSE(test_store.store.begin("tx1", 1).is_ok());
        CHECK_FALSE(test_store.store.get("k").is_ok());
    }
}

// ===========================================
// Units of work
// ===========================================

TEST_CASE("Transactions") {
    TestStore test_store("test_file_tx");
    REQUIRE(test_store.store.open(test_store.path).is_ok());
    FileStore &store = test_store.store;

    SUBCASE("Writes require an open transaction") {
        auto put = store.put("k", "{}");
        REQUIRE_FALSE(put.is_ok());
        CHECK(put.error().code == ERR_STORE_FAILURE);
    }

    SUBCASE("Only one transaction at a time") {
        REQUIRE(store.begin("tx1", 1).is_ok());
        CHECK_FALSE(store.begin("tx2", 1).is_ok());
        store.rollback();
        CHECK(store.begin("tx2", 1).is_ok());
        store.rollback();
    }

    SUBCASE("Read your own writes before commit") {
        REQUIRE(store.begin("tx1", 1).is_ok());
        REQUIRE(store.put("k", R"({"v":1})").is_ok());
        auto inside = store.get("k");
        REQUIRE(inside.is_ok());
        CHECK(inside.value() == std::optional<std::string>(R"({"v":1})"));
        REQUIRE(store.commit().is_ok());

        auto after = store.get("k");
        REQUIRE(after.is_ok());
        CHECK(after.value() == std::optional<std::string>(R"({"v":1})"));
        CHECK(store.lastSequence() == 1);
    }

    SUBCASE("Rollback discards every pending write") {
        commitOne(store, "tx1", "a", R"({"v":1})");

        REQUIRE(store.begin("tx2", 2).is_ok());
        REQUIRE(store.put("a", R"({"v":2})").is_ok());
        REQUIRE(store.put("b", R"({"v":3})").is_ok());
        store.rollback();

        CHECK(store.get("a").value() == std::optional<std::string>(R"({"v":1})"));
        CHECK_FALSE(store.get("b").value().has_value());
        CHECK(store.history("a").value().size() == 1);
        CHECK(store.lastSequence() == 1);
    }

    SUBCASE("RAII guard rolls back when not committed") {
        {
            TxGuard guard(store);
            REQUIRE(guard.begin("tx1", 1).is_ok());
            REQUIRE(store.put("k", "{}").is_ok());
        }
        CHECK_FALSE(store.inTransaction());
        CHECK_FALSE(store.get("k").value().has_value());
    }

    SUBCASE("Last write wins within one transaction") {
        REQUIRE(store.begin("tx1", 1).is_ok());
        REQUIRE(store.put("k", R"({"v":1})").is_ok());
        REQUIRE(store.put("k", R"({"v":2})").is_ok());
        REQUIRE(store.commit().is_ok());

        auto revs = store.history("k");
        REQUIRE(revs.is_ok());
        REQUIRE(revs.value().size() == 1);
        CHECK(*revs.value()[0].value == R"({"v":2})");
    }

    SUBCASE("Empty commit writes nothing") {
        REQUIRE(store.begin("tx1", 1).is_ok());
        REQUIRE(store.commit().is_ok());
        CHECK(store.lastSequence() == 0);
    }
}

// ===========================================
// History
// ===========================================

TEST_CASE("Revision history") {
    TestStore test_store("test_file_history");
    REQUIRE(test_store.store.open(test_store.path).is_ok());
    FileStore &store = test_store.store;

    commitOne(store, "tx-a", "unit", R"({"owner":"m"})");
    commitOne(store, "tx-b", "other", R"({"owner":"x"})");
    commitOne(store, "tx-c", "unit", R"({"owner":"d"})");

    REQUIRE(store.begin("tx-d", 2000).is_ok());
    REQUIRE(store.remove("unit").is_ok());
    REQUIRE(store.commit().is_ok());

    auto revs = store.history("unit");
    REQUIRE(revs.is_ok());
    REQUIRE(revs.value().size() == 3);

    CHECK(revs.value()[0].tx_id == "tx-a");
    CHECK(revs.value()[0].version == 1);
    CHECK(*revs.value()[0].value == R"({"owner":"m"})");
    CHECK(revs.value()[1].tx_id == "tx-c");
    CHECK(revs.value()[2].tx_id == "tx-d");
    CHECK(revs.value()[2].timestamp == 2000);
    CHECK(revs.value()[2].isDelete());

    // Tombstoned keys read as absent and drop out of queries
    CHECK_FALSE(store.get("unit").value().has_value());
    auto all = store.query(Selector());
    REQUIRE(all.is_ok());
    REQUIRE(all.value().size() == 1);
    CHECK(all.value()[0].key == "other");

    CHECK(store.history("never-written").value().empty());
}

// ===========================================
// Queries
// ===========================================

TEST_CASE("Selector queries") {
    TestStore test_store("test_file_query");
    REQUIRE(test_store.store.open(test_store.path).is_ok());
    FileStore &store = test_store.store;

    REQUIRE(store.begin("tx1", 1).is_ok());
    REQUIRE(store.put("u2", R"({"owner":"m1","docType":"ASSET","n":2})").is_ok());
    REQUIRE(store.put("u1", R"({"owner":"m1","docType":"ASSET","n":1})").is_ok());
    REQUIRE(store.put("u3", R"({"owner":"m2","docType":"ASSET","n":3})").is_ok());
    REQUIRE(store.put("p1", R"({"owner":"m1","docType":"ITEM"})").is_ok());
    REQUIRE(store.commit().is_ok());

    SUBCASE("Equality on several fields, key ordered") {
        auto hits = store.query(Selector().eq("owner", "m1").eq("docType", "ASSET"));
        REQUIRE(hits.is_ok());
        REQUIRE(hits.value().size() == 2);
        CHECK(hits.value()[0].key == "u1");
        CHECK(hits.value()[1].key == "u2");
    }

    SUBCASE("Numeric equality") {
        auto hits = store.query(Selector().eq("n", int64_t(3)));
        REQUIRE(hits.is_ok());
        REQUIRE(hits.value().size() == 1);
        CHECK(hits.value()[0].key == "u3");
    }

    SUBCASE("Pending writes are visible to queries in the same transaction") {
        REQUIRE(store.begin("tx2", 2).is_ok());
        REQUIRE(store.put("u3", R"({"owner":"m1","docType":"ASSET","n":3})").is_ok());
        REQUIRE(store.remove("u1").is_ok());
        auto hits = store.query(Selector().eq("owner", "m1").eq("docType", "ASSET"));
        REQUIRE(hits.is_ok());
        REQUIRE(hits.value().size() == 2);
        CHECK(hits.value()[0].key == "u2");
        CHECK(hits.value()[1].key == "u3");
        store.rollback();
    }

    SUBCASE("Selector rendering") {
        CHECK(Selector().eq("owner", "m1").eq("n", int64_t(2)).toJson() == R"({"selector":{"owner":"m1","n":2}})");
    }
}

// ===========================================
// Concurrency control and durability
// ===========================================

TEST_CASE("Optimistic version checks across handles") {
    TestStore test_store("test_file_conflict");
    REQUIRE(test_store.store.open(test_store.path).is_ok());
    FileStore &first = test_store.store;
    commitOne(first, "tx0", "counter", R"({"n":0})");

    FileStore second;
    REQUIRE(second.open(test_store.path).is_ok());

    // Both read the counter, the second handle commits first
    REQUIRE(first.begin("tx-first", 1).is_ok());
    REQUIRE(first.get("counter").is_ok());

    REQUIRE(second.begin("tx-second", 1).is_ok());
    REQUIRE(second.get("counter").is_ok());
    REQUIRE(second.put("counter", R"({"n":1})").is_ok());
    REQUIRE(second.commit().is_ok());

    REQUIRE(first.put("counter", R"({"n":1})").is_ok());
    auto conflict = first.commit();
    REQUIRE_FALSE(conflict.is_ok());
    CHECK(conflict.error().code == ERR_STORE_FAILURE);
    CHECK(std::string(conflict.error().message.c_str()).find("Version conflict") != std::string::npos);

    // The losing handle sees the winner after its next begin
    REQUIRE(first.begin("tx-retry", 2).is_ok());
    CHECK(first.get("counter").value() == std::optional<std::string>(R"({"n":1})"));
    first.rollback();
    CHECK(first.history("counter").value().size() == 2);
    second.close();
}

TEST_CASE("Persistence across reopen") {
    TestStore test_store("test_file_reopen");
    REQUIRE(test_store.store.open(test_store.path).is_ok());
    commitOne(test_store.store, "tx1", "k", R"({"v":1})");
    commitOne(test_store.store, "tx2", "k", R"({"v":2})");
    test_store.store.close();

    SUBCASE("State and history are rebuilt") {
        FileStore reopened;
        REQUIRE(reopened.open(test_store.path).is_ok());
        CHECK(reopened.get("k").value() == std::optional<std::string>(R"({"v":2})"));
        CHECK(reopened.history("k").value().size() == 2);
        CHECK(reopened.lastSequence() == 2);
    }

    SUBCASE("A torn trailing frame is ignored and overwritten") {
        auto data = std::filesystem::path(test_store.path) / FileStore::DATA_FILE;
        {
            std::ofstream out(data, std::ios::binary | std::ios::app);
            out.write("\x40\x00\x00\x00garbage", 11);
        }

        FileStore reopened;
        REQUIRE(reopened.open(test_store.path).is_ok());
        CHECK(reopened.get("k").value() == std::optional<std::string>(R"({"v":2})"));

        commitOne(reopened, "tx3", "k", R"({"v":3})");
        reopened.close();

        FileStore again;
        REQUIRE(again.open(test_store.path).is_ok());
        CHECK(again.get("k").value() == std::optional<std::string>(R"({"v":3})"));
        CHECK(again.history("k").value().size() == 3);
    }
}
