#include <doctest/doctest.h>

#include <filesystem>
#include <vaxchain/ledger/record_key.hpp>
#include <vaxchain/storage/sqlite_store.hpp>

using namespace vaxchain;
using namespace vaxchain::storage;

// Test helper: cleanup database file
struct TestDB {
    std::string path;
    SqliteStore store;

    explicit TestDB(const std::string &name) : path(name + ".db") { cleanup(); }

    ~TestDB() {
        store.close();
        cleanup();
    }

    void cleanup() {
        if (std::filesystem::exists(path)) {
            std::filesystem::remove(path);
        }
        if (std::filesystem::exists(path + "-wal")) {
            std::filesystem::remove(path + "-wal");
        }
        if (std::filesystem::exists(path + "-shm")) {
            std::filesystem::remove(path + "-shm");
        }
    }
};

// ===========================================
// Lifecycle
// ===========================================

TEST_CASE("Database lifecycle") {
    TestDB db("test_sqlite_lifecycle");

    SUBCASE("Open and close") {
        CHECK(db.store.open(db.path).is_ok());
        CHECK(db.store.isOpen());
        CHECK(std::filesystem::exists(db.path));

        db.store.close();
        CHECK_FALSE(db.store.isOpen());
    }

    SUBCASE("Open with custom options") {
        OpenOptions opts;
        opts.enable_wal = false;
        opts.sync_mode = OpenOptions::Synchronous::FULL;
        opts.busy_timeout_ms = 1000;

        CHECK(db.store.open(db.path, opts).is_ok());
        CHECK(db.store.isOpen());
    }

    SUBCASE("Integrity check") {
        REQUIRE(db.store.open(db.path).is_ok());
        auto check = db.store.quickCheck();
        REQUIRE(check.is_ok());
        CHECK(check.value());
    }

    SUBCASE("Schema is applied once") {
        REQUIRE(db.store.open(db.path).is_ok());
        db.store.close();
        CHECK(db.store.open(db.path).is_ok());
        CHECK(db.store.revisionCount().value() == 0);
    }
}

// ===========================================
// Units of work
// ===========================================

TEST_CASE("Atomic commit and rollback") {
    TestDB db("test_sqlite_tx");
    REQUIRE(db.store.open(db.path).is_ok());
    SqliteStore &store = db.store;

    SUBCASE("Commit applies every write") {
        REQUIRE(store.begin("tx1", 100).is_ok());
        REQUIRE(store.put("a", R"({"v":1})").is_ok());
        REQUIRE(store.put("b", R"({"v":2})").is_ok());
        REQUIRE(store.commit().is_ok());

        CHECK(store.get("a").value() == std::optional<std::string>(R"({"v":1})"));
        CHECK(store.get("b").value() == std::optional<std::string>(R"({"v":2})"));
        CHECK(store.revisionCount().value() == 2);
    }

    SUBCASE("Rollback leaves no trace") {
        REQUIRE(store.begin("tx1", 100).is_ok());
        REQUIRE(store.put("a", R"({"v":1})").is_ok());
        store.rollback();

        CHECK_FALSE(store.inTransaction());
        CHECK_FALSE(store.get("a").value().has_value());
        CHECK(store.revisionCount().value() == 0);
        CHECK(store.history("a").value().empty());
    }

    SUBCASE("Composite keys with embedded NULs") {
        auto key = ledger::RecordKey::composite("mfg1", "MANUFACTURER").encode();
        auto other = ledger::RecordKey::composite("mfg1", "CHEMIST").encode();

        REQUIRE(store.begin("tx1", 100).is_ok());
        REQUIRE(store.put(key, R"({"id":"mfg1","docType":"MANUFACTURER"})").is_ok());
        REQUIRE(store.put(other, R"({"id":"mfg1","docType":"CHEMIST"})").is_ok());
        REQUIRE(store.commit().is_ok());

        CHECK(store.get(key).value() == std::optional<std::string>(R"({"id":"mfg1","docType":"MANUFACTURER"})"));
        CHECK(store.get(other).value() == std::optional<std::string>(R"({"id":"mfg1","docType":"CHEMIST"})"));
    }
}

// ===========================================
// History and queries
// ===========================================

TEST_CASE("Revision history and tombstones") {
    TestDB db("test_sqlite_history");
    REQUIRE(db.store.open(db.path).is_ok());
    SqliteStore &store = db.store;

    for (int i = 1; i <= 3; ++i) {
        REQUIRE(store.begin("tx" + std::to_string(i), 100 * i).is_ok());
        REQUIRE(store.put("unit", "{\"step\":" + std::to_string(i) + "}").is_ok());
        REQUIRE(store.commit().is_ok());
    }
    REQUIRE(store.begin("tx-del", 400).is_ok());
    REQUIRE(store.remove("unit").is_ok());
    REQUIRE(store.commit().is_ok());

    auto revs = store.history("unit");
    REQUIRE(revs.is_ok());
    REQUIRE(revs.value().size() == 4);
    for (size_t i = 0; i < 3; ++i) {
        CHECK(revs.value()[i].version == static_cast<int64_t>(i + 1));
        CHECK(revs.value()[i].tx_id == "tx" + std::to_string(i + 1));
        CHECK(revs.value()[i].timestamp == static_cast<int64_t>(100 * (i + 1)));
        CHECK_FALSE(revs.value()[i].isDelete());
    }
    CHECK(revs.value()[3].isDelete());
    CHECK(revs.value()[3].tx_id == "tx-del");

    CHECK_FALSE(store.get("unit").value().has_value());
    CHECK(store.query(Selector().eq("step", int64_t(3))).value().empty());
}

TEST_CASE("Queries merge committed and pending state") {
    TestDB db("test_sqlite_query");
    REQUIRE(db.store.open(db.path).is_ok());
    SqliteStore &store = db.store;

    REQUIRE(store.begin("tx1", 1).is_ok());
    REQUIRE(store.put("u1", R"({"owner":"d1","status":"ReceivedAtDistributor","docType":"ASSET"})").is_ok());
    REQUIRE(store.put("u2", R"({"owner":"d1","status":"ReceivedAtDistributor","docType":"ASSET"})").is_ok());
    REQUIRE(store.commit().is_ok());

    REQUIRE(store.begin("tx2", 2).is_ok());
    REQUIRE(store.put("u1", R"({"owner":"c1","status":"ChemistInventoryReceived","docType":"ASSET"})").is_ok());

    auto held = store.query(Selector().eq("owner", "d1"));
    REQUIRE(held.is_ok());
    REQUIRE(held.value().size() == 1);
    CHECK(held.value()[0].key == "u2");

    store.rollback();
    CHECK(store.query(Selector().eq("owner", "d1")).value().size() == 2);
}

// ===========================================
// Concurrency control
// ===========================================

TEST_CASE("Version conflicts between connections") {
    TestDB db("test_sqlite_conflict");
    REQUIRE(db.store.open(db.path).is_ok());
    SqliteStore &first = db.store;

    SqliteStore second;
    REQUIRE(second.open(db.path).is_ok());

    SUBCASE("Concurrent update of a read key") {
        REQUIRE(first.begin("seed", 1).is_ok());
        REQUIRE(first.put("mfg", R"({"batchCount":0})").is_ok());
        REQUIRE(first.commit().is_ok());

        REQUIRE(first.begin("tx-a", 2).is_ok());
        REQUIRE(first.get("mfg").value().has_value());

        REQUIRE(second.begin("tx-b", 2).is_ok());
        REQUIRE(second.get("mfg").value().has_value());
        REQUIRE(second.put("mfg", R"({"batchCount":1})").is_ok());
        REQUIRE(second.commit().is_ok());

        REQUIRE(first.put("mfg", R"({"batchCount":1})").is_ok());
        auto conflict = first.commit();
        REQUIRE_FALSE(conflict.is_ok());
        CHECK(conflict.error().code == ERR_STORE_FAILURE);

        // Nothing from the losing transaction was written
        CHECK(first.history("mfg").value().size() == 2);
    }

    SUBCASE("Concurrent insert of a key read as absent") {
        REQUIRE(first.begin("tx-a", 2).is_ok());
        REQUIRE_FALSE(first.get("receipt").value().has_value());

        REQUIRE(second.begin("tx-b", 2).is_ok());
        REQUIRE(second.put("receipt", R"({"by":"b"})").is_ok());
        REQUIRE(second.commit().is_ok());

        REQUIRE(first.put("receipt", R"({"by":"a"})").is_ok());
        CHECK_FALSE(first.commit().is_ok());
        CHECK(first.get("receipt").value() == std::optional<std::string>(R"({"by":"b"})"));
    }

    second.close();
}
