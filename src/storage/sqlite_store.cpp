#include "vaxchain/storage/sqlite_store.hpp"

#include <sqlite3.h>

namespace vaxchain::storage {

    namespace {

        void bindKey(sqlite3_stmt *stmt, int index, const std::string &key) {
            sqlite3_bind_blob(stmt, index, key.data(), static_cast<int>(key.size()), SQLITE_TRANSIENT);
        }

        std::string columnBytes(sqlite3_stmt *stmt, int column) {
            const void *blob = sqlite3_column_blob(stmt, column);
            int size = sqlite3_column_bytes(stmt, column);
            if (blob == nullptr || size <= 0)
                return std::string();
            return std::string(static_cast<const char *>(blob), static_cast<size_t>(size));
        }

        std::string columnText(sqlite3_stmt *stmt, int column) {
            const unsigned char *text = sqlite3_column_text(stmt, column);
            if (text == nullptr)
                return std::string();
            return std::string(reinterpret_cast<const char *>(text));
        }

        /// Finalizes the statement on scope exit
        class Statement {
          public:
            explicit Statement(sqlite3_stmt *stmt) : stmt_(stmt) {}
            ~Statement() {
                if (stmt_)
                    sqlite3_finalize(stmt_);
            }
            Statement(const Statement &) = delete;
            Statement &operator=(const Statement &) = delete;

            sqlite3_stmt *get() const { return stmt_; }

          private:
            sqlite3_stmt *stmt_;
        };

    } // namespace

    // ===========================================
    // SqliteStore implementation
    // ===========================================

    SqliteStore::SqliteStore() : db_(nullptr), is_open_(false) {}

    SqliteStore::~SqliteStore() { close(); }

    dp::Result<void, dp::Error> SqliteStore::open(const std::string &path, const OpenOptions &opts) {
        std::unique_lock lock(mutex_);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
            is_open_ = false;
        }

        int flags = SQLITE_OPEN_READWRITE;
        if (opts.create_if_missing)
            flags |= SQLITE_OPEN_CREATE;

        int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
        if (rc != SQLITE_OK) {
            dp::Error error = lastError("open " + path);
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            is_open_ = false;
            return dp::Result<void, dp::Error>::err(error);
        }

        db_path_ = path;
        applyPragmas(opts);

        auto schema = initializeSchema();
        if (!schema.is_ok()) {
            sqlite3_close(db_);
            db_ = nullptr;
            return schema;
        }

        is_open_ = true;
        return dp::Result<void, dp::Error>::ok();
    }

    void SqliteStore::close() {
        std::unique_lock lock(mutex_);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        is_open_ = false;
    }

    bool SqliteStore::isOpen() const {
        std::shared_lock lock(mutex_);
        return is_open_;
    }

    bool SqliteStore::isReady() const { return is_open_ && db_ != nullptr; }

    void SqliteStore::applyPragmas(const OpenOptions &opts) {
        if (!db_)
            return;

        if (opts.enable_wal) {
            sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
        }

        if (opts.enable_foreign_keys) {
            sqlite3_exec(db_, "PRAGMA foreign_keys=ON;", nullptr, nullptr, nullptr);
        }

        sqlite3_busy_timeout(db_, opts.busy_timeout_ms);

        std::string cache_size = "PRAGMA cache_size=-" + std::to_string(opts.cache_size_kb) + ";";
        sqlite3_exec(db_, cache_size.c_str(), nullptr, nullptr, nullptr);

        std::string sync_mode;
        switch (opts.sync_mode) {
        case OpenOptions::Synchronous::OFF:
            sync_mode = "PRAGMA synchronous=OFF;";
            break;
        case OpenOptions::Synchronous::NORMAL:
            sync_mode = "PRAGMA synchronous=NORMAL;";
            break;
        case OpenOptions::Synchronous::FULL:
            sync_mode = "PRAGMA synchronous=FULL;";
            break;
        }
        sqlite3_exec(db_, sync_mode.c_str(), nullptr, nullptr, nullptr);
    }

    dp::Result<void, dp::Error> SqliteStore::initializeSchema() {
        auto begin = exec("BEGIN IMMEDIATE");
        if (!begin.is_ok())
            return begin;

        auto fail = [this](dp::Result<void, dp::Error> result) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
            return result;
        };

        auto migrations = exec(SCHEMA_MIGRATIONS_TABLE);
        if (!migrations.is_ok())
            return fail(migrations);

        if (getCurrentSchemaVersion() < SCHEMA_VERSION) {
            for (const char *sql : {REVISIONS_TABLE, WORLD_STATE_TABLE, IDX_REVISIONS_KEY, IDX_REVISIONS_TX}) {
                auto step = exec(sql);
                if (!step.is_ok())
                    return fail(step);
            }

            auto stmt = prepare("INSERT OR REPLACE INTO schema_migrations (version, applied_at) VALUES (?, ?)");
            if (!stmt.is_ok())
                return fail(dp::Result<void, dp::Error>::err(stmt.error()));
            Statement guard(stmt.value());
            sqlite3_bind_int(guard.get(), 1, SCHEMA_VERSION);
            sqlite3_bind_int64(guard.get(), 2, currentTimestamp());
            if (sqlite3_step(guard.get()) != SQLITE_DONE)
                return fail(dp::Result<void, dp::Error>::err(lastError("record schema version")));
        }

        return exec("COMMIT");
    }

    int32_t SqliteStore::getCurrentSchemaVersion() {
        auto stmt = prepare("SELECT MAX(version) FROM schema_migrations");
        if (!stmt.is_ok())
            return 0;
        Statement guard(stmt.value());

        int32_t version = 0;
        if (sqlite3_step(guard.get()) == SQLITE_ROW) {
            version = sqlite3_column_int(guard.get(), 0);
        }
        return version;
    }

    dp::Result<void, dp::Error> SqliteStore::exec(const char *sql) {
        char *message = nullptr;
        int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &message);
        if (rc != SQLITE_OK) {
            std::string text = message ? message : sqlite3_errstr(rc);
            sqlite3_free(message);
            return dp::Result<void, dp::Error>::err(store_failure(errorText("SQLite: " + text)));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<sqlite3_stmt *, dp::Error> SqliteStore::prepare(const char *sql) {
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<sqlite3_stmt *, dp::Error>::err(lastError("prepare"));
        }
        return dp::Result<sqlite3_stmt *, dp::Error>::ok(stmt);
    }

    dp::Error SqliteStore::lastError(const std::string &context) const {
        std::string detail = db_ ? sqlite3_errmsg(db_) : "no connection";
        return store_failure(errorText("SQLite " + context + ": " + detail));
    }

    // ===========================================
    // Committed-state hooks
    // ===========================================

    dp::Result<std::optional<StoredRecord>, dp::Error> SqliteStore::loadLatest(const std::string &key) {
        auto stmt = prepare("SELECT payload, is_delete, version FROM world_state WHERE record_key = ?");
        if (!stmt.is_ok())
            return dp::Result<std::optional<StoredRecord>, dp::Error>::err(stmt.error());
        Statement guard(stmt.value());
        bindKey(guard.get(), 1, key);

        int rc = sqlite3_step(guard.get());
        if (rc == SQLITE_DONE)
            return dp::Result<std::optional<StoredRecord>, dp::Error>::ok(std::nullopt);
        if (rc != SQLITE_ROW)
            return dp::Result<std::optional<StoredRecord>, dp::Error>::err(lastError("read state"));

        StoredRecord record;
        record.key = key;
        if (sqlite3_column_int(guard.get(), 1) == 0)
            record.value = columnBytes(guard.get(), 0);
        record.version = sqlite3_column_int64(guard.get(), 2);
        return dp::Result<std::optional<StoredRecord>, dp::Error>::ok(std::move(record));
    }

    dp::Result<std::vector<StoredRecord>, dp::Error> SqliteStore::scanLatest() {
        auto stmt = prepare("SELECT record_key, payload, version FROM world_state WHERE is_delete = 0 "
                            "ORDER BY record_key");
        if (!stmt.is_ok())
            return dp::Result<std::vector<StoredRecord>, dp::Error>::err(stmt.error());
        Statement guard(stmt.value());

        std::vector<StoredRecord> out;
        int rc;
        while ((rc = sqlite3_step(guard.get())) == SQLITE_ROW) {
            StoredRecord record;
            record.key = columnBytes(guard.get(), 0);
            record.value = columnBytes(guard.get(), 1);
            record.version = sqlite3_column_int64(guard.get(), 2);
            out.push_back(std::move(record));
        }
        if (rc != SQLITE_DONE)
            return dp::Result<std::vector<StoredRecord>, dp::Error>::err(lastError("scan state"));
        return dp::Result<std::vector<StoredRecord>, dp::Error>::ok(std::move(out));
    }

    dp::Result<std::vector<Revision>, dp::Error> SqliteStore::loadHistory(const std::string &key) {
        auto stmt = prepare("SELECT payload, is_delete, tx_id, timestamp, version FROM revisions "
                            "WHERE record_key = ? ORDER BY seq");
        if (!stmt.is_ok())
            return dp::Result<std::vector<Revision>, dp::Error>::err(stmt.error());
        Statement guard(stmt.value());
        bindKey(guard.get(), 1, key);

        std::vector<Revision> out;
        int rc;
        while ((rc = sqlite3_step(guard.get())) == SQLITE_ROW) {
            Revision rev;
            rev.key = key;
            if (sqlite3_column_int(guard.get(), 1) == 0)
                rev.value = columnBytes(guard.get(), 0);
            rev.tx_id = columnText(guard.get(), 2);
            rev.timestamp = sqlite3_column_int64(guard.get(), 3);
            rev.version = sqlite3_column_int64(guard.get(), 4);
            out.push_back(std::move(rev));
        }
        if (rc != SQLITE_DONE)
            return dp::Result<std::vector<Revision>, dp::Error>::err(lastError("read history"));
        return dp::Result<std::vector<Revision>, dp::Error>::ok(std::move(out));
    }

    dp::Result<void, dp::Error> SqliteStore::applyCommit(const CommitBatch &batch) {
        auto begin = exec("BEGIN IMMEDIATE");
        if (!begin.is_ok())
            return begin;

        auto fail = [this](const dp::Error &error) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
            return dp::Result<void, dp::Error>::err(error);
        };

        // Versions as committed right now, for every key read or written
        std::unordered_map<std::string, int64_t> current;
        {
            auto stmt = prepare("SELECT version FROM world_state WHERE record_key = ?");
            if (!stmt.is_ok())
                return fail(stmt.error());
            Statement guard(stmt.value());

            auto lookup = [&](const std::string &key) -> bool {
                sqlite3_reset(guard.get());
                sqlite3_clear_bindings(guard.get());
                bindKey(guard.get(), 1, key);
                int rc = sqlite3_step(guard.get());
                if (rc == SQLITE_ROW)
                    current[key] = sqlite3_column_int64(guard.get(), 0);
                return rc == SQLITE_ROW || rc == SQLITE_DONE;
            };

            for (const auto &[key, seen] : batch.read_versions) {
                if (!lookup(key))
                    return fail(lastError("read version"));
            }
            for (const auto &write : batch.writes) {
                if (current.find(write.key) == current.end() && !lookup(write.key))
                    return fail(lastError("read version"));
            }
        }

        auto check = checkReadVersions(batch, current);
        if (!check.is_ok())
            return fail(check.error());

        auto insert = prepare("INSERT INTO revisions (record_key, payload, is_delete, tx_id, timestamp, version) "
                              "VALUES (?, ?, ?, ?, ?, ?)");
        if (!insert.is_ok())
            return fail(insert.error());
        Statement insert_guard(insert.value());

        auto upsert = prepare("INSERT OR REPLACE INTO world_state (record_key, payload, is_delete, version) "
                              "VALUES (?, ?, ?, ?)");
        if (!upsert.is_ok())
            return fail(upsert.error());
        Statement upsert_guard(upsert.value());

        for (const auto &write : batch.writes) {
            auto it = current.find(write.key);
            int64_t version = (it != current.end() ? it->second : 0) + 1;
            int is_delete = write.value.has_value() ? 0 : 1;

            sqlite3_stmt *ins = insert_guard.get();
            sqlite3_reset(ins);
            sqlite3_clear_bindings(ins);
            bindKey(ins, 1, write.key);
            if (write.value.has_value())
                sqlite3_bind_blob(ins, 2, write.value->data(), static_cast<int>(write.value->size()),
                                  SQLITE_TRANSIENT);
            else
                sqlite3_bind_null(ins, 2);
            sqlite3_bind_int(ins, 3, is_delete);
            sqlite3_bind_text(ins, 4, batch.tx_id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(ins, 5, batch.timestamp);
            sqlite3_bind_int64(ins, 6, version);
            if (sqlite3_step(ins) != SQLITE_DONE)
                return fail(lastError("append revision"));

            sqlite3_stmt *ups = upsert_guard.get();
            sqlite3_reset(ups);
            sqlite3_clear_bindings(ups);
            bindKey(ups, 1, write.key);
            if (write.value.has_value())
                sqlite3_bind_blob(ups, 2, write.value->data(), static_cast<int>(write.value->size()),
                                  SQLITE_TRANSIENT);
            else
                sqlite3_bind_null(ups, 2);
            sqlite3_bind_int(ups, 3, is_delete);
            sqlite3_bind_int64(ups, 4, version);
            if (sqlite3_step(ups) != SQLITE_DONE)
                return fail(lastError("update state"));
        }

        auto commit = exec("COMMIT");
        if (!commit.is_ok())
            return fail(commit.error());
        return dp::Result<void, dp::Error>::ok();
    }

    // ===========================================
    // Statistics & Diagnostics
    // ===========================================

    dp::Result<int64_t, dp::Error> SqliteStore::revisionCount() {
        std::shared_lock lock(mutex_);
        if (!isReady())
            return dp::Result<int64_t, dp::Error>::err(store_failure("Store not open"));

        auto stmt = prepare("SELECT COUNT(*) FROM revisions");
        if (!stmt.is_ok())
            return dp::Result<int64_t, dp::Error>::err(stmt.error());
        Statement guard(stmt.value());

        if (sqlite3_step(guard.get()) != SQLITE_ROW)
            return dp::Result<int64_t, dp::Error>::err(lastError("count revisions"));
        return dp::Result<int64_t, dp::Error>::ok(sqlite3_column_int64(guard.get(), 0));
    }

    dp::Result<bool, dp::Error> SqliteStore::quickCheck() {
        std::shared_lock lock(mutex_);
        if (!isReady())
            return dp::Result<bool, dp::Error>::err(store_failure("Store not open"));

        auto stmt = prepare("PRAGMA quick_check");
        if (!stmt.is_ok())
            return dp::Result<bool, dp::Error>::err(stmt.error());
        Statement guard(stmt.value());

        bool ok = false;
        if (sqlite3_step(guard.get()) == SQLITE_ROW)
            ok = columnText(guard.get(), 0) == "ok";
        return dp::Result<bool, dp::Error>::ok(ok);
    }

} // namespace vaxchain::storage
