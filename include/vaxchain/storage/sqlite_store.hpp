#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "vaxchain/storage/record_store.hpp"

// Forward declaration for sqlite3 C API
struct sqlite3;
struct sqlite3_stmt;

namespace vaxchain::storage {

    // ===========================================
    // SqliteStore - SQL-backed record store
    // ===========================================

    /// Two tables: `revisions` is the append-only write log, `world_state` holds the latest revision of each key
    /// with its version. A commit runs inside BEGIN IMMEDIATE so the version check and the writes are atomic even
    /// with several connections on the same database file.
    class SqliteStore : public BufferedRecordStore {
      public:
        SqliteStore();
        ~SqliteStore() override;

        SqliteStore(const SqliteStore &) = delete;
        SqliteStore &operator=(const SqliteStore &) = delete;

        /// Open or create database at given path and apply the schema
        /// @param path Database file path (e.g. "data/vaxchain.db"), or ":memory:"
        /// @param opts Configuration options
        dp::Result<void, dp::Error> open(const std::string &path, const OpenOptions &opts = OpenOptions{});

        /// Close database connection
        void close();

        /// Check if database is open
        bool isOpen() const;

        /// Number of revisions in the write log
        dp::Result<int64_t, dp::Error> revisionCount();

        /// Run SQLite integrity check
        dp::Result<bool, dp::Error> quickCheck();

      protected:
        bool isReady() const override;
        dp::Result<std::optional<StoredRecord>, dp::Error> loadLatest(const std::string &key) override;
        dp::Result<std::vector<StoredRecord>, dp::Error> scanLatest() override;
        dp::Result<std::vector<Revision>, dp::Error> loadHistory(const std::string &key) override;
        dp::Result<void, dp::Error> applyCommit(const CommitBatch &batch) override;

      private:
        sqlite3 *db_;
        std::string db_path_;
        bool is_open_;

        void applyPragmas(const OpenOptions &opts);
        dp::Result<void, dp::Error> initializeSchema();
        dp::Result<void, dp::Error> exec(const char *sql);
        dp::Result<sqlite3_stmt *, dp::Error> prepare(const char *sql);
        dp::Error lastError(const std::string &context) const;
        int32_t getCurrentSchemaVersion();

        static constexpr int32_t SCHEMA_VERSION = 1;

        static constexpr const char *SCHEMA_MIGRATIONS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS schema_migrations (
                version INTEGER PRIMARY KEY,
                applied_at INTEGER NOT NULL
            )
        )";

        static constexpr const char *REVISIONS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS revisions (
                seq INTEGER PRIMARY KEY AUTOINCREMENT,
                record_key BLOB NOT NULL,
                payload BLOB,
                is_delete INTEGER NOT NULL,
                tx_id TEXT NOT NULL,
                timestamp INTEGER NOT NULL,
                version INTEGER NOT NULL,
                UNIQUE(record_key, version)
            )
        )";

        static constexpr const char *WORLD_STATE_TABLE = R"(
            CREATE TABLE IF NOT EXISTS world_state (
                record_key BLOB PRIMARY KEY,
                payload BLOB,
                is_delete INTEGER NOT NULL,
                version INTEGER NOT NULL
            )
        )";

        static constexpr const char *IDX_REVISIONS_KEY =
            "CREATE INDEX IF NOT EXISTS idx_revisions_key ON revisions(record_key, seq)";
        static constexpr const char *IDX_REVISIONS_TX = "CREATE INDEX IF NOT EXISTS idx_revisions_tx ON revisions(tx_id)";
    };

} // namespace vaxchain::storage
