#pragma once

#include <algorithm>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

#include <datapod/datapod.hpp>

#include "vaxchain/common/error.hpp"
#include "vaxchain/ledger/json.hpp"

namespace vaxchain::storage {

    inline int64_t currentTimestamp() {
        return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    // ===========================================
    // Core Types
    // ===========================================

    /// One entry of a key's write log, oldest first
    struct Revision {
        std::string key;
        std::optional<std::string> value; // nullopt for a tombstone
        std::string tx_id;
        int64_t timestamp = 0;
        int64_t version = 0;

        inline bool isDelete() const { return !value.has_value(); }
    };

    /// Live record returned by a predicate query
    struct QueryRecord {
        std::string key;
        std::string value;
    };

    /// Latest committed state of one key
    struct StoredRecord {
        std::string key;
        std::optional<std::string> value;
        int64_t version = 0;
    };

    /// Write buffered inside a unit of work
    struct PendingWrite {
        std::string key;
        std::optional<std::string> value;
    };

    /// Everything a backend needs to apply one unit of work atomically
    struct CommitBatch {
        std::string tx_id;
        int64_t timestamp = 0;
        std::vector<PendingWrite> writes;
        std::map<std::string, int64_t> read_versions; // key -> version observed when read
    };

    /// Storage configuration options
    struct OpenOptions {
        bool create_if_missing = true;
        bool enable_wal = true;          // SQLite only
        bool enable_foreign_keys = true; // SQLite only
        int busy_timeout_ms = 5000;      // SQLite only
        int cache_size_kb = 20000;       // SQLite only
        enum class Synchronous { OFF = 0, NORMAL = 1, FULL = 2 };
        Synchronous sync_mode = Synchronous::NORMAL;

        auto members() {
            return std::tie(create_if_missing, enable_wal, enable_foreign_keys, busy_timeout_ms, cache_size_kb,
                            sync_mode);
        }
        auto members() const {
            return std::tie(create_if_missing, enable_wal, enable_foreign_keys, busy_timeout_ms, cache_size_kb,
                            sync_mode);
        }
    };

    /// Equality predicate over the top-level fields of a JSON document
    class Selector {
      public:
        Selector() = default;

        inline Selector &eq(const std::string &field, const std::string &value) {
            conditions_.emplace_back(field, ledger::JsonValue::makeString(value));
            return *this;
        }

        inline Selector &eq(const std::string &field, const char *value) { return eq(field, std::string(value)); }

        inline Selector &eq(const std::string &field, int64_t value) {
            conditions_.emplace_back(field, ledger::JsonValue::makeNumber(std::to_string(value)));
            return *this;
        }

        inline Selector &eq(const std::string &field, bool value) {
            conditions_.emplace_back(field, ledger::JsonValue::makeBool(value));
            return *this;
        }

        inline bool matches(const ledger::JsonValue &doc) const {
            if (!doc.isObject())
                return false;
            for (const auto &[field, expected] : conditions_) {
                const ledger::JsonValue *actual = doc.find(field);
                if (actual == nullptr || actual->kind() != expected.kind())
                    return false;
                if (expected.isBool()) {
                    if (actual->asBool() != expected.asBool())
                        return false;
                } else if (expected.isNumber()) {
                    auto a = actual->asInt();
                    auto e = expected.asInt();
                    if (!a.is_ok() || !e.is_ok() || a.value() != e.value())
                        return false;
                } else if (actual->asString() != expected.asString()) {
                    return false;
                }
            }
            return true;
        }

        /// Parses the document first; unparseable documents never match
        inline bool matches(const std::string &document) const {
            auto parsed = ledger::JsonValue::parse(document);
            return parsed.is_ok() && matches(parsed.value());
        }

        inline bool empty() const { return conditions_.empty(); }

        /// CouchDB-style rendering for log lines: {"selector":{...}}
        inline std::string toJson() const {
            std::string inner = "{";
            bool first = true;
            for (const auto &[field, value] : conditions_) {
                if (!first)
                    inner += ",";
                inner += ledger::JsonSerializer::quote(field) + ":" + value.dump();
                first = false;
            }
            inner += "}";
            return "{\"selector\":" + inner + "}";
        }

      private:
        std::vector<std::pair<std::string, ledger::JsonValue>> conditions_;
    };

    // ===========================================
    // RecordStore - keyed store contract
    // ===========================================

    /// Durable keyed document store with per-invocation atomicity and a per-key write log.
    /// Writes are only accepted between begin() and commit()/rollback(); reads inside a unit of work
    /// see committed state plus that unit's own pending writes.
    class RecordStore {
      public:
        virtual ~RecordStore() = default;

        /// Start a unit of work. Revisions written by it carry tx_id and timestamp.
        virtual dp::Result<void, dp::Error> begin(const std::string &tx_id, int64_t timestamp) = 0;

        /// Apply all pending writes atomically; fails with StoreFailure on a version conflict
        virtual dp::Result<void, dp::Error> commit() = 0;

        /// Discard all pending writes
        virtual void rollback() = 0;

        virtual bool inTransaction() const = 0;

        virtual dp::Result<void, dp::Error> put(const std::string &key, const std::string &document) = 0;

        /// Write a tombstone revision
        virtual dp::Result<void, dp::Error> remove(const std::string &key) = 0;

        virtual dp::Result<std::optional<std::string>, dp::Error> get(const std::string &key) = 0;

        virtual dp::Result<std::vector<QueryRecord>, dp::Error> query(const Selector &selector) = 0;

        /// Committed revisions of a key, oldest first
        virtual dp::Result<std::vector<Revision>, dp::Error> history(const std::string &key) = 0;
    };

    // ===========================================
    // Transaction management (RAII)
    // ===========================================

    class TxGuard {
      public:
        explicit TxGuard(RecordStore &store) : store_(store), active_(false) {}

        ~TxGuard() {
            if (active_)
                store_.rollback();
        }

        TxGuard(const TxGuard &) = delete;
        TxGuard &operator=(const TxGuard &) = delete;

        inline dp::Result<void, dp::Error> begin(const std::string &tx_id, int64_t timestamp) {
            auto result = store_.begin(tx_id, timestamp);
            active_ = result.is_ok();
            return result;
        }

        inline dp::Result<void, dp::Error> commit() {
            if (!active_)
                return dp::Result<void, dp::Error>::err(store_failure("No active transaction"));
            active_ = false;
            return store_.commit();
        }

        inline void rollback() {
            if (active_) {
                store_.rollback();
                active_ = false;
            }
        }

      private:
        RecordStore &store_;
        bool active_;
    };

    // ===========================================
    // BufferedRecordStore - shared unit-of-work logic
    // ===========================================

    /// Buffers writes in memory and hands them to the backend in one CommitBatch.
    /// Backends implement the committed-state hooks; the backend must apply a batch all-or-nothing
    /// and reject it when a read version no longer matches.
    class BufferedRecordStore : public RecordStore {
      public:
        inline dp::Result<void, dp::Error> begin(const std::string &tx_id, int64_t timestamp) override {
            std::unique_lock lock(mutex_);
            if (!isReady())
                return dp::Result<void, dp::Error>::err(store_failure("Store not open"));
            if (in_tx_) {
                return dp::Result<void, dp::Error>::err(
                    store_failure(errorText("Transaction " + batch_.tx_id + " already in progress")));
            }
            if (tx_id.empty())
                return dp::Result<void, dp::Error>::err(store_failure("Transaction id must not be empty"));
            auto refreshed = onBegin();
            if (!refreshed.is_ok())
                return refreshed;
            batch_ = CommitBatch{};
            batch_.tx_id = tx_id;
            batch_.timestamp = timestamp;
            write_index_.clear();
            in_tx_ = true;
            return dp::Result<void, dp::Error>::ok();
        }

        inline dp::Result<void, dp::Error> commit() override {
            std::unique_lock lock(mutex_);
            if (!in_tx_)
                return dp::Result<void, dp::Error>::err(store_failure("No active transaction"));
            in_tx_ = false;
            CommitBatch batch = std::move(batch_);
            batch_ = CommitBatch{};
            write_index_.clear();
            if (batch.writes.empty())
                return dp::Result<void, dp::Error>::ok();
            return applyCommit(batch);
        }

        inline void rollback() override {
            std::unique_lock lock(mutex_);
            in_tx_ = false;
            batch_ = CommitBatch{};
            write_index_.clear();
        }

        inline bool inTransaction() const override {
            std::shared_lock lock(mutex_);
            return in_tx_;
        }

        inline dp::Result<void, dp::Error> put(const std::string &key, const std::string &document) override {
            return bufferWrite(key, document);
        }

        inline dp::Result<void, dp::Error> remove(const std::string &key) override {
            return bufferWrite(key, std::nullopt);
        }

        inline dp::Result<std::optional<std::string>, dp::Error> get(const std::string &key) override {
            std::unique_lock lock(mutex_);
            if (!isReady())
                return dp::Result<std::optional<std::string>, dp::Error>::err(store_failure("Store not open"));

            // Pending writes of this unit of work win
            if (in_tx_) {
                auto it = write_index_.find(key);
                if (it != write_index_.end())
                    return dp::Result<std::optional<std::string>, dp::Error>::ok(batch_.writes[it->second].value);
            }

            auto latest = loadLatest(key);
            if (!latest.is_ok())
                return dp::Result<std::optional<std::string>, dp::Error>::err(latest.error());

            const auto &record = latest.value();
            if (in_tx_)
                noteRead(key, record.has_value() ? record->version : 0);
            if (!record.has_value())
                return dp::Result<std::optional<std::string>, dp::Error>::ok(std::nullopt);
            return dp::Result<std::optional<std::string>, dp::Error>::ok(record->value);
        }

        inline dp::Result<std::vector<QueryRecord>, dp::Error> query(const Selector &selector) override {
            std::unique_lock lock(mutex_);
            if (!isReady())
                return dp::Result<std::vector<QueryRecord>, dp::Error>::err(store_failure("Store not open"));

            auto committed = scanLatest();
            if (!committed.is_ok())
                return dp::Result<std::vector<QueryRecord>, dp::Error>::err(committed.error());

            std::map<std::string, std::string> view;
            std::unordered_map<std::string, int64_t> versions;
            for (const auto &record : committed.value()) {
                if (record.value.has_value()) {
                    view[record.key] = *record.value;
                    versions[record.key] = record.version;
                }
            }
            if (in_tx_) {
                for (const auto &write : batch_.writes) {
                    if (write.value.has_value())
                        view[write.key] = *write.value;
                    else
                        view.erase(write.key);
                }
            }

            std::vector<QueryRecord> out;
            for (const auto &[key, value] : view) {
                if (!selector.matches(value))
                    continue;
                if (in_tx_ && write_index_.find(key) == write_index_.end()) {
                    auto vit = versions.find(key);
                    noteRead(key, vit != versions.end() ? vit->second : 0);
                }
                out.push_back(QueryRecord{key, value});
            }
            return dp::Result<std::vector<QueryRecord>, dp::Error>::ok(std::move(out));
        }

        inline dp::Result<std::vector<Revision>, dp::Error> history(const std::string &key) override {
            std::shared_lock lock(mutex_);
            if (!isReady())
                return dp::Result<std::vector<Revision>, dp::Error>::err(store_failure("Store not open"));
            return loadHistory(key);
        }

      protected:
        /// Backend is open and usable
        virtual bool isReady() const = 0;

        /// Latest committed state of a key (a tombstone has no value), nullopt if never written
        virtual dp::Result<std::optional<StoredRecord>, dp::Error> loadLatest(const std::string &key) = 0;

        /// Latest committed state of every key
        virtual dp::Result<std::vector<StoredRecord>, dp::Error> scanLatest() = 0;

        virtual dp::Result<std::vector<Revision>, dp::Error> loadHistory(const std::string &key) = 0;

        /// Atomically verify read versions and append the batch
        virtual dp::Result<void, dp::Error> applyCommit(const CommitBatch &batch) = 0;

        /// Called under the write lock when a unit of work starts
        virtual dp::Result<void, dp::Error> onBegin() { return dp::Result<void, dp::Error>::ok(); }

        /// Version conflict check shared by the backends
        inline static dp::Result<void, dp::Error>
        checkReadVersions(const CommitBatch &batch, const std::unordered_map<std::string, int64_t> &current) {
            for (const auto &[key, seen] : batch.read_versions) {
                auto it = current.find(key);
                int64_t now = (it != current.end()) ? it->second : 0;
                if (now != seen) {
                    return dp::Result<void, dp::Error>::err(store_failure(
                        errorText("Version conflict on key '" + printableKey(key) + "': read version " +
                                  std::to_string(seen) + ", committed version " + std::to_string(now))));
                }
            }
            return dp::Result<void, dp::Error>::ok();
        }

        /// Composite keys embed NUL delimiters; swap them for '/' in messages
        inline static std::string printableKey(const std::string &key) {
            std::string out;
            for (char c : key) {
                if (c == '\0') {
                    if (!out.empty() && out.back() != '/')
                        out += '/';
                } else {
                    out += c;
                }
            }
            if (!out.empty() && out.back() == '/')
                out.pop_back();
            return out;
        }

        mutable std::shared_mutex mutex_;

      private:
        bool in_tx_ = false;
        CommitBatch batch_;
        std::unordered_map<std::string, size_t> write_index_;

        inline void noteRead(const std::string &key, int64_t version) {
            batch_.read_versions.emplace(key, version); // first observation wins
        }

        inline dp::Result<void, dp::Error> bufferWrite(const std::string &key, std::optional<std::string> value) {
            std::unique_lock lock(mutex_);
            if (!isReady())
                return dp::Result<void, dp::Error>::err(store_failure("Store not open"));
            if (!in_tx_)
                return dp::Result<void, dp::Error>::err(store_failure("Write outside of a transaction"));
            if (key.empty())
                return dp::Result<void, dp::Error>::err(store_failure("Key must not be empty"));

            auto it = write_index_.find(key);
            if (it != write_index_.end()) {
                batch_.writes[it->second].value = std::move(value);
            } else {
                write_index_[key] = batch_.writes.size();
                batch_.writes.push_back(PendingWrite{key, std::move(value)});
            }
            return dp::Result<void, dp::Error>::ok();
        }
    };

} // namespace vaxchain::storage
