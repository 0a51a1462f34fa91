#pragma once

#include <optional>
#include <string>
#include <vector>

#include <datapod/datapod.hpp>

#include "vaxchain/chain/config.hpp"
#include "vaxchain/chain/events.hpp"
#include "vaxchain/common/error.hpp"
#include "vaxchain/identity/identity.hpp"
#include "vaxchain/ledger/document.hpp"
#include "vaxchain/ledger/record_key.hpp"
#include "vaxchain/storage/record_store.hpp"

namespace vaxchain::chain {

    /// State of one invocation: the open unit of work, the caller, and notifications queued until commit
    class TxContext {
      public:
        TxContext(storage::RecordStore &store, const IdentityResolver &identity, const ChainConfig &config,
                  std::string tx_id, int64_t timestamp)
            : store_(store), identity_(identity), config_(config), tx_id_(std::move(tx_id)), timestamp_(timestamp) {}

        TxContext(const TxContext &) = delete;
        TxContext &operator=(const TxContext &) = delete;

        inline storage::RecordStore &store() const { return store_; }
        inline const IdentityResolver &identity() const { return identity_; }
        inline const ChainConfig &config() const { return config_; }
        inline const std::string &txId() const { return tx_id_; }
        inline int64_t timestamp() const { return timestamp_; }

        /// Composite key in the configured index
        inline ledger::RecordKey key(const std::string &id, ledger::DocType type) const {
            return ledger::RecordKey::composite(id, ledger::docTypeToString(type), config_.key_index);
        }

        /// Load and decode a document; nullopt when the key is absent or deleted
        template <typename T> dp::Result<std::optional<T>, dp::Error> load(const ledger::RecordKey &key) {
            auto raw = store_.get(key.encode());
            if (!raw.is_ok())
                return dp::Result<std::optional<T>, dp::Error>::err(raw.error());
            if (!raw.value().has_value())
                return dp::Result<std::optional<T>, dp::Error>::ok(std::nullopt);

            auto doc = ledger::decodeAs<T>(*raw.value());
            if (!doc.is_ok())
                return dp::Result<std::optional<T>, dp::Error>::err(doc.error());
            return dp::Result<std::optional<T>, dp::Error>::ok(std::optional<T>(std::move(doc.value())));
        }

        template <typename T> dp::Result<void, dp::Error> save(const ledger::RecordKey &key, const T &doc) {
            return store_.put(key.encode(), doc.toJson());
        }

        inline void emit(const std::string &name, const AuditEvent &payload) {
            notifications_.push_back(Notification{name, tx_id_, payload});
        }

        inline const std::vector<Notification> &notifications() const { return notifications_; }

      private:
        storage::RecordStore &store_;
        const IdentityResolver &identity_;
        const ChainConfig &config_;
        std::string tx_id_;
        int64_t timestamp_;
        std::vector<Notification> notifications_;
    };

} // namespace vaxchain::chain
