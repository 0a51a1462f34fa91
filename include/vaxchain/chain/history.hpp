#pragma once

#include <string>
#include <vector>

#include <datapod/datapod.hpp>

#include "vaxchain/ledger/json.hpp"
#include "vaxchain/storage/record_store.hpp"

namespace vaxchain::chain {

    /// One custody event derived from a unit's write log
    struct HistoryEntry {
        std::string id;
        std::string owner;
        std::string status;
        std::string tx_id;
        int64_t timestamp = 0;
        bool is_delete = false;

        inline std::string toJson() const {
            return ledger::JsonWriter()
                .field("id", id)
                .field("owner", owner)
                .field("status", status)
                .field("txId", tx_id)
                .field("timestamp", timestamp)
                .field("isDelete", is_delete)
                .str();
        }
    };

    /// Replays a unit key's revisions into its custody trail. Pure read.
    class HistoryReconstructor {
      public:
        explicit HistoryReconstructor(storage::RecordStore &store) : store_(store) {}

        /// Oldest first. NotFound without revisions, NotAnAsset when the key does not hold a unit.
        dp::Result<std::vector<HistoryEntry>, dp::Error> trackUnit(const std::string &unit_id) const;

        static std::string toJson(const std::vector<HistoryEntry> &entries);

      private:
        storage::RecordStore &store_;
    };

} // namespace vaxchain::chain
