#pragma once

#include <string>
#include <vector>

#include <datapod/datapod.hpp>

#include "vaxchain/chain/catalog.hpp"
#include "vaxchain/chain/context.hpp"
#include "vaxchain/chain/registry.hpp"
#include "vaxchain/ledger/document.hpp"

namespace vaxchain::chain {

    /// Result of one batch submission
    struct CreatedBatch {
        ledger::Batch batch;
        std::vector<std::string> unit_ids; // carton-major, packet-minor
    };

    /// Fans one batch submission out into cartonQnty x cartonCapacity unit records
    class BatchGenerator {
      public:
        explicit BatchGenerator(const ProductCatalog &catalog) : catalog_(catalog) {}

        /// The caller's profile is updated with the advanced batch counter on success
        dp::Result<CreatedBatch, dp::Error> createBatch(TxContext &ctx, CallerProfile &manufacturer,
                                                        const ledger::Batch &input) const;

        // ===== Identifier scheme =====

        inline static std::string batchId(int64_t sequence) { return "B" + std::to_string(sequence); }

        inline static std::string cartonId(const std::string &batch_id, int64_t carton_index) {
            return batch_id + "_C" + std::to_string(carton_index);
        }

        inline static std::string unitId(const std::string &manufacturer_id, const std::string &carton_id,
                                         int64_t packet_index) {
            return manufacturer_id + "_" + carton_id + "_P" + std::to_string(packet_index);
        }

        /// Composite key of the batch record
        inline static ledger::RecordKey batchKey(const TxContext &ctx, const std::string &manufacturer_id,
                                                 const std::string &batch_id) {
            return ctx.key(manufacturer_id + "_" + batch_id, ledger::DocType::Batch);
        }

      private:
        const ProductCatalog &catalog_;
    };

} // namespace vaxchain::chain
