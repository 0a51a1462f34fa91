#pragma once

#include <string>

#include <datapod/datapod.hpp>

#include "vaxchain/chain/context.hpp"
#include "vaxchain/chain/registry.hpp"
#include "vaxchain/ledger/document.hpp"

namespace vaxchain::chain {

    /// Immutable per-transfer commercial records, keyed by the transaction id
    class ReceiptBook {
      public:
        /// Fails with AlreadyExists when the transaction already issued a receipt
        dp::Result<ledger::Receipt, dp::Error> issue(TxContext &ctx, const std::string &bundle_id,
                                                     const std::string &supplier_id, const std::string &customer_id,
                                                     const std::string &product_id, int64_t transaction_date,
                                                     int64_t bill_amount) const;

        /// Stored bytes of a receipt; only its supplier or customer may read it
        dp::Result<std::string, dp::Error> view(TxContext &ctx, const CallerProfile &caller,
                                                const std::string &receipt_id) const;
    };

} // namespace vaxchain::chain
