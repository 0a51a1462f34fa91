#pragma once

#include <string>

#include <datapod/datapod.hpp>

#include "vaxchain/chain/context.hpp"
#include "vaxchain/chain/receipts.hpp"
#include "vaxchain/chain/registry.hpp"

namespace vaxchain::chain {

    /// Read-only listings. Results are JSON arrays of the stored documents, verbatim.
    class QueryViews {
      public:
        explicit QueryViews(const ReceiptBook &receipts) : receipts_(receipts) {}

        /// Products owned by the calling manufacturer
        dp::Result<std::string, dp::Error> productsByManufacturer(TxContext &ctx, const CallerProfile &caller) const;

        /// Units currently held by the caller
        dp::Result<std::string, dp::Error> unitsByOwner(TxContext &ctx, const CallerProfile &caller) const;

        dp::Result<std::string, dp::Error> viewReceipt(TxContext &ctx, const CallerProfile &caller,
                                                       const std::string &receipt_id) const;

        inline std::string viewProfile(const CallerProfile &caller) const { return caller.entity.toJson(); }

      private:
        const ReceiptBook &receipts_;

        dp::Result<std::string, dp::Error> listOwned(TxContext &ctx, const std::string &owner,
                                                     ledger::DocType type) const;
    };

} // namespace vaxchain::chain
