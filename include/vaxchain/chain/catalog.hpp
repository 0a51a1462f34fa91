#pragma once

#include <string>

#include <datapod/datapod.hpp>

#include "vaxchain/chain/context.hpp"
#include "vaxchain/chain/registry.hpp"
#include "vaxchain/ledger/document.hpp"

namespace vaxchain::chain {

    /// Manufacturer-scoped product definitions, keyed by (product id, manufacturer id)
    class ProductCatalog {
      public:
        /// Owner is forced to the calling manufacturer
        dp::Result<ledger::Product, dp::Error> addProduct(TxContext &ctx, const CallerProfile &caller,
                                                          const ledger::Product &product) const;

        dp::Result<ledger::Product, dp::Error> getActiveProduct(TxContext &ctx, const std::string &product_id,
                                                                const std::string &manufacturer_id) const;

        /// Only the owning manufacturer may suspend or reactivate a product
        dp::Result<void, dp::Error> setProductActive(TxContext &ctx, const CallerProfile &caller,
                                                     const std::string &product_id, bool active) const;

        inline static ledger::RecordKey productKey(const TxContext &ctx, const std::string &product_id,
                                                   const std::string &manufacturer_id) {
            return ledger::RecordKey::compound({product_id, manufacturer_id},
                                               ledger::docTypeToString(ledger::DocType::Item), ctx.config().key_index);
        }
    };

} // namespace vaxchain::chain
