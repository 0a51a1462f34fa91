#pragma once

#include <optional>
#include <string>

#include <datapod/datapod.hpp>

#include "vaxchain/chain/catalog.hpp"
#include "vaxchain/chain/context.hpp"
#include "vaxchain/chain/events.hpp"
#include "vaxchain/chain/receipts.hpp"
#include "vaxchain/chain/registry.hpp"
#include "vaxchain/identity/capability.hpp"
#include "vaxchain/ledger/document.hpp"

namespace vaxchain::chain {

    /// One custody hop. bundle_id is a carton id for manufacturer shipments and a unit id otherwise.
    struct TransferRequest {
        std::string customer_id;
        std::string bundle_id;
        int64_t transaction_date = 0;
        int64_t per_unit_selling_price = 0;

        /// Decodes {customerId, cartonId|packetId, transactionDate, perUnitSellingPrice}
        static dp::Result<TransferRequest, dp::Error> fromJson(const std::string &json, const char *bundle_field);
    };

    struct TransferResult {
        ledger::Receipt receipt;
        int64_t units = 0;
        AuditEvent event;
    };

    /// Hop definition: who may call, who receives, which status moves to which
    struct TransferStep {
        Operation operation;
        std::optional<ledger::DocType> counterparty; // nullopt: end customer, not a registered party
        const char *match_field;                     // asset field compared with the bundle id
        ledger::AssetStatus from;
        ledger::AssetStatus to;
        const char *event_name;
    };

    /// Moves every matched unit to the next custodian and status, bills the hop and issues its receipt
    class TransferPipeline {
      public:
        TransferPipeline(const EntityRegistry &registry, const ProductCatalog &catalog, const ReceiptBook &receipts)
            : registry_(registry), catalog_(catalog), receipts_(receipts) {}

        /// Manufacturer to distributor, a whole carton. Bill = price x packetCapacity x units.
        dp::Result<TransferResult, dp::Error> shipToDistributor(TxContext &ctx, const CallerProfile &caller,
                                                                const TransferRequest &request) const;

        /// Distributor to chemist, one unit. Bill = price x packetCapacity.
        dp::Result<TransferResult, dp::Error> shipToChemist(TxContext &ctx, const CallerProfile &caller,
                                                            const TransferRequest &request) const;

        /// Chemist to end customer, one unit, billed at catalog price x packetCapacity
        dp::Result<TransferResult, dp::Error> sellToCustomer(TxContext &ctx, const CallerProfile &caller,
                                                             const TransferRequest &request) const;

        /// Hop definition for a transfer operation, nullptr for any other operation
        static const TransferStep *step(Operation op);

      private:
        const EntityRegistry &registry_;
        const ProductCatalog &catalog_;
        const ReceiptBook &receipts_;

        dp::Result<TransferResult, dp::Error> run(TxContext &ctx, const CallerProfile &caller, Operation op,
                                                  const TransferRequest &request) const;
        dp::Result<TransferResult, dp::Error> execute(TxContext &ctx, const CallerProfile &caller,
                                                      const TransferStep &step, const TransferRequest &request) const;
    };

} // namespace vaxchain::chain
