#include <initializer_list>
#include <iostream>
#include <limits>
#include <vaxchain/chain/transfer.hpp>
#include <vaxchain/chain/validation.hpp>
#include <vaxchain/storage/record_store.hpp>

namespace vaxchain::chain {

    namespace {

        const TransferStep STEPS[] = {
            {Operation::ShipToDistributor, ledger::DocType::Distributor, "cartonId",
             ledger::AssetStatus::ReadyForDistribution, ledger::AssetStatus::ReceivedAtDistributor,
             DISTRIBUTOR_SHIPMENT_ALERT},
            {Operation::ShipToChemist, ledger::DocType::Chemist, "id", ledger::AssetStatus::ReceivedAtDistributor,
             ledger::AssetStatus::ChemistInventoryReceived, CHEMIST_SHIPMENT_ALERT},
            {Operation::SellToCustomer, std::nullopt, "id", ledger::AssetStatus::ChemistInventoryReceived,
             ledger::AssetStatus::SoldToCustomer, CUSTOMER_SELLING_ALERT},
        };

        /// Product of non-negative factors, ValidationError on overflow
        dp::Result<int64_t, dp::Error> checkedProduct(std::initializer_list<int64_t> factors) {
            int64_t product = 1;
            for (int64_t f : factors) {
                if (f > 0 && product > std::numeric_limits<int64_t>::max() / f)
                    return dp::Result<int64_t, dp::Error>::err(validation_error("Bill amount overflows"));
                product *= f;
            }
            return dp::Result<int64_t, dp::Error>::ok(product);
        }

    } // namespace

    dp::Result<TransferRequest, dp::Error> TransferRequest::fromJson(const std::string &json,
                                                                     const char *bundle_field) {
        auto parsed = ledger::parseObject(json);
        if (!parsed.is_ok())
            return dp::Result<TransferRequest, dp::Error>::err(parsed.error());

        TransferRequest request;
        ledger::FieldReader r(parsed.value());
        r.str("customerId", request.customer_id)
            .str(bundle_field, request.bundle_id)
            .i64("transactionDate", request.transaction_date)
            .i64("perUnitSellingPrice", request.per_unit_selling_price);
        if (!r.ok())
            return dp::Result<TransferRequest, dp::Error>::err(r.error());
        return dp::Result<TransferRequest, dp::Error>::ok(std::move(request));
    }

    const TransferStep *TransferPipeline::step(Operation op) {
        for (const auto &s : STEPS) {
            if (s.operation == op)
                return &s;
        }
        return nullptr;
    }

    dp::Result<TransferResult, dp::Error> TransferPipeline::run(TxContext &ctx, const CallerProfile &caller,
                                                                Operation op, const TransferRequest &request) const {
        const TransferStep *hop = step(op);
        if (hop == nullptr) {
            return dp::Result<TransferResult, dp::Error>::err(
                validation_error(errorText(operationToString(op) + " is not a transfer operation")));
        }
        return execute(ctx, caller, *hop, request);
    }

    dp::Result<TransferResult, dp::Error> TransferPipeline::shipToDistributor(TxContext &ctx,
                                                                              const CallerProfile &caller,
                                                                              const TransferRequest &request) const {
        return run(ctx, caller, Operation::ShipToDistributor, request);
    }

    dp::Result<TransferResult, dp::Error> TransferPipeline::shipToChemist(TxContext &ctx, const CallerProfile &caller,
                                                                          const TransferRequest &request) const {
        return run(ctx, caller, Operation::ShipToChemist, request);
    }

    dp::Result<TransferResult, dp::Error> TransferPipeline::sellToCustomer(TxContext &ctx, const CallerProfile &caller,
                                                                           const TransferRequest &request) const {
        return run(ctx, caller, Operation::SellToCustomer, request);
    }

    dp::Result<TransferResult, dp::Error> TransferPipeline::execute(TxContext &ctx, const CallerProfile &caller,
                                                                    const TransferStep &step,
                                                                    const TransferRequest &request) const {
        const std::string op_name = operationToString(step.operation);

        auto permitted = requireCapability(step.operation, caller.role);
        if (!permitted.is_ok())
            return dp::Result<TransferResult, dp::Error>::err(permitted.error());

        FieldCheck check;
        check.require("customerId", !request.customer_id.empty(), "is required")
            .require(step.match_field == std::string("cartonId") ? "cartonId" : "packetId", !request.bundle_id.empty(),
                     "is required")
            .require("perUnitSellingPrice", request.per_unit_selling_price >= 0, "must not be negative");
        auto valid = check.result();
        if (!valid.is_ok())
            return dp::Result<TransferResult, dp::Error>::err(valid.error());

        // Counterparty must be a registered, active party of the receiving role
        if (step.counterparty.has_value()) {
            auto counterparty = registry_.requireActive(ctx, request.customer_id, *step.counterparty);
            if (!counterparty.is_ok()) {
                std::cout << "Rejected " << op_name << " by " << caller.id() << ": "
                          << counterparty.error().message.c_str() << std::endl;
                return dp::Result<TransferResult, dp::Error>::err(counterparty.error());
            }
        }

        auto selector = storage::Selector()
                            .eq("owner", caller.id())
                            .eq(step.match_field, request.bundle_id)
                            .eq("docType", ledger::docTypeToString(ledger::DocType::Asset))
                            .eq("status", ledger::assetStatusToString(step.from));
        std::cout << "queryString: " << selector.toJson() << std::endl;

        auto matches = ctx.store().query(selector);
        if (!matches.is_ok())
            return dp::Result<TransferResult, dp::Error>::err(matches.error());
        if (matches.value().empty()) {
            std::cout << "Rejected " << op_name << " by " << caller.id() << ": no matching units" << std::endl;
            return dp::Result<TransferResult, dp::Error>::err(no_matching_units());
        }

        std::string product_id;
        std::string manufacturer_id;
        int64_t units = 0;
        for (const auto &record : matches.value()) {
            auto asset = ledger::decodeAs<ledger::Asset>(record.value);
            if (!asset.is_ok())
                return dp::Result<TransferResult, dp::Error>::err(asset.error());

            ledger::Asset unit = asset.value();
            unit.owner = request.customer_id;
            unit.status = step.to;
            auto saved = ctx.store().put(record.key, unit.toJson());
            if (!saved.is_ok()) {
                return dp::Result<TransferResult, dp::Error>::err(
                    store_failure(errorText("Shipment failed for asset " + unit.id + ": " +
                                            saved.error().message.c_str())));
            }
            product_id = unit.product_id;
            manufacturer_id = unit.manufacturer_id;
            ++units;
        }

        auto product = catalog_.getActiveProduct(ctx, product_id, manufacturer_id);
        if (!product.is_ok())
            return dp::Result<TransferResult, dp::Error>::err(product.error());
        const int64_t packet_capacity = product.value().packet_capacity;

        // Customer sales bill the catalog price; the other hops bill the negotiated price
        const int64_t unit_price = step.operation == Operation::SellToCustomer ? product.value().price
                                                                                : request.per_unit_selling_price;
        auto bill = step.operation == Operation::ShipToDistributor
                        ? checkedProduct({unit_price, packet_capacity, units})
                        : checkedProduct({unit_price, packet_capacity});
        if (!bill.is_ok())
            return dp::Result<TransferResult, dp::Error>::err(bill.error());

        auto receipt = receipts_.issue(ctx, request.bundle_id, caller.id(), request.customer_id, product_id,
                                       request.transaction_date, bill.value());
        if (!receipt.is_ok())
            return dp::Result<TransferResult, dp::Error>::err(receipt.error());

        TransferResult result;
        result.receipt = receipt.value();
        result.units = units;
        result.event.supplier_id = caller.id();
        result.event.customer_id = request.customer_id;
        result.event.transaction_date = request.transaction_date;
        result.event.per_unit_selling_price = unit_price;
        result.event.manufacturer_id = manufacturer_id;
        result.event.product_id = product_id;
        result.event.total_parcel_units = units;
        result.event.total_bill = bill.value();
        ctx.emit(step.event_name, result.event);

        std::cout << "Transfer " << op_name << " by " << caller.id() << " to " << request.customer_id << ": " << units
                  << " units, bill " << bill.value() << std::endl;
        return dp::Result<TransferResult, dp::Error>::ok(std::move(result));
    }

} // namespace vaxchain::chain
