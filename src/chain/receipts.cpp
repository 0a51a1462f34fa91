#include <iostream>
#include <vaxchain/chain/receipts.hpp>

namespace vaxchain::chain {

    namespace {

        bool isReceipt(const ledger::JsonValue &obj) {
            auto type = ledger::docTypeOf(obj);
            return type.is_ok() && type.value() == ledger::DocType::Receipt;
        }

    } // namespace

    dp::Result<ledger::Receipt, dp::Error> ReceiptBook::issue(TxContext &ctx, const std::string &bundle_id,
                                                              const std::string &supplier_id,
                                                              const std::string &customer_id,
                                                              const std::string &product_id, int64_t transaction_date,
                                                              int64_t bill_amount) const {
        auto key = ledger::RecordKey::flat(ctx.txId());
        auto existing = ctx.store().get(key.encode());
        if (!existing.is_ok())
            return dp::Result<ledger::Receipt, dp::Error>::err(existing.error());
        if (existing.value().has_value()) {
            return dp::Result<ledger::Receipt, dp::Error>::err(
                already_exists(errorText("Receipt already exists for transaction " + ctx.txId())));
        }

        ledger::Receipt receipt;
        receipt.id = ctx.txId();
        receipt.bundle_id = bundle_id;
        receipt.supplier_id = supplier_id;
        receipt.customer_id = customer_id;
        receipt.product_id = product_id;
        receipt.transaction_date = transaction_date;
        receipt.bill_amount = bill_amount;

        auto saved = ctx.save(key, receipt);
        if (!saved.is_ok())
            return dp::Result<ledger::Receipt, dp::Error>::err(saved.error());
        return dp::Result<ledger::Receipt, dp::Error>::ok(std::move(receipt));
    }

    dp::Result<std::string, dp::Error> ReceiptBook::view(TxContext &ctx, const CallerProfile &caller,
                                                         const std::string &receipt_id) const {
        auto raw = ctx.store().get(ledger::RecordKey::flat(receipt_id).encode());
        if (!raw.is_ok())
            return dp::Result<std::string, dp::Error>::err(raw.error());
        if (!raw.value().has_value()) {
            return dp::Result<std::string, dp::Error>::err(
                not_found(errorText("Receipt does not exist for ID: " + receipt_id)));
        }

        // Records of any other type are invisible through this view
        auto parsed = ledger::parseObject(*raw.value());
        if (!parsed.is_ok() || !isReceipt(parsed.value())) {
            return dp::Result<std::string, dp::Error>::err(
                not_found(errorText("Receipt does not exist for ID: " + receipt_id)));
        }

        auto receipt = ledger::Receipt::fromJson(parsed.value());
        if (!receipt.is_ok())
            return dp::Result<std::string, dp::Error>::err(receipt.error());

        if (receipt.value().supplier_id != caller.id() && receipt.value().customer_id != caller.id()) {
            std::cout << "Participant " << caller.id() << " denied access to receipt " << receipt_id << std::endl;
            return dp::Result<std::string, dp::Error>::err(not_authorized());
        }
        return dp::Result<std::string, dp::Error>::ok(*raw.value());
    }

} // namespace vaxchain::chain
