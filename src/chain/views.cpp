#include <vaxchain/chain/views.hpp>
#include <vaxchain/identity/capability.hpp>
#include <vaxchain/storage/record_store.hpp>

namespace vaxchain::chain {

    dp::Result<std::string, dp::Error> QueryViews::listOwned(TxContext &ctx, const std::string &owner,
                                                             ledger::DocType type) const {
        auto selector = storage::Selector().eq("owner", owner).eq("docType", ledger::docTypeToString(type));
        auto matches = ctx.store().query(selector);
        if (!matches.is_ok())
            return dp::Result<std::string, dp::Error>::err(matches.error());

        std::vector<std::string> documents;
        documents.reserve(matches.value().size());
        for (const auto &record : matches.value())
            documents.push_back(record.value);
        return dp::Result<std::string, dp::Error>::ok(ledger::joinJsonArray(documents));
    }

    dp::Result<std::string, dp::Error> QueryViews::productsByManufacturer(TxContext &ctx,
                                                                          const CallerProfile &caller) const {
        auto permitted = requireCapability(Operation::ProductsByManufacturer, caller.role);
        if (!permitted.is_ok())
            return dp::Result<std::string, dp::Error>::err(permitted.error());
        return listOwned(ctx, caller.id(), ledger::DocType::Item);
    }

    dp::Result<std::string, dp::Error> QueryViews::unitsByOwner(TxContext &ctx, const CallerProfile &caller) const {
        return listOwned(ctx, caller.id(), ledger::DocType::Asset);
    }

    dp::Result<std::string, dp::Error> QueryViews::viewReceipt(TxContext &ctx, const CallerProfile &caller,
                                                               const std::string &receipt_id) const {
        return receipts_.view(ctx, caller, receipt_id);
    }

} // namespace vaxchain::chain
