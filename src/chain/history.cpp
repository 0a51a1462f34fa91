#include <vaxchain/chain/history.hpp>
#include <vaxchain/ledger/document.hpp>
#include <vaxchain/ledger/record_key.hpp>

namespace vaxchain::chain {

    dp::Result<std::vector<HistoryEntry>, dp::Error> HistoryReconstructor::trackUnit(const std::string &unit_id) const {
        auto revisions = store_.history(ledger::RecordKey::flat(unit_id).encode());
        if (!revisions.is_ok())
            return dp::Result<std::vector<HistoryEntry>, dp::Error>::err(revisions.error());
        if (revisions.value().empty()) {
            return dp::Result<std::vector<HistoryEntry>, dp::Error>::err(
                not_found(errorText("No history for key " + unit_id)));
        }

        std::vector<HistoryEntry> entries;
        bool checked = false;
        for (const auto &rev : revisions.value()) {
            HistoryEntry entry;
            entry.tx_id = rev.tx_id;
            entry.timestamp = rev.timestamp;
            entry.is_delete = rev.isDelete();

            if (rev.isDelete()) {
                entry.id = unit_id;
                entries.push_back(std::move(entry));
                continue;
            }

            auto parsed = ledger::parseObject(*rev.value);
            if (!checked) {
                // The first live revision decides whether the key is a unit at all
                auto type = parsed.is_ok() ? ledger::docTypeOf(parsed.value())
                                           : dp::Result<ledger::DocType, dp::Error>::err(parsed.error());
                if (!type.is_ok() || type.value() != ledger::DocType::Asset) {
                    return dp::Result<std::vector<HistoryEntry>, dp::Error>::err(
                        not_an_asset(errorText("This tracking ID does not belong to an asset: " + unit_id)));
                }
                checked = true;
            }
            if (!parsed.is_ok())
                return dp::Result<std::vector<HistoryEntry>, dp::Error>::err(parsed.error());

            auto asset = ledger::Asset::fromJson(parsed.value());
            if (!asset.is_ok())
                return dp::Result<std::vector<HistoryEntry>, dp::Error>::err(asset.error());

            entry.id = asset.value().id;
            entry.owner = asset.value().owner;
            entry.status = ledger::assetStatusToString(asset.value().status);
            entries.push_back(std::move(entry));
        }
        return dp::Result<std::vector<HistoryEntry>, dp::Error>::ok(std::move(entries));
    }

    std::string HistoryReconstructor::toJson(const std::vector<HistoryEntry> &entries) {
        std::vector<std::string> documents;
        documents.reserve(entries.size());
        for (const auto &entry : entries)
            documents.push_back(entry.toJson());
        return ledger::joinJsonArray(documents);
    }

} // namespace vaxchain::chain
