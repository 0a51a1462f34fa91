#include <iostream>
#include <vaxchain/chain/batch.hpp>
#include <vaxchain/chain/validation.hpp>

namespace vaxchain::chain {

    dp::Result<CreatedBatch, dp::Error> BatchGenerator::createBatch(TxContext &ctx, CallerProfile &manufacturer,
                                                                    const ledger::Batch &input) const {
        auto permitted = requireCapability(Operation::CreateBatch, manufacturer.role);
        if (!permitted.is_ok())
            return dp::Result<CreatedBatch, dp::Error>::err(permitted.error());

        FieldCheck check;
        check.require("productId", !input.product_id.empty(), "is required")
            .require("manufacturingDate", input.manufacturing_date != 0, "is required")
            .require("expiryDate", input.expiry_date != 0, "is required")
            .require("expiryDate", input.expiry_date > input.manufacturing_date, "must be after manufacturingDate")
            .require("cartonQnty", input.carton_qnty >= 0, "must not be negative");
        auto valid = check.result();
        if (!valid.is_ok())
            return dp::Result<CreatedBatch, dp::Error>::err(valid.error());

        const std::string &mfr_id = manufacturer.id();
        auto product = catalog_.getActiveProduct(ctx, input.product_id, mfr_id);
        if (!product.is_ok())
            return dp::Result<CreatedBatch, dp::Error>::err(product.error());

        CreatedBatch created;
        created.batch = input;
        created.batch.id = batchId(manufacturer.entity.batch_count);
        created.batch.owner = mfr_id;

        const int64_t cartons = created.batch.carton_qnty;
        const int64_t packets = product.value().carton_capacity;

        for (int64_t i = 1; i <= cartons; ++i) {
            std::string carton = cartonId(created.batch.id, i);
            for (int64_t j = 1; j <= packets; ++j) {
                ledger::Asset unit;
                unit.id = unitId(mfr_id, carton, j);
                unit.batch_id = created.batch.id;
                unit.carton_id = carton;
                unit.owner = mfr_id;
                unit.status = ledger::AssetStatus::ReadyForDistribution;
                unit.product_id = product.value().id;
                unit.manufacturer_id = mfr_id;
                unit.manufacturing_date = created.batch.manufacturing_date;
                unit.expiry_date = created.batch.expiry_date;

                auto saved = ctx.save(ledger::RecordKey::flat(unit.id), unit);
                if (!saved.is_ok())
                    return dp::Result<CreatedBatch, dp::Error>::err(saved.error());
                created.unit_ids.push_back(unit.id);
            }
        }

        auto batch_saved = ctx.save(batchKey(ctx, mfr_id, created.batch.id), created.batch);
        if (!batch_saved.is_ok())
            return dp::Result<CreatedBatch, dp::Error>::err(batch_saved.error());

        // Counter advances even for an empty batch
        ledger::Entity updated = manufacturer.entity;
        updated.batch_count += 1;
        auto party_saved = ctx.save(ctx.key(updated.id, updated.doc_type), updated);
        if (!party_saved.is_ok())
            return dp::Result<CreatedBatch, dp::Error>::err(party_saved.error());
        manufacturer.entity = updated;

        std::cout << "Batch " << created.batch.id << " created for " << mfr_id << ": " << created.unit_ids.size()
                  << " units" << std::endl;
        return dp::Result<CreatedBatch, dp::Error>::ok(std::move(created));
    }

} // namespace vaxchain::chain
