#include <iostream>
#include <vaxchain/chain/catalog.hpp>
#include <vaxchain/chain/validation.hpp>

namespace vaxchain::chain {

    dp::Result<ledger::Product, dp::Error> ProductCatalog::addProduct(TxContext &ctx, const CallerProfile &caller,
                                                                      const ledger::Product &input) const {
        auto permitted = requireCapability(Operation::AddProduct, caller.role);
        if (!permitted.is_ok())
            return dp::Result<ledger::Product, dp::Error>::err(permitted.error());

        FieldCheck check;
        check.require("id", !input.id.empty(), "is required")
            .require("name", isValidName(input.name), "must contain only letters and spaces")
            .require("price", input.price >= 0, "must not be negative")
            .require("cartonCapacity", input.carton_capacity >= 0, "must not be negative")
            .require("packetCapacity", input.packet_capacity >= 0, "must not be negative");
        auto valid = check.result();
        if (!valid.is_ok())
            return dp::Result<ledger::Product, dp::Error>::err(valid.error());

        ledger::Product product = input;
        product.owner = caller.id();
        product.suspended = false;

        auto key = productKey(ctx, product.id, product.owner);
        auto existing = ctx.store().get(key.encode());
        if (!existing.is_ok())
            return dp::Result<ledger::Product, dp::Error>::err(existing.error());
        if (existing.value().has_value()) {
            return dp::Result<ledger::Product, dp::Error>::err(
                already_exists(errorText("Product " + product.id + " already exists for " + product.owner)));
        }

        auto saved = ctx.save(key, product);
        if (!saved.is_ok())
            return dp::Result<ledger::Product, dp::Error>::err(saved.error());

        std::cout << "Product " << product.id << " added by " << product.owner << std::endl;
        return dp::Result<ledger::Product, dp::Error>::ok(std::move(product));
    }

    dp::Result<ledger::Product, dp::Error> ProductCatalog::getActiveProduct(TxContext &ctx,
                                                                            const std::string &product_id,
                                                                            const std::string &manufacturer_id) const {
        auto loaded = ctx.load<ledger::Product>(productKey(ctx, product_id, manufacturer_id));
        if (!loaded.is_ok())
            return dp::Result<ledger::Product, dp::Error>::err(loaded.error());
        if (!loaded.value().has_value() || loaded.value()->owner != manufacturer_id) {
            return dp::Result<ledger::Product, dp::Error>::err(not_found(
                errorText("Product " + product_id + " does not exist for manufacturer " + manufacturer_id)));
        }
        if (loaded.value()->suspended) {
            return dp::Result<ledger::Product, dp::Error>::err(
                not_active(errorText("Product " + product_id + " is suspended")));
        }
        return dp::Result<ledger::Product, dp::Error>::ok(*loaded.value());
    }

    dp::Result<void, dp::Error> ProductCatalog::setProductActive(TxContext &ctx, const CallerProfile &caller,
                                                                 const std::string &product_id, bool active) const {
        auto permitted = requireCapability(Operation::SetProductActive, caller.role);
        if (!permitted.is_ok())
            return permitted;

        auto key = productKey(ctx, product_id, caller.id());
        auto loaded = ctx.load<ledger::Product>(key);
        if (!loaded.is_ok())
            return dp::Result<void, dp::Error>::err(loaded.error());
        if (!loaded.value().has_value()) {
            return dp::Result<void, dp::Error>::err(
                not_found(errorText("Product " + product_id + " does not exist for " + caller.id())));
        }

        ledger::Product product = *loaded.value();
        bool suspended = !active;
        if (product.suspended == suspended) {
            return dp::Result<void, dp::Error>::err(
                no_op(errorText(std::string("Status is already ") + (suspended ? "suspended" : "active"))));
        }

        product.suspended = suspended;
        auto saved = ctx.save(key, product);
        if (!saved.is_ok())
            return saved;

        std::cout << "Product " << product_id << " state changed to: " << (suspended ? "suspended" : "active")
                  << std::endl;
        return dp::Result<void, dp::Error>::ok();
    }

} // namespace vaxchain::chain
