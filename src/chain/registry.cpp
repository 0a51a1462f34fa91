#include <iostream>
#include <vaxchain/chain/registry.hpp>
#include <vaxchain/chain/validation.hpp>

namespace vaxchain::chain {

    dp::Result<void, dp::Error> EntityRegistry::validate(const ledger::Entity &entity) {
        FieldCheck check;
        check.require("id", !entity.id.empty(), "is required")
            .require("name", isValidName(entity.name), "must contain only letters and spaces")
            .require("licenseNo", !entity.license_no.empty(), "is required")
            .require("contactNo", entity.contact_no.empty() || isValidNumber(entity.contact_no),
                     "must contain only digits")
            .require("emailId", entity.email_id.empty() || isValidEmail(entity.email_id),
                     "must be a valid email address");
        return check.result();
    }

    dp::Result<void, dp::Error> EntityRegistry::requireSuperAdmin(TxContext &ctx, Operation op) const {
        auto caller = ctx.identity().callerId();
        if (!caller.is_ok())
            return dp::Result<void, dp::Error>::err(caller.error());
        if (caller.value() != ctx.config().super_admin_id) {
            std::cout << "Unauthorized participant: " << caller.value() << " cannot " << operationToString(op)
                      << std::endl;
            return dp::Result<void, dp::Error>::err(
                permission_denied("Permission denied: only the super admin can call this function"));
        }
        return requireCapability(op, Role::SuperAdmin);
    }

    dp::Result<void, dp::Error> EntityRegistry::insert(TxContext &ctx, ledger::Entity entity) const {
        auto key = ctx.key(entity.id, entity.doc_type);
        auto existing = ctx.store().get(key.encode());
        if (!existing.is_ok())
            return dp::Result<void, dp::Error>::err(existing.error());
        if (existing.value().has_value()) {
            return dp::Result<void, dp::Error>::err(already_exists(
                errorText("Record already exists for " + entity.id + " as " + ledger::docTypeToString(entity.doc_type))));
        }

        entity.suspended = false;
        entity.batch_count = 0;
        auto saved = ctx.save(key, entity);
        if (!saved.is_ok())
            return saved;

        std::cout << "Participant " << entity.id << " registered as " << ledger::docTypeToString(entity.doc_type)
                  << std::endl;
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> EntityRegistry::registerAdmin(TxContext &ctx, const ledger::Entity &admin) const {
        auto permitted = requireSuperAdmin(ctx, Operation::RegisterAdmin);
        if (!permitted.is_ok())
            return permitted;

        if (admin.doc_type != ledger::DocType::ChainAdmin) {
            return dp::Result<void, dp::Error>::err(
                validation_error("Invalid input: docType must be VACCINE_CHAIN_ADMIN"));
        }
        auto valid = validate(admin);
        if (!valid.is_ok())
            return valid;

        return insert(ctx, admin);
    }

    dp::Result<void, dp::Error> EntityRegistry::registerParty(TxContext &ctx, const ledger::Entity &entity) const {
        auto caller = authorize(ctx, Operation::RegisterParty);
        if (!caller.is_ok())
            return dp::Result<void, dp::Error>::err(caller.error());

        if (entity.doc_type == ledger::DocType::ChainAdmin) {
            return dp::Result<void, dp::Error>::err(
                validation_error("Invalid input: docType must be one of MANUFACTURER, DISTRIBUTER, CHEMIST"));
        }
        auto valid = validate(entity);
        if (!valid.is_ok())
            return valid;

        return insert(ctx, entity);
    }

    dp::Result<void, dp::Error> EntityRegistry::setActive(TxContext &ctx, const std::string &id, ledger::DocType type,
                                                          bool active) const {
        if (!ledger::isPartyType(type)) {
            return dp::Result<void, dp::Error>::err(
                validation_error(errorText("Invalid input: docType " + ledger::docTypeToString(type) + " is not a party")));
        }

        if (type == ledger::DocType::ChainAdmin) {
            auto permitted = requireSuperAdmin(ctx, Operation::SetAdminActive);
            if (!permitted.is_ok())
                return permitted;
        } else {
            auto caller = authorize(ctx, Operation::SetPartyActive);
            if (!caller.is_ok())
                return dp::Result<void, dp::Error>::err(caller.error());
        }

        auto key = ctx.key(id, type);
        auto loaded = ctx.load<ledger::Entity>(key);
        if (!loaded.is_ok())
            return dp::Result<void, dp::Error>::err(loaded.error());
        if (!loaded.value().has_value())
            return dp::Result<void, dp::Error>::err(not_found(errorText("Record for " + id + " user does not exist")));

        ledger::Entity entity = *loaded.value();
        bool suspended = !active;
        if (entity.suspended == suspended) {
            return dp::Result<void, dp::Error>::err(
                no_op(errorText(std::string("Status is already ") + (suspended ? "suspended" : "active"))));
        }

        entity.suspended = suspended;
        auto saved = ctx.save(key, entity);
        if (!saved.is_ok())
            return saved;

        std::cout << "Participant " << id << " state changed to: " << (suspended ? "suspended" : "active")
                  << std::endl;
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<CallerProfile, dp::Error> EntityRegistry::getProfile(TxContext &ctx) const {
        auto caller = ctx.identity().callerId();
        if (!caller.is_ok())
            return dp::Result<CallerProfile, dp::Error>::err(caller.error());

        const std::string &attribute = ctx.config().role_attribute;
        auto attributes = ctx.identity().callerAttributes({attribute});
        if (!attributes.is_ok())
            return dp::Result<CallerProfile, dp::Error>::err(attributes.error());

        auto claim = attributes.value().find(attribute);
        if (claim == attributes.value().end()) {
            return dp::Result<CallerProfile, dp::Error>::err(
                permission_denied(errorText("Caller " + caller.value() + " has no " + attribute + " attribute")));
        }

        auto role = roleFromTag(claim->second);
        if (!role.is_ok())
            return dp::Result<CallerProfile, dp::Error>::err(role.error());

        auto entity = requireActive(ctx, caller.value(), roleDocType(role.value()));
        if (!entity.is_ok())
            return dp::Result<CallerProfile, dp::Error>::err(entity.error());

        CallerProfile profile;
        profile.entity = entity.value();
        profile.role = role.value();
        return dp::Result<CallerProfile, dp::Error>::ok(std::move(profile));
    }

    dp::Result<CallerProfile, dp::Error> EntityRegistry::authorize(TxContext &ctx, Operation op) const {
        auto profile = getProfile(ctx);
        if (!profile.is_ok())
            return profile;

        auto permitted = requireCapability(op, profile.value().role);
        if (!permitted.is_ok()) {
            std::cout << "Participant " << profile.value().id() << " lacks capability: " << operationToString(op)
                      << std::endl;
            return dp::Result<CallerProfile, dp::Error>::err(permitted.error());
        }
        return profile;
    }

    dp::Result<std::optional<ledger::Entity>, dp::Error> EntityRegistry::find(TxContext &ctx, const std::string &id,
                                                                              ledger::DocType type) const {
        return ctx.load<ledger::Entity>(ctx.key(id, type));
    }

    dp::Result<ledger::Entity, dp::Error> EntityRegistry::requireActive(TxContext &ctx, const std::string &id,
                                                                        ledger::DocType type) const {
        auto found = find(ctx, id, type);
        if (!found.is_ok())
            return dp::Result<ledger::Entity, dp::Error>::err(found.error());
        if (!found.value().has_value()) {
            return dp::Result<ledger::Entity, dp::Error>::err(
                not_found(errorText("Record for " + id + " as " + ledger::docTypeToString(type) + " does not exist")));
        }
        if (found.value()->suspended) {
            return dp::Result<ledger::Entity, dp::Error>::err(
                not_active(errorText("Record for " + id + " is suspended")));
        }
        return dp::Result<ledger::Entity, dp::Error>::ok(*found.value());
    }

} // namespace vaxchain::chain
