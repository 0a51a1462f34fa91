#pragma once

#include <optional>
#include <string>

#include <datapod/datapod.hpp>

#include "vaxchain/chain/context.hpp"
#include "vaxchain/identity/capability.hpp"
#include "vaxchain/identity/identity.hpp"
#include "vaxchain/ledger/document.hpp"

namespace vaxchain::chain {

    /// Authenticated caller resolved to its party record
    struct CallerProfile {
        ledger::Entity entity;
        Role role = Role::Manufacturer;

        inline const std::string &id() const { return entity.id; }
    };

    /// Onboarding and lifecycle of administrators and supply-chain parties
    class EntityRegistry {
      public:
        /// Super administrator only; admin.docType must be VACCINE_CHAIN_ADMIN
        dp::Result<void, dp::Error> registerAdmin(TxContext &ctx, const ledger::Entity &admin) const;

        /// Administrator only; entity.docType must be a supply-chain role
        dp::Result<void, dp::Error> registerParty(TxContext &ctx, const ledger::Entity &entity) const;

        /// Suspend or reactivate a party. Administrator targets need the super administrator.
        dp::Result<void, dp::Error> setActive(TxContext &ctx, const std::string &id, ledger::DocType type,
                                              bool active) const;

        /// Resolve the caller and its role claim to an active party record
        dp::Result<CallerProfile, dp::Error> getProfile(TxContext &ctx) const;

        /// Resolve the caller and require a capability for an operation
        dp::Result<CallerProfile, dp::Error> authorize(TxContext &ctx, Operation op) const;

        /// Counterparty lookup: NotFound when absent, NotActive when suspended
        dp::Result<ledger::Entity, dp::Error> requireActive(TxContext &ctx, const std::string &id,
                                                            ledger::DocType type) const;

        dp::Result<std::optional<ledger::Entity>, dp::Error> find(TxContext &ctx, const std::string &id,
                                                                  ledger::DocType type) const;

        /// Field rules shared by every registration
        static dp::Result<void, dp::Error> validate(const ledger::Entity &entity);

      private:
        dp::Result<void, dp::Error> requireSuperAdmin(TxContext &ctx, Operation op) const;
        dp::Result<void, dp::Error> insert(TxContext &ctx, ledger::Entity entity) const;
    };

} // namespace vaxchain::chain
