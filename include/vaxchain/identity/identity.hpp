#pragma once

#include <map>
#include <string>
#include <vector>

#include <datapod/datapod.hpp>

#include "vaxchain/common/error.hpp"
#include "vaxchain/ledger/document.hpp"

namespace vaxchain {

    /// Closed set of caller roles
    enum class Role : dp::u8 {
        SuperAdmin = 0,
        ChainAdmin = 1,
        Manufacturer = 2,
        Distributor = 3,
        Chemist = 4,
    };

    inline std::string roleToString(Role role) {
        switch (role) {
        case Role::SuperAdmin:
            return "SuperAdmin";
        case Role::ChainAdmin:
            return "ChainAdmin";
        case Role::Manufacturer:
            return "Manufacturer";
        case Role::Distributor:
            return "Distributor";
        case Role::Chemist:
            return "Chemist";
        default:
            return "Unknown";
        }
    }

    /// Role claimed by a `userRole` attribute. The attribute carries the party document type tag.
    inline dp::Result<Role, dp::Error> roleFromTag(const std::string &tag) {
        auto type = ledger::docTypeFromString(tag);
        if (!type.is_ok() || !ledger::isPartyType(type.value())) {
            return dp::Result<Role, dp::Error>::err(permission_denied(errorText("Unrecognised role claim: '" + tag + "'")));
        }
        switch (type.value()) {
        case ledger::DocType::ChainAdmin:
            return dp::Result<Role, dp::Error>::ok(Role::ChainAdmin);
        case ledger::DocType::Manufacturer:
            return dp::Result<Role, dp::Error>::ok(Role::Manufacturer);
        case ledger::DocType::Distributor:
            return dp::Result<Role, dp::Error>::ok(Role::Distributor);
        default:
            return dp::Result<Role, dp::Error>::ok(Role::Chemist);
        }
    }

    /// Document type under which a role's party record is stored
    inline ledger::DocType roleDocType(Role role) {
        switch (role) {
        case Role::Manufacturer:
            return ledger::DocType::Manufacturer;
        case Role::Distributor:
            return ledger::DocType::Distributor;
        case Role::Chemist:
            return ledger::DocType::Chemist;
        default:
            return ledger::DocType::ChainAdmin;
        }
    }

    // ===========================================
    // Identity provider interface
    // ===========================================

    /// Authenticated caller of one invocation
    class IdentityResolver {
      public:
        virtual ~IdentityResolver() = default;

        /// Identity name of the caller
        virtual dp::Result<std::string, dp::Error> callerId() const = 0;

        /// Requested attributes of the caller's credential; missing attributes are absent from the map
        virtual dp::Result<std::map<std::string, std::string>, dp::Error>
        callerAttributes(const std::vector<std::string> &names) const = 0;
    };

    /// Fixed identity, used by embedders that authenticate callers themselves and by tests
    class StaticIdentity : public IdentityResolver {
      public:
        StaticIdentity() = default;

        inline StaticIdentity(std::string id, std::map<std::string, std::string> attributes = {})
            : id_(std::move(id)), attributes_(std::move(attributes)) {}

        /// Identity carrying a `userRole` claim for a party document type
        inline static StaticIdentity withRole(const std::string &id, ledger::DocType type,
                                              const std::string &role_attribute = "userRole") {
            return StaticIdentity(id, {{role_attribute, ledger::docTypeToString(type)}});
        }

        inline dp::Result<std::string, dp::Error> callerId() const override {
            if (id_.empty())
                return dp::Result<std::string, dp::Error>::err(permission_denied("Caller identity is not set"));
            return dp::Result<std::string, dp::Error>::ok(id_);
        }

        inline dp::Result<std::map<std::string, std::string>, dp::Error>
        callerAttributes(const std::vector<std::string> &names) const override {
            std::map<std::string, std::string> out;
            for (const auto &name : names) {
                auto it = attributes_.find(name);
                if (it != attributes_.end())
                    out[name] = it->second;
            }
            return dp::Result<std::map<std::string, std::string>, dp::Error>::ok(std::move(out));
        }

        inline void setAttribute(const std::string &name, const std::string &value) { attributes_[name] = value; }

      private:
        std::string id_;
        std::map<std::string, std::string> attributes_;
    };

} // namespace vaxchain
