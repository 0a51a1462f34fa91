#pragma once

#include <string>

#include "vaxchain/common/error.hpp"
#include "vaxchain/identity/identity.hpp"

namespace vaxchain {

    /// Every role-gated operation of the chain
    enum class Operation : dp::u8 {
        RegisterAdmin,
        RegisterParty,
        SetAdminActive,
        SetPartyActive,
        AddProduct,
        SetProductActive,
        CreateBatch,
        ShipToDistributor,
        ShipToChemist,
        SellToCustomer,
        ProductsByManufacturer,
    };

    inline std::string operationToString(Operation op) {
        switch (op) {
        case Operation::RegisterAdmin:
            return "registerAdmin";
        case Operation::RegisterParty:
            return "registerParty";
        case Operation::SetAdminActive:
            return "setAdminActive";
        case Operation::SetPartyActive:
            return "setPartyActive";
        case Operation::AddProduct:
            return "addProduct";
        case Operation::SetProductActive:
            return "setProductActive";
        case Operation::CreateBatch:
            return "createBatch";
        case Operation::ShipToDistributor:
            return "shipToDistributor";
        case Operation::ShipToChemist:
            return "shipToChemist";
        case Operation::SellToCustomer:
            return "sellToCustomer";
        case Operation::ProductsByManufacturer:
            return "productsByManufacturer";
        default:
            return "unknown";
        }
    }

    inline constexpr dp::u32 roleBit(Role role) { return 1u << static_cast<dp::u32>(role); }

    /// Roles allowed to invoke an operation, as a mask of roleBit() values
    struct Capability {
        Operation operation;
        dp::u32 roles;
    };

    // Operations absent here (profile, unit and receipt views) are open to any active party.
    inline const Capability *capabilityFor(Operation op) {
        static const Capability TABLE[] = {
            {Operation::RegisterAdmin, roleBit(Role::SuperAdmin)},
            {Operation::RegisterParty, roleBit(Role::ChainAdmin)},
            {Operation::SetAdminActive, roleBit(Role::SuperAdmin)},
            {Operation::SetPartyActive, roleBit(Role::ChainAdmin)},
            {Operation::AddProduct, roleBit(Role::Manufacturer)},
            {Operation::SetProductActive, roleBit(Role::Manufacturer)},
            {Operation::CreateBatch, roleBit(Role::Manufacturer)},
            {Operation::ShipToDistributor, roleBit(Role::Manufacturer)},
            {Operation::ShipToChemist, roleBit(Role::Distributor)},
            {Operation::SellToCustomer, roleBit(Role::Chemist)},
            {Operation::ProductsByManufacturer, roleBit(Role::Manufacturer)},
        };
        for (const auto &cap : TABLE) {
            if (cap.operation == op)
                return &cap;
        }
        return nullptr;
    }

    inline bool isPermitted(Operation op, Role role) {
        const Capability *cap = capabilityFor(op);
        if (cap == nullptr)
            return true;
        return (cap->roles & roleBit(role)) != 0;
    }

    /// Capability check performed once at operation entry
    inline dp::Result<void, dp::Error> requireCapability(Operation op, Role role) {
        if (!isPermitted(op, role)) {
            return dp::Result<void, dp::Error>::err(permission_denied(
                errorText("Permission denied: " + roleToString(role) + " may not call " + operationToString(op))));
        }
        return dp::Result<void, dp::Error>::ok();
    }

} // namespace vaxchain
