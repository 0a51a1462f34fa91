#pragma once

#include <string>
#include <tuple>

namespace vaxchain {

    /// Chain-wide settings
    struct ChainConfig {
        std::string super_admin_id = "vaxchain-superadmin"; // identity name allowed to onboard administrators
        std::string role_attribute = "userRole";            // credential attribute carrying the role tag
        std::string key_index = "IdDoctype";                // namespace of composite keys

        auto members() { return std::tie(super_admin_id, role_attribute, key_index); }
        auto members() const { return std::tie(super_admin_id, role_attribute, key_index); }
    };

} // namespace vaxchain
