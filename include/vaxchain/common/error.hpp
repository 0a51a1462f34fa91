#pragma once

#include <datapod/datapod.hpp>
#include <string>

namespace vaxchain {

    // ===========================================
    // Vaxchain-specific error codes (100+)
    // ===========================================

    constexpr dp::u32 ERR_DECODE = 100;
    constexpr dp::u32 ERR_VALIDATION = 101;
    constexpr dp::u32 ERR_PERMISSION_DENIED = 102;
    constexpr dp::u32 ERR_NOT_FOUND = 103;
    constexpr dp::u32 ERR_ALREADY_EXISTS = 104;
    constexpr dp::u32 ERR_NOT_ACTIVE = 105;
    constexpr dp::u32 ERR_NO_MATCHING_UNITS = 106;
    constexpr dp::u32 ERR_NO_OP = 107;
    constexpr dp::u32 ERR_NOT_AUTHORIZED = 108;
    constexpr dp::u32 ERR_STORE_FAILURE = 109;
    constexpr dp::u32 ERR_NOT_AN_ASSET = 110;

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error decode_error(const dp::String &msg = "Malformed input") { return dp::Error{ERR_DECODE, msg}; }

    inline dp::Error validation_error(const dp::String &msg = "Validation failed") {
        return dp::Error{ERR_VALIDATION, msg};
    }

    inline dp::Error permission_denied(const dp::String &msg = "Permission denied") {
        return dp::Error{ERR_PERMISSION_DENIED, msg};
    }

    inline dp::Error not_found(const dp::String &msg = "Record not found") { return dp::Error{ERR_NOT_FOUND, msg}; }

    inline dp::Error already_exists(const dp::String &msg = "Record already exists") {
        return dp::Error{ERR_ALREADY_EXISTS, msg};
    }

    inline dp::Error not_active(const dp::String &msg = "Record is suspended") {
        return dp::Error{ERR_NOT_ACTIVE, msg};
    }

    inline dp::Error no_matching_units(const dp::String &msg = "No records found for transaction") {
        return dp::Error{ERR_NO_MATCHING_UNITS, msg};
    }

    inline dp::Error no_op(const dp::String &msg = "Status is unchanged") { return dp::Error{ERR_NO_OP, msg}; }

    inline dp::Error not_authorized(const dp::String &msg = "You are not authorized to view the receipt") {
        return dp::Error{ERR_NOT_AUTHORIZED, msg};
    }

    inline dp::Error store_failure(const dp::String &msg = "Record store failure") {
        return dp::Error{ERR_STORE_FAILURE, msg};
    }

    inline dp::Error not_an_asset(const dp::String &msg = "Tracking ID does not belong to an asset") {
        return dp::Error{ERR_NOT_AN_ASSET, msg};
    }

    /// std::string overloads, most call sites build messages with std::string
    inline dp::String errorText(const std::string &msg) { return dp::String(msg.c_str()); }

    /// Short name of an error code, used in log lines
    inline std::string errorName(dp::u32 code) {
        switch (code) {
        case ERR_DECODE:
            return "DecodeError";
        case ERR_VALIDATION:
            return "ValidationError";
        case ERR_PERMISSION_DENIED:
            return "PermissionDenied";
        case ERR_NOT_FOUND:
            return "NotFound";
        case ERR_ALREADY_EXISTS:
            return "AlreadyExists";
        case ERR_NOT_ACTIVE:
            return "NotActive";
        case ERR_NO_MATCHING_UNITS:
            return "NoMatchingUnits";
        case ERR_NO_OP:
            return "NoOp";
        case ERR_NOT_AUTHORIZED:
            return "NotAuthorized";
        case ERR_STORE_FAILURE:
            return "StoreFailure";
        case ERR_NOT_AN_ASSET:
            return "NotAnAsset";
        default:
            return "Error";
        }
    }

} // namespace vaxchain
