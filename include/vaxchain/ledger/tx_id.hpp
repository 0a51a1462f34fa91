#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include <datapod/datapod.hpp>
#include <keylock/keylock.hpp>

#include "vaxchain/common/error.hpp"

namespace vaxchain::ledger {

    /// Derives unique transaction ids: hex SHA-256 over caller, operation, request body, timestamp, a
    /// per-generator salt and a per-generator nonce. The salt (startup nanoseconds plus a random word) keeps
    /// generators on the same store, or across restarts, from repeating each other's ids.
    class TxIdGenerator {
      public:
        TxIdGenerator() : nonce_(0) {
            std::random_device rd;
            auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
                             std::chrono::system_clock::now().time_since_epoch())
                             .count();
            salt_ = std::to_string(nanos) + ":" + std::to_string(rd()) + ":" + std::to_string(rd());
        }

        explicit TxIdGenerator(std::string salt) : nonce_(0), salt_(std::move(salt)) {}

        inline dp::Result<std::string, dp::Error> next(const std::string &caller, const std::string &operation,
                                                       const std::string &request, int64_t timestamp) {
            uint64_t nonce = nonce_.fetch_add(1);

            std::string material;
            material.reserve(caller.size() + operation.size() + request.size() + 48);
            material += caller;
            material += '\x1f';
            material += operation;
            material += '\x1f';
            material += request;
            material += '\x1f';
            material += std::to_string(timestamp);
            material += '\x1f';
            material += std::to_string(nonce);
            material += '\x1f';
            material += salt_;

            keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
            std::vector<uint8_t> input(material.begin(), material.end());
            auto result = crypto.hash(input);
            if (!result.success) {
                return dp::Result<std::string, dp::Error>::err(store_failure("Failed to derive transaction id"));
            }
            return dp::Result<std::string, dp::Error>::ok(keylock::keylock::to_hex(result.data));
        }

        inline uint64_t issued() const { return nonce_.load(); }
        inline const std::string &salt() const { return salt_; }

      private:
        std::atomic<uint64_t> nonce_;
        std::string salt_;
    };

} // namespace vaxchain::ledger
