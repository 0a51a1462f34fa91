#pragma once

#include <iostream>
#include <mutex>
#include <string>
#include <vector>

#include <datapod/datapod.hpp>

#include "vaxchain/common/error.hpp"
#include "vaxchain/ledger/json.hpp"

namespace vaxchain::chain {

    constexpr const char *DISTRIBUTOR_SHIPMENT_ALERT = "Distributor Shipment Alert";
    constexpr const char *CHEMIST_SHIPMENT_ALERT = "Chemist Shipment Alert";
    constexpr const char *CUSTOMER_SELLING_ALERT = "Customer Selling Alert";

    /// Payload of a transfer notification
    struct AuditEvent {
        std::string supplier_id;
        std::string customer_id;
        int64_t transaction_date = 0;
        int64_t per_unit_selling_price = 0;
        std::string manufacturer_id;
        std::string product_id;
        int64_t total_parcel_units = 0;
        int64_t total_bill = 0;

        inline std::string toJson() const {
            return ledger::JsonWriter()
                .field("supplierId", supplier_id)
                .field("customerId", customer_id)
                .field("transactionDate", transaction_date)
                .field("perUnitSellingPrice", per_unit_selling_price)
                .field("manufacturerId", manufacturer_id)
                .field("productId", product_id)
                .field("totalParcelUnits", total_parcel_units)
                .field("totalBill", total_bill)
                .str();
        }
    };

    /// Named notification queued by an operation and delivered after commit
    struct Notification {
        std::string name;
        std::string tx_id;
        AuditEvent payload;
    };

    // ===========================================
    // Event sinks
    // ===========================================

    class EventSink {
      public:
        virtual ~EventSink() = default;
        virtual dp::Result<void, dp::Error> publish(const Notification &notification) = 0;
    };

    /// Prints each notification as one line of JSON
    class StdoutEventSink : public EventSink {
      public:
        inline dp::Result<void, dp::Error> publish(const Notification &notification) override {
            std::cout << "[event] " << notification.name << " tx=" << notification.tx_id << " "
                      << notification.payload.toJson() << std::endl;
            return dp::Result<void, dp::Error>::ok();
        }
    };

    /// Keeps every delivered notification in memory
    class EventLog : public EventSink {
      public:
        inline dp::Result<void, dp::Error> publish(const Notification &notification) override {
            std::lock_guard<std::mutex> lock(mutex_);
            notifications_.push_back(notification);
            return dp::Result<void, dp::Error>::ok();
        }

        inline std::vector<Notification> notifications() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return notifications_;
        }

        inline size_t count(const std::string &name) const {
            std::lock_guard<std::mutex> lock(mutex_);
            size_t n = 0;
            for (const auto &notification : notifications_) {
                if (notification.name == name)
                    ++n;
            }
            return n;
        }

        inline size_t size() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return notifications_.size();
        }

        inline void clear() {
            std::lock_guard<std::mutex> lock(mutex_);
            notifications_.clear();
        }

      private:
        mutable std::mutex mutex_;
        std::vector<Notification> notifications_;
    };

} // namespace vaxchain::chain
