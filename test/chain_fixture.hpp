#pragma once

#include <doctest/doctest.h>

#include <filesystem>
#include <memory>
#include <string>

#include <vaxchain/vaxchain.hpp>

// Test helper: a chain on a fresh file store with the four standard parties onboarded
struct ChainFixture {
    std::string path;
    vaxchain::storage::FileStore store;
    vaxchain::VaccineChain chain;
    std::shared_ptr<vaxchain::chain::EventLog> events;
    int64_t now = 1700000000;

    vaxchain::StaticIdentity super_admin;
    vaxchain::StaticIdentity admin = vaxchain::StaticIdentity::withRole("admin1", vaxchain::ledger::DocType::ChainAdmin);
    vaxchain::StaticIdentity mfg = vaxchain::StaticIdentity::withRole("mfg1", vaxchain::ledger::DocType::Manufacturer);
    vaxchain::StaticIdentity dist = vaxchain::StaticIdentity::withRole("dist1", vaxchain::ledger::DocType::Distributor);
    vaxchain::StaticIdentity chem = vaxchain::StaticIdentity::withRole("chem1", vaxchain::ledger::DocType::Chemist);

    explicit ChainFixture(const std::string &name)
        : path(name + "_store"), chain(store), events(std::make_shared<vaxchain::chain::EventLog>()),
          super_admin(chain.config().super_admin_id) {
        cleanup();
        REQUIRE(store.open(path).is_ok());
        chain.addEventSink(events);
        chain.setClock([this]() { return ++now; });
    }

    ~ChainFixture() {
        store.close();
        cleanup();
    }

    void cleanup() {
        if (std::filesystem::exists(path)) {
            std::filesystem::remove_all(path);
        }
    }

    static std::string party(const std::string &id, const std::string &doc_type) {
        return R"({"id":")" + id + R"(","name":"Test Party","licenseNo":"LIC-)" + id + R"(","docType":")" +
               doc_type + R"("})";
    }

    void onboard() {
        REQUIRE(chain.registerAdmin(super_admin, party("admin1", "VACCINE_CHAIN_ADMIN")).is_ok());
        REQUIRE(chain.registerParty(admin, party("mfg1", "MANUFACTURER")).is_ok());
        REQUIRE(chain.registerParty(admin, party("dist1", "DISTRIBUTER")).is_ok());
        REQUIRE(chain.registerParty(admin, party("chem1", "CHEMIST")).is_ok());
    }

    void addProduct(const std::string &id, int64_t price, int64_t carton_capacity, int64_t packet_capacity) {
        std::string request = R"({"id":")" + id + R"(","name":"Flu Vaccine","desc":"d","type":"vial","price":)" +
                              std::to_string(price) + R"(,"cartonCapacity":)" + std::to_string(carton_capacity) +
                              R"(,"packetCapacity":)" + std::to_string(packet_capacity) + R"(,"docType":"ITEM"})";
        REQUIRE(chain.addProduct(mfg, request).is_ok());
    }

    static std::string batchRequest(const std::string &product_id, int64_t cartons) {
        return R"({"productId":")" + product_id +
               R"(","manufacturingDate":1700000000,"expiryDate":1760000000,"cartonQnty":)" +
               std::to_string(cartons) + "}";
    }

    static std::string transfer(const std::string &customer, const char *bundle_field, const std::string &bundle,
                                int64_t price) {
        return R"({"customerId":")" + customer + R"(",")" + bundle_field + R"(":")" + bundle +
               R"(","transactionDate":1700100000,"perUnitSellingPrice":)" + std::to_string(price) + "}";
    }

    /// Current stored document of a unit, decoded
    vaxchain::ledger::Asset unit(const std::string &unit_id) {
        auto raw = store.get(unit_id);
        REQUIRE(raw.is_ok());
        REQUIRE(raw.value().has_value());
        auto asset = vaxchain::ledger::decodeAs<vaxchain::ledger::Asset>(*raw.value());
        REQUIRE(asset.is_ok());
        return asset.value();
    }
};
