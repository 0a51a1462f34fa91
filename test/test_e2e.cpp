#include "chain_fixture.hpp"

using namespace vaxchain;

namespace {

    /// Full supply path on any record store: onboard, catalog, one carton of two units, then every hop
    void runSupplyPath(storage::RecordStore &store) {
        VaccineChain vax(store);
        auto events = std::make_shared<chain::EventLog>();
        vax.addEventSink(events);
        int64_t now = 1700000000;
        vax.setClock([&now]() { return ++now; });

        StaticIdentity super_admin(vax.config().super_admin_id);
        auto admin = StaticIdentity::withRole("admin1", ledger::DocType::ChainAdmin);
        auto mfg = StaticIdentity::withRole("mfg1", ledger::DocType::Manufacturer);
        auto dist = StaticIdentity::withRole("dist1", ledger::DocType::Distributor);
        auto chem = StaticIdentity::withRole("chem1", ledger::DocType::Chemist);

        REQUIRE(vax.registerAdmin(super_admin, ChainFixture::party("admin1", "VACCINE_CHAIN_ADMIN")).is_ok());
        REQUIRE(vax.registerParty(admin, ChainFixture::party("mfg1", "MANUFACTURER")).is_ok());
        REQUIRE(vax.registerParty(admin, ChainFixture::party("dist1", "DISTRIBUTER")).is_ok());
        REQUIRE(vax.registerParty(admin, ChainFixture::party("chem1", "CHEMIST")).is_ok());

        REQUIRE(vax.addProduct(mfg, R"({"id":"p1","name":"Polio Vaccine","desc":"oral","type":"drops","price":3,)"
                                      R"("cartonCapacity":2,"packetCapacity":4,"docType":"ITEM"})")
                    .is_ok());

        auto batch = vax.createBatch(mfg, ChainFixture::batchRequest("p1", 1));
        REQUIRE(batch.is_ok());
        CHECK(batch.value().find(R"("id":"B0")") != std::string::npos);

        auto stock = vax.unitsByOwner(mfg);
        REQUIRE(stock.is_ok());
        CHECK(stock.value().find("mfg1_B0_C1_P1") != std::string::npos);
        CHECK(stock.value().find("mfg1_B0_C1_P2") != std::string::npos);
        CHECK(stock.value().find("mfg1_B0_C1_P3") == std::string::npos);

        auto to_dist = vax.shipToDistributor(mfg, ChainFixture::transfer("dist1", "cartonId", "B0_C1", 2));
        REQUIRE(to_dist.is_ok());
        CHECK(to_dist.value().find(R"("billAmount":16)") != std::string::npos);
        REQUIRE(events->size() == 1);
        CHECK(events->notifications()[0].payload.total_parcel_units == 2);

        auto to_chem = vax.shipToChemist(dist, ChainFixture::transfer("chem1", "packetId", "mfg1_B0_C1_P2", 3));
        REQUIRE(to_chem.is_ok());
        CHECK(to_chem.value().find(R"("billAmount":12)") != std::string::npos);

        auto sale = vax.sellToCustomer(chem, ChainFixture::transfer("patient-9", "packetId", "mfg1_B0_C1_P2", 50));
        REQUIRE(sale.is_ok());
        CHECK(sale.value().find(R"("billAmount":12)") != std::string::npos);

        CHECK(events->count(chain::DISTRIBUTOR_SHIPMENT_ALERT) == 1);
        CHECK(events->count(chain::CHEMIST_SHIPMENT_ALERT) == 1);
        CHECK(events->count(chain::CUSTOMER_SELLING_ALERT) == 1);

        auto trail = vax.history("mfg1_B0_C1_P2");
        REQUIRE(trail.is_ok());
        REQUIRE(trail.value().size() == 4);
        CHECK(trail.value()[0].owner == "mfg1");
        CHECK(trail.value()[1].owner == "dist1");
        CHECK(trail.value()[2].owner == "chem1");
        CHECK(trail.value()[3].owner == "patient-9");
        CHECK(trail.value()[3].status == "SoldToCustomer");

        auto remaining = vax.unitsByOwner(dist);
        REQUIRE(remaining.is_ok());
        CHECK(remaining.value().find("mfg1_B0_C1_P1") != std::string::npos);
        CHECK(remaining.value().find("mfg1_B0_C1_P2") == std::string::npos);
        CHECK(vax.unitsByOwner(mfg).value() == "[]");
    }

} // namespace

TEST_SUITE("End to end") {
    TEST_CASE("Supply path on the file store") {
        const std::string path = "test_e2e_file_store";
        std::filesystem::remove_all(path);
        {
            storage::FileStore store;
            REQUIRE(store.open(path).is_ok());
            runSupplyPath(store);
            store.close();
        }

        SUBCASE("State survives a reopen") {
            storage::FileStore reopened;
            REQUIRE(reopened.open(path).is_ok());
            VaccineChain vax(reopened);
            auto trail = vax.history("mfg1_B0_C1_P2");
            REQUIRE(trail.is_ok());
            CHECK(trail.value().size() == 4);

            auto chem = StaticIdentity::withRole("chem1", ledger::DocType::Chemist);
            auto resale = vax.sellToCustomer(chem, ChainFixture::transfer("patient-10", "packetId", "mfg1_B0_C1_P2", 1));
            REQUIRE_FALSE(resale.is_ok());
            CHECK(resale.error().code == ERR_NO_MATCHING_UNITS);
            reopened.close();
        }

        std::filesystem::remove_all(path);
    }

    TEST_CASE("Supply path on the SQLite store") {
        const std::string path = "test_e2e_sqlite.db";
        for (const auto &suffix : {"", "-wal", "-shm"})
            std::filesystem::remove(path + suffix);
        {
            storage::SqliteStore store;
            REQUIRE(store.open(path).is_ok());
            runSupplyPath(store);
            store.close();
        }
        for (const auto &suffix : {"", "-wal", "-shm"})
            std::filesystem::remove(path + suffix);
    }
}
