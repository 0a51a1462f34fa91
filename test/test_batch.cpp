#include "chain_fixture.hpp"

using namespace vaxchain;

TEST_SUITE("Batch generation") {
    TEST_CASE("Identifier scheme") {
        CHECK(chain::BatchGenerator::batchId(0) == "B0");
        CHECK(chain::BatchGenerator::cartonId("B3", 2) == "B3_C2");
        CHECK(chain::BatchGenerator::unitId("mfg1", "B3_C2", 7) == "mfg1_B3_C2_P7");
    }

    TEST_CASE("Units are generated carton by carton") {
        ChainFixture f("test_batch_units");
        f.onboard();
        f.addProduct("p1", 12, 3, 10);

        auto created = f.chain.createBatch(f.mfg, ChainFixture::batchRequest("p1", 2));
        REQUIRE(created.is_ok());
        CHECK(created.value().find(R"("id":"B0")") != std::string::npos);
        CHECK(created.value().find(R"("owner":"mfg1")") != std::string::npos);

        for (int carton = 1; carton <= 2; ++carton) {
            for (int packet = 1; packet <= 3; ++packet) {
                std::string id = "mfg1_B0_C" + std::to_string(carton) + "_P" + std::to_string(packet);
                CAPTURE(id);
                auto unit = f.unit(id);
                CHECK(unit.id == id);
                CHECK(unit.batch_id == "B0");
                CHECK(unit.carton_id == "B0_C" + std::to_string(carton));
                CHECK(unit.owner == "mfg1");
                CHECK(unit.manufacturer_id == "mfg1");
                CHECK(unit.product_id == "p1");
                CHECK(unit.status == ledger::AssetStatus::ReadyForDistribution);
                CHECK(unit.manufacturing_date == 1700000000);
                CHECK(unit.expiry_date == 1760000000);
            }
        }
        CHECK_FALSE(f.store.get("mfg1_B0_C3_P1").value().has_value());
        CHECK_FALSE(f.store.get("mfg1_B0_C1_P4").value().has_value());

        auto units = f.chain.unitsByOwner(f.mfg);
        REQUIRE(units.is_ok());
        auto parsed = ledger::JsonValue::parse(units.value());
        REQUIRE(parsed.is_ok());
        CHECK(parsed.value().items().size() == 6);

        auto batch = f.store.get(ledger::RecordKey::composite("mfg1_B0", "BATCH").encode());
        REQUIRE(batch.is_ok());
        REQUIRE(batch.value().has_value());
        CHECK(batch.value()->find(R"("cartonQnty":2)") != std::string::npos);
    }

    TEST_CASE("Batch counter") {
        ChainFixture f("test_batch_counter");
        f.onboard();
        f.addProduct("p1", 12, 1, 1);

        SUBCASE("Each batch takes the next sequence number") {
            auto first = f.chain.createBatch(f.mfg, ChainFixture::batchRequest("p1", 1));
            auto second = f.chain.createBatch(f.mfg, ChainFixture::batchRequest("p1", 1));
            REQUIRE(first.is_ok());
            REQUIRE(second.is_ok());
            CHECK(first.value().find(R"("id":"B0")") != std::string::npos);
            CHECK(second.value().find(R"("id":"B1")") != std::string::npos);
            CHECK(f.store.get("mfg1_B1_C1_P1").value().has_value());

            auto profile = f.chain.viewProfile(f.mfg);
            REQUIRE(profile.is_ok());
            CHECK(profile.value().find(R"("batchCount":2)") != std::string::npos);
        }

        SUBCASE("An empty batch still advances the counter") {
            auto empty = f.chain.createBatch(f.mfg, ChainFixture::batchRequest("p1", 0));
            REQUIRE(empty.is_ok());
            CHECK(empty.value().find(R"("id":"B0")") != std::string::npos);
            CHECK_FALSE(f.store.get("mfg1_B0_C1_P1").value().has_value());

            auto next = f.chain.createBatch(f.mfg, ChainFixture::batchRequest("p1", 1));
            REQUIRE(next.is_ok());
            CHECK(next.value().find(R"("id":"B1")") != std::string::npos);
        }

        SUBCASE("Rejected batches do not consume a sequence number") {
            CHECK_FALSE(f.chain.createBatch(f.mfg, ChainFixture::batchRequest("unknown", 1)).is_ok());
            auto created = f.chain.createBatch(f.mfg, ChainFixture::batchRequest("p1", 1));
            REQUIRE(created.is_ok());
            CHECK(created.value().find(R"("id":"B0")") != std::string::npos);
        }
    }

    TEST_CASE("Batch rejections") {
        ChainFixture f("test_batch_reject");
        f.onboard();
        f.addProduct("p1", 12, 2, 10);

        SUBCASE("Expiry must follow manufacture") {
            auto request = R"({"productId":"p1","manufacturingDate":1760000000,"expiryDate":1700000000,"cartonQnty":1})";
            auto invalid = f.chain.createBatch(f.mfg, request);
            REQUIRE_FALSE(invalid.is_ok());
            CHECK(invalid.error().code == ERR_VALIDATION);
        }

        SUBCASE("Negative carton quantity") {
            auto request = R"({"productId":"p1","manufacturingDate":1700000000,"expiryDate":1760000000,"cartonQnty":-1})";
            auto invalid = f.chain.createBatch(f.mfg, request);
            REQUIRE_FALSE(invalid.is_ok());
            CHECK(invalid.error().code == ERR_VALIDATION);
        }

        SUBCASE("Unknown product") {
            auto missing = f.chain.createBatch(f.mfg, ChainFixture::batchRequest("p9", 1));
            REQUIRE_FALSE(missing.is_ok());
            CHECK(missing.error().code == ERR_NOT_FOUND);
        }

        SUBCASE("Only manufacturers create batches") {
            auto denied = f.chain.createBatch(f.dist, ChainFixture::batchRequest("p1", 1));
            REQUIRE_FALSE(denied.is_ok());
            CHECK(denied.error().code == ERR_PERMISSION_DENIED);
        }

        SUBCASE("Suspended manufacturer") {
            REQUIRE(f.chain.changeStatus(f.admin, R"({"id":"mfg1","docType":"MANUFACTURER","status":true})").is_ok());
            auto blocked = f.chain.createBatch(f.mfg, ChainFixture::batchRequest("p1", 1));
            REQUIRE_FALSE(blocked.is_ok());
            CHECK(blocked.error().code == ERR_NOT_ACTIVE);
        }

        CHECK_FALSE(f.store.get("mfg1_B0_C1_P1").value().has_value());
    }
}
