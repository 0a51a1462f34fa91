/**
 * Example: one vaccine carton from the factory floor to a customer
 *
 * This demo shows how to:
 * 1. Open a file-backed record store and attach the supply chain to it
 * 2. Onboard an administrator and the three supply-chain parties
 * 3. Register a product, produce a batch and move its units down the chain
 * 4. Track a unit's custody and read back a receipt
 */

#include <vaxchain/vaxchain.hpp>
#include <filesystem>
#include <iostream>
#include <memory>

using namespace vaxchain;

namespace {

    bool report(const char *step, const dp::Result<void, dp::Error> &result) {
        if (!result.is_ok()) {
            std::cerr << "  [FAIL] " << step << ": " << result.error().message.c_str() << "\n";
            return false;
        }
        std::cout << "  [OK] " << step << "\n";
        return true;
    }

    bool report(const char *step, const dp::Result<std::string, dp::Error> &result) {
        if (!result.is_ok()) {
            std::cerr << "  [FAIL] " << step << ": " << result.error().message.c_str() << "\n";
            return false;
        }
        std::cout << "  [OK] " << step << " -> " << result.value() << "\n";
        return true;
    }

} // namespace

int main() {
    std::cout << "=== vaxchain Supply Chain Demo ===\n\n";

    const std::string storage_path = "demo_vaxchain_store";
    if (std::filesystem::exists(storage_path)) {
        std::filesystem::remove_all(storage_path);
    }

    // ===========================================
    // Step 1: Storage and chain
    // ===========================================

    storage::FileStore store;
    storage::OpenOptions opts;
    opts.sync_mode = storage::OpenOptions::Synchronous::FULL;
    auto opened = store.open(storage_path, opts);
    if (!opened.is_ok()) {
        std::cerr << "Failed to open storage: " << opened.error().message.c_str() << "\n";
        return 1;
    }
    std::cout << "[OK] Storage opened at: " << storage_path << "\n\n";

    VaccineChain vax(store);
    vax.addEventSink(std::make_shared<chain::StdoutEventSink>());

    // ===========================================
    // Step 2: Parties
    // ===========================================

    std::cout << "Onboarding parties...\n";
    StaticIdentity super_admin(vax.config().super_admin_id);
    auto admin = StaticIdentity::withRole("admin1", ledger::DocType::ChainAdmin);
    auto factory = StaticIdentity::withRole("mfg1", ledger::DocType::Manufacturer);
    auto wholesaler = StaticIdentity::withRole("dist1", ledger::DocType::Distributor);
    auto pharmacy = StaticIdentity::withRole("chem1", ledger::DocType::Chemist);

    bool ok = report("admin1 registered",
                     vax.registerAdmin(super_admin, R"({"id":"admin1","name":"Chain Admin","licenseNo":"ADM-1",)"
                                                      R"("docType":"VACCINE_CHAIN_ADMIN"})"));
    ok = ok && report("mfg1 registered",
                      vax.registerParty(admin, R"({"id":"mfg1","name":"Northwind Biologics","licenseNo":"MFG-77",)"
                                                 R"("contactNo":"5550100","docType":"MANUFACTURER"})"));
    ok = ok && report("dist1 registered",
                      vax.registerParty(admin, R"({"id":"dist1","name":"Coldline Logistics","licenseNo":"DST-12",)"
                                                 R"("docType":"DISTRIBUTER"})"));
    ok = ok && report("chem1 registered",
                      vax.registerParty(admin, R"({"id":"chem1","name":"Corner Pharmacy","licenseNo":"CHM-3",)"
                                                 R"("emailId":"desk@corner.example","docType":"CHEMIST"})"));
    if (!ok)
        return 1;

    // ===========================================
    // Step 3: Product and batch
    // ===========================================

    std::cout << "\nManufacturing...\n";
    ok = report("product registered",
                vax.addProduct(factory, R"({"id":"p1","name":"Influenza Vaccine","desc":"Quadrivalent",)"
                                          R"("type":"vial","price":12,"cartonCapacity":4,"packetCapacity":10,)"
                                          R"("docType":"ITEM"})"));
    ok = ok && report("batch created", vax.createBatch(factory, R"({"productId":"p1","manufacturingDate":1700000000,)"
                                                                  R"("expiryDate":1760000000,"cartonQnty":2})"));
    if (!ok)
        return 1;

    // ===========================================
    // Step 4: Custody transfers
    // ===========================================

    std::cout << "\nShipping...\n";
    ok = report("carton B0_C1 shipped to dist1",
                vax.shipToDistributor(factory, R"({"customerId":"dist1","cartonId":"B0_C1",)"
                                                 R"("transactionDate":1700100000,"perUnitSellingPrice":9})"));
    ok = ok && report("unit shipped to chem1",
                      vax.shipToChemist(wholesaler, R"({"customerId":"chem1","packetId":"mfg1_B0_C1_P1",)"
                                                      R"("transactionDate":1700200000,"perUnitSellingPrice":11})"));

    auto sale = vax.sellToCustomer(pharmacy, R"({"customerId":"patient-42","packetId":"mfg1_B0_C1_P1",)"
                                               R"("transactionDate":1700300000})");
    ok = ok && report("unit sold to patient-42", sale);
    if (!ok)
        return 1;

    // A unit that has already been sold cannot move again
    auto resale = vax.sellToCustomer(pharmacy, R"({"customerId":"patient-43","packetId":"mfg1_B0_C1_P1",)"
                                                 R"("transactionDate":1700400000})");
    std::cout << "  [" << (resale.is_ok() ? "UNEXPECTED" : "OK") << "] resale rejected\n";

    // ===========================================
    // Step 5: Tracking and receipts
    // ===========================================

    std::cout << "\nTracking mfg1_B0_C1_P1...\n";
    auto trail = vax.history("mfg1_B0_C1_P1");
    if (!trail.is_ok()) {
        std::cerr << "Tracking failed: " << trail.error().message.c_str() << "\n";
        return 1;
    }
    for (const auto &entry : trail.value()) {
        std::cout << "  " << entry.timestamp << "  " << entry.status << "  owner=" << entry.owner << "\n";
    }

    std::cout << "\nReceipts...\n";
    auto receipt = ledger::decodeAs<ledger::Receipt>(sale.value());
    if (receipt.is_ok()) {
        report("chem1 reads its sale receipt", vax.viewReceipt(pharmacy, receipt.value().id));
        auto denied = vax.viewReceipt(wholesaler, receipt.value().id);
        std::cout << "  [" << (denied.is_ok() ? "UNEXPECTED" : "OK") << "] dist1 denied access\n";
    }

    report("units held by dist1", vax.unitsByOwner(wholesaler));

    store.close();
    std::cout << "\n=== Demo complete ===\n";
    return 0;
}
