#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <datapod/datapod.hpp>

#include "vaxchain/chain/batch.hpp"
#include "vaxchain/chain/catalog.hpp"
#include "vaxchain/chain/config.hpp"
#include "vaxchain/chain/context.hpp"
#include "vaxchain/chain/events.hpp"
#include "vaxchain/chain/history.hpp"
#include "vaxchain/chain/receipts.hpp"
#include "vaxchain/chain/registry.hpp"
#include "vaxchain/chain/transfer.hpp"
#include "vaxchain/chain/views.hpp"
#include "vaxchain/identity/identity.hpp"
#include "vaxchain/ledger/tx_id.hpp"
#include "vaxchain/storage/record_store.hpp"

namespace vaxchain {

    /// Invocation boundary of the supply chain.
    ///
    /// Every operation takes the authenticated caller and a JSON request body, runs as one store
    /// transaction and either commits or rolls back as a whole. Audit notifications queued by an
    /// operation reach the registered sinks only after its commit succeeded.
    class VaccineChain {
      public:
        using Clock = std::function<int64_t()>;

        explicit VaccineChain(storage::RecordStore &store, ChainConfig config = {});

        VaccineChain(const VaccineChain &) = delete;
        VaccineChain &operator=(const VaccineChain &) = delete;

        void addEventSink(std::shared_ptr<chain::EventSink> sink);

        /// Source of invocation timestamps (epoch seconds)
        void setClock(Clock clock);

        inline const ChainConfig &config() const { return config_; }

        // ===== Registry =====

        dp::Result<void, dp::Error> registerAdmin(const IdentityResolver &caller, const std::string &request);
        dp::Result<void, dp::Error> registerParty(const IdentityResolver &caller, const std::string &request);

        /// Request {"id","docType","status"}; status is the requested suspended flag
        dp::Result<void, dp::Error> changeStatus(const IdentityResolver &caller, const std::string &request);

        dp::Result<std::string, dp::Error> viewProfile(const IdentityResolver &caller);

        // ===== Catalog and batches =====

        dp::Result<std::string, dp::Error> addProduct(const IdentityResolver &caller, const std::string &request);

        /// Request {"id","status"}; status is the requested suspended flag
        dp::Result<void, dp::Error> setProductActive(const IdentityResolver &caller, const std::string &request);

        /// Returns the stored batch document
        dp::Result<std::string, dp::Error> createBatch(const IdentityResolver &caller, const std::string &request);

        // ===== Transfers (each returns the issued receipt) =====

        dp::Result<std::string, dp::Error> shipToDistributor(const IdentityResolver &caller,
                                                             const std::string &request);
        dp::Result<std::string, dp::Error> shipToChemist(const IdentityResolver &caller, const std::string &request);
        dp::Result<std::string, dp::Error> sellToCustomer(const IdentityResolver &caller, const std::string &request);

        // ===== Views =====

        dp::Result<std::string, dp::Error> productsByManufacturer(const IdentityResolver &caller);
        dp::Result<std::string, dp::Error> unitsByOwner(const IdentityResolver &caller);
        dp::Result<std::string, dp::Error> viewReceipt(const IdentityResolver &caller, const std::string &receipt_id);

        /// Custody trail of a unit as a JSON array. Open to anyone holding the unit id.
        dp::Result<std::string, dp::Error> trackUnit(const std::string &unit_id);
        dp::Result<std::vector<chain::HistoryEntry>, dp::Error> history(const std::string &unit_id);

      private:
        storage::RecordStore &store_;
        ChainConfig config_;
        Clock clock_;
        ledger::TxIdGenerator tx_ids_;

        // One unit of work at a time on the shared store handle
        std::mutex tx_mutex_;

        chain::EntityRegistry registry_;
        chain::ProductCatalog catalog_;
        chain::ReceiptBook receipts_;
        chain::BatchGenerator batches_;
        chain::TransferPipeline transfers_;
        chain::QueryViews views_;

        std::mutex sinks_mutex_;
        std::vector<std::shared_ptr<chain::EventSink>> sinks_;

        /// Runs fn inside one store transaction
        template <typename Fn>
        auto invoke(const IdentityResolver &caller, const std::string &operation, const std::string &request, Fn &&fn)
            -> decltype(fn(std::declval<chain::TxContext &>()));

        void publish(const std::vector<chain::Notification> &notifications);
    };

} // namespace vaxchain
