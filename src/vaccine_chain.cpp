#include <iostream>
#include <vaxchain/vaccine_chain.hpp>

namespace vaxchain {

    namespace {

        /// Decode a document request body
        template <typename T> dp::Result<T, dp::Error> decodeRequest(const std::string &request) {
            auto parsed = ledger::parseObject(request);
            if (!parsed.is_ok())
                return dp::Result<T, dp::Error>::err(parsed.error());
            return T::fromJson(parsed.value());
        }

        /// Suspension toggle request: {"id", ["docType",] "status"}
        struct StatusRequest {
            std::string id;
            std::string doc_type;
            bool suspended = false;

            static dp::Result<StatusRequest, dp::Error> fromJson(const ledger::JsonValue &obj) {
                StatusRequest request;
                ledger::FieldReader r(obj);
                r.str("id", request.id).str("docType", request.doc_type).boolean("status", request.suspended);
                if (!r.ok())
                    return dp::Result<StatusRequest, dp::Error>::err(r.error());
                if (request.id.empty())
                    return dp::Result<StatusRequest, dp::Error>::err(validation_error("Invalid input: id is required"));
                if (obj.find("status") == nullptr) {
                    return dp::Result<StatusRequest, dp::Error>::err(
                        validation_error("Invalid input: status is required"));
                }
                return dp::Result<StatusRequest, dp::Error>::ok(std::move(request));
            }
        };

        dp::Result<std::string, dp::Error> receiptJson(const dp::Result<chain::TransferResult, dp::Error> &result) {
            if (!result.is_ok())
                return dp::Result<std::string, dp::Error>::err(result.error());
            return dp::Result<std::string, dp::Error>::ok(result.value().receipt.toJson());
        }

    } // namespace

    VaccineChain::VaccineChain(storage::RecordStore &store, ChainConfig config)
        : store_(store), config_(std::move(config)), clock_(storage::currentTimestamp), batches_(catalog_),
          transfers_(registry_, catalog_, receipts_), views_(receipts_) {}

    void VaccineChain::addEventSink(std::shared_ptr<chain::EventSink> sink) {
        if (!sink)
            return;
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        sinks_.push_back(std::move(sink));
    }

    void VaccineChain::setClock(Clock clock) {
        if (clock)
            clock_ = std::move(clock);
    }

    // ===========================================
    // Invocation
    // ===========================================

    template <typename Fn>
    auto VaccineChain::invoke(const IdentityResolver &caller, const std::string &operation, const std::string &request,
                              Fn &&fn) -> decltype(fn(std::declval<chain::TxContext &>())) {
        using R = decltype(fn(std::declval<chain::TxContext &>()));

        std::unique_lock<std::mutex> tx_lock(tx_mutex_);
        const int64_t timestamp = clock_();
        auto who = caller.callerId();
        const std::string caller_id = who.is_ok() ? who.value() : std::string("<anonymous>");

        auto tx_id = tx_ids_.next(caller_id, operation, request, timestamp);
        if (!tx_id.is_ok())
            return R::err(tx_id.error());

        storage::TxGuard guard(store_);
        auto begun = guard.begin(tx_id.value(), timestamp);
        if (!begun.is_ok()) {
            std::cerr << "Failed to begin " << operation << ": " << begun.error().message.c_str() << std::endl;
            return R::err(begun.error());
        }

        chain::TxContext ctx(store_, caller, config_, tx_id.value(), timestamp);
        auto result = fn(ctx);
        if (!result.is_ok()) {
            guard.rollback();
            std::cout << "Rejected " << operation << " by " << caller_id << " [" << errorName(result.error().code)
                      << "]: " << result.error().message.c_str() << std::endl;
            return result;
        }

        auto committed = guard.commit();
        if (!committed.is_ok()) {
            std::cerr << "Commit failed for " << operation << " tx " << tx_id.value() << ": "
                      << committed.error().message.c_str() << std::endl;
            return R::err(committed.error());
        }

        tx_lock.unlock();
        publish(ctx.notifications());
        std::cout << "Committed " << operation << " by " << caller_id << " tx " << tx_id.value() << std::endl;
        return result;
    }

    void VaccineChain::publish(const std::vector<chain::Notification> &notifications) {
        if (notifications.empty())
            return;
        std::vector<std::shared_ptr<chain::EventSink>> sinks;
        {
            std::lock_guard<std::mutex> lock(sinks_mutex_);
            sinks = sinks_;
        }
        for (const auto &notification : notifications) {
            for (const auto &sink : sinks) {
                auto delivered = sink->publish(notification);
                if (!delivered.is_ok()) {
                    std::cerr << "Event sink failed for " << notification.name << " tx " << notification.tx_id << ": "
                              << delivered.error().message.c_str() << std::endl;
                }
            }
        }
    }

    // ===========================================
    // Registry
    // ===========================================

    dp::Result<void, dp::Error> VaccineChain::registerAdmin(const IdentityResolver &caller,
                                                            const std::string &request) {
        return invoke(caller, "registerAdmin", request, [&](chain::TxContext &ctx) {
            auto admin = decodeRequest<ledger::Entity>(request);
            if (!admin.is_ok())
                return dp::Result<void, dp::Error>::err(admin.error());
            return registry_.registerAdmin(ctx, admin.value());
        });
    }

    dp::Result<void, dp::Error> VaccineChain::registerParty(const IdentityResolver &caller,
                                                            const std::string &request) {
        return invoke(caller, "registerParty", request, [&](chain::TxContext &ctx) {
            auto party = decodeRequest<ledger::Entity>(request);
            if (!party.is_ok())
                return dp::Result<void, dp::Error>::err(party.error());
            return registry_.registerParty(ctx, party.value());
        });
    }

    dp::Result<void, dp::Error> VaccineChain::changeStatus(const IdentityResolver &caller,
                                                           const std::string &request) {
        return invoke(caller, "changeStatus", request, [&](chain::TxContext &ctx) {
            auto status = decodeRequest<StatusRequest>(request);
            if (!status.is_ok())
                return dp::Result<void, dp::Error>::err(status.error());
            auto type = ledger::docTypeFromString(status.value().doc_type);
            if (!type.is_ok())
                return dp::Result<void, dp::Error>::err(type.error());
            return registry_.setActive(ctx, status.value().id, type.value(), !status.value().suspended);
        });
    }

    dp::Result<std::string, dp::Error> VaccineChain::viewProfile(const IdentityResolver &caller) {
        return invoke(caller, "viewProfile", "", [&](chain::TxContext &ctx) {
            auto profile = registry_.getProfile(ctx);
            if (!profile.is_ok())
                return dp::Result<std::string, dp::Error>::err(profile.error());
            return dp::Result<std::string, dp::Error>::ok(views_.viewProfile(profile.value()));
        });
    }

    // ===========================================
    // Catalog and batches
    // ===========================================

    dp::Result<std::string, dp::Error> VaccineChain::addProduct(const IdentityResolver &caller,
                                                                const std::string &request) {
        return invoke(caller, "addProduct", request, [&](chain::TxContext &ctx) {
            auto parsed = ledger::parseObject(request);
            if (!parsed.is_ok())
                return dp::Result<std::string, dp::Error>::err(parsed.error());

            const ledger::JsonValue *tag = parsed.value().find("docType");
            if (tag == nullptr || !tag->isString() ||
                tag->asString() != ledger::docTypeToString(ledger::DocType::Item)) {
                return dp::Result<std::string, dp::Error>::err(
                    validation_error("Invalid input: docType must be ITEM"));
            }

            auto product = ledger::Product::fromJson(parsed.value());
            if (!product.is_ok())
                return dp::Result<std::string, dp::Error>::err(product.error());

            auto profile = registry_.getProfile(ctx);
            if (!profile.is_ok())
                return dp::Result<std::string, dp::Error>::err(profile.error());

            auto added = catalog_.addProduct(ctx, profile.value(), product.value());
            if (!added.is_ok())
                return dp::Result<std::string, dp::Error>::err(added.error());
            return dp::Result<std::string, dp::Error>::ok(added.value().toJson());
        });
    }

    dp::Result<void, dp::Error> VaccineChain::setProductActive(const IdentityResolver &caller,
                                                               const std::string &request) {
        return invoke(caller, "setProductActive", request, [&](chain::TxContext &ctx) {
            auto status = decodeRequest<StatusRequest>(request);
            if (!status.is_ok())
                return dp::Result<void, dp::Error>::err(status.error());

            auto profile = registry_.getProfile(ctx);
            if (!profile.is_ok())
                return dp::Result<void, dp::Error>::err(profile.error());
            return catalog_.setProductActive(ctx, profile.value(), status.value().id, !status.value().suspended);
        });
    }

    dp::Result<std::string, dp::Error> VaccineChain::createBatch(const IdentityResolver &caller,
                                                                 const std::string &request) {
        return invoke(caller, "createBatch", request, [&](chain::TxContext &ctx) {
            auto input = decodeRequest<ledger::Batch>(request);
            if (!input.is_ok())
                return dp::Result<std::string, dp::Error>::err(input.error());

            auto profile = registry_.getProfile(ctx);
            if (!profile.is_ok())
                return dp::Result<std::string, dp::Error>::err(profile.error());

            chain::CallerProfile manufacturer = profile.value();
            auto created = batches_.createBatch(ctx, manufacturer, input.value());
            if (!created.is_ok())
                return dp::Result<std::string, dp::Error>::err(created.error());
            return dp::Result<std::string, dp::Error>::ok(created.value().batch.toJson());
        });
    }

    // ===========================================
    // Transfers
    // ===========================================

    dp::Result<std::string, dp::Error> VaccineChain::shipToDistributor(const IdentityResolver &caller,
                                                                       const std::string &request) {
        return invoke(caller, "shipToDistributor", request, [&](chain::TxContext &ctx) {
            auto transfer = chain::TransferRequest::fromJson(request, "cartonId");
            if (!transfer.is_ok())
                return dp::Result<std::string, dp::Error>::err(transfer.error());
            auto profile = registry_.getProfile(ctx);
            if (!profile.is_ok())
                return dp::Result<std::string, dp::Error>::err(profile.error());
            return receiptJson(transfers_.shipToDistributor(ctx, profile.value(), transfer.value()));
        });
    }

    dp::Result<std::string, dp::Error> VaccineChain::shipToChemist(const IdentityResolver &caller,
                                                                   const std::string &request) {
        return invoke(caller, "shipToChemist", request, [&](chain::TxContext &ctx) {
            auto transfer = chain::TransferRequest::fromJson(request, "packetId");
            if (!transfer.is_ok())
                return dp::Result<std::string, dp::Error>::err(transfer.error());
            auto profile = registry_.getProfile(ctx);
            if (!profile.is_ok())
                return dp::Result<std::string, dp::Error>::err(profile.error());
            return receiptJson(transfers_.shipToChemist(ctx, profile.value(), transfer.value()));
        });
    }

    dp::Result<std::string, dp::Error> VaccineChain::sellToCustomer(const IdentityResolver &caller,
                                                                    const std::string &request) {
        return invoke(caller, "sellToCustomer", request, [&](chain::TxContext &ctx) {
            auto transfer = chain::TransferRequest::fromJson(request, "packetId");
            if (!transfer.is_ok())
                return dp::Result<std::string, dp::Error>::err(transfer.error());
            auto profile = registry_.getProfile(ctx);
            if (!profile.is_ok())
                return dp::Result<std::string, dp::Error>::err(profile.error());
            return receiptJson(transfers_.sellToCustomer(ctx, profile.value(), transfer.value()));
        });
    }

    // ===========================================
    // Views
    // ===========================================

    dp::Result<std::string, dp::Error> VaccineChain::productsByManufacturer(const IdentityResolver &caller) {
        return invoke(caller, "productsByManufacturer", "", [&](chain::TxContext &ctx) {
            auto profile = registry_.getProfile(ctx);
            if (!profile.is_ok())
                return dp::Result<std::string, dp::Error>::err(profile.error());
            return views_.productsByManufacturer(ctx, profile.value());
        });
    }

    dp::Result<std::string, dp::Error> VaccineChain::unitsByOwner(const IdentityResolver &caller) {
        return invoke(caller, "unitsByOwner", "", [&](chain::TxContext &ctx) {
            auto profile = registry_.getProfile(ctx);
            if (!profile.is_ok())
                return dp::Result<std::string, dp::Error>::err(profile.error());
            return views_.unitsByOwner(ctx, profile.value());
        });
    }

    dp::Result<std::string, dp::Error> VaccineChain::viewReceipt(const IdentityResolver &caller,
                                                                 const std::string &receipt_id) {
        return invoke(caller, "viewReceipt", receipt_id, [&](chain::TxContext &ctx) {
            auto profile = registry_.getProfile(ctx);
            if (!profile.is_ok())
                return dp::Result<std::string, dp::Error>::err(profile.error());
            return views_.viewReceipt(ctx, profile.value(), receipt_id);
        });
    }

    dp::Result<std::vector<chain::HistoryEntry>, dp::Error> VaccineChain::history(const std::string &unit_id) {
        chain::HistoryReconstructor reconstructor(store_);
        return reconstructor.trackUnit(unit_id);
    }

    dp::Result<std::string, dp::Error> VaccineChain::trackUnit(const std::string &unit_id) {
        auto entries = history(unit_id);
        if (!entries.is_ok()) {
            std::cout << "Tracking failed for " << unit_id << ": " << entries.error().message.c_str() << std::endl;
            return dp::Result<std::string, dp::Error>::err(entries.error());
        }
        return dp::Result<std::string, dp::Error>::ok(chain::HistoryReconstructor::toJson(entries.value()));
    }

} // namespace vaxchain
