#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include <datapod/datapod.hpp>

#include "vaxchain/common/error.hpp"
#include "vaxchain/ledger/json.hpp"

namespace vaxchain::ledger {

    /// Document-type discriminator carried by every stored record
    enum class DocType : dp::u8 {
        ChainAdmin = 0,
        Manufacturer = 1,
        Distributor = 2,
        Chemist = 3,
        Item = 4,
        Batch = 5,
        Asset = 6,
        Receipt = 7,
    };

    /// Wire tag of a document type
    inline std::string docTypeToString(DocType type) {
        switch (type) {
        case DocType::ChainAdmin:
            return "VACCINE_CHAIN_ADMIN";
        case DocType::Manufacturer:
            return "MANUFACTURER";
        case DocType::Distributor:
            return "DISTRIBUTER";
        case DocType::Chemist:
            return "CHEMIST";
        case DocType::Item:
            return "ITEM";
        case DocType::Batch:
            return "BATCH";
        case DocType::Asset:
            return "ASSET";
        case DocType::Receipt:
            return "RECEIPT";
        default:
            return "UNKNOWN";
        }
    }

    inline dp::Result<DocType, dp::Error> docTypeFromString(const std::string &tag) {
        for (dp::u8 i = 0; i <= static_cast<dp::u8>(DocType::Receipt); ++i) {
            auto type = static_cast<DocType>(i);
            if (docTypeToString(type) == tag)
                return dp::Result<DocType, dp::Error>::ok(type);
        }
        return dp::Result<DocType, dp::Error>::err(decode_error(errorText("Unknown docType: '" + tag + "'")));
    }

    /// Party document types (the registrable roles)
    inline bool isPartyType(DocType type) {
        return type == DocType::ChainAdmin || type == DocType::Manufacturer || type == DocType::Distributor ||
               type == DocType::Chemist;
    }

    /// Custody states of a unit, in supply-chain order
    enum class AssetStatus : dp::u8 {
        ReadyForDistribution = 0,
        ReceivedAtDistributor = 1,
        ChemistInventoryReceived = 2,
        SoldToCustomer = 3,
    };

    inline std::string assetStatusToString(AssetStatus status) {
        switch (status) {
        case AssetStatus::ReadyForDistribution:
            return "ReadyForDistribution";
        case AssetStatus::ReceivedAtDistributor:
            return "ReceivedAtDistributor";
        case AssetStatus::ChemistInventoryReceived:
            return "ChemistInventoryReceived";
        case AssetStatus::SoldToCustomer:
            return "SoldToCustomer";
        default:
            return "Unknown";
        }
    }

    inline dp::Result<AssetStatus, dp::Error> assetStatusFromString(const std::string &name) {
        for (dp::u8 i = 0; i <= static_cast<dp::u8>(AssetStatus::SoldToCustomer); ++i) {
            auto status = static_cast<AssetStatus>(i);
            if (assetStatusToString(status) == name)
                return dp::Result<AssetStatus, dp::Error>::ok(status);
        }
        return dp::Result<AssetStatus, dp::Error>::err(decode_error(errorText("Unknown asset status: '" + name + "'")));
    }

    /// Successor state, nullopt for the terminal state
    inline std::optional<AssetStatus> nextStatus(AssetStatus status) {
        if (status == AssetStatus::SoldToCustomer)
            return std::nullopt;
        return static_cast<AssetStatus>(static_cast<dp::u8>(status) + 1);
    }

    // ===========================================
    // Field reader used by the document decoders
    // ===========================================

    /// Reads typed members out of a JSON object. Absent members leave the target untouched,
    /// members of the wrong JSON type record a decode error (the first one wins).
    class FieldReader {
      public:
        explicit FieldReader(const JsonValue &object) : object_(object) {}

        inline FieldReader &str(const char *key, std::string &out) {
            const JsonValue *v = object_.find(key);
            if (v == nullptr || v->isNull())
                return *this;
            if (!v->isString())
                return fail(key, "string");
            out = v->asString();
            return *this;
        }

        inline FieldReader &i64(const char *key, int64_t &out) {
            const JsonValue *v = object_.find(key);
            if (v == nullptr || v->isNull())
                return *this;
            auto n = v->asInt();
            if (!n.is_ok())
                return fail(key, "integer");
            out = n.value();
            return *this;
        }

        inline FieldReader &boolean(const char *key, bool &out) {
            const JsonValue *v = object_.find(key);
            if (v == nullptr || v->isNull())
                return *this;
            if (!v->isBool())
                return fail(key, "boolean");
            out = v->asBool();
            return *this;
        }

        inline bool ok() const { return error_.empty(); }
        inline dp::Error error() const { return decode_error(errorText(error_)); }

      private:
        const JsonValue &object_;
        std::string error_;

        inline FieldReader &fail(const char *key, const char *expected) {
            if (error_.empty())
                error_ = std::string("Field '") + key + "' must be a " + expected;
            return *this;
        }
    };

    /// Parse text and require a JSON object
    inline dp::Result<JsonValue, dp::Error> parseObject(const std::string &json) {
        auto parsed = JsonValue::parse(json);
        if (!parsed.is_ok())
            return parsed;
        if (!parsed.value().isObject())
            return dp::Result<JsonValue, dp::Error>::err(decode_error("Expected a JSON object"));
        return parsed;
    }

    // ===========================================
    // Documents
    // ===========================================

    /// Registered party: administrator, manufacturer, distributor or chemist
    struct Entity {
        std::string id;
        std::string name;
        std::string license_no;
        std::string address;
        std::string owner_name;
        std::string owner_identity;
        std::string owner_address;
        std::string contact_no;
        std::string email_id;
        bool suspended = false;
        int64_t batch_count = 0;
        DocType doc_type = DocType::Manufacturer;

        static constexpr DocType KIND = DocType::Manufacturer;

        inline std::string toJson() const {
            JsonWriter w;
            w.field("id", id);
            w.fieldIfSet("name", name);
            w.fieldIfSet("licenseNo", license_no);
            w.fieldIfSet("address", address);
            w.fieldIfSet("ownerName", owner_name);
            w.fieldIfSet("ownerIdentity", owner_identity);
            w.fieldIfSet("ownerAddress", owner_address);
            w.fieldIfSet("contactNo", contact_no);
            w.fieldIfSet("emailId", email_id);
            w.field("suspended", suspended);
            if (batch_count > 0)
                w.field("batchCount", batch_count);
            w.field("docType", docTypeToString(doc_type));
            return w.str();
        }

        inline static dp::Result<Entity, dp::Error> fromJson(const JsonValue &obj) {
            Entity e;
            std::string tag;
            FieldReader r(obj);
            r.str("id", e.id)
                .str("name", e.name)
                .str("licenseNo", e.license_no)
                .str("address", e.address)
                .str("ownerName", e.owner_name)
                .str("ownerIdentity", e.owner_identity)
                .str("ownerAddress", e.owner_address)
                .str("contactNo", e.contact_no)
                .str("emailId", e.email_id)
                .boolean("suspended", e.suspended)
                .i64("batchCount", e.batch_count)
                .str("docType", tag);
            if (!r.ok())
                return dp::Result<Entity, dp::Error>::err(r.error());

            auto type = docTypeFromString(tag);
            if (!type.is_ok())
                return dp::Result<Entity, dp::Error>::err(type.error());
            if (!isPartyType(type.value()))
                return dp::Result<Entity, dp::Error>::err(
                    decode_error(errorText("docType '" + tag + "' is not a party type")));
            e.doc_type = type.value();
            return dp::Result<Entity, dp::Error>::ok(std::move(e));
        }
    };

    /// Manufacturer-scoped product definition
    struct Product {
        std::string id;
        std::string name;
        std::string desc;
        std::string type;
        int64_t price = 0;
        int64_t carton_capacity = 0;
        int64_t packet_capacity = 0;
        bool suspended = false;
        std::string owner;

        static constexpr DocType KIND = DocType::Item;

        inline std::string toJson() const {
            return JsonWriter()
                .field("id", id)
                .field("name", name)
                .field("desc", desc)
                .field("type", type)
                .field("price", price)
                .field("cartonCapacity", carton_capacity)
                .field("packetCapacity", packet_capacity)
                .field("docType", docTypeToString(KIND))
                .field("suspended", suspended)
                .field("owner", owner)
                .str();
        }

        inline static dp::Result<Product, dp::Error> fromJson(const JsonValue &obj) {
            Product p;
            FieldReader r(obj);
            r.str("id", p.id)
                .str("name", p.name)
                .str("desc", p.desc)
                .str("type", p.type)
                .i64("price", p.price)
                .i64("cartonCapacity", p.carton_capacity)
                .i64("packetCapacity", p.packet_capacity)
                .boolean("suspended", p.suspended)
                .str("owner", p.owner);
            if (!r.ok())
                return dp::Result<Product, dp::Error>::err(r.error());
            return dp::Result<Product, dp::Error>::ok(std::move(p));
        }
    };

    /// One manufacturing run; the template from which units are generated
    struct Batch {
        std::string id;
        std::string owner;
        std::string product_id;
        int64_t manufacturing_date = 0;
        int64_t expiry_date = 0;
        int64_t carton_qnty = 0;

        static constexpr DocType KIND = DocType::Batch;

        inline std::string toJson() const {
            return JsonWriter()
                .field("id", id)
                .field("owner", owner)
                .field("productId", product_id)
                .field("manufacturingDate", manufacturing_date)
                .field("expiryDate", expiry_date)
                .field("cartonQnty", carton_qnty)
                .field("docType", docTypeToString(KIND))
                .str();
        }

        inline static dp::Result<Batch, dp::Error> fromJson(const JsonValue &obj) {
            Batch b;
            FieldReader r(obj);
            r.str("id", b.id)
                .str("owner", b.owner)
                .str("productId", b.product_id)
                .i64("manufacturingDate", b.manufacturing_date)
                .i64("expiryDate", b.expiry_date)
                .i64("cartonQnty", b.carton_qnty);
            if (!r.ok())
                return dp::Result<Batch, dp::Error>::err(r.error());
            return dp::Result<Batch, dp::Error>::ok(std::move(b));
        }
    };

    /// One physically trackable unit
    struct Asset {
        std::string id;
        std::string batch_id;
        std::string carton_id;
        std::string owner;
        AssetStatus status = AssetStatus::ReadyForDistribution;
        std::string product_id;
        std::string manufacturer_id;
        int64_t manufacturing_date = 0;
        int64_t expiry_date = 0;

        static constexpr DocType KIND = DocType::Asset;

        inline std::string toJson() const {
            return JsonWriter()
                .field("id", id)
                .field("batchId", batch_id)
                .field("cartonId", carton_id)
                .field("owner", owner)
                .field("status", assetStatusToString(status))
                .field("productId", product_id)
                .field("manufacturerId", manufacturer_id)
                .field("manufacturingDate", manufacturing_date)
                .field("expiryDate", expiry_date)
                .field("docType", docTypeToString(KIND))
                .str();
        }

        inline static dp::Result<Asset, dp::Error> fromJson(const JsonValue &obj) {
            Asset a;
            std::string status;
            FieldReader r(obj);
            r.str("id", a.id)
                .str("batchId", a.batch_id)
                .str("cartonId", a.carton_id)
                .str("owner", a.owner)
                .str("status", status)
                .str("productId", a.product_id)
                .str("manufacturerId", a.manufacturer_id)
                .i64("manufacturingDate", a.manufacturing_date)
                .i64("expiryDate", a.expiry_date);
            if (!r.ok())
                return dp::Result<Asset, dp::Error>::err(r.error());
            auto parsed = assetStatusFromString(status);
            if (!parsed.is_ok())
                return dp::Result<Asset, dp::Error>::err(parsed.error());
            a.status = parsed.value();
            return dp::Result<Asset, dp::Error>::ok(std::move(a));
        }
    };

    /// Immutable commercial record of one transfer
    struct Receipt {
        std::string id;
        std::string bundle_id;
        std::string supplier_id;
        std::string customer_id;
        std::string product_id;
        int64_t transaction_date = 0;
        int64_t bill_amount = 0;

        static constexpr DocType KIND = DocType::Receipt;

        inline std::string toJson() const {
            return JsonWriter()
                .field("id", id)
                .field("bundleId", bundle_id)
                .field("docType", docTypeToString(KIND))
                .field("supplierId", supplier_id)
                .field("customerId", customer_id)
                .field("productId", product_id)
                .field("transactionDate", transaction_date)
                .field("billAmount", bill_amount)
                .str();
        }

        inline static dp::Result<Receipt, dp::Error> fromJson(const JsonValue &obj) {
            Receipt rc;
            FieldReader r(obj);
            r.str("id", rc.id)
                .str("bundleId", rc.bundle_id)
                .str("supplierId", rc.supplier_id)
                .str("customerId", rc.customer_id)
                .str("productId", rc.product_id)
                .i64("transactionDate", rc.transaction_date)
                .i64("billAmount", rc.bill_amount);
            if (!r.ok())
                return dp::Result<Receipt, dp::Error>::err(r.error());
            return dp::Result<Receipt, dp::Error>::ok(std::move(rc));
        }
    };

    /// Closed set of stored record variants
    using Document = std::variant<Entity, Product, Batch, Asset, Receipt>;

    /// Discriminator of a stored document, DecodeError when missing or unknown
    inline dp::Result<DocType, dp::Error> docTypeOf(const JsonValue &obj) {
        const JsonValue *tag = obj.find("docType");
        if (tag == nullptr || !tag->isString())
            return dp::Result<DocType, dp::Error>::err(decode_error("Document has no docType"));
        return docTypeFromString(tag->asString());
    }

    /// Decode any stored document into its tagged variant
    inline dp::Result<Document, dp::Error> decodeDocument(const std::string &bytes) {
        auto parsed = parseObject(bytes);
        if (!parsed.is_ok())
            return dp::Result<Document, dp::Error>::err(parsed.error());
        const auto &obj = parsed.value();

        auto type = docTypeOf(obj);
        if (!type.is_ok())
            return dp::Result<Document, dp::Error>::err(type.error());

        auto wrap = [](auto result) -> dp::Result<Document, dp::Error> {
            if (!result.is_ok())
                return dp::Result<Document, dp::Error>::err(result.error());
            return dp::Result<Document, dp::Error>::ok(Document(std::move(result.value())));
        };

        switch (type.value()) {
        case DocType::ChainAdmin:
        case DocType::Manufacturer:
        case DocType::Distributor:
        case DocType::Chemist:
            return wrap(Entity::fromJson(obj));
        case DocType::Item:
            return wrap(Product::fromJson(obj));
        case DocType::Batch:
            return wrap(Batch::fromJson(obj));
        case DocType::Asset:
            return wrap(Asset::fromJson(obj));
        case DocType::Receipt:
            return wrap(Receipt::fromJson(obj));
        }
        return dp::Result<Document, dp::Error>::err(decode_error("Unknown docType"));
    }

    /// Decode a stored document and require a specific variant
    template <typename T> inline dp::Result<T, dp::Error> decodeAs(const std::string &bytes) {
        auto doc = decodeDocument(bytes);
        if (!doc.is_ok())
            return dp::Result<T, dp::Error>::err(doc.error());
        if (!std::holds_alternative<T>(doc.value())) {
            return dp::Result<T, dp::Error>::err(
                decode_error(errorText("Document is not of type " + docTypeToString(T::KIND))));
        }
        return dp::Result<T, dp::Error>::ok(std::get<T>(doc.value()));
    }

    /// Encode any document variant
    inline std::string encodeDocument(const Document &doc) {
        return std::visit([](const auto &d) { return d.toJson(); }, doc);
    }

} // namespace vaxchain::ledger
