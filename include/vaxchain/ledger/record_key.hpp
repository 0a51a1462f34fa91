#pragma once

#include <string>
#include <vector>

namespace vaxchain::ledger {

    /// Key under which a document is stored.
    ///
    /// Party and Batch records use a composite key (entity id, document type) so the same id can be registered
    /// once per role. Product records use a compound key (product id, manufacturer id, document type) so each
    /// manufacturer has its own product id space. Unit and Receipt records use a flat key (their own id or the transaction id).
    /// The store only ever sees the encoded string; this class is the single place that knows the encoding.
    class RecordKey {
      public:
        static constexpr char DELIMITER = '\x00';
        static constexpr const char *DEFAULT_INDEX = "IdDoctype";

        RecordKey() = default;

        /// Composite key in namespace `index`
        inline static RecordKey composite(const std::string &id, const std::string &doc_type,
                                          const std::string &index = DEFAULT_INDEX) {
            return compound(std::vector<std::string>{id}, doc_type, index);
        }

        /// Composite key over several id attributes, each kept in its own delimited slot
        inline static RecordKey compound(const std::vector<std::string> &attributes, const std::string &doc_type,
                                         const std::string &index = DEFAULT_INDEX) {
            RecordKey key;
            key.index_ = index;
            if (!attributes.empty())
                key.attributes_ = attributes;
            key.doc_type_ = doc_type;
            key.composite_ = true;
            return key;
        }

        inline static RecordKey flat(const std::string &id) {
            RecordKey key;
            key.attributes_.front() = id;
            return key;
        }

        /// Store-native encoding: "\0<index>\0<attr>...\0<docType>\0" for composite keys, the bare id otherwise
        inline std::string encode() const {
            if (!composite_)
                return id();
            std::string out;
            out += DELIMITER;
            out += index_;
            for (const auto &attribute : attributes_) {
                out += DELIMITER;
                out += attribute;
            }
            out += DELIMITER;
            out += doc_type_;
            out += DELIMITER;
            return out;
        }

        /// Inverse of encode(); any string without the leading delimiter is a flat key
        inline static RecordKey decode(const std::string &encoded) {
            if (encoded.empty() || encoded[0] != DELIMITER)
                return flat(encoded);

            std::vector<std::string> parts;
            std::string current;
            for (size_t i = 1; i < encoded.size(); ++i) {
                if (encoded[i] == DELIMITER) {
                    parts.push_back(current);
                    current.clear();
                } else {
                    current += encoded[i];
                }
            }
            if (parts.size() < 3)
                return flat(encoded);
            return compound(std::vector<std::string>(parts.begin() + 1, parts.end() - 1), parts.back(), parts[0]);
        }

        inline bool isComposite() const { return composite_; }
        /// First id attribute
        inline const std::string &id() const { return attributes_.front(); }
        inline const std::vector<std::string> &attributes() const { return attributes_; }
        inline const std::string &docType() const { return doc_type_; }
        inline const std::string &index() const { return index_; }

        /// Human-readable form for log lines
        inline std::string toString() const {
            if (!composite_)
                return id();
            std::string out;
            for (const auto &attribute : attributes_)
                out += attribute + "/";
            return out + doc_type_;
        }

        inline bool operator==(const RecordKey &other) const { return encode() == other.encode(); }
        inline bool operator!=(const RecordKey &other) const { return !(*this == other); }

      private:
        std::string index_;
        std::vector<std::string> attributes_{std::string()};
        std::string doc_type_;
        bool composite_ = false;
    };

} // namespace vaxchain::ledger
