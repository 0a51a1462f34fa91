#pragma once

#include <datapod/datapod.hpp>
#include <filesystem>
#include <fstream>
#include <keylock/keylock.hpp>
#include <unordered_map>

#include "vaxchain/storage/record_store.hpp"

namespace vaxchain::storage {

    // ===========================================
    // Utility functions
    // ===========================================

    inline dp::Vector<dp::u8> computeSHA256(const dp::Vector<dp::u8> &data) {
        keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
        std::vector<uint8_t> input(data.begin(), data.end());
        auto result = crypto.hash(input);
        if (!result.success) {
            return dp::Vector<dp::u8>{};
        }
        return dp::Vector<dp::u8>(result.data.begin(), result.data.end());
    }

    inline dp::Vector<dp::u8> toBytes(const std::string &s) { return dp::Vector<dp::u8>(s.begin(), s.end()); }

    inline std::string fromBytes(const dp::Vector<dp::u8> &bytes) { return std::string(bytes.begin(), bytes.end()); }

    // ===========================================
    // On-disk records - POD structs with members()
    // ===========================================

    /// One key written by a commit. Keys are raw bytes since composite keys embed NUL delimiters.
    struct RevisionEntry {
        dp::Vector<dp::u8> key;
        dp::Vector<dp::u8> value;
        bool is_delete = false;

        auto members() { return std::tie(key, value, is_delete); }
        auto members() const { return std::tie(key, value, is_delete); }
    };

    /// One committed unit of work; the unit of atomicity on disk
    struct CommitRecord {
        dp::i64 sequence = 0;
        dp::String tx_id;
        dp::i64 timestamp = 0;
        dp::Vector<RevisionEntry> entries;

        auto members() { return std::tie(sequence, tx_id, timestamp, entries); }
        auto members() const { return std::tie(sequence, tx_id, timestamp, entries); }
    };

    // ===========================================
    // FileStore - append-only file backend
    // ===========================================

    /// Every commit is one frame in `revisions.dat`: [u32 length][datapod payload][SHA-256 of payload].
    /// A torn or corrupt trailing frame is ignored on load, so a commit is either fully visible or absent.
    /// Latest state and per-key frame offsets are rebuilt in memory on open.
    class FileStore : public BufferedRecordStore {
      public:
        static constexpr const char *DATA_FILE = "revisions.dat";
        static constexpr size_t CHECKSUM_SIZE = 32;

        inline FileStore() : is_open_(false), sync_mode_(OpenOptions::Synchronous::NORMAL) {}

        inline ~FileStore() override { close(); }

        FileStore(const FileStore &) = delete;
        FileStore &operator=(const FileStore &) = delete;

        /// Open or create storage at given path (directory)
        inline dp::Result<void, dp::Error> open(const std::string &path, const OpenOptions &opts = OpenOptions{}) {
            std::unique_lock lock(mutex_);
            try {
                base_path_ = path;
                sync_mode_ = opts.sync_mode;

                if (!std::filesystem::exists(base_path_)) {
                    if (!opts.create_if_missing)
                        return dp::Result<void, dp::Error>::err(store_failure(errorText("No store at " + path)));
                    std::filesystem::create_directories(base_path_);
                }
                if (!std::filesystem::exists(dataPath()))
                    std::ofstream(dataPath(), std::ios::binary).close();

                latest_.clear();
                key_frames_.clear();
                end_offset_ = 0;
                last_sequence_ = 0;
                catchUp();

                is_open_ = true;
                return dp::Result<void, dp::Error>::ok();
            } catch (const std::exception &e) {
                is_open_ = false;
                return dp::Result<void, dp::Error>::err(store_failure(errorText(e.what())));
            }
        }

        inline void close() {
            std::unique_lock lock(mutex_);
            is_open_ = false;
        }

        inline bool isOpen() const {
            std::shared_lock lock(mutex_);
            return is_open_;
        }

        /// Number of commits applied so far
        inline dp::i64 lastSequence() const {
            std::shared_lock lock(mutex_);
            return last_sequence_;
        }

      protected:
        inline bool isReady() const override { return is_open_; }

        inline dp::Result<void, dp::Error> onBegin() override {
            try {
                catchUp();
                return dp::Result<void, dp::Error>::ok();
            } catch (const std::exception &e) {
                return dp::Result<void, dp::Error>::err(store_failure(errorText(e.what())));
            }
        }

        inline dp::Result<std::optional<StoredRecord>, dp::Error> loadLatest(const std::string &key) override {
            auto it = latest_.find(key);
            if (it == latest_.end())
                return dp::Result<std::optional<StoredRecord>, dp::Error>::ok(std::nullopt);
            return dp::Result<std::optional<StoredRecord>, dp::Error>::ok(it->second);
        }

        inline dp::Result<std::vector<StoredRecord>, dp::Error> scanLatest() override {
            std::vector<StoredRecord> out;
            out.reserve(latest_.size());
            for (const auto &[key, record] : latest_)
                out.push_back(record);
            return dp::Result<std::vector<StoredRecord>, dp::Error>::ok(std::move(out));
        }

        inline dp::Result<std::vector<Revision>, dp::Error> loadHistory(const std::string &key) override {
            std::vector<Revision> out;
            auto it = key_frames_.find(key);
            if (it == key_frames_.end())
                return dp::Result<std::vector<Revision>, dp::Error>::ok(std::move(out));

            std::ifstream in(dataPath(), std::ios::binary);
            if (!in)
                return dp::Result<std::vector<Revision>, dp::Error>::err(store_failure("Failed to open revisions file"));

            int64_t version = 0;
            for (dp::u64 offset : it->second) {
                auto frame = readFrameAt(in, offset);
                if (!frame.has_value()) {
                    return dp::Result<std::vector<Revision>, dp::Error>::err(
                        store_failure(errorText("Unreadable frame at offset " + std::to_string(offset))));
                }
                for (const auto &entry : frame->entries) {
                    if (fromBytes(entry.key) != key)
                        continue;
                    Revision rev;
                    rev.key = key;
                    if (!entry.is_delete)
                        rev.value = fromBytes(entry.value);
                    rev.tx_id = std::string(frame->tx_id.c_str());
                    rev.timestamp = frame->timestamp;
                    rev.version = ++version;
                    out.push_back(std::move(rev));
                }
            }
            return dp::Result<std::vector<Revision>, dp::Error>::ok(std::move(out));
        }

        inline dp::Result<void, dp::Error> applyCommit(const CommitBatch &batch) override {
            try {
                // Pick up frames appended by other handles on the same directory
                catchUp();

                // Drop a torn tail so the next frame stays reachable on reload
                if (currentFileSize() > end_offset_)
                    std::filesystem::resize_file(dataPath(), end_offset_);

                std::unordered_map<std::string, int64_t> current;
                for (const auto &[key, seen] : batch.read_versions) {
                    auto it = latest_.find(key);
                    if (it != latest_.end())
                        current[key] = it->second.version;
                }
                auto check = checkReadVersions(batch, current);
                if (!check.is_ok())
                    return check;

                CommitRecord record;
                record.sequence = last_sequence_ + 1;
                record.tx_id = dp::String(batch.tx_id.c_str());
                record.timestamp = batch.timestamp;
                for (const auto &write : batch.writes) {
                    RevisionEntry entry;
                    entry.key = toBytes(write.key);
                    entry.is_delete = !write.value.has_value();
                    if (write.value.has_value())
                        entry.value = toBytes(*write.value);
                    record.entries.push_back(std::move(entry));
                }

                dp::u64 offset = appendFrame(record);
                applyFrame(record, offset);
                end_offset_ = currentFileSize();
                return dp::Result<void, dp::Error>::ok();
            } catch (const std::exception &e) {
                return dp::Result<void, dp::Error>::err(store_failure(errorText(e.what())));
            }
        }

      private:
        // ===========================================
        // File I/O with datapod serialization
        // ===========================================

        inline std::filesystem::path dataPath() const { return base_path_ / DATA_FILE; }

        inline dp::u64 currentFileSize() const {
            return static_cast<dp::u64>(std::filesystem::file_size(dataPath()));
        }

        inline dp::u64 appendFrame(const CommitRecord &record) {
            std::ofstream out(dataPath(), std::ios::binary | std::ios::app);
            if (!out)
                throw std::runtime_error("Failed to open revisions file for writing");

            dp::u64 offset = currentFileSize();

            CommitRecord mutable_record = record;
            auto buffer = dp::serialize(mutable_record);
            dp::Vector<dp::u8> payload(buffer.begin(), buffer.end());
            auto checksum = computeSHA256(payload);
            if (checksum.size() != CHECKSUM_SIZE)
                throw std::runtime_error("Failed to checksum commit frame");

            dp::u32 len = static_cast<dp::u32>(payload.size());
            out.write(reinterpret_cast<const char *>(&len), sizeof(len));
            out.write(reinterpret_cast<const char *>(payload.data()), payload.size());
            out.write(reinterpret_cast<const char *>(checksum.data()), checksum.size());

            if (sync_mode_ != OpenOptions::Synchronous::OFF)
                out.flush();
            if (!out)
                throw std::runtime_error("Failed to write commit frame");
            return offset;
        }

        /// Reads one frame; nullopt on a short read, checksum mismatch or undecodable payload
        inline std::optional<CommitRecord> readFrameAt(std::ifstream &in, dp::u64 offset) const {
            in.clear();
            in.seekg(static_cast<std::streamoff>(offset));

            dp::u32 len;
            in.read(reinterpret_cast<char *>(&len), sizeof(len));
            if (!in)
                return std::nullopt;

            dp::ByteBuf data(len);
            in.read(reinterpret_cast<char *>(data.data()), len);
            if (!in)
                return std::nullopt;

            dp::Vector<dp::u8> stored(CHECKSUM_SIZE);
            in.read(reinterpret_cast<char *>(stored.data()), CHECKSUM_SIZE);
            if (!in)
                return std::nullopt;

            dp::Vector<dp::u8> payload(data.begin(), data.end());
            auto expected = computeSHA256(payload);
            if (expected.size() != CHECKSUM_SIZE || !std::equal(expected.begin(), expected.end(), stored.begin()))
                return std::nullopt;

            try {
                return dp::deserialize<dp::Mode::NONE, CommitRecord>(data);
            } catch (const std::exception &) {
                return std::nullopt;
            }
        }

        // ===========================================
        // Index management
        // ===========================================

        /// Apply every complete frame past end_offset_. Stops at the first torn or corrupt frame.
        inline void catchUp() {
            std::ifstream in(dataPath(), std::ios::binary);
            if (!in)
                return;

            dp::u64 size = currentFileSize();
            dp::u64 offset = end_offset_;
            while (offset < size) {
                auto frame = readFrameAt(in, offset);
                if (!frame.has_value())
                    break;
                applyFrame(*frame, offset);
                in.clear();
                offset = static_cast<dp::u64>(in.tellg());
            }
            end_offset_ = offset;
        }

        inline void applyFrame(const CommitRecord &record, dp::u64 offset) {
            for (const auto &entry : record.entries) {
                std::string key = fromBytes(entry.key);
                auto &frames = key_frames_[key];
                if (frames.empty() || frames.back() != offset)
                    frames.push_back(offset);

                StoredRecord &latest = latest_[key];
                latest.key = key;
                latest.version += 1;
                if (entry.is_delete)
                    latest.value.reset();
                else
                    latest.value = fromBytes(entry.value);
            }
            last_sequence_ = std::max(last_sequence_, record.sequence);
        }

        // ===========================================
        // Member variables
        // ===========================================

        std::filesystem::path base_path_;
        bool is_open_;
        OpenOptions::Synchronous sync_mode_;

        // In-memory indexes
        std::unordered_map<std::string, StoredRecord> latest_;
        std::unordered_map<std::string, std::vector<dp::u64>> key_frames_;
        dp::u64 end_offset_ = 0;
        dp::i64 last_sequence_ = 0;
    };

} // namespace vaxchain::storage
