#include "airlink/transfer/resume_store.hpp"
#include "airlink/core/logging.hpp"
#include "airlink/crypto/crypto_primitives.hpp"
#include "airlink/crypto/sha256.hpp"
#include "protocol/resume_state.pb.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <format>
#include <fstream>
#include <system_error>

namespace airlink::transfer {
    namespace {
        constexpr std::string_view kRecordExtension = ".resume";

        ResumeKey Normalized(const ResumeKey& key) {
            ResumeKey normalized = key;
            std::transform(normalized.checksum.begin(), normalized.checksum.end(), normalized.checksum.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return normalized;
        }
    }

    uint32_t ResumeRecord::TotalChunks() const noexcept {
        if (chunk_size == 0) {
            return 0;
        }
        return static_cast<uint32_t>((file_size + chunk_size - 1) / chunk_size);
    }

    Result<std::unique_ptr<ResumeStore>, TransferFailure> ResumeStore::Create(std::filesystem::path directory) {
        std::error_code ec;
        std::filesystem::create_directories(directory, ec);
        if (ec) {
            return Result<std::unique_ptr<ResumeStore>, TransferFailure>::Err(TransferFailure::Io(
                std::format("Cannot create resume directory {}: {}", directory.string(), ec.message())));
        }
        return Result<std::unique_ptr<ResumeStore>, TransferFailure>::Ok(
            std::unique_ptr<ResumeStore>(new ResumeStore(std::move(directory))));
    }

    ResumeStore::ResumeStore(std::filesystem::path directory)
        : directory_(std::move(directory)) {
    }

    Result<std::filesystem::path, TransferFailure> ResumeStore::RecordPath(const ResumeKey& key) const {
        const ResumeKey normalized = Normalized(key);
        std::string material;
        material.reserve(normalized.peer.size() + normalized.file_name.size() + normalized.checksum.size() + 2);
        material += normalized.peer;
        material.push_back('\0');
        material += normalized.file_name;
        material.push_back('\0');
        material += normalized.checksum;
        const auto bytes = std::span(reinterpret_cast<const uint8_t*>(material.data()), material.size());
        auto digest = crypto::CryptoPrimitives::Sha256(bytes);
        if (digest.IsErr()) {
            return Result<std::filesystem::path, TransferFailure>::Err(
                TransferFailure::Io("Cannot name resume record: " + digest.UnwrapErr().message));
        }
        return Result<std::filesystem::path, TransferFailure>::Ok(
            directory_ / (crypto::Sha256Hasher::ToHex(digest.Unwrap()) + std::string(kRecordExtension)));
    }

    Result<std::optional<ResumeRecord>, TransferFailure> ResumeStore::LoadLocked(const ResumeKey& key) const {
        using R = Result<std::optional<ResumeRecord>, TransferFailure>;
        auto path_result = RecordPath(key);
        if (path_result.IsErr()) {
            return R::Err(std::move(path_result).UnwrapErr());
        }
        const std::filesystem::path path = std::move(path_result).Unwrap();
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return R::Ok(std::nullopt);
        }
        proto::protocol::ResumeRecord message;
        if (!message.ParseFromIstream(&in)) {
            return R::Err(TransferFailure::Io(std::format("Corrupt resume record {}", path.string())));
        }
        ResumeRecord record;
        record.key = ResumeKey{message.peer(), message.file_name(), message.checksum()};
        if (!(record.key == Normalized(key))) {
            return R::Err(TransferFailure::Io(std::format("Resume record {} belongs to another file", path.string())));
        }
        record.path = message.path();
        record.file_size = message.file_size();
        record.chunk_size = message.chunk_size();
        record.received_chunks.insert(message.received_chunks().begin(), message.received_chunks().end());
        return R::Ok(std::move(record));
    }

    Result<Unit, TransferFailure> ResumeStore::SaveLocked(const ResumeRecord& record) {
        proto::protocol::ResumeRecord message;
        message.set_peer(record.key.peer);
        message.set_file_name(record.key.file_name);
        message.set_checksum(record.key.checksum);
        message.set_path(record.path);
        message.set_file_size(record.file_size);
        message.set_chunk_size(record.chunk_size);
        for (const uint32_t index : record.received_chunks) {
            message.add_received_chunks(index);
        }
        message.set_updated_at_unix_ms(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());

        return RecordPath(record.key).Bind([&message](const std::filesystem::path& path) {
            std::ofstream out(path, std::ios::binary | std::ios::trunc);
            if (!out || !message.SerializeToOstream(&out)) {
                return Result<Unit, TransferFailure>::Err(
                    TransferFailure::Io(std::format("Cannot write resume record {}", path.string())));
            }
            return Result<Unit, TransferFailure>::Ok(unit);
        });
    }

    Result<ResumeRecord, TransferFailure> ResumeStore::Begin(
        const ResumeKey& key,
        const std::string& path,
        const uint64_t file_size,
        const uint32_t chunk_size) {
        std::lock_guard guard(lock_);
        auto existing = LoadLocked(key);
        if (existing.IsErr()) {
            logging::Get()->warn("{}; starting over", existing.UnwrapErr().message);
        } else if (const auto& loaded = existing.Unwrap();
                   loaded.has_value() && loaded->path == path &&
                   loaded->file_size == file_size && loaded->chunk_size == chunk_size) {
            return Result<ResumeRecord, TransferFailure>::Ok(*loaded);
        }
        ResumeRecord record;
        record.key = Normalized(key);
        record.path = path;
        record.file_size = file_size;
        record.chunk_size = chunk_size;
        AIRLINK_TRY(SaveLocked(record));
        return Result<ResumeRecord, TransferFailure>::Ok(std::move(record));
    }

    Result<Unit, TransferFailure> ResumeStore::MarkChunkReceived(const ResumeKey& key, const uint32_t chunk_index) {
        std::lock_guard guard(lock_);
        auto loaded = LoadLocked(key);
        if (loaded.IsErr()) {
            return Result<Unit, TransferFailure>::Err(std::move(loaded).UnwrapErr());
        }
        std::optional<ResumeRecord> record = std::move(loaded).Unwrap();
        if (!record.has_value()) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::Io(std::format("No resume record for {}", key.file_name)));
        }
        if (chunk_index >= record->TotalChunks()) {
            return Result<Unit, TransferFailure>::Err(TransferFailure::Io(std::format(
                "Chunk {} is outside the {} chunks of {}", chunk_index, record->TotalChunks(), key.file_name)));
        }
        if (!record->received_chunks.insert(chunk_index).second) {
            return Result<Unit, TransferFailure>::Ok(unit);
        }
        return SaveLocked(*record);
    }

    Result<std::vector<uint32_t>, TransferFailure> ResumeStore::GetMissingChunks(const ResumeKey& key) const {
        std::lock_guard guard(lock_);
        auto loaded = LoadLocked(key);
        if (loaded.IsErr()) {
            return Result<std::vector<uint32_t>, TransferFailure>::Err(std::move(loaded).UnwrapErr());
        }
        const auto& record = loaded.Unwrap();
        if (!record.has_value()) {
            return Result<std::vector<uint32_t>, TransferFailure>::Err(
                TransferFailure::Io(std::format("No resume record for {}", key.file_name)));
        }
        std::vector<uint32_t> missing;
        const uint32_t total = record->TotalChunks();
        for (uint32_t index = 0; index < total; ++index) {
            if (!record->received_chunks.contains(index)) {
                missing.push_back(index);
            }
        }
        return Result<std::vector<uint32_t>, TransferFailure>::Ok(std::move(missing));
    }

    Result<std::optional<ResumeRecord>, TransferFailure> ResumeStore::Load(const ResumeKey& key) const {
        std::lock_guard guard(lock_);
        return LoadLocked(key);
    }

    void ResumeStore::Remove(const ResumeKey& key) {
        std::lock_guard guard(lock_);
        auto path = RecordPath(key);
        if (path.IsErr()) {
            logging::Get()->warn("{}", path.UnwrapErr().message);
            return;
        }
        std::error_code ec;
        std::filesystem::remove(path.Unwrap(), ec);
        if (ec) {
            logging::Get()->warn("Cannot remove resume record for {}: {}", key.file_name, ec.message());
        }
    }
}
