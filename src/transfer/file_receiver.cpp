#include "airlink/transfer/file_receiver.hpp"
#include "airlink/core/constants.hpp"
#include "airlink/core/logging.hpp"
#include "airlink/transfer/checksum_service.hpp"
#include <algorithm>
#include <format>
#include <limits>
#include <system_error>

namespace airlink::transfer {
    Result<std::unique_ptr<FileReceiver>, TransferFailure> FileReceiver::Open(
        FileReceiveState state,
        const uint32_t chunk_size,
        ResumeStore* resume_store,
        const std::string& peer) {
        using R = Result<std::unique_ptr<FileReceiver>, TransferFailure>;
        if (state.expected_bytes > 0 && chunk_size == 0) {
            return R::Err(TransferFailure::Rejected(
                std::format("{} announced {} bytes without a chunk size", state.file_name, state.expected_bytes)));
        }
        if (chunk_size > 0 &&
            (state.expected_bytes + chunk_size - 1) / chunk_size > std::numeric_limits<uint32_t>::max()) {
            return R::Err(TransferFailure::Rejected(
                std::format("{} needs more than {} chunks", state.file_name, std::numeric_limits<uint32_t>::max())));
        }
        std::error_code ec;
        if (state.destination.has_parent_path()) {
            std::filesystem::create_directories(state.destination.parent_path(), ec);
            if (ec) {
                return R::Err(TransferFailure::Io(std::format("Cannot create {}: {}",
                                                              state.destination.parent_path().string(), ec.message())));
            }
        }
        state.written_bytes = 0;

        std::optional<ResumeKey> key;
        if (resume_store != nullptr && chunk_size > 0 && state.checksum.has_value() && !state.checksum->empty()) {
            key = ResumeKey{peer, state.file_name, *state.checksum};
        }
        std::unique_ptr<FileReceiver> receiver(new FileReceiver(std::move(state), chunk_size, resume_store, key));

        if (key.has_value()) {
            auto record = resume_store->Begin(*key, receiver->state_.destination.string(),
                                              receiver->state_.expected_bytes, chunk_size);
            if (record.IsErr()) {
                return R::Err(std::move(record).UnwrapErr());
            }
            if (!record.Unwrap().received_chunks.empty()) {
                if (std::filesystem::exists(receiver->partial_path_, ec)) {
                    receiver->RestoreFrom(record.Unwrap());
                } else {
                    // The part file is gone: the record describes bytes we no longer have.
                    resume_store->Remove(*key);
                    AIRLINK_TRY(resume_store->Begin(*key, receiver->state_.destination.string(),
                                                    receiver->state_.expected_bytes, chunk_size));
                }
            }
        }

        auto mode = std::ios::binary | std::ios::in | std::ios::out;
        if (!receiver->resumed_) {
            mode |= std::ios::trunc;
        }
        receiver->stream_.open(receiver->partial_path_, mode);
        if (!receiver->stream_.is_open()) {
            return R::Err(TransferFailure::Io(
                std::format("Cannot open {} for writing", receiver->partial_path_.string())));
        }
        if (receiver->resumed_) {
            logging::Get()->info("Resuming {}: {} of {} chunks already on disk", receiver->state_.file_name,
                                 receiver->received_chunks_.size(), receiver->TotalChunks());
        }
        return R::Ok(std::move(receiver));
    }

    FileReceiver::FileReceiver(
        FileReceiveState state,
        const uint32_t chunk_size,
        ResumeStore* resume_store,
        std::optional<ResumeKey> key)
        : state_(std::move(state))
          , chunk_size_(chunk_size)
          , resume_store_(resume_store)
          , resume_key_(std::move(key))
          , partial_path_(state_.destination.string() + std::string(kPartialFileSuffix)) {
    }

    FileReceiver::~FileReceiver() {
        if (stream_.is_open()) {
            stream_.close();
        }
    }

    void FileReceiver::RestoreFrom(const ResumeRecord& record) {
        for (const uint32_t index : record.received_chunks) {
            if (index < TotalChunks() && received_chunks_.insert(index).second) {
                state_.written_bytes += ChunkLength(index);
            }
        }
        resumed_ = !received_chunks_.empty();
    }

    uint32_t FileReceiver::TotalChunks() const noexcept {
        if (chunk_size_ == 0) {
            return 0;
        }
        return static_cast<uint32_t>((state_.expected_bytes + chunk_size_ - 1) / chunk_size_);
    }

    uint64_t FileReceiver::ChunkLength(const uint64_t index) const noexcept {
        const uint64_t start = index * chunk_size_;
        return std::min<uint64_t>(chunk_size_, state_.expected_bytes - start);
    }

    std::vector<uint32_t> FileReceiver::MissingChunks() const {
        std::vector<uint32_t> missing;
        const uint32_t total = TotalChunks();
        for (uint32_t index = 0; index < total; ++index) {
            if (!received_chunks_.contains(index)) {
                missing.push_back(index);
            }
        }
        return missing;
    }

    Result<Unit, TransferFailure> FileReceiver::WriteChunk(const uint64_t offset, std::span<const uint8_t> data) {
        using R = Result<Unit, TransferFailure>;
        if (!stream_.is_open()) {
            return R::Err(TransferFailure::Io(std::format("{} is not open", state_.file_name)));
        }
        if (state_.expected_bytes == 0) {
            return R::Err(TransferFailure::Rejected(
                std::format("Chunk at {} for {} which was announced empty", offset, state_.file_name)));
        }
        if (offset >= state_.expected_bytes || data.size() > state_.expected_bytes - offset) {
            return R::Err(TransferFailure::Rejected(std::format(
                "Chunk at {} (+{}) runs past the announced size {} of {}",
                offset, data.size(), state_.expected_bytes, state_.file_name)));
        }
        if (offset % chunk_size_ != 0) {
            return R::Err(TransferFailure::Rejected(std::format(
                "Chunk offset {} of {} is not a multiple of {}", offset, state_.file_name, chunk_size_)));
        }
        const uint64_t index = offset / chunk_size_;
        if (data.size() != ChunkLength(index)) {
            return R::Err(TransferFailure::Rejected(std::format(
                "Chunk {} of {} carries {} bytes, expected {}", index, state_.file_name, data.size(), ChunkLength(index))));
        }
        if (received_chunks_.contains(index)) {
            logging::Get()->debug("{}: chunk {} arrived again; ignoring", state_.file_name, index);
            return R::Ok(unit);
        }

        stream_.seekp(static_cast<std::streamoff>(offset));
        stream_.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!stream_) {
            return R::Err(TransferFailure::Io(
                std::format("Write of {} bytes at {} failed for {}", data.size(), offset, state_.file_name)));
        }
        received_chunks_.insert(index);
        state_.written_bytes += data.size();
        if (resume_key_.has_value()) {
            AIRLINK_TRY(resume_store_->MarkChunkReceived(*resume_key_, static_cast<uint32_t>(index)));
        }
        return R::Ok(unit);
    }

    Result<Unit, TransferFailure> FileReceiver::Close() {
        if (!stream_.is_open()) {
            return Result<Unit, TransferFailure>::Ok(unit);
        }
        stream_.flush();
        const bool flushed = static_cast<bool>(stream_);
        stream_.close();
        if (!flushed) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::Io(std::format("Flush failed for {}", state_.file_name)));
        }
        return Result<Unit, TransferFailure>::Ok(unit);
    }

    Result<Unit, ValidationFailure> FileReceiver::VerifyChecksum() {
        using R = Result<Unit, ValidationFailure>;
        if (finished_) {
            return R::Err(ValidationFailure::Io(std::format("{} was already finished", state_.file_name)));
        }
        auto fail = [this](ValidationFailure failure) {
            Discard();
            return R::Err(std::move(failure));
        };
        if (auto closed = Close(); closed.IsErr()) {
            return fail(ValidationFailure::Io(closed.UnwrapErr().message));
        }
        if (state_.written_bytes != state_.expected_bytes) {
            return fail(ValidationFailure::Io(std::format("{}: {} of {} bytes received",
                                                          state_.file_name, state_.written_bytes, state_.expected_bytes)));
        }
        if (state_.checksum.has_value() && !state_.checksum->empty()) {
            if (auto verified = ChecksumService::Verify(partial_path_, *state_.checksum); verified.IsErr()) {
                return fail(std::move(verified).UnwrapErr());
            }
        } else if (state_.require_checksum) {
            return fail(ValidationFailure::MissingChecksum(
                std::format("{} arrived without a checksum on a protected session", state_.file_name)));
        } else {
            logging::Get()->warn("{} arrived without a checksum; accepting unverified", state_.file_name);
        }

        std::error_code ec;
        std::filesystem::rename(partial_path_, state_.destination, ec);
        if (ec) {
            return fail(ValidationFailure::Io(std::format("Cannot move {} into place: {}",
                                                          state_.destination.string(), ec.message())));
        }
        finished_ = true;
        ForgetResumeRecord();
        return R::Ok(unit);
    }

    void FileReceiver::Discard() {
        if (finished_) {
            return;
        }
        finished_ = true;
        if (stream_.is_open()) {
            stream_.close();
        }
        std::error_code ec;
        std::filesystem::remove(partial_path_, ec);
        if (ec) {
            logging::Get()->warn("Cannot remove {}: {}", partial_path_.string(), ec.message());
        }
        ForgetResumeRecord();
    }

    void FileReceiver::ForgetResumeRecord() {
        if (resume_key_.has_value()) {
            resume_store_->Remove(*resume_key_);
        }
    }
}
