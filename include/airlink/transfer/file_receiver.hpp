#pragma once
#include "airlink/core/result.hpp"
#include "airlink/core/failures.hpp"
#include "airlink/transfer/resume_store.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <vector>
namespace airlink::transfer {

struct FileReceiveState {
    std::string file_id;
    std::string file_name;
    std::filesystem::path destination;
    uint64_t expected_bytes = 0;
    std::optional<std::string> checksum;
    /// A file announced without a checksum fails verification.
    bool require_checksum = false;
    /// Distinct bytes on disk; a repeated chunk is not counted again.
    uint64_t written_bytes = 0;
};

/**
 * @brief Receive side of one file: created by file_meta, fed by file_chunk, closed by file_end
 *
 * Bytes go to <destination>.part. Chunk i covers [i * chunk_size, (i + 1) * chunk_size)
 * clipped to the announced size; chunks may arrive in any order, and a chunk
 * that arrives twice is written once. The part file becomes <destination>
 * only after VerifyChecksum() succeeds; a failed verification or Discard()
 * removes it.
 *
 * With a ResumeStore and a checksum, received chunks are recorded under
 * (peer, file name, checksum). A later Open() of the same file continues the
 * part file and MissingChunks() lists what is still needed.
 */
class FileReceiver {
public:
    [[nodiscard]] static Result<std::unique_ptr<FileReceiver>, TransferFailure> Open(
        FileReceiveState state,
        uint32_t chunk_size,
        ResumeStore* resume_store = nullptr,
        const std::string& peer = {});

    [[nodiscard]] Result<Unit, TransferFailure> WriteChunk(uint64_t offset, std::span<const uint8_t> data);

    [[nodiscard]] Result<Unit, TransferFailure> Close();

    /// Verifies the part file and moves it to the destination.
    [[nodiscard]] Result<Unit, ValidationFailure> VerifyChecksum();

    /// Drops the part file and any resume record.
    void Discard();

    [[nodiscard]] std::vector<uint32_t> MissingChunks() const;

    [[nodiscard]] uint32_t TotalChunks() const noexcept;

    [[nodiscard]] bool Resumed() const noexcept { return resumed_; }

    [[nodiscard]] const FileReceiveState& State() const noexcept { return state_; }

    [[nodiscard]] const std::filesystem::path& PartialPath() const noexcept { return partial_path_; }

    [[nodiscard]] bool IsOpen() const noexcept { return stream_.is_open(); }

    FileReceiver(const FileReceiver&) = delete;
    FileReceiver& operator=(const FileReceiver&) = delete;
    ~FileReceiver();

private:
    FileReceiver(FileReceiveState state, uint32_t chunk_size, ResumeStore* resume_store, std::optional<ResumeKey> key);

    [[nodiscard]] uint64_t ChunkLength(uint64_t index) const noexcept;

    void RestoreFrom(const ResumeRecord& record);

    void ForgetResumeRecord();

    FileReceiveState state_;
    uint32_t chunk_size_;
    ResumeStore* resume_store_;
    std::optional<ResumeKey> resume_key_;
    std::filesystem::path partial_path_;
    std::set<uint64_t> received_chunks_;
    std::fstream stream_;
    bool resumed_ = false;
    bool finished_ = false;
};

}
