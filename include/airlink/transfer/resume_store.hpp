#pragma once
#include "airlink/core/result.hpp"
#include "airlink/core/failures.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
namespace airlink::transfer {

/// The same bytes from the same peer under the same name, whatever session carries them.
struct ResumeKey {
    std::string peer;
    std::string file_name;
    std::string checksum;

    bool operator==(const ResumeKey&) const = default;
};

struct ResumeRecord {
    ResumeKey key;
    std::string path;
    uint64_t file_size = 0;
    uint32_t chunk_size = 0;
    std::set<uint32_t> received_chunks;

    [[nodiscard]] uint32_t TotalChunks() const noexcept;
};

/**
 * @brief Received-chunk bookkeeping persisted per (peer, file name, checksum)
 *
 * Records live in <directory>/<sha256 of the key>.resume as binary
 * airlink.proto.protocol.ResumeRecord, so a transfer interrupted in one
 * session continues in the next one. The checksum is compared
 * case-insensitively.
 */
class ResumeStore {
public:
    [[nodiscard]] static Result<std::unique_ptr<ResumeStore>, TransferFailure> Create(std::filesystem::path directory);

    /// Loads the existing record when it describes the same file layout, otherwise starts a fresh one.
    [[nodiscard]] Result<ResumeRecord, TransferFailure> Begin(
        const ResumeKey& key,
        const std::string& path,
        uint64_t file_size,
        uint32_t chunk_size);

    [[nodiscard]] Result<Unit, TransferFailure> MarkChunkReceived(const ResumeKey& key, uint32_t chunk_index);

    [[nodiscard]] Result<std::vector<uint32_t>, TransferFailure> GetMissingChunks(const ResumeKey& key) const;

    [[nodiscard]] Result<std::optional<ResumeRecord>, TransferFailure> Load(const ResumeKey& key) const;

    void Remove(const ResumeKey& key);

    [[nodiscard]] Result<std::filesystem::path, TransferFailure> RecordPath(const ResumeKey& key) const;

    [[nodiscard]] const std::filesystem::path& Directory() const noexcept { return directory_; }

    ResumeStore(const ResumeStore&) = delete;
    ResumeStore& operator=(const ResumeStore&) = delete;

private:
    explicit ResumeStore(std::filesystem::path directory);

    [[nodiscard]] Result<std::optional<ResumeRecord>, TransferFailure> LoadLocked(const ResumeKey& key) const;

    [[nodiscard]] Result<Unit, TransferFailure> SaveLocked(const ResumeRecord& record);

    std::filesystem::path directory_;
    mutable std::mutex lock_;
};

}
