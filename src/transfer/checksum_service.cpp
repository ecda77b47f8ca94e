#include "airlink/transfer/checksum_service.hpp"
#include "airlink/core/constants.hpp"
#include "airlink/crypto/sha256.hpp"
#include <cctype>
#include <format>
#include <fstream>
#include <vector>

namespace airlink::transfer {
    using crypto::Sha256Hasher;

    Result<std::string, ValidationFailure> ChecksumService::Calculate(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return Result<std::string, ValidationFailure>::Err(
                ValidationFailure::Io(std::format("Cannot open {} for hashing", path.string())));
        }
        auto hasher_result = Sha256Hasher::Create();
        if (hasher_result.IsErr()) {
            return Result<std::string, ValidationFailure>::Err(
                ValidationFailure::Io(hasher_result.UnwrapErr().message));
        }
        Sha256Hasher hasher = std::move(hasher_result).Unwrap();
        std::vector<uint8_t> buffer(kFileReadBufferBytes);
        while (in) {
            in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            const auto read = static_cast<size_t>(in.gcount());
            if (read == 0) {
                break;
            }
            if (auto updated = hasher.Update(std::span<const uint8_t>(buffer.data(), read)); updated.IsErr()) {
                return Result<std::string, ValidationFailure>::Err(ValidationFailure::Io(updated.UnwrapErr().message));
            }
        }
        if (in.bad()) {
            return Result<std::string, ValidationFailure>::Err(
                ValidationFailure::Io(std::format("Read error while hashing {}", path.string())));
        }
        auto digest = hasher.Finalize();
        if (digest.IsErr()) {
            return Result<std::string, ValidationFailure>::Err(ValidationFailure::Io(digest.UnwrapErr().message));
        }
        return Result<std::string, ValidationFailure>::Ok(Sha256Hasher::ToHex(digest.Unwrap()));
    }

    bool ChecksumService::Matches(const std::string_view expected, const std::string_view actual) noexcept {
        if (expected.size() != actual.size()) {
            return false;
        }
        for (size_t i = 0; i < expected.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(expected[i])) !=
                std::tolower(static_cast<unsigned char>(actual[i]))) {
                return false;
            }
        }
        return true;
    }

    Result<Unit, ValidationFailure> ChecksumService::Verify(
        const std::filesystem::path& path,
        const std::string_view expected) {
        if (expected.empty()) {
            return Result<Unit, ValidationFailure>::Err(
                ValidationFailure::MissingChecksum(std::format("No checksum to verify {} against", path.string())));
        }
        auto actual = Calculate(path);
        if (actual.IsErr()) {
            return Result<Unit, ValidationFailure>::Err(std::move(actual).UnwrapErr());
        }
        if (!Matches(expected, actual.Unwrap())) {
            return Result<Unit, ValidationFailure>::Err(ValidationFailure::ChecksumMismatch(
                std::format("Checksum mismatch for {}", path.filename().string())));
        }
        return Result<Unit, ValidationFailure>::Ok(unit);
    }

    Result<std::string, ValidationFailure> ChecksumService::CalculateAndStore(
        const std::string& session_id,
        const std::string& path) {
        auto checksum = Calculate(path);
        if (checksum.IsErr()) {
            return checksum;
        }
        std::lock_guard guard(lock_);
        checksums_[{session_id, path}] = checksum.Unwrap();
        return checksum;
    }

    std::optional<std::string> ChecksumService::Stored(const std::string& session_id, const std::string& path) const {
        std::lock_guard guard(lock_);
        if (const auto it = checksums_.find({session_id, path}); it != checksums_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    void ChecksumService::ClearSession(const std::string& session_id) {
        std::lock_guard guard(lock_);
        for (auto it = checksums_.lower_bound({session_id, std::string()}); it != checksums_.end() && it->first.first == session_id;) {
            it = checksums_.erase(it);
        }
    }
}
