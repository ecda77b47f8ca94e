#pragma once
#include "airlink/core/result.hpp"
#include "airlink/core/failures.hpp"
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
namespace airlink::transfer {

/// Streaming SHA-256 file checksums (lowercase hex) and a per-session store of them.
class ChecksumService {
public:
    [[nodiscard]] static Result<std::string, ValidationFailure> Calculate(const std::filesystem::path& path);

    /// Case-insensitive hex comparison.
    [[nodiscard]] static bool Matches(std::string_view expected, std::string_view actual) noexcept;

    /// Recomputes the file checksum and compares it with @p expected.
    [[nodiscard]] static Result<Unit, ValidationFailure> Verify(
        const std::filesystem::path& path,
        std::string_view expected);

    [[nodiscard]] Result<std::string, ValidationFailure> CalculateAndStore(
        const std::string& session_id,
        const std::string& path);

    [[nodiscard]] std::optional<std::string> Stored(const std::string& session_id, const std::string& path) const;

    void ClearSession(const std::string& session_id);

private:
    mutable std::mutex lock_;
    std::map<std::pair<std::string, std::string>, std::string> checksums_;
};

}
