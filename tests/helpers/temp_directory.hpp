#pragma once
#include "airlink/crypto/sodium_interop.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <vector>

namespace airlink::test_helpers {

/// Unique directory under the system temp dir, removed with everything in it on destruction.
class TempDirectory {
public:
    TempDirectory() {
        (void)crypto::SodiumInterop::Initialize();
        std::string suffix;
        for (const uint8_t byte : crypto::SodiumInterop::GetRandomBytes(8)) {
            constexpr char kHex[] = "0123456789abcdef";
            suffix.push_back(kHex[byte >> 4]);
            suffix.push_back(kHex[byte & 0x0F]);
        }
        path_ = std::filesystem::temp_directory_path() / ("airlink-test-" + suffix);
        std::filesystem::create_directories(path_);
    }

    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    [[nodiscard]] const std::filesystem::path& Path() const noexcept { return path_; }

    [[nodiscard]] std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

    std::filesystem::path WriteFile(const std::string& name, const std::vector<uint8_t>& content) const {
        const auto file = path_ / name;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
        return file;
    }

    std::filesystem::path WriteFile(const std::string& name, const std::string& content) const {
        return WriteFile(name, std::vector<uint8_t>(content.begin(), content.end()));
    }

private:
    std::filesystem::path path_;
};

inline std::vector<uint8_t> ReadFileBytes(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

/// Deterministic filler so content mismatches point at a byte offset.
inline std::vector<uint8_t> PatternBytes(const size_t size, const uint8_t seed = 0) {
    std::vector<uint8_t> bytes(size);
    for (size_t i = 0; i < size; ++i) {
        bytes[i] = static_cast<uint8_t>((i * 31 + seed) & 0xFF);
    }
    return bytes;
}

}
