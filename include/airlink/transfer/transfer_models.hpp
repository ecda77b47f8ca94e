#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
namespace airlink::transfer {

enum class TransferStatus : uint8_t {
    Pending,
    Connecting,
    Handshaking,
    Transferring,
    Paused,
    Resuming,
    Completed,
    Failed,
    Cancelled
};

enum class TransferDirection : uint8_t {
    Outgoing,
    Incoming
};

[[nodiscard]] std::string_view ToString(TransferStatus status) noexcept;

[[nodiscard]] bool IsTerminal(TransferStatus status) noexcept;

struct TransferFile {
    std::string id;
    std::string name;
    std::string path;
    uint64_t size = 0;
    std::string mime_type;
};

/// One batch of files to or from one peer.
struct TransferSession {
    std::string id;
    int64_t transfer_id = 0;
    std::string target_device_id;
    std::vector<TransferFile> files;
    std::string connection_method;
    TransferStatus status = TransferStatus::Pending;
    TransferDirection direction = TransferDirection::Outgoing;
    std::chrono::steady_clock::time_point created_at;
    std::optional<std::chrono::steady_clock::time_point> completed_at;
    std::optional<std::string> error_message;
};

struct TransferProgress {
    std::string transfer_id;
    std::string file_id;
    std::string file_name;
    uint64_t bytes_transferred = 0;
    uint64_t total_bytes = 0;
    /// 0.0 .. 1.0
    double progress = 0.0;
    /// bytes per second since started_at
    double speed = 0.0;
    TransferStatus status = TransferStatus::Transferring;
    std::chrono::steady_clock::time_point started_at;
    std::optional<std::string> error_message;
};

struct TransferQueueProgress {
    std::string session_id;
    size_t completed_files = 0;
    size_t total_files = 0;
};

struct StatusUpdate {
    std::string session_id;
    TransferStatus status = TransferStatus::Pending;
    std::optional<std::string> message;
};

}
