#pragma once
#include "airlink/core/result.hpp"
#include "airlink/core/failures.hpp"
#include "airlink/configuration/transfer_config.hpp"
#include "airlink/interfaces/i_connection_directory.hpp"
#include "airlink/interfaces/i_transport.hpp"
#include "airlink/protocol/control_channel.hpp"
#include "airlink/protocol/handshake_protocol.hpp"
#include "airlink/session/secure_session_manager.hpp"
#include "airlink/transfer/checksum_service.hpp"
#include "airlink/transfer/event_channel.hpp"
#include "airlink/transfer/rate_limiter.hpp"
#include "airlink/transfer/resume_store.hpp"
#include "airlink/transfer/status_machine.hpp"
#include "airlink/transfer/transfer_models.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>
namespace airlink::transfer {
using configuration::TransferConfig;
using interfaces::IConnectionDirectory;
using interfaces::ITransport;
using interfaces::TransportCapabilities;
using protocol::ControlMessage;
using protocol::HandshakeProtocol;
using session::SecureSessionManager;

/**
 * @brief Batch file transfer sessions between two devices
 *
 * Admission: per-device window, then global window, then the concurrent
 * session cap. Each accepted session gets a random UUID and a numeric
 * transport id that is never handed out twice by this instance.
 *
 * SendFiles() and StartReceiving() run the whole session on the calling
 * thread. Pause/Resume/Cancel may be called from any other thread.
 *
 * Files are transferred one after another. A failing file is recorded and
 * the batch continues; transient failures (I/O, native layer) are retried
 * with a fixed backoff. A session with any failed file ends as failed with
 * "Some files failed: <names>" and still lands in history.
 *
 * Per-session resources (connection, secure session, checksums, debounced
 * status, resume records on cancel) are released exactly once, on every exit
 * path.
 *
 * The receiver decides from its own session state whether chunks must be
 * sealed; a chunk whose encrypted flag disagrees fails its file. Files are
 * accepted only after the peer's verify message, and a protected session
 * requires a checksum for every file. With a resume directory, a file cut
 * off in one session continues in the next from the chunks still missing.
 */
class TransferOrchestrator {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    [[nodiscard]] static Result<std::unique_ptr<TransferOrchestrator>, TransferFailure> Create(
        std::shared_ptr<ITransport> transport,
        std::shared_ptr<IConnectionDirectory> directory,
        SecureSessionManager& sessions,
        std::shared_ptr<HandshakeProtocol> handshake,
        TransferConfig config = TransferConfig::Default(),
        std::optional<std::filesystem::path> resume_directory = std::nullopt,
        Clock clock = {});

    /// Admits a new outgoing session in `pending`. Returns its session id.
    [[nodiscard]] Result<std::string, TransferFailure> StartSession(
        const std::string& target_device_id,
        const std::string& connection_method,
        std::vector<TransferFile> files);

    /// Runs connect, handshake and the file loop. An empty @p files sends the files given to StartSession().
    [[nodiscard]] Result<Unit, TransferFailure> SendFiles(
        const std::string& session_id,
        std::vector<TransferFile> files = {});

    /**
     * @brief Serve one incoming session until transfer_end, cancellation or stall
     *
     * Answers the handshake and verification, writes announced files under
     * @p save_path, verifies each checksum and reports every outcome back
     * with a file_result message.
     */
    [[nodiscard]] Result<Unit, TransferFailure> StartReceiving(
        const std::string& session_id,
        const std::string& connection_token,
        const std::string& connection_method,
        const std::filesystem::path& save_path);

    [[nodiscard]] Result<Unit, TransferFailure> PauseTransfer(const std::string& session_id);

    /// Passes through `resuming` back to `transferring`.
    [[nodiscard]] Result<Unit, TransferFailure> ResumeTransfer(const std::string& session_id);

    [[nodiscard]] Result<Unit, TransferFailure> CancelTransfer(const std::string& session_id);

    SubscriptionId SubscribeProgress(EventChannel<TransferProgress>::Handler handler);

    SubscriptionId SubscribeQueueProgress(EventChannel<TransferQueueProgress>::Handler handler);

    SubscriptionId SubscribeStatus(EventChannel<StatusUpdate>::Handler handler);

    bool Unsubscribe(SubscriptionId id);

    [[nodiscard]] std::vector<TransferSession> GetActiveTransfers() const;

    [[nodiscard]] std::vector<TransferSession> GetTransferHistory() const;

    [[nodiscard]] std::optional<TransferSession> GetTransfer(const std::string& session_id) const;

    [[nodiscard]] size_t GetActiveTransferCount() const;

    /// Drops history entries that finished more than history_retention ago.
    size_t CleanupCompletedTransfers();

    [[nodiscard]] const TransferConfig& GetConfig() const noexcept { return config_; }

    TransferOrchestrator(const TransferOrchestrator&) = delete;
    TransferOrchestrator& operator=(const TransferOrchestrator&) = delete;
    TransferOrchestrator(TransferOrchestrator&&) = delete;
    TransferOrchestrator& operator=(TransferOrchestrator&&) = delete;
    ~TransferOrchestrator();

private:
    struct SessionControl {
        int64_t transfer_id = 0;
        std::atomic<bool> cancelled{false};
        std::atomic<bool> paused{false};
        std::atomic<bool> released{false};
        std::atomic<bool> native{false};
    };

    struct ActiveTransfer {
        TransferSession session;
        std::optional<std::string> connection_token;
        std::string crypto_session_id;
        std::shared_ptr<SessionControl> control;
    };

    struct SendContext {
        std::string session_id;
        std::string connection_token;
        std::string connection_method;
        int64_t transfer_id = 0;
        TransportCapabilities capabilities;
        std::shared_ptr<SessionControl> control;
        std::optional<std::string> checksum;
    };

    struct ReceiveContext;

    class SessionReleaser;

    TransferOrchestrator(
        std::shared_ptr<ITransport> transport,
        std::shared_ptr<IConnectionDirectory> directory,
        SecureSessionManager& sessions,
        std::shared_ptr<HandshakeProtocol> handshake,
        TransferConfig config,
        std::unique_ptr<ResumeStore> resume_store,
        Clock clock);

    [[nodiscard]] std::chrono::steady_clock::time_point Now() const;

    [[nodiscard]] static std::string NewSessionId();

    [[nodiscard]] static std::vector<TransferFile> NormalizeFiles(std::vector<TransferFile> files);

    [[nodiscard]] std::shared_ptr<SessionControl> ControlFor(const std::string& session_id) const;

    void OnStatusCommitted(const StatusUpdate& update);

    [[nodiscard]] Result<Unit, TransferFailure> Fail(const std::string& session_id, TransferFailure failure);

    void Release(const std::string& session_id);

    [[nodiscard]] Result<Unit, TransferFailure> TransferWithRetry(SendContext& context, const TransferFile& file);

    [[nodiscard]] Result<Unit, TransferFailure> SendStreamed(SendContext& context, const TransferFile& file);

    [[nodiscard]] Result<Unit, TransferFailure> SendNative(SendContext& context, const TransferFile& file);

    /// Next file_ready or file_result about @p file; replies about other files are skipped.
    [[nodiscard]] Result<ControlMessage, TransferFailure> AwaitFileReply(SendContext& context, const TransferFile& file);

    [[nodiscard]] Result<protocol::FileReadyMessage, TransferFailure> AwaitFileReady(
        SendContext& context,
        const TransferFile& file);

    [[nodiscard]] Result<Unit, TransferFailure> AwaitFileResult(SendContext& context, const TransferFile& file);

    [[nodiscard]] size_t ChunkSizeFor(const SendContext& context) const noexcept;

    [[nodiscard]] Result<Unit, TransferFailure> HandleReceiveFrame(ReceiveContext& context, std::span<const uint8_t> frame);

    void OnFileMeta(ReceiveContext& context, const protocol::FileMetaMessage& meta);

    /// @p claims_encrypted is the sender's flag; @p plain_size is the declared plaintext length when one was sent.
    void OnFileChunk(
        ReceiveContext& context,
        const std::string& file_id,
        uint64_t offset,
        std::span<const uint8_t> data,
        bool claims_encrypted,
        std::optional<uint64_t> plain_size);

    void OnFileEnd(ReceiveContext& context, const std::string& file_id);

    /// Reports the outcome of @p file_id with file_result and records it.
    void FinishFile(ReceiveContext& context, const std::string& file_id, std::optional<std::string> reason, uint64_t written);

    void EmitProgress(
        const std::string& session_id,
        const TransferFile& file,
        uint64_t bytes,
        TransferStatus status,
        std::chrono::steady_clock::time_point started_at,
        std::optional<std::string> error = std::nullopt);

    /// Blocks while paused. Returns false once the session is cancelled.
    [[nodiscard]] bool WaitWhilePaused(const SessionControl& control) const;

    /// Sleeps @p duration unless cancelled first. Returns false when cancelled.
    [[nodiscard]] bool SleepUnlessCancelled(const SessionControl& control, std::chrono::milliseconds duration) const;

    std::shared_ptr<ITransport> transport_;
    std::shared_ptr<IConnectionDirectory> directory_;
    SecureSessionManager& sessions_;
    std::shared_ptr<HandshakeProtocol> handshake_;
    protocol::ControlChannel channel_;
    TransferConfig config_;
    std::unique_ptr<ResumeStore> resume_store_;
    Clock clock_;

    SlidingWindowLimiter device_limiter_;
    SlidingWindowLimiter global_limiter_;
    ChecksumService checksums_;
    EventChannel<TransferProgress> progress_events_;
    EventChannel<TransferQueueProgress> queue_events_;
    EventChannel<StatusUpdate> status_events_;

    std::mutex admission_lock_;
    mutable std::mutex lock_;
    std::unordered_map<std::string, ActiveTransfer> active_;
    std::vector<TransferSession> history_;
    std::atomic<int64_t> next_transfer_id_{1};

    /// Declared last: its worker thread calls back into the members above.
    StatusMachine status_;
};

}
