#include "airlink/transfer/transfer_orchestrator.hpp"
#include "airlink/core/constants.hpp"
#include "airlink/core/logging.hpp"
#include "airlink/crypto/crypto_primitives.hpp"
#include "airlink/crypto/sodium_interop.hpp"
#include "airlink/transfer/file_receiver.hpp"
#include <algorithm>
#include <format>
#include <fstream>
#include <limits>
#include <system_error>
#include <thread>

namespace airlink::transfer {
    using crypto::EncryptedPayload;
    using crypto::SodiumInterop;
    using protocol::ChunkFrame;
    using protocol::ChunkFrameCodec;
    using protocol::ControlMessage;
    using protocol::ControlMessageCodec;
    using protocol::FileChunkMessage;
    using protocol::FileEndMessage;
    using protocol::FileMetaMessage;
    using protocol::FileReadyMessage;
    using protocol::FileResultMessage;
    using protocol::HandshakeMessage;
    using protocol::TransferEndMessage;
    using protocol::VerifyMessage;
    using protocol::WireFrame;
    using protocol::WireFrameCodec;
    using protocol::WireFrameType;
    using session::PayloadProtection;

    namespace {
        constexpr std::string_view kGlobalLimiterKey = "*";
        constexpr std::string_view kPartialFailurePrefix = "Some files failed: ";

        std::string JoinNames(const std::vector<std::string>& names) {
            std::string joined;
            for (const auto& name : names) {
                if (!joined.empty()) {
                    joined += ", ";
                }
                joined += name;
            }
            return joined;
        }

        std::string Describe(std::string_view code, const std::string& message) {
            return std::format("{}: {}", code, message);
        }

        TransferFailure ClassifyRejection(const std::string& reason) {
            if (reason.starts_with(TransferFailure::ChecksumMismatch("").Code())) {
                return TransferFailure::ChecksumMismatch(reason);
            }
            if (reason.starts_with(TransferFailure::Io("").Code())) {
                return TransferFailure::Io(reason);
            }
            return TransferFailure::Rejected(reason);
        }

        std::filesystem::path SafeFileName(const std::string& name, const std::string& fallback) {
            const std::filesystem::path leaf = std::filesystem::path(name).filename();
            if (leaf.empty() || leaf == "." || leaf == "..") {
                return std::filesystem::path(fallback);
            }
            return leaf;
        }

        std::vector<uint8_t> FileAad(const std::string& file_id) {
            return {file_id.begin(), file_id.end()};
        }
    }

    struct TransferOrchestrator::ReceiveContext {
        std::string session_id;
        std::string connection_token;
        std::string connection_method;
        std::filesystem::path save_path;
        int64_t transfer_id = 0;
        std::shared_ptr<SessionControl> control;
        std::string crypto_session_id;
        std::unordered_map<std::string, std::unique_ptr<FileReceiver>> receivers;
        std::unordered_map<std::string, TransferFile> files;
        std::unordered_map<std::string, std::chrono::steady_clock::time_point> started;
        std::unordered_map<std::string, std::string> rejected;
        /// Announcement order; a re-announced file keeps its slot.
        std::vector<std::string> announced;
        std::unordered_map<std::string, bool> outcomes;
        bool transfer_ended = false;
        /// Set once the peer's verify message checked out; file messages are refused before that.
        bool verified = false;
        /// Interrupted files keep their part file and resume record for a later session.
        bool keep_partials = false;

        ReceiveContext() = default;
        ReceiveContext(const ReceiveContext&) = delete;
        ReceiveContext& operator=(const ReceiveContext&) = delete;

        ~ReceiveContext() {
            const bool keep = keep_partials && !(control && control->cancelled);
            for (auto& [file_id, receiver] : receivers) {
                if (!keep) {
                    receiver->Discard();
                } else if (auto closed = receiver->Close(); closed.IsErr()) {
                    logging::Get()->warn("Session {}: {}", session_id, closed.UnwrapErr().message);
                }
            }
        }

        [[nodiscard]] std::vector<std::string> FailedNames() const {
            std::vector<std::string> names;
            for (const auto& file_id : announced) {
                const auto outcome = outcomes.find(file_id);
                if (outcome != outcomes.end() && !outcome->second) {
                    names.push_back(files.at(file_id).name);
                }
            }
            return names;
        }

        /// Drops whatever was written for @p file_id. Returns the reason reported in file_result.
        std::string Reject(const std::string& file_id, const TransferFailure& failure) {
            logging::Get()->warn("Session {}: rejecting file {}: {}", session_id, file_id, failure.message);
            std::string reason = Describe(failure.Code(), failure.message);
            rejected[file_id] = reason;
            if (const auto it = receivers.find(file_id); it != receivers.end()) {
                it->second->Discard();
                receivers.erase(it);
            }
            return reason;
        }
    };

    class TransferOrchestrator::SessionReleaser {
    public:
        SessionReleaser(TransferOrchestrator& owner, std::string session_id)
            : owner_(owner)
              , session_id_(std::move(session_id)) {
        }

        ~SessionReleaser() {
            owner_.Release(session_id_);
        }

        SessionReleaser(const SessionReleaser&) = delete;
        SessionReleaser& operator=(const SessionReleaser&) = delete;

    private:
        TransferOrchestrator& owner_;
        std::string session_id_;
    };

    Result<std::unique_ptr<TransferOrchestrator>, TransferFailure> TransferOrchestrator::Create(
        std::shared_ptr<ITransport> transport,
        std::shared_ptr<IConnectionDirectory> directory,
        SecureSessionManager& sessions,
        std::shared_ptr<HandshakeProtocol> handshake,
        TransferConfig config,
        std::optional<std::filesystem::path> resume_directory,
        Clock clock) {
        using R = Result<std::unique_ptr<TransferOrchestrator>, TransferFailure>;
        if (!transport || !directory || !handshake) {
            return R::Err(TransferFailure::NativeFailure(
                "A transport, a connection directory and a handshake protocol are required"));
        }
        if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
            return R::Err(TransferFailure::NativeFailure(init.UnwrapErr().message));
        }
        std::unique_ptr<ResumeStore> resume_store;
        if (resume_directory.has_value()) {
            auto store = ResumeStore::Create(std::move(*resume_directory));
            if (store.IsErr()) {
                return R::Err(std::move(store).UnwrapErr());
            }
            resume_store = std::move(store).Unwrap();
        }
        sessions.GetKeyManager().SetEventHandler(handshake);
        return R::Ok(std::unique_ptr<TransferOrchestrator>(new TransferOrchestrator(
            std::move(transport), std::move(directory), sessions, std::move(handshake),
            std::move(config), std::move(resume_store), std::move(clock))));
    }

    TransferOrchestrator::TransferOrchestrator(
        std::shared_ptr<ITransport> transport,
        std::shared_ptr<IConnectionDirectory> directory,
        SecureSessionManager& sessions,
        std::shared_ptr<HandshakeProtocol> handshake,
        TransferConfig config,
        std::unique_ptr<ResumeStore> resume_store,
        Clock clock)
        : transport_(transport)
          , directory_(std::move(directory))
          , sessions_(sessions)
          , handshake_(std::move(handshake))
          , channel_(std::move(transport))
          , config_(std::move(config))
          , resume_store_(std::move(resume_store))
          , clock_(std::move(clock))
          , device_limiter_(config_.GetPerDeviceLimit(), config_.GetRateWindow(), clock_)
          , global_limiter_(config_.GetGlobalLimit(), config_.GetRateWindow(), clock_)
          , status_(config_.GetStatusDebounce(), [this](const StatusUpdate& update) { OnStatusCommitted(update); }) {
    }

    TransferOrchestrator::~TransferOrchestrator() {
        std::vector<std::string> remaining;
        {
            std::lock_guard guard(lock_);
            for (const auto& [session_id, transfer] : active_) {
                transfer.control->cancelled = true;
                remaining.push_back(session_id);
            }
        }
        for (const auto& session_id : remaining) {
            Release(session_id);
        }
    }

    std::chrono::steady_clock::time_point TransferOrchestrator::Now() const {
        return clock_ ? clock_() : std::chrono::steady_clock::now();
    }

    std::string TransferOrchestrator::NewSessionId() {
        std::vector<uint8_t> bytes = SodiumInterop::GetRandomBytes(16);
        bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
        bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);
        std::string id;
        id.reserve(36);
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                id.push_back('-');
            }
            id += std::format("{:02x}", bytes[i]);
        }
        return id;
    }

    std::vector<TransferFile> TransferOrchestrator::NormalizeFiles(std::vector<TransferFile> files) {
        for (auto& file : files) {
            if (file.name.empty()) {
                file.name = std::filesystem::path(file.path).filename().string();
            }
            if (file.id.empty()) {
                file.id = NewSessionId();
            }
            if (file.size == 0) {
                std::error_code ec;
                const auto size = std::filesystem::file_size(file.path, ec);
                if (!ec) {
                    file.size = size;
                }
            }
        }
        return files;
    }

    std::shared_ptr<TransferOrchestrator::SessionControl> TransferOrchestrator::ControlFor(
        const std::string& session_id) const {
        std::lock_guard guard(lock_);
        if (const auto it = active_.find(session_id); it != active_.end()) {
            return it->second.control;
        }
        return nullptr;
    }

    Result<std::string, TransferFailure> TransferOrchestrator::StartSession(
        const std::string& target_device_id,
        const std::string& connection_method,
        std::vector<TransferFile> files) {
        using R = Result<std::string, TransferFailure>;
        std::lock_guard admission(admission_lock_);

        if (const auto device = device_limiter_.Check(target_device_id); !device.allowed) {
            return R::Err(TransferFailure::RateLimitedDevice(
                std::format("Too many transfers to {} in the last {}ms", target_device_id, config_.GetRateWindow().count()),
                device.retry_after.value_or(std::chrono::milliseconds(0))));
        }
        const std::string global_key(kGlobalLimiterKey);
        if (const auto global = global_limiter_.Check(global_key); !global.allowed) {
            return R::Err(TransferFailure::RateLimitedGlobal(
                std::format("Too many transfers in the last {}ms", config_.GetRateWindow().count()),
                global.retry_after.value_or(std::chrono::milliseconds(0))));
        }
        const std::string session_id = NewSessionId();
        {
            std::lock_guard guard(lock_);
            if (active_.size() >= config_.GetMaxConcurrentSessions()) {
                return R::Err(TransferFailure::ConcurrencyLimit(
                    std::format("{} transfer sessions already active", active_.size())));
            }
            device_limiter_.Record(target_device_id);
            global_limiter_.Record(global_key);

            ActiveTransfer transfer;
            transfer.control = std::make_shared<SessionControl>();
            transfer.control->transfer_id = next_transfer_id_.fetch_add(1);
            transfer.session.id = session_id;
            transfer.session.transfer_id = transfer.control->transfer_id;
            transfer.session.target_device_id = target_device_id;
            transfer.session.files = NormalizeFiles(std::move(files));
            transfer.session.connection_method = connection_method;
            transfer.session.direction = TransferDirection::Outgoing;
            transfer.session.created_at = Now();
            active_.emplace(session_id, std::move(transfer));
        }
        status_.Register(session_id, TransferStatus::Pending);
        logging::Get()->info("Session {} admitted for device {}", session_id, target_device_id);
        return R::Ok(session_id);
    }

    Result<Unit, TransferFailure> TransferOrchestrator::SendFiles(
        const std::string& session_id,
        std::vector<TransferFile> files) {
        std::shared_ptr<SessionControl> control;
        std::string target;
        std::string requested_method;
        std::vector<TransferFile> batch;
        {
            std::lock_guard guard(lock_);
            const auto it = active_.find(session_id);
            if (it == active_.end()) {
                return Result<Unit, TransferFailure>::Err(
                    TransferFailure::SessionNotFound(std::format("No active session {}", session_id)));
            }
            if (it->second.session.direction != TransferDirection::Outgoing) {
                return Result<Unit, TransferFailure>::Err(
                    TransferFailure::InvalidTransition(std::format("Session {} is not outgoing", session_id)));
            }
            if (!files.empty()) {
                it->second.session.files = NormalizeFiles(std::move(files));
            }
            batch = it->second.session.files;
            control = it->second.control;
            target = it->second.session.target_device_id;
            requested_method = it->second.session.connection_method;
        }
        SessionReleaser releaser(*this, session_id);

        const auto info = directory_->GetConnectionInfo(target);
        if (!info.has_value()) {
            return Fail(session_id, TransferFailure::ConnectionInfoNotFound(
                std::format("No connection info for device {}", target)));
        }
        const std::string method = info->connection_method.empty() ? requested_method : info->connection_method;
        const bool token_based = method == kMethodBle || method == kMethodWifiAware;
        if (token_based && (!info->connection_token.has_value() || info->connection_token->empty())) {
            return Fail(session_id, TransferFailure::MissingConnectionToken(
                std::format("{} connection to {} has no token", method, target)));
        }
        const std::string token = info->connection_token.value_or(target);
        {
            std::lock_guard guard(lock_);
            if (const auto it = active_.find(session_id); it != active_.end()) {
                it->second.connection_token = token;
                it->second.session.connection_method = method;
            }
        }
        AIRLINK_TRY(status_.Transition(session_id, TransferStatus::Connecting));

        std::unordered_map<std::string, std::string> unreadable;
        for (const auto& file : batch) {
            if (auto checksum = checksums_.CalculateAndStore(session_id, file.path); checksum.IsErr()) {
                const ValidationFailure& failure = checksum.UnwrapErr();
                logging::Get()->warn("Session {}: no checksum for {}: {}", session_id, file.name, failure.message);
                unreadable.emplace(file.id, Describe(failure.Code(), failure.message));
            }
        }

        if (auto created = sessions_.CreateSession(session_id, target, token, method); created.IsErr()) {
            return Fail(session_id, TransferFailure::FromSessionFailure(created.UnwrapErr()));
        }
        {
            std::lock_guard guard(lock_);
            if (const auto it = active_.find(session_id); it != active_.end()) {
                it->second.crypto_session_id = session_id;
            }
        }

        AIRLINK_TRY(status_.Transition(session_id, TransferStatus::Handshaking));
        if (auto handshake = handshake_->RunInitiator(session_id, token); handshake.IsErr()) {
            return Fail(session_id, TransferFailure::FromHandshakeFailure(handshake.UnwrapErr()));
        }
        AIRLINK_TRY(status_.Transition(session_id, TransferStatus::Transferring));

        SendContext context;
        context.session_id = session_id;
        context.connection_token = token;
        context.connection_method = method;
        context.transfer_id = control->transfer_id;
        context.capabilities = transport_->GetCapabilities(method);
        context.control = control;
        control->native = context.capabilities.native_file_transfer;

        std::vector<std::string> failed_names;
        size_t finished = 0;
        for (const auto& file : batch) {
            if (control->cancelled) {
                break;
            }
            auto sent = [&] {
                if (const auto it = unreadable.find(file.id); it != unreadable.end()) {
                    EmitProgress(session_id, file, 0, TransferStatus::Failed, Now(), it->second);
                    return Result<Unit, TransferFailure>::Err(TransferFailure::Io(it->second));
                }
                context.checksum = checksums_.Stored(session_id, file.path);
                return TransferWithRetry(context, file);
            }();
            if (sent.IsErr()) {
                if (control->cancelled) {
                    break;
                }
                const TransferFailure& failure = sent.UnwrapErr();
                logging::Get()->warn("Session {}: {} failed ({}): {}",
                                     session_id, file.name, failure.Code(), failure.message);
                failed_names.push_back(file.name);
            }
            ++finished;
            queue_events_.Publish(TransferQueueProgress{session_id, finished, batch.size()});
        }

        if (control->cancelled) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::Cancelled(std::format("Session {} was cancelled", session_id)));
        }
        if (auto ended = channel_.Send(token, TransferEndMessage{session_id}); ended.IsErr()) {
            logging::Get()->warn("Session {}: transfer_end not delivered: {}", session_id, ended.UnwrapErr().message);
        }
        if (!failed_names.empty()) {
            return Fail(session_id, TransferFailure::PartialFailure(
                std::string(kPartialFailurePrefix) + JoinNames(failed_names)));
        }
        AIRLINK_TRY(status_.Transition(session_id, TransferStatus::Completed));
        logging::Get()->info("Session {}: {} file(s) sent", session_id, batch.size());
        return Result<Unit, TransferFailure>::Ok(unit);
    }

    Result<Unit, TransferFailure> TransferOrchestrator::TransferWithRetry(SendContext& context, const TransferFile& file) {
        const uint32_t attempts = std::max<uint32_t>(1, config_.GetRetryAttempts());
        for (uint32_t attempt = 1;; ++attempt) {
            auto result = context.capabilities.native_file_transfer
                              ? SendNative(context, file)
                              : SendStreamed(context, file);
            if (result.IsOk() || context.control->cancelled) {
                return result;
            }
            const TransferFailure& failure = result.UnwrapErr();
            if (!failure.IsTransient() || attempt >= attempts) {
                return result;
            }
            logging::Get()->warn("Session {}: {} attempt {}/{} failed: {}; retrying in {}ms",
                                 context.session_id, file.name, attempt, attempts, failure.message,
                                 config_.GetRetryBackoff().count());
            if (!SleepUnlessCancelled(*context.control, config_.GetRetryBackoff())) {
                return Result<Unit, TransferFailure>::Err(
                    TransferFailure::Cancelled(std::format("Session {} was cancelled", context.session_id)));
            }
        }
    }

    size_t TransferOrchestrator::ChunkSizeFor(const SendContext& context) const noexcept {
        size_t chunk = std::max<size_t>(1, config_.GetChunkSize());
        if (context.capabilities.constrained_frames) {
            chunk = std::min(chunk, kWireMaxChunkDataBytes);
        }
        return std::min<size_t>(chunk, std::numeric_limits<uint32_t>::max());
    }

    Result<Unit, TransferFailure> TransferOrchestrator::SendStreamed(SendContext& context, const TransferFile& file) {
        using R = Result<Unit, TransferFailure>;
        const std::string& session_id = context.session_id;
        const auto started = Now();
        std::ifstream in(file.path, std::ios::binary);
        if (!in) {
            return R::Err(TransferFailure::Io(std::format("Cannot open {}", file.path)));
        }
        std::error_code ec;
        const uint64_t size = std::filesystem::file_size(file.path, ec);
        if (ec) {
            return R::Err(TransferFailure::Io(std::format("Cannot size {}: {}", file.path, ec.message())));
        }
        const auto chunk_size = static_cast<uint32_t>(ChunkSizeFor(context));
        const uint64_t total = (size + chunk_size - 1) / chunk_size;
        if (total > std::numeric_limits<uint32_t>::max()) {
            return R::Err(TransferFailure::Rejected(std::format("{} needs {} chunks", file.name, total)));
        }
        EmitProgress(session_id, file, 0, TransferStatus::Transferring, started);

        FileMetaMessage meta;
        meta.session_id = session_id;
        meta.file_id = file.id;
        meta.name = file.name;
        meta.size = size;
        meta.checksum = context.checksum;
        meta.mime_type = file.mime_type;
        meta.chunk_size = size > 0 ? chunk_size : 0;
        if (auto sent = channel_.Send(context.connection_token, meta); sent.IsErr()) {
            return R::Err(TransferFailure::NativeFailure(sent.UnwrapErr().message));
        }

        auto ready = AwaitFileReady(context, file);
        if (ready.IsErr()) {
            EmitProgress(session_id, file, 0, TransferStatus::Failed, started, ready.UnwrapErr().message);
            return R::Err(std::move(ready).UnwrapErr());
        }
        std::vector<uint64_t> plan;
        if (ready.Unwrap().resumed) {
            for (const uint32_t index : ready.Unwrap().missing_chunks) {
                if (index >= total) {
                    return R::Err(TransferFailure::Rejected(std::format(
                        "Receiver asked for chunk {} of {} which has {}", index, file.name, total)));
                }
                plan.push_back(index);
            }
            std::sort(plan.begin(), plan.end());
            plan.erase(std::unique(plan.begin(), plan.end()), plan.end());
            logging::Get()->info("Session {}: resuming {} with {} of {} chunks missing",
                                 session_id, file.name, plan.size(), total);
        } else {
            plan.reserve(static_cast<size_t>(total));
            for (uint64_t index = 0; index < total; ++index) {
                plan.push_back(index);
            }
        }
        uint64_t delivered = size;
        for (const uint64_t index : plan) {
            delivered -= std::min<uint64_t>(chunk_size, size - index * chunk_size);
        }

        const std::vector<uint8_t> aad = FileAad(file.id);
        std::vector<uint8_t> buffer(chunk_size);
        uint32_t sequence = 0;
        for (const uint64_t index : plan) {
            if (!WaitWhilePaused(*context.control)) {
                return R::Err(TransferFailure::Cancelled(std::format("Session {} was cancelled", session_id)));
            }
            const uint64_t offset = index * chunk_size;
            const auto length = static_cast<size_t>(std::min<uint64_t>(chunk_size, size - offset));
            in.seekg(static_cast<std::streamoff>(offset));
            in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(length));
            if (static_cast<size_t>(in.gcount()) != length) {
                return R::Err(TransferFailure::Io(std::format("Short read of {} at {}", file.path, offset)));
            }
            if (handshake_->NeedsRenegotiation(session_id)) {
                if (auto renegotiated = handshake_->Renegotiate(session_id); renegotiated.IsErr()) {
                    return R::Err(TransferFailure::FromHandshakeFailure(renegotiated.UnwrapErr()));
                }
            }

            const std::span<const uint8_t> plain(buffer.data(), length);
            std::vector<uint8_t> data;
            bool encrypted = false;
            if (sessions_.UsesLocalEncryption(session_id)) {
                auto sealed = sessions_.EncryptData(session_id, plain, aad);
                if (sealed.IsErr()) {
                    const SessionFailure& failure = sealed.UnwrapErr();
                    return R::Err(TransferFailure::Rejected(Describe(failure.Code(), failure.message)));
                }
                data = sealed.Unwrap().Combined();
                encrypted = true;
            } else {
                data.assign(plain.begin(), plain.end());
            }

            Result<Unit, HandshakeFailure> sent = Result<Unit, HandshakeFailure>::Ok(unit);
            if (context.capabilities.constrained_frames) {
                WireFrame envelope;
                envelope.type = WireFrameType::Data;
                envelope.flags = static_cast<uint16_t>(kWireFlagHasFooter | (encrypted ? kWireFlagEncrypted : 0));
                envelope.sequence = sequence++;
                envelope.chunk_index = static_cast<uint32_t>(index);
                envelope.total_chunks = static_cast<uint32_t>(total);
                sent = channel_.SendChunk(context.connection_token, ChunkFrame{file.id, offset, std::move(data)},
                                          std::move(envelope));
            } else {
                sent = channel_.Send(context.connection_token,
                                     FileChunkMessage{session_id, file.id, std::move(data), offset, length, encrypted});
            }
            if (sent.IsErr()) {
                return R::Err(TransferFailure::NativeFailure(sent.UnwrapErr().message));
            }
            delivered += length;
            EmitProgress(session_id, file, delivered, TransferStatus::Transferring, started);
        }
        if (auto ended = channel_.Send(context.connection_token, FileEndMessage{session_id, file.id}); ended.IsErr()) {
            return R::Err(TransferFailure::NativeFailure(ended.UnwrapErr().message));
        }

        auto result = AwaitFileResult(context, file);
        if (result.IsOk()) {
            EmitProgress(session_id, file, size, TransferStatus::Completed, started);
        } else {
            EmitProgress(session_id, file, delivered, TransferStatus::Failed, started, result.UnwrapErr().message);
        }
        return result;
    }

    Result<ControlMessage, TransferFailure> TransferOrchestrator::AwaitFileReply(
        SendContext& context,
        const TransferFile& file) {
        using R = Result<ControlMessage, TransferFailure>;
        using SteadyClock = std::chrono::steady_clock;
        const auto deadline = SteadyClock::now() + config_.GetFileResultTimeout();
        while (true) {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now());
            if (remaining.count() <= 0) {
                return R::Err(TransferFailure::Io(std::format("No reply about {}", file.name)));
            }
            auto reply = channel_.Await<FileReadyMessage, FileResultMessage>(
                context.connection_token, context.session_id, remaining, &context.control->cancelled);
            if (reply.IsErr()) {
                if (context.control->cancelled) {
                    return R::Err(TransferFailure::Cancelled(std::format("Session {} was cancelled", context.session_id)));
                }
                const HandshakeFailure& failure = reply.UnwrapErr();
                if (failure.type == HandshakeFailureType::Timeout) {
                    return R::Err(TransferFailure::Io(std::format("No reply about {}: {}", file.name, failure.message)));
                }
                return R::Err(TransferFailure::NativeFailure(failure.message));
            }
            ControlMessage message = std::move(reply).Unwrap();
            const auto* ready = std::get_if<FileReadyMessage>(&message);
            const std::string& about = ready != nullptr ? ready->file_id : std::get<FileResultMessage>(message).file_id;
            if (about != file.id) {
                logging::Get()->debug("Session {}: late '{}' for {}", context.session_id,
                                      ControlMessageCodec::TypeName(message), about);
                continue;
            }
            return R::Ok(std::move(message));
        }
    }

    Result<FileReadyMessage, TransferFailure> TransferOrchestrator::AwaitFileReady(
        SendContext& context,
        const TransferFile& file) {
        using R = Result<FileReadyMessage, TransferFailure>;
        auto reply = AwaitFileReply(context, file);
        if (reply.IsErr()) {
            return R::Err(std::move(reply).UnwrapErr());
        }
        if (const auto* outcome = std::get_if<FileResultMessage>(&reply.Unwrap())) {
            if (outcome->success) {
                return R::Err(TransferFailure::Rejected(std::format("{} reported complete before any chunk", file.name)));
            }
            return R::Err(ClassifyRejection(outcome->reason));
        }
        return R::Ok(std::get<FileReadyMessage>(std::move(reply).Unwrap()));
    }

    Result<Unit, TransferFailure> TransferOrchestrator::AwaitFileResult(SendContext& context, const TransferFile& file) {
        using R = Result<Unit, TransferFailure>;
        while (true) {
            auto reply = AwaitFileReply(context, file);
            if (reply.IsErr()) {
                return R::Err(std::move(reply).UnwrapErr());
            }
            const auto* outcome = std::get_if<FileResultMessage>(&reply.Unwrap());
            if (outcome == nullptr) {
                logging::Get()->debug("Session {}: repeated file_ready for {}", context.session_id, file.name);
                continue;
            }
            if (outcome->success) {
                return R::Ok(unit);
            }
            return R::Err(ClassifyRejection(outcome->reason));
        }
    }

    Result<Unit, TransferFailure> TransferOrchestrator::SendNative(SendContext& context, const TransferFile& file) {
        using R = Result<Unit, TransferFailure>;
        const std::string& session_id = context.session_id;
        const auto started = Now();
        interfaces::NativeTransferRequest request;
        request.connection_token = context.connection_token;
        request.connection_method = context.connection_method;
        request.transfer_id = context.transfer_id;
        request.file_path = file.path;
        request.file_name = file.name;
        request.file_size = file.size;

        EmitProgress(session_id, file, 0, TransferStatus::Transferring, started);
        if (!transport_->StartTransfer(request)) {
            return R::Err(TransferFailure::NativeFailure(std::format("Transport refused to start {}", file.name)));
        }

        uint64_t last_bytes = 0;
        auto last_change = Now();
        while (true) {
            if (context.control->cancelled) {
                return R::Err(TransferFailure::Cancelled(std::format("Session {} was cancelled", session_id)));
            }
            const auto progress = transport_->NextProgress(context.transfer_id, kReceivePollInterval);
            const auto now = Now();
            if (progress.has_value()) {
                if (progress->bytes_transferred != last_bytes) {
                    last_bytes = progress->bytes_transferred;
                    last_change = now;
                }
                switch (progress->state) {
                    case interfaces::NativeTransferState::Completed:
                        EmitProgress(session_id, file, std::max(last_bytes, file.size), TransferStatus::Completed, started);
                        return R::Ok(unit);
                    case interfaces::NativeTransferState::Failed: {
                        const std::string reason = progress->error.value_or("native transfer failed");
                        EmitProgress(session_id, file, last_bytes, TransferStatus::Failed, started, reason);
                        return R::Err(TransferFailure::NativeFailure(reason));
                    }
                    case interfaces::NativeTransferState::Cancelled:
                        EmitProgress(session_id, file, last_bytes, TransferStatus::Cancelled, started);
                        return R::Err(TransferFailure::Cancelled(std::format("{} cancelled by the transport", file.name)));
                    case interfaces::NativeTransferState::Paused:
                        last_change = now;
                        EmitProgress(session_id, file, last_bytes, TransferStatus::Paused, started);
                        break;
                    case interfaces::NativeTransferState::Running:
                        EmitProgress(session_id, file, last_bytes, TransferStatus::Transferring, started);
                        break;
                }
            }
            if (context.control->paused) {
                last_change = now;
                continue;
            }
            if (now - last_change >= config_.GetStallThreshold()) {
                const std::string reason = std::format("Transfer stalled: no progress on {} for {}ms",
                                                       file.name, config_.GetStallThreshold().count());
                EmitProgress(session_id, file, last_bytes, TransferStatus::Failed, started, reason);
                return R::Err(TransferFailure::Stalled(reason));
            }
        }
    }

    Result<Unit, TransferFailure> TransferOrchestrator::StartReceiving(
        const std::string& session_id,
        const std::string& connection_token,
        const std::string& connection_method,
        const std::filesystem::path& save_path) {
        using R = Result<Unit, TransferFailure>;
        auto control = std::make_shared<SessionControl>();
        {
            std::lock_guard admission(admission_lock_);
            std::lock_guard guard(lock_);
            if (active_.contains(session_id)) {
                return R::Err(TransferFailure::InvalidTransition(std::format("Session {} is already active", session_id)));
            }
            if (active_.size() >= config_.GetMaxConcurrentSessions()) {
                return R::Err(TransferFailure::ConcurrencyLimit(
                    std::format("{} transfer sessions already active", active_.size())));
            }
            control->transfer_id = next_transfer_id_.fetch_add(1);
            ActiveTransfer transfer;
            transfer.control = control;
            transfer.connection_token = connection_token;
            transfer.session.id = session_id;
            transfer.session.transfer_id = control->transfer_id;
            transfer.session.target_device_id = connection_token;
            transfer.session.connection_method = connection_method;
            transfer.session.direction = TransferDirection::Incoming;
            transfer.session.created_at = Now();
            active_.emplace(session_id, std::move(transfer));
        }
        status_.Register(session_id, TransferStatus::Pending);
        SessionReleaser releaser(*this, session_id);
        AIRLINK_TRY(status_.Transition(session_id, TransferStatus::Connecting));

        const TransportCapabilities capabilities = transport_->GetCapabilities(connection_method);
        control->native = capabilities.native_file_transfer;
        if (capabilities.native_file_transfer &&
            !transport_->StartReceive(connection_token, control->transfer_id, save_path.string())) {
            return Fail(session_id, TransferFailure::NativeFailure(
                std::format("Transport refused to receive into {}", save_path.string())));
        }

        ReceiveContext context;
        context.session_id = session_id;
        context.connection_token = connection_token;
        context.connection_method = connection_method;
        context.save_path = save_path;
        context.transfer_id = control->transfer_id;
        context.control = control;
        context.keep_partials = resume_store_ != nullptr;

        auto last_activity = Now();
        while (!context.transfer_ended) {
            if (control->cancelled) {
                return R::Err(TransferFailure::Cancelled(std::format("Session {} was cancelled", session_id)));
            }
            const auto frame = transport_->Receive(connection_token, kReceivePollInterval);
            const auto now = Now();
            if (capabilities.native_file_transfer &&
                transport_->NextProgress(control->transfer_id, std::chrono::milliseconds(0)).has_value()) {
                last_activity = now;
            }
            if (!frame.has_value()) {
                if (control->paused) {
                    last_activity = now;
                } else if (now - last_activity >= config_.GetStallThreshold()) {
                    return Fail(session_id, TransferFailure::Stalled(std::format(
                        "Transfer stalled: nothing received for {}ms", config_.GetStallThreshold().count())));
                }
                continue;
            }
            last_activity = now;
            if (auto handled = HandleReceiveFrame(context, *frame); handled.IsErr()) {
                return Fail(session_id, std::move(handled).UnwrapErr());
            }
        }

        if (const auto failed = context.FailedNames(); !failed.empty()) {
            return Fail(session_id, TransferFailure::PartialFailure(
                std::string(kPartialFailurePrefix) + JoinNames(failed)));
        }
        AIRLINK_TRY(status_.Transition(session_id, TransferStatus::Completed));
        logging::Get()->info("Session {}: received {} file(s)", session_id, context.outcomes.size());
        return R::Ok(unit);
    }

    Result<Unit, TransferFailure> TransferOrchestrator::HandleReceiveFrame(
        ReceiveContext& context,
        std::span<const uint8_t> frame) {
        using R = Result<Unit, TransferFailure>;
        if (!ControlMessageCodec::IsJsonFrame(frame)) {
            auto envelope = WireFrameCodec::Decode(frame);
            if (envelope.IsErr()) {
                logging::Get()->warn("Session {}: dropping binary frame: {}",
                                     context.session_id, envelope.UnwrapErr().message);
                return R::Ok(unit);
            }
            if (envelope.Unwrap().type != WireFrameType::Data) {
                logging::Get()->debug("Session {}: ignoring wire frame of type {}",
                                      context.session_id, static_cast<int>(envelope.Unwrap().type));
                return R::Ok(unit);
            }
            auto chunk = ChunkFrameCodec::Decode(envelope.Unwrap().payload);
            if (chunk.IsErr()) {
                logging::Get()->warn("Session {}: dropping chunk frame: {}", context.session_id, chunk.UnwrapErr().message);
                return R::Ok(unit);
            }
            const ChunkFrame& decoded = chunk.Unwrap();
            OnFileChunk(context, decoded.file_id, decoded.offset, decoded.data,
                        envelope.Unwrap().IsEncrypted(), std::nullopt);
            return R::Ok(unit);
        }

        auto decoded = ControlMessageCodec::Decode(frame);
        if (decoded.IsErr()) {
            logging::Get()->warn("Session {}: dropping control frame: {}", context.session_id, decoded.UnwrapErr().message);
            return R::Ok(unit);
        }
        const ControlMessage message = std::move(decoded).Unwrap();
        const std::string& peer_session = ControlMessageCodec::SessionId(message);
        const bool is_handshake = std::holds_alternative<HandshakeMessage>(message);

        if (!context.crypto_session_id.empty() && peer_session != context.crypto_session_id) {
            logging::Get()->debug("Session {}: ignoring '{}' for foreign session {}",
                                  context.session_id, ControlMessageCodec::TypeName(message), peer_session);
            return R::Ok(unit);
        }
        if (is_handshake) {
            AIRLINK_TRY(status_.Transition(context.session_id, TransferStatus::Handshaking));
            context.crypto_session_id = peer_session;
            std::lock_guard guard(lock_);
            if (const auto it = active_.find(context.session_id); it != active_.end()) {
                it->second.crypto_session_id = peer_session;
            }
        }

        auto handled = handshake_->HandleMessage(
            context.connection_token, context.connection_method, context.connection_token, message);
        if (handled.IsErr()) {
            return R::Err(TransferFailure::FromHandshakeFailure(handled.UnwrapErr()));
        }
        if (handled.Unwrap()) {
            if (std::holds_alternative<VerifyMessage>(message)) {
                context.verified = true;
                AIRLINK_TRY(status_.Transition(context.session_id, TransferStatus::Transferring));
            }
            return R::Ok(unit);
        }

        if (const auto* meta = std::get_if<FileMetaMessage>(&message)) {
            OnFileMeta(context, *meta);
        } else if (const auto* chunk = std::get_if<FileChunkMessage>(&message)) {
            OnFileChunk(context, chunk->file_id, chunk->offset, chunk->data, chunk->encrypted, chunk->size);
        } else if (const auto* end = std::get_if<FileEndMessage>(&message)) {
            OnFileEnd(context, end->file_id);
        } else if (std::holds_alternative<TransferEndMessage>(message)) {
            context.transfer_ended = true;
        } else {
            logging::Get()->debug("Session {}: ignoring '{}'", context.session_id, ControlMessageCodec::TypeName(message));
        }
        return R::Ok(unit);
    }

    void TransferOrchestrator::OnFileMeta(ReceiveContext& context, const FileMetaMessage& meta) {
        if (!context.verified) {
            logging::Get()->warn("Session {}: file_meta for {} before verification", context.session_id, meta.file_id);
            FileResultMessage refused{meta.session_id, meta.file_id, false,
                                      Describe(TransferFailure::Rejected("").Code(), "session not verified")};
            if (auto sent = channel_.Send(context.connection_token, refused); sent.IsErr()) {
                logging::Get()->warn("Session {}: {}", context.session_id, sent.UnwrapErr().message);
            }
            return;
        }
        TransferFile file;
        file.id = meta.file_id;
        file.name = meta.name.empty() ? meta.file_id : meta.name;
        file.path = (context.save_path / SafeFileName(meta.name, meta.file_id)).string();
        file.size = meta.size;
        file.mime_type = meta.mime_type;

        if (const auto previous = context.receivers.find(file.id); previous != context.receivers.end()) {
            if (!context.keep_partials) {
                previous->second->Discard();
            } else if (auto closed = previous->second->Close(); closed.IsErr()) {
                logging::Get()->warn("Session {}: {}", context.session_id, closed.UnwrapErr().message);
            }
            context.receivers.erase(previous);
        }
        context.rejected.erase(file.id);
        context.outcomes.erase(file.id);
        if (!context.files.contains(file.id)) {
            context.announced.push_back(file.id);
        }
        context.files[file.id] = file;
        context.started[file.id] = Now();
        {
            std::lock_guard guard(lock_);
            if (const auto it = active_.find(context.session_id); it != active_.end()) {
                auto& known = it->second.session.files;
                const bool seen = std::any_of(known.begin(), known.end(),
                                              [&](const TransferFile& f) { return f.id == file.id; });
                if (!seen) {
                    known.push_back(file);
                }
            }
        }

        const bool protected_session =
            sessions_.GetPayloadProtection(context.crypto_session_id) != PayloadProtection::Passthrough;
        if (protected_session && (!meta.checksum.has_value() || meta.checksum->empty())) {
            std::string reason = context.Reject(file.id, TransferFailure::Rejected(
                std::format("{} was announced without a checksum on an encrypted session", file.name)));
            FinishFile(context, file.id, std::move(reason), 0);
            return;
        }

        FileReceiveState state;
        state.file_id = file.id;
        state.file_name = file.name;
        state.destination = file.path;
        state.expected_bytes = file.size;
        state.checksum = meta.checksum;
        state.require_checksum = protected_session;
        auto opened = FileReceiver::Open(std::move(state), meta.chunk_size, resume_store_.get(), context.connection_token);
        if (opened.IsErr()) {
            std::string reason = context.Reject(file.id, opened.UnwrapErr());
            FinishFile(context, file.id, std::move(reason), 0);
            return;
        }
        std::unique_ptr<FileReceiver> receiver = std::move(opened).Unwrap();
        FileReadyMessage ready;
        ready.session_id = context.crypto_session_id;
        ready.file_id = file.id;
        ready.resumed = receiver->Resumed();
        if (ready.resumed) {
            ready.missing_chunks = receiver->MissingChunks();
        }
        const uint64_t already = receiver->State().written_bytes;
        context.receivers[file.id] = std::move(receiver);
        if (auto sent = channel_.Send(context.connection_token, ready); sent.IsErr()) {
            logging::Get()->warn("Session {}: file_ready for {} not delivered: {}",
                                 context.session_id, file.name, sent.UnwrapErr().message);
        }
        EmitProgress(context.session_id, file, already, TransferStatus::Transferring, context.started[file.id]);
    }

    void TransferOrchestrator::OnFileChunk(
        ReceiveContext& context,
        const std::string& file_id,
        const uint64_t offset,
        std::span<const uint8_t> data,
        const bool claims_encrypted,
        const std::optional<uint64_t> plain_size) {
        if (!context.verified) {
            logging::Get()->warn("Session {}: dropping chunk for {} before verification", context.session_id, file_id);
            return;
        }
        if (context.rejected.contains(file_id)) {
            return;
        }
        const auto it = context.receivers.find(file_id);
        if (it == context.receivers.end()) {
            logging::Get()->debug("Session {}: chunk for unannounced file {}", context.session_id, file_id);
            return;
        }

        const bool local = sessions_.UsesLocalEncryption(context.crypto_session_id);
        if (claims_encrypted != local) {
            context.Reject(file_id, TransferFailure::Rejected(
                local ? "Plaintext chunk on a session that encrypts locally"
                      : "Encrypted chunk on a session that is not encrypting locally"));
            return;
        }
        std::vector<uint8_t> plain;
        std::span<const uint8_t> bytes = data;
        if (local) {
            auto payload = EncryptedPayload::FromCombined(data);
            if (payload.IsErr()) {
                context.Reject(file_id, TransferFailure::Rejected(payload.UnwrapErr().message));
                return;
            }
            auto opened = sessions_.DecryptData(context.crypto_session_id, payload.Unwrap(), FileAad(file_id));
            if (opened.IsErr()) {
                const SessionFailure& failure = opened.UnwrapErr();
                context.Reject(file_id, TransferFailure::Rejected(Describe(failure.Code(), failure.message)));
                return;
            }
            plain = std::move(opened).Unwrap();
            bytes = plain;
        }
        if (plain_size.has_value() && *plain_size != bytes.size()) {
            context.Reject(file_id, TransferFailure::Rejected(std::format(
                "Chunk at {} declares {} bytes but holds {}", offset, *plain_size, bytes.size())));
            return;
        }

        if (auto written = it->second->WriteChunk(offset, bytes); written.IsErr()) {
            context.Reject(file_id, written.UnwrapErr());
            return;
        }
        const TransferFile& file = context.files[file_id];
        EmitProgress(context.session_id, file, it->second->State().written_bytes,
                     TransferStatus::Transferring, context.started[file_id]);
    }

    void TransferOrchestrator::OnFileEnd(ReceiveContext& context, const std::string& file_id) {
        if (!context.verified) {
            logging::Get()->warn("Session {}: file_end for {} before verification", context.session_id, file_id);
            return;
        }
        if (!context.files.contains(file_id)) {
            logging::Get()->warn("Session {}: file_end for unannounced file {}", context.session_id, file_id);
            return;
        }

        std::optional<std::string> reason;
        uint64_t written = 0;
        if (const auto rejected = context.rejected.find(file_id); rejected != context.rejected.end()) {
            reason = rejected->second;
        } else if (const auto receiver = context.receivers.find(file_id); receiver == context.receivers.end()) {
            reason = Describe(TransferFailure::Rejected("").Code(), "file was never opened");
        } else {
            written = receiver->second->State().written_bytes;
            if (auto verified = receiver->second->VerifyChecksum(); verified.IsErr()) {
                const ValidationFailure& failure = verified.UnwrapErr();
                reason = Describe(failure.Code(), failure.message);
            }
        }
        FinishFile(context, file_id, std::move(reason), written);
    }

    void TransferOrchestrator::FinishFile(
        ReceiveContext& context,
        const std::string& file_id,
        std::optional<std::string> reason,
        const uint64_t written) {
        const TransferFile file = context.files.at(file_id);
        context.receivers.erase(file_id);
        context.rejected.erase(file_id);

        const bool success = !reason.has_value();
        FileResultMessage outcome{context.crypto_session_id, file_id, success, reason.value_or("")};
        if (auto sent = channel_.Send(context.connection_token, outcome); sent.IsErr()) {
            logging::Get()->warn("Session {}: file_result for {} not delivered: {}",
                                 context.session_id, file.name, sent.UnwrapErr().message);
        }
        if (success) {
            EmitProgress(context.session_id, file, written, TransferStatus::Completed, context.started[file_id]);
        } else {
            logging::Get()->warn("Session {}: {} failed: {}", context.session_id, file.name, *reason);
            EmitProgress(context.session_id, file, written, TransferStatus::Failed, context.started[file_id], reason);
        }
        context.outcomes[file_id] = success;
        queue_events_.Publish(TransferQueueProgress{context.session_id, context.outcomes.size(), context.files.size()});
    }

    Result<Unit, TransferFailure> TransferOrchestrator::PauseTransfer(const std::string& session_id) {
        const auto control = ControlFor(session_id);
        if (!control) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::SessionNotFound(std::format("No active session {}", session_id)));
        }
        AIRLINK_TRY(status_.Transition(session_id, TransferStatus::Paused));
        control->paused = true;
        if (control->native && !transport_->Pause(control->transfer_id)) {
            return Result<Unit, TransferFailure>::Err(TransferFailure::NativeFailure(
                std::format("Transport could not pause transfer {}", control->transfer_id)));
        }
        logging::Get()->info("Session {} paused", session_id);
        return Result<Unit, TransferFailure>::Ok(unit);
    }

    Result<Unit, TransferFailure> TransferOrchestrator::ResumeTransfer(const std::string& session_id) {
        const auto control = ControlFor(session_id);
        if (!control) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::SessionNotFound(std::format("No active session {}", session_id)));
        }
        AIRLINK_TRY(status_.Transition(session_id, TransferStatus::Resuming));
        if (control->native && !transport_->Resume(control->transfer_id)) {
            return Result<Unit, TransferFailure>::Err(TransferFailure::NativeFailure(
                std::format("Transport could not resume transfer {}", control->transfer_id)));
        }
        control->paused = false;
        AIRLINK_TRY(status_.Transition(session_id, TransferStatus::Transferring));
        logging::Get()->info("Session {} resumed", session_id);
        return Result<Unit, TransferFailure>::Ok(unit);
    }

    Result<Unit, TransferFailure> TransferOrchestrator::CancelTransfer(const std::string& session_id) {
        const auto control = ControlFor(session_id);
        if (!control) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::SessionNotFound(std::format("No active session {}", session_id)));
        }
        if (control->cancelled.exchange(true)) {
            return Result<Unit, TransferFailure>::Ok(unit);
        }
        if (control->native && !transport_->Cancel(control->transfer_id)) {
            logging::Get()->warn("Session {}: transport did not acknowledge cancel", session_id);
        }
        if (auto cancelled = status_.Transition(session_id, TransferStatus::Cancelled, "Cancelled"); cancelled.IsErr()) {
            logging::Get()->debug("Session {}: {}", session_id, cancelled.UnwrapErr().message);
        }
        Release(session_id);
        logging::Get()->info("Session {} cancelled", session_id);
        return Result<Unit, TransferFailure>::Ok(unit);
    }

    Result<Unit, TransferFailure> TransferOrchestrator::Fail(const std::string& session_id, TransferFailure failure) {
        logging::Get()->error("Session {} failed ({}): {}", session_id, failure.Code(), failure.message);
        if (auto failed = status_.Transition(session_id, TransferStatus::Failed, failure.message); failed.IsErr()) {
            logging::Get()->debug("Session {}: {}", session_id, failed.UnwrapErr().message);
        }
        return Result<Unit, TransferFailure>::Err(std::move(failure));
    }

    void TransferOrchestrator::OnStatusCommitted(const StatusUpdate& update) {
        {
            std::lock_guard guard(lock_);
            const auto it = active_.find(update.session_id);
            if (it == active_.end()) {
                return;
            }
            TransferSession& session = it->second.session;
            if (IsTerminal(session.status) && !IsTerminal(update.status)) {
                return;
            }
            session.status = update.status;
            if (IsTerminal(update.status) && update.message.has_value() && update.status != TransferStatus::Completed) {
                session.error_message = update.message;
            }
        }
        status_events_.Publish(update);
    }

    void TransferOrchestrator::Release(const std::string& session_id) {
        std::shared_ptr<SessionControl> control;
        std::optional<std::string> token;
        std::string crypto_session_id;
        {
            std::lock_guard guard(lock_);
            const auto it = active_.find(session_id);
            if (it == active_.end()) {
                return;
            }
            control = it->second.control;
            token = it->second.connection_token;
            crypto_session_id = it->second.crypto_session_id;
        }
        if (control->released.exchange(true)) {
            return;
        }
        if (!crypto_session_id.empty()) {
            handshake_->Forget(crypto_session_id);
            sessions_.EndSession(crypto_session_id);
        }
        if (token.has_value()) {
            transport_->CloseConnection(*token);
        }
        checksums_.ClearSession(session_id);
        status_.Forget(session_id);
        {
            std::lock_guard guard(lock_);
            const auto it = active_.find(session_id);
            if (it == active_.end()) {
                return;
            }
            TransferSession session = std::move(it->second.session);
            session.completed_at = Now();
            active_.erase(it);
            history_.push_back(std::move(session));
        }
        logging::Get()->debug("Session {} released", session_id);
    }

    void TransferOrchestrator::EmitProgress(
        const std::string& session_id,
        const TransferFile& file,
        const uint64_t bytes,
        const TransferStatus status,
        const std::chrono::steady_clock::time_point started_at,
        std::optional<std::string> error) {
        TransferProgress progress;
        progress.transfer_id = session_id;
        progress.file_id = file.id;
        progress.file_name = file.name;
        progress.bytes_transferred = bytes;
        progress.total_bytes = file.size;
        if (file.size > 0) {
            progress.progress = std::min(1.0, static_cast<double>(bytes) / static_cast<double>(file.size));
        } else {
            progress.progress = status == TransferStatus::Completed ? 1.0 : 0.0;
        }
        const double elapsed = std::chrono::duration<double>(Now() - started_at).count();
        progress.speed = elapsed > 0.0 ? static_cast<double>(bytes) / elapsed : 0.0;
        progress.status = status;
        progress.started_at = started_at;
        progress.error_message = std::move(error);
        progress_events_.Publish(progress);
    }

    bool TransferOrchestrator::WaitWhilePaused(const SessionControl& control) const {
        while (control.paused && !control.cancelled) {
            std::this_thread::sleep_for(kReceivePollInterval);
        }
        return !control.cancelled;
    }

    bool TransferOrchestrator::SleepUnlessCancelled(
        const SessionControl& control,
        const std::chrono::milliseconds duration) const {
        const auto deadline = std::chrono::steady_clock::now() + duration;
        while (!control.cancelled) {
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                return true;
            }
            std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(deadline - now, kReceivePollInterval));
        }
        return false;
    }

    SubscriptionId TransferOrchestrator::SubscribeProgress(EventChannel<TransferProgress>::Handler handler) {
        return progress_events_.Subscribe(std::move(handler));
    }

    SubscriptionId TransferOrchestrator::SubscribeQueueProgress(EventChannel<TransferQueueProgress>::Handler handler) {
        return queue_events_.Subscribe(std::move(handler));
    }

    SubscriptionId TransferOrchestrator::SubscribeStatus(EventChannel<StatusUpdate>::Handler handler) {
        return status_events_.Subscribe(std::move(handler));
    }

    bool TransferOrchestrator::Unsubscribe(const SubscriptionId id) {
        return progress_events_.Unsubscribe(id) || queue_events_.Unsubscribe(id) || status_events_.Unsubscribe(id);
    }

    std::vector<TransferSession> TransferOrchestrator::GetActiveTransfers() const {
        std::lock_guard guard(lock_);
        std::vector<TransferSession> sessions;
        sessions.reserve(active_.size());
        for (const auto& [session_id, transfer] : active_) {
            sessions.push_back(transfer.session);
        }
        return sessions;
    }

    std::vector<TransferSession> TransferOrchestrator::GetTransferHistory() const {
        std::lock_guard guard(lock_);
        return history_;
    }

    std::optional<TransferSession> TransferOrchestrator::GetTransfer(const std::string& session_id) const {
        std::lock_guard guard(lock_);
        if (const auto it = active_.find(session_id); it != active_.end()) {
            return it->second.session;
        }
        for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
            if (it->id == session_id) {
                return *it;
            }
        }
        return std::nullopt;
    }

    size_t TransferOrchestrator::GetActiveTransferCount() const {
        std::lock_guard guard(lock_);
        return active_.size();
    }

    size_t TransferOrchestrator::CleanupCompletedTransfers() {
        const auto now = Now();
        const auto retention = config_.GetHistoryRetention();
        std::lock_guard guard(lock_);
        return std::erase_if(history_, [&](const TransferSession& session) {
            return session.completed_at.has_value() && now - *session.completed_at > retention;
        });
    }
}
