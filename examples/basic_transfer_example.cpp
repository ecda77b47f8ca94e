/**
 * @file basic_transfer_example.cpp
 * @brief Two in-process devices exchanging a file over an encrypted session
 */

#include "airlink/configuration/handshake_config.hpp"
#include "airlink/configuration/session_config.hpp"
#include "airlink/configuration/transfer_config.hpp"
#include "airlink/core/logging.hpp"
#include "airlink/crypto/sodium_interop.hpp"
#include "airlink/interfaces/i_connection_directory.hpp"
#include "airlink/interfaces/i_transport.hpp"
#include "airlink/protocol/handshake_protocol.hpp"
#include "airlink/security/key_manager.hpp"
#include "airlink/session/secure_session_manager.hpp"
#include "airlink/transfer/transfer_orchestrator.hpp"

#include <condition_variable>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

using namespace airlink;
using namespace airlink::configuration;
using namespace airlink::interfaces;

namespace {

/// Memory pipe: whatever one end sends, the other end receives. No native primitives.
class PipeTransport final : public ITransport {
public:
    static std::pair<std::shared_ptr<PipeTransport>, std::shared_ptr<PipeTransport>> Pair() {
        auto a = std::make_shared<PipeTransport>();
        auto b = std::make_shared<PipeTransport>();
        a->peer_ = b;
        b->peer_ = a;
        return {a, b};
    }

    bool Send(const std::string&, std::span<const uint8_t> bytes) override {
        const auto peer = peer_.lock();
        if (!peer) {
            return false;
        }
        {
            std::lock_guard guard(peer->lock_);
            peer->inbox_.emplace_back(bytes.begin(), bytes.end());
        }
        peer->ready_.notify_all();
        return true;
    }

    std::optional<std::vector<uint8_t>> Receive(const std::string&, std::chrono::milliseconds timeout) override {
        std::unique_lock lock(lock_);
        if (!ready_.wait_for(lock, timeout, [this] { return !inbox_.empty(); })) {
            return std::nullopt;
        }
        std::vector<uint8_t> frame = std::move(inbox_.front());
        inbox_.pop_front();
        return frame;
    }

    bool StartTransfer(const NativeTransferRequest&) override { return false; }
    bool StartReceive(const std::string&, int64_t, const std::string&) override { return false; }
    bool Pause(int64_t) override { return true; }
    bool Resume(int64_t) override { return true; }
    bool Cancel(int64_t) override { return true; }
    void CloseConnection(const std::string&) override {}
    bool SetEncryptionKey(const std::string&, std::span<const uint8_t>) override { return false; }

    std::optional<NativeVerification> VerifyEncryptionKey(const std::string&, std::span<const uint8_t>) override {
        return std::nullopt;
    }

    std::optional<NativeProgress> NextProgress(int64_t, std::chrono::milliseconds) override {
        return std::nullopt;
    }

    TransportCapabilities GetCapabilities(std::string_view) const override { return {}; }

private:
    std::weak_ptr<PipeTransport> peer_;
    std::mutex lock_;
    std::condition_variable ready_;
    std::deque<std::vector<uint8_t>> inbox_;
};

class StaticDirectory final : public IConnectionDirectory {
public:
    std::optional<ConnectionInfo> GetConnectionInfo(const std::string& device_id) override {
        if (device_id != "living-room-tablet") {
            return std::nullopt;
        }
        return ConnectionInfo{std::string("pipe-1"), std::string(kMethodP2p)};
    }
};

struct Device {
    std::unique_ptr<security::KeyManager> keys;
    std::unique_ptr<session::SecureSessionManager> sessions;
    std::shared_ptr<protocol::HandshakeProtocol> handshake;
    std::unique_ptr<transfer::TransferOrchestrator> orchestrator;
};

Result<Device, TransferFailure> MakeDevice(const std::shared_ptr<ITransport>& transport) {
    using R = Result<Device, TransferFailure>;
    Device device;
    auto keys = security::KeyManager::Create();
    if (keys.IsErr()) {
        return R::Err(TransferFailure::NativeFailure(keys.UnwrapErr().message));
    }
    device.keys = std::move(keys).Unwrap();
    auto sessions = session::SecureSessionManager::Create(*device.keys, transport);
    if (sessions.IsErr()) {
        return R::Err(TransferFailure::FromSessionFailure(sessions.UnwrapErr()));
    }
    device.sessions = std::move(sessions).Unwrap();
    auto handshake = protocol::HandshakeProtocol::Create(*device.sessions, transport);
    if (handshake.IsErr()) {
        return R::Err(TransferFailure::FromHandshakeFailure(handshake.UnwrapErr()));
    }
    device.handshake = std::move(handshake).Unwrap();
    auto orchestrator = transfer::TransferOrchestrator::Create(
        transport, std::make_shared<StaticDirectory>(), *device.sessions, device.handshake,
        TransferConfig::Default().WithChunkSize(16 * 1024));
    if (orchestrator.IsErr()) {
        return R::Err(std::move(orchestrator).UnwrapErr());
    }
    device.orchestrator = std::move(orchestrator).Unwrap();
    return R::Ok(std::move(device));
}

}

int main() {
    std::cout << "=== AirLink - Basic Transfer Example ===" << std::endl << std::endl;
    logging::SetLevel(spdlog::level::warn);

    if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
        std::cerr << "Failed to initialize libsodium: " << init.UnwrapErr().message << std::endl;
        return 1;
    }

    const auto workdir = std::filesystem::temp_directory_path() / "airlink-example";
    const auto outbox = workdir / "outbox";
    const auto inbox = workdir / "inbox";
    std::filesystem::create_directories(outbox);
    std::filesystem::create_directories(inbox);

    std::cout << "1. Writing a 200 KiB file to send..." << std::endl;
    const auto source = outbox / "slides.pdf";
    {
        std::ofstream out(source, std::ios::binary | std::ios::trunc);
        for (int i = 0; i < 200 * 1024; ++i) {
            out.put(static_cast<char>(i % 251));
        }
    }

    std::cout << "2. Creating two devices on a memory pipe..." << std::endl;
    auto [phone_link, tablet_link] = PipeTransport::Pair();
    auto phone = MakeDevice(phone_link);
    auto tablet = MakeDevice(tablet_link);
    if (phone.IsErr() || tablet.IsErr()) {
        std::cerr << "Failed to create devices" << std::endl;
        return 1;
    }
    Device& sender = phone.Unwrap();
    Device& receiver = tablet.Unwrap();

    sender.orchestrator->SubscribeProgress([](const transfer::TransferProgress& progress) {
        if (progress.status == transfer::TransferStatus::Completed) {
            std::cout << "   " << progress.file_name << ": " << progress.bytes_transferred
                      << " bytes at " << static_cast<uint64_t>(progress.speed / 1024.0) << " KiB/s" << std::endl;
        }
    });
    sender.orchestrator->SubscribeStatus([](const transfer::StatusUpdate& update) {
        std::cout << "   status -> " << transfer::ToString(update.status) << std::endl;
    });

    std::cout << "3. Sending..." << std::endl;
    transfer::TransferFile file;
    file.path = source.string();
    file.mime_type = "application/pdf";
    auto started = sender.orchestrator->StartSession("living-room-tablet", std::string(kMethodP2p), {file});
    if (started.IsErr()) {
        std::cerr << "Admission refused: " << started.UnwrapErr().message << std::endl;
        return 1;
    }
    const std::string session_id = started.Unwrap();

    std::optional<Result<Unit, TransferFailure>> received;
    std::thread receive_thread([&] {
        received.emplace(receiver.orchestrator->StartReceiving("incoming", "pipe-1", std::string(kMethodP2p), inbox));
    });
    auto sent = sender.orchestrator->SendFiles(session_id);
    receive_thread.join();

    if (sent.IsErr()) {
        std::cerr << "Send failed: " << sent.UnwrapErr().Code() << " " << sent.UnwrapErr().message << std::endl;
        return 1;
    }
    if (!received.has_value() || received->IsErr()) {
        std::cerr << "Receive failed" << std::endl;
        return 1;
    }

    std::cout << std::endl << "4. Result" << std::endl;
    std::cout << "   ✓ " << (inbox / "slides.pdf").string() << " ("
              << std::filesystem::file_size(inbox / "slides.pdf") << " bytes, checksum verified)" << std::endl;

    std::error_code ec;
    std::filesystem::remove_all(workdir, ec);
    return 0;
}
