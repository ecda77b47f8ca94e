#pragma once
#include "airlink/configuration/handshake_config.hpp"
#include "airlink/configuration/key_rotation_config.hpp"
#include "airlink/configuration/session_config.hpp"
#include "airlink/configuration/transfer_config.hpp"
#include "airlink/protocol/control_message.hpp"
#include "airlink/protocol/handshake_protocol.hpp"
#include "airlink/security/key_manager.hpp"
#include "airlink/session/secure_session_manager.hpp"
#include "airlink/transfer/transfer_orchestrator.hpp"
#include "helpers/fake_connection_directory.hpp"
#include "helpers/loopback_transport.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace airlink::test_helpers {

using configuration::HandshakeConfig;
using configuration::KeyRotationConfig;
using configuration::SessionConfig;
using configuration::TransferConfig;
using protocol::ControlMessageCodec;
using protocol::HandshakeProtocol;
using security::KeyManager;
using session::SecureSessionManager;
using transfer::TransferOrchestrator;

inline HandshakeConfig FastHandshake() {
    return HandshakeConfig::Default()
        .WithHandshakeTimeout(std::chrono::seconds(3))
        .WithVerifyTimeout(std::chrono::seconds(3))
        .WithRenegotiationTimeout(std::chrono::seconds(3));
}

/// One device: key manager, secure sessions and handshake over one loopback endpoint.
struct SecurePeer {
    std::shared_ptr<LoopbackTransport> transport;
    std::unique_ptr<KeyManager> keys;
    std::unique_ptr<SecureSessionManager> sessions;
    std::shared_ptr<HandshakeProtocol> handshake;

    static SecurePeer Create(
        std::shared_ptr<LoopbackTransport> transport,
        SessionConfig session_config = SessionConfig::Default(),
        HandshakeConfig handshake_config = FastHandshake(),
        KeyRotationConfig rotation = KeyRotationConfig::Default()) {
        SecurePeer peer;
        peer.transport = std::move(transport);
        auto keys = KeyManager::Create(rotation);
        if (keys.IsErr()) {
            throw std::runtime_error(keys.UnwrapErr().message);
        }
        peer.keys = std::move(keys).Unwrap();
        auto sessions = SecureSessionManager::Create(*peer.keys, peer.transport, session_config);
        if (sessions.IsErr()) {
            throw std::runtime_error(sessions.UnwrapErr().message);
        }
        peer.sessions = std::move(sessions).Unwrap();
        auto handshake = HandshakeProtocol::Create(*peer.sessions, peer.transport, handshake_config);
        if (handshake.IsErr()) {
            throw std::runtime_error(handshake.UnwrapErr().message);
        }
        peer.handshake = std::move(handshake).Unwrap();
        peer.keys->SetEventHandler(peer.handshake);
        return peer;
    }

    /**
     * Feeds incoming control frames to HandshakeProtocol::HandleMessage()
     * until @p consumed key-exchange messages were handled or @p timeout ran out.
     * Returns the number handled; stops early on the first error.
     */
    int Serve(const std::string& token, const int consumed, const std::chrono::milliseconds timeout) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        int handled = 0;
        while (handled < consumed && std::chrono::steady_clock::now() < deadline) {
            const auto frame = transport->Receive(token, std::chrono::milliseconds(20));
            if (!frame.has_value() || !ControlMessageCodec::IsJsonFrame(*frame)) {
                continue;
            }
            auto message = ControlMessageCodec::Decode(*frame);
            if (message.IsErr()) {
                continue;
            }
            auto result = handshake->HandleMessage(token, "p2p", "initiator", message.Unwrap());
            if (result.IsErr()) {
                return handled;
            }
            if (result.Unwrap()) {
                ++handled;
            }
        }
        return handled;
    }
};

/// SecurePeer plus a TransferOrchestrator and a fake connection directory.
struct TransferPeer {
    SecurePeer secure;
    std::shared_ptr<FakeConnectionDirectory> directory;
    std::unique_ptr<TransferOrchestrator> orchestrator;

    static TransferPeer Create(
        std::shared_ptr<LoopbackTransport> transport,
        TransferConfig config,
        SessionConfig session_config = SessionConfig::Default(),
        std::optional<std::filesystem::path> resume_directory = std::nullopt,
        TransferOrchestrator::Clock clock = {}) {
        TransferPeer peer;
        peer.secure = SecurePeer::Create(std::move(transport), session_config);
        peer.directory = std::make_shared<FakeConnectionDirectory>();
        auto orchestrator = TransferOrchestrator::Create(
            peer.secure.transport, peer.directory, *peer.secure.sessions, peer.secure.handshake,
            config, std::move(resume_directory), std::move(clock));
        if (orchestrator.IsErr()) {
            throw std::runtime_error(orchestrator.UnwrapErr().message);
        }
        peer.orchestrator = std::move(orchestrator).Unwrap();
        return peer;
    }

    [[nodiscard]] LoopbackTransport& Transport() const { return *secure.transport; }

    [[nodiscard]] TransferOrchestrator& Orchestrator() const { return *orchestrator; }
};

}
