#pragma once
#include "airlink/crypto/crypto_primitives.hpp"
#include "airlink/interfaces/i_transport.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace airlink::test_helpers {

using interfaces::ITransport;
using interfaces::NativeProgress;
using interfaces::NativeTransferRequest;
using interfaces::NativeVerification;
using interfaces::TransportCapabilities;

/**
 * In-memory ITransport. Two endpoints made by CreatePair() deliver every
 * Send() into the other endpoint's inbox; connection tokens are recorded
 * but not used for routing.
 *
 * Native primitives are scripted: progress events are queued with
 * PushProgress(), and the key verification answer is computed from the
 * key handed to SetEncryptionKey() unless failures are injected.
 */
class LoopbackTransport : public ITransport {
public:
    using TamperHook = std::function<void(std::vector<uint8_t>&)>;

    static std::pair<std::shared_ptr<LoopbackTransport>, std::shared_ptr<LoopbackTransport>> CreatePair() {
        auto a = std::make_shared<LoopbackTransport>();
        auto b = std::make_shared<LoopbackTransport>();
        a->peer_ = b;
        b->peer_ = a;
        return {a, b};
    }

    bool Send(const std::string& connection_token, std::span<const uint8_t> bytes) override {
        TamperHook hook;
        {
            std::lock_guard guard(lock_);
            sent_tokens_.push_back(connection_token);
            if (!send_enabled_) {
                return false;
            }
            hook = tamper_;
        }
        std::vector<uint8_t> frame(bytes.begin(), bytes.end());
        if (hook) {
            hook(frame);
        }
        const auto peer = peer_.lock();
        if (!peer) {
            return false;
        }
        peer->Deliver(std::move(frame));
        return true;
    }

    std::optional<std::vector<uint8_t>> Receive(
        const std::string&,
        const std::chrono::milliseconds timeout) override {
        std::unique_lock lock(lock_);
        if (!inbox_ready_.wait_for(lock, timeout, [this] { return !inbox_.empty(); })) {
            return std::nullopt;
        }
        std::vector<uint8_t> frame = std::move(inbox_.front());
        inbox_.pop_front();
        return frame;
    }

    bool StartTransfer(const NativeTransferRequest& request) override {
        std::lock_guard guard(lock_);
        transfer_requests_.push_back(request);
        return start_result_;
    }

    bool StartReceive(const std::string&, const int64_t transfer_id, const std::string&) override {
        std::lock_guard guard(lock_);
        receive_ids_.push_back(transfer_id);
        return start_result_;
    }

    bool Pause(const int64_t transfer_id) override {
        std::lock_guard guard(lock_);
        paused_ids_.push_back(transfer_id);
        return true;
    }

    bool Resume(const int64_t transfer_id) override {
        std::lock_guard guard(lock_);
        resumed_ids_.push_back(transfer_id);
        return true;
    }

    bool Cancel(const int64_t transfer_id) override {
        std::lock_guard guard(lock_);
        cancelled_ids_.push_back(transfer_id);
        return true;
    }

    void CloseConnection(const std::string& connection_token) override {
        std::lock_guard guard(lock_);
        closed_tokens_.push_back(connection_token);
    }

    bool SetEncryptionKey(const std::string&, std::span<const uint8_t> key) override {
        std::lock_guard guard(lock_);
        if (!accept_key_) {
            return false;
        }
        native_key_.assign(key.begin(), key.end());
        return true;
    }

    std::optional<NativeVerification> VerifyEncryptionKey(
        const std::string&,
        std::span<const uint8_t> test_payload) override {
        std::vector<uint8_t> key;
        {
            std::lock_guard guard(lock_);
            ++verify_calls_;
            if (verify_failures_ > 0) {
                --verify_failures_;
                return std::nullopt;
            }
            key = native_key_;
        }
        auto sealed = crypto::CryptoPrimitives::Encrypt(key, test_payload);
        if (sealed.IsErr()) {
            return std::nullopt;
        }
        crypto::EncryptedPayload payload = std::move(sealed).Unwrap();
        return NativeVerification{payload.ciphertext, payload.iv, payload.tag};
    }

    std::optional<NativeProgress> NextProgress(
        const int64_t transfer_id,
        const std::chrono::milliseconds timeout) override {
        std::unique_lock lock(lock_);
        const auto ready = [&] {
            for (const auto& progress : progress_) {
                if (progress.transfer_id == transfer_id) {
                    return true;
                }
            }
            return false;
        };
        if (!progress_ready_.wait_for(lock, timeout, ready)) {
            return std::nullopt;
        }
        for (auto it = progress_.begin(); it != progress_.end(); ++it) {
            if (it->transfer_id == transfer_id) {
                NativeProgress progress = *it;
                progress_.erase(it);
                return progress;
            }
        }
        return std::nullopt;
    }

    TransportCapabilities GetCapabilities(std::string_view) const override {
        std::lock_guard guard(lock_);
        return capabilities_;
    }

    void SetCapabilities(const TransportCapabilities capabilities) {
        std::lock_guard guard(lock_);
        capabilities_ = capabilities;
    }

    /// Runs on every outgoing frame before delivery.
    void SetTamperHook(TamperHook hook) {
        std::lock_guard guard(lock_);
        tamper_ = std::move(hook);
    }

    void SetSendEnabled(const bool enabled) {
        std::lock_guard guard(lock_);
        send_enabled_ = enabled;
    }

    void SetStartResult(const bool result) {
        std::lock_guard guard(lock_);
        start_result_ = result;
    }

    void SetAcceptKey(const bool accept) {
        std::lock_guard guard(lock_);
        accept_key_ = accept;
    }

    /// The next @p count VerifyEncryptionKey() calls get no answer.
    void FailNextVerifications(const int count) {
        std::lock_guard guard(lock_);
        verify_failures_ = count;
    }

    void PushProgress(const NativeProgress& progress) {
        {
            std::lock_guard guard(lock_);
            progress_.push_back(progress);
        }
        progress_ready_.notify_all();
    }

    void Deliver(std::vector<uint8_t> frame) {
        {
            std::lock_guard guard(lock_);
            inbox_.push_back(std::move(frame));
        }
        inbox_ready_.notify_all();
    }

    [[nodiscard]] int VerifyCalls() const {
        std::lock_guard guard(lock_);
        return verify_calls_;
    }

    [[nodiscard]] std::vector<uint8_t> NativeKey() const {
        std::lock_guard guard(lock_);
        return native_key_;
    }

    [[nodiscard]] std::vector<NativeTransferRequest> TransferRequests() const {
        std::lock_guard guard(lock_);
        return transfer_requests_;
    }

    [[nodiscard]] std::vector<int64_t> CancelledIds() const {
        std::lock_guard guard(lock_);
        return cancelled_ids_;
    }

    [[nodiscard]] std::vector<int64_t> PausedIds() const {
        std::lock_guard guard(lock_);
        return paused_ids_;
    }

    [[nodiscard]] std::vector<int64_t> ResumedIds() const {
        std::lock_guard guard(lock_);
        return resumed_ids_;
    }

    [[nodiscard]] std::vector<std::string> ClosedTokens() const {
        std::lock_guard guard(lock_);
        return closed_tokens_;
    }

    [[nodiscard]] std::vector<std::string> SentTokens() const {
        std::lock_guard guard(lock_);
        return sent_tokens_;
    }

private:
    mutable std::mutex lock_;
    std::condition_variable inbox_ready_;
    std::condition_variable progress_ready_;
    std::weak_ptr<LoopbackTransport> peer_;
    std::deque<std::vector<uint8_t>> inbox_;
    std::deque<NativeProgress> progress_;
    TransportCapabilities capabilities_;
    TamperHook tamper_;
    bool send_enabled_ = true;
    bool start_result_ = true;
    bool accept_key_ = true;
    int verify_failures_ = 0;
    int verify_calls_ = 0;
    std::vector<uint8_t> native_key_;
    std::vector<NativeTransferRequest> transfer_requests_;
    std::vector<int64_t> receive_ids_;
    std::vector<int64_t> paused_ids_;
    std::vector<int64_t> resumed_ids_;
    std::vector<int64_t> cancelled_ids_;
    std::vector<std::string> closed_tokens_;
    std::vector<std::string> sent_tokens_;
};

}
