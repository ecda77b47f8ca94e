#include "airlink/protocol/control_channel.hpp"

namespace airlink::protocol {
    ControlChannel::ControlChannel(std::shared_ptr<ITransport> transport)
        : transport_(std::move(transport)) {}

    Result<Unit, HandshakeFailure> ControlChannel::Send(
        const std::string& connection_token,
        const ControlMessage& message) const {
        auto encoded = ControlMessageCodec::Encode(message);
        if (encoded.IsErr()) {
            return Result<Unit, HandshakeFailure>::Err(std::move(encoded).UnwrapErr());
        }
        return SendRaw(connection_token, encoded.Unwrap(), ControlMessageCodec::TypeName(message));
    }

    Result<Unit, HandshakeFailure> ControlChannel::SendChunk(
        const std::string& connection_token,
        const ChunkFrame& frame,
        WireFrame envelope) const {
        auto chunk = ChunkFrameCodec::Encode(frame);
        if (chunk.IsErr()) {
            return Result<Unit, HandshakeFailure>::Err(std::move(chunk).UnwrapErr());
        }
        envelope.payload = std::move(chunk).Unwrap();
        auto encoded = WireFrameCodec::Encode(envelope);
        if (encoded.IsErr()) {
            return Result<Unit, HandshakeFailure>::Err(std::move(encoded).UnwrapErr());
        }
        return SendRaw(connection_token, encoded.Unwrap(), "chunk frame");
    }

    Result<Unit, HandshakeFailure> ControlChannel::SendRaw(
        const std::string& connection_token,
        std::span<const uint8_t> bytes,
        const std::string_view what) const {
        if (!transport_->Send(connection_token, bytes)) {
            return Result<Unit, HandshakeFailure>::Err(
                HandshakeFailure::Transport(std::format("Transport refused {} ({} bytes)", what, bytes.size())));
        }
        return Result<Unit, HandshakeFailure>::Ok(unit);
    }
}
