#include "airlink/protocol/control_message.hpp"
#include "airlink/core/constants.hpp"
#include "protocol/control.pb.h"
#include <google/protobuf/util/json_util.h>
#include <format>
#include <type_traits>

namespace airlink::protocol {
    using proto::protocol::ControlFrame;
    using proto::protocol::VerifyPayload;

    namespace {
        constexpr std::string_view kTypeHandshake = "handshake";
        constexpr std::string_view kTypeHandshakeResponse = "handshake_response";
        constexpr std::string_view kTypeVerify = "verify";
        constexpr std::string_view kTypeVerifyAck = "verify_ack";
        constexpr std::string_view kTypeVerifyFail = "verify_fail";
        constexpr std::string_view kTypeFileMeta = "file_meta";
        constexpr std::string_view kTypeFileReady = "file_ready";
        constexpr std::string_view kTypeFileChunk = "file_chunk";
        constexpr std::string_view kTypeFileEnd = "file_end";
        constexpr std::string_view kTypeFileResult = "file_result";
        constexpr std::string_view kTypeTransferEnd = "transfer_end";
        constexpr std::string_view kTypeRekey = "rekey";
        constexpr std::string_view kTypeRekeyResponse = "rekey_response";

        template<typename Repeated>
        void PutBytes(Repeated* field, std::span<const uint8_t> bytes) {
            field->Reserve(static_cast<int>(bytes.size()));
            for (const uint8_t byte : bytes) {
                field->Add(byte);
            }
        }

        template<typename Repeated>
        Result<std::vector<uint8_t>, HandshakeFailure> TakeBytes(const Repeated& field, std::string_view name) {
            std::vector<uint8_t> bytes;
            bytes.reserve(static_cast<size_t>(field.size()));
            for (const uint32_t value : field) {
                if (value > 0xFF) {
                    return Result<std::vector<uint8_t>, HandshakeFailure>::Err(
                        HandshakeFailure::Decode(std::format("Field '{}' holds {} which is not a byte", name, value)));
                }
                bytes.push_back(static_cast<uint8_t>(value));
            }
            return Result<std::vector<uint8_t>, HandshakeFailure>::Ok(std::move(bytes));
        }

        Result<Unit, HandshakeFailure> RequireFileId(const ControlFrame& frame) {
            if (frame.file_id().empty()) {
                return Result<Unit, HandshakeFailure>::Err(
                    HandshakeFailure::Decode(std::format("'{}' message without fileId", frame.type())));
            }
            return Result<Unit, HandshakeFailure>::Ok(unit);
        }

        void FillFrame(ControlFrame& frame, const HandshakeMessage& m) {
            frame.set_type(std::string(kTypeHandshake));
            frame.set_session_id(m.session_id);
            PutBytes(frame.mutable_public_key(), m.public_key);
        }

        void FillFrame(ControlFrame& frame, const HandshakeResponseMessage& m) {
            frame.set_type(std::string(kTypeHandshakeResponse));
            frame.set_session_id(m.session_id);
            PutBytes(frame.mutable_public_key(), m.public_key);
        }

        void FillFrame(ControlFrame& frame, const VerifyMessage& m) {
            frame.set_type(std::string(kTypeVerify));
            frame.set_session_id(m.session_id);
            VerifyPayload* payload = frame.mutable_payload();
            PutBytes(payload->mutable_aad(), m.payload.aad);
            PutBytes(payload->mutable_iv(), m.payload.iv);
            PutBytes(payload->mutable_tag(), m.payload.tag);
            PutBytes(payload->mutable_ciphertext(), m.payload.ciphertext);
        }

        void FillFrame(ControlFrame& frame, const VerifyAckMessage& m) {
            frame.set_type(std::string(kTypeVerifyAck));
            frame.set_session_id(m.session_id);
        }

        void FillFrame(ControlFrame& frame, const VerifyFailMessage& m) {
            frame.set_type(std::string(kTypeVerifyFail));
            frame.set_session_id(m.session_id);
        }

        void FillFrame(ControlFrame& frame, const FileMetaMessage& m) {
            frame.set_type(std::string(kTypeFileMeta));
            frame.set_session_id(m.session_id);
            frame.set_file_id(m.file_id);
            frame.set_name(m.name);
            frame.set_size(m.size);
            if (m.checksum.has_value()) {
                frame.set_checksum(*m.checksum);
            }
            frame.set_mime_type(m.mime_type);
            frame.set_chunk_size(m.chunk_size);
        }

        void FillFrame(ControlFrame& frame, const FileReadyMessage& m) {
            frame.set_type(std::string(kTypeFileReady));
            frame.set_session_id(m.session_id);
            frame.set_file_id(m.file_id);
            frame.set_resumed(m.resumed);
            frame.mutable_missing_chunks()->Reserve(static_cast<int>(m.missing_chunks.size()));
            for (const uint32_t index : m.missing_chunks) {
                frame.add_missing_chunks(index);
            }
        }

        void FillFrame(ControlFrame& frame, const FileChunkMessage& m) {
            frame.set_type(std::string(kTypeFileChunk));
            frame.set_session_id(m.session_id);
            frame.set_file_id(m.file_id);
            PutBytes(frame.mutable_data(), m.data);
            frame.set_offset(m.offset);
            frame.set_size(m.size);
            frame.set_encrypted(m.encrypted);
        }

        void FillFrame(ControlFrame& frame, const FileEndMessage& m) {
            frame.set_type(std::string(kTypeFileEnd));
            frame.set_session_id(m.session_id);
            frame.set_file_id(m.file_id);
        }

        void FillFrame(ControlFrame& frame, const FileResultMessage& m) {
            frame.set_type(std::string(kTypeFileResult));
            frame.set_session_id(m.session_id);
            frame.set_file_id(m.file_id);
            frame.set_success(m.success);
            frame.set_reason(m.reason);
        }

        void FillFrame(ControlFrame& frame, const TransferEndMessage& m) {
            frame.set_type(std::string(kTypeTransferEnd));
            frame.set_session_id(m.session_id);
        }

        void FillFrame(ControlFrame& frame, const RekeyMessage& m) {
            frame.set_type(std::string(kTypeRekey));
            frame.set_session_id(m.session_id);
            PutBytes(frame.mutable_public_key(), m.public_key);
        }

        void FillFrame(ControlFrame& frame, const RekeyResponseMessage& m) {
            frame.set_type(std::string(kTypeRekeyResponse));
            frame.set_session_id(m.session_id);
            PutBytes(frame.mutable_public_key(), m.public_key);
        }

        template<typename KeyMessage>
        Result<ControlMessage, HandshakeFailure> KeyCarrier(const ControlFrame& frame) {
            auto key = TakeBytes(frame.public_key(), "publicKey");
            if (key.IsErr()) {
                return Result<ControlMessage, HandshakeFailure>::Err(std::move(key).UnwrapErr());
            }
            return Result<ControlMessage, HandshakeFailure>::Ok(
                KeyMessage{frame.session_id(), std::move(key).Unwrap()});
        }

        Result<ControlMessage, HandshakeFailure> FromFrame(const ControlFrame& frame) {
            using R = Result<ControlMessage, HandshakeFailure>;
            const std::string& type = frame.type();
            if (frame.session_id().empty()) {
                return R::Err(HandshakeFailure::Decode(std::format("'{}' message without sessionId", type)));
            }
            if (type == kTypeHandshake) {
                return KeyCarrier<HandshakeMessage>(frame);
            }
            if (type == kTypeHandshakeResponse) {
                return KeyCarrier<HandshakeResponseMessage>(frame);
            }
            if (type == kTypeRekey) {
                return KeyCarrier<RekeyMessage>(frame);
            }
            if (type == kTypeRekeyResponse) {
                return KeyCarrier<RekeyResponseMessage>(frame);
            }
            if (type == kTypeVerify) {
                if (!frame.has_payload()) {
                    return R::Err(HandshakeFailure::Decode("'verify' message without payload"));
                }
                const VerifyPayload& p = frame.payload();
                auto aad = TakeBytes(p.aad(), "payload.aad");
                auto iv = TakeBytes(p.iv(), "payload.iv");
                auto tag = TakeBytes(p.tag(), "payload.tag");
                auto ciphertext = TakeBytes(p.ciphertext(), "payload.ciphertext");
                for (auto* part : {&aad, &iv, &tag, &ciphertext}) {
                    if (part->IsErr()) {
                        return R::Err(part->UnwrapErr());
                    }
                }
                return R::Ok(VerifyMessage{
                    frame.session_id(),
                    session::VerificationPayload{
                        .aad = std::move(aad).Unwrap(),
                        .iv = std::move(iv).Unwrap(),
                        .tag = std::move(tag).Unwrap(),
                        .ciphertext = std::move(ciphertext).Unwrap(),
                    }});
            }
            if (type == kTypeVerifyAck) {
                return R::Ok(VerifyAckMessage{frame.session_id()});
            }
            if (type == kTypeVerifyFail) {
                return R::Ok(VerifyFailMessage{frame.session_id()});
            }
            if (type == kTypeTransferEnd) {
                return R::Ok(TransferEndMessage{frame.session_id()});
            }
            if (type == kTypeFileMeta) {
                AIRLINK_TRY(RequireFileId(frame));
                FileMetaMessage meta;
                meta.session_id = frame.session_id();
                meta.file_id = frame.file_id();
                meta.name = frame.name();
                meta.size = frame.size();
                if (!frame.checksum().empty()) {
                    meta.checksum = frame.checksum();
                }
                meta.mime_type = frame.mime_type();
                meta.chunk_size = frame.chunk_size();
                return R::Ok(std::move(meta));
            }
            if (type == kTypeFileReady) {
                AIRLINK_TRY(RequireFileId(frame));
                FileReadyMessage ready;
                ready.session_id = frame.session_id();
                ready.file_id = frame.file_id();
                ready.resumed = frame.resumed();
                ready.missing_chunks.assign(frame.missing_chunks().begin(), frame.missing_chunks().end());
                return R::Ok(std::move(ready));
            }
            if (type == kTypeFileChunk) {
                AIRLINK_TRY(RequireFileId(frame));
                auto data = TakeBytes(frame.data(), "data");
                if (data.IsErr()) {
                    return R::Err(std::move(data).UnwrapErr());
                }
                const size_t carried = data.Unwrap().size();
                if (frame.encrypted() ? frame.size() > carried : frame.size() != carried) {
                    return R::Err(HandshakeFailure::Decode(std::format(
                        "'file_chunk' declares {} bytes but carries {}", frame.size(), carried)));
                }
                FileChunkMessage chunk;
                chunk.session_id = frame.session_id();
                chunk.file_id = frame.file_id();
                chunk.data = std::move(data).Unwrap();
                chunk.offset = frame.offset();
                chunk.size = frame.size();
                chunk.encrypted = frame.encrypted();
                return R::Ok(std::move(chunk));
            }
            if (type == kTypeFileEnd) {
                AIRLINK_TRY(RequireFileId(frame));
                return R::Ok(FileEndMessage{frame.session_id(), frame.file_id()});
            }
            if (type == kTypeFileResult) {
                AIRLINK_TRY(RequireFileId(frame));
                return R::Ok(FileResultMessage{frame.session_id(), frame.file_id(), frame.success(), frame.reason()});
            }
            return R::Err(HandshakeFailure::Decode(std::format("Unknown control message type '{}'", type)));
        }
    }

    Result<std::vector<uint8_t>, HandshakeFailure> ControlMessageCodec::Encode(const ControlMessage& message) {
        ControlFrame frame;
        std::visit([&frame](const auto& typed) { FillFrame(frame, typed); }, message);

        google::protobuf::util::JsonPrintOptions options;
        options.add_whitespace = false;
        std::string json;
        if (const auto status = google::protobuf::util::MessageToJsonString(frame, &json, options); !status.ok()) {
            return Result<std::vector<uint8_t>, HandshakeFailure>::Err(
                HandshakeFailure::Encode(std::format("Failed to encode '{}' message: {}",
                                                     frame.type(), std::string(status.message()))));
        }
        return Result<std::vector<uint8_t>, HandshakeFailure>::Ok(std::vector<uint8_t>(json.begin(), json.end()));
    }

    Result<ControlMessage, HandshakeFailure> ControlMessageCodec::Decode(std::span<const uint8_t> bytes) {
        if (!IsJsonFrame(bytes)) {
            return Result<ControlMessage, HandshakeFailure>::Err(
                HandshakeFailure::Decode("Control message is not a JSON object"));
        }
        const std::string json(bytes.begin(), bytes.end());
        google::protobuf::util::JsonParseOptions options;
        options.ignore_unknown_fields = true;
        ControlFrame frame;
        if (const auto status = google::protobuf::util::JsonStringToMessage(json, &frame, options); !status.ok()) {
            return Result<ControlMessage, HandshakeFailure>::Err(
                HandshakeFailure::Decode(std::format("Malformed control message: {}", std::string(status.message()))));
        }
        return FromFrame(frame);
    }

    std::string_view ControlMessageCodec::TypeName(const ControlMessage& message) noexcept {
        return std::visit([](const auto& typed) -> std::string_view {
            using T = std::decay_t<decltype(typed)>;
            if constexpr (std::is_same_v<T, HandshakeMessage>) return kTypeHandshake;
            else if constexpr (std::is_same_v<T, HandshakeResponseMessage>) return kTypeHandshakeResponse;
            else if constexpr (std::is_same_v<T, VerifyMessage>) return kTypeVerify;
            else if constexpr (std::is_same_v<T, VerifyAckMessage>) return kTypeVerifyAck;
            else if constexpr (std::is_same_v<T, VerifyFailMessage>) return kTypeVerifyFail;
            else if constexpr (std::is_same_v<T, FileMetaMessage>) return kTypeFileMeta;
            else if constexpr (std::is_same_v<T, FileReadyMessage>) return kTypeFileReady;
            else if constexpr (std::is_same_v<T, FileChunkMessage>) return kTypeFileChunk;
            else if constexpr (std::is_same_v<T, FileEndMessage>) return kTypeFileEnd;
            else if constexpr (std::is_same_v<T, FileResultMessage>) return kTypeFileResult;
            else if constexpr (std::is_same_v<T, TransferEndMessage>) return kTypeTransferEnd;
            else if constexpr (std::is_same_v<T, RekeyMessage>) return kTypeRekey;
            else return kTypeRekeyResponse;
        }, message);
    }

    const std::string& ControlMessageCodec::SessionId(const ControlMessage& message) noexcept {
        return std::visit([](const auto& typed) -> const std::string& { return typed.session_id; }, message);
    }

    bool ControlMessageCodec::IsJsonFrame(std::span<const uint8_t> bytes) noexcept {
        return !bytes.empty() && bytes.front() == kJsonFrameLeadByte;
    }
}
