#pragma once
#include <cstdint>
#include <span>
#include <string>
namespace airlink::interfaces {
class IKeyEventHandler {
public:
    virtual ~IKeyEventHandler() = default;
    virtual void OnKeyRotated(const std::string& session_id, std::span<const uint8_t> new_public_key) = 0;
    virtual void OnRenegotiationStarted(const std::string& session_id, std::span<const uint8_t> staged_public_key) = 0;
    virtual void OnRenegotiationCompleted(const std::string& session_id) = 0;
};
}
