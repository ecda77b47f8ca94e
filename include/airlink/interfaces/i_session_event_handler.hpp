#pragma once
#include <string>
namespace airlink::interfaces {
class ISessionEventHandler {
public:
    virtual ~ISessionEventHandler() = default;
    virtual void OnSessionCreated(const std::string& session_id, const std::string& device_id) = 0;
    virtual void OnHandshakeCompleted(const std::string& session_id) = 0;
    virtual void OnKeyPropagated(const std::string& session_id, bool native_key_verified) = 0;
    virtual void OnSessionEnded(const std::string& session_id) = 0;
};
}
