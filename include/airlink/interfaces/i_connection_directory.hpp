#pragma once

#include <optional>
#include <string>

namespace airlink::interfaces {

struct ConnectionInfo {
    std::optional<std::string> connection_token;
    std::string connection_method;
};

/// Resolves a discovered device to the connection the transport should use.
class IConnectionDirectory {
public:
    virtual ~IConnectionDirectory() = default;
    [[nodiscard]] virtual std::optional<ConnectionInfo> GetConnectionInfo(const std::string& device_id) = 0;
};

}
