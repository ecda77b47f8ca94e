#pragma once
#include "airlink/interfaces/i_connection_directory.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace airlink::test_helpers {

using interfaces::ConnectionInfo;
using interfaces::IConnectionDirectory;

class FakeConnectionDirectory : public IConnectionDirectory {
public:
    void Add(const std::string& device_id, ConnectionInfo info) {
        std::lock_guard guard(lock_);
        entries_[device_id] = std::move(info);
    }

    std::optional<ConnectionInfo> GetConnectionInfo(const std::string& device_id) override {
        std::lock_guard guard(lock_);
        if (const auto it = entries_.find(device_id); it != entries_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

private:
    std::mutex lock_;
    std::map<std::string, ConnectionInfo> entries_;
};

}
