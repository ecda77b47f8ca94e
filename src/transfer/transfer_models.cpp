#include "airlink/transfer/transfer_models.hpp"

namespace airlink::transfer {
    std::string_view ToString(const TransferStatus status) noexcept {
        switch (status) {
            case TransferStatus::Pending: return "pending";
            case TransferStatus::Connecting: return "connecting";
            case TransferStatus::Handshaking: return "handshaking";
            case TransferStatus::Transferring: return "transferring";
            case TransferStatus::Paused: return "paused";
            case TransferStatus::Resuming: return "resuming";
            case TransferStatus::Completed: return "completed";
            case TransferStatus::Failed: return "failed";
            case TransferStatus::Cancelled: return "cancelled";
        }
        return "unknown";
    }

    bool IsTerminal(const TransferStatus status) noexcept {
        return status == TransferStatus::Completed ||
               status == TransferStatus::Failed ||
               status == TransferStatus::Cancelled;
    }
}
