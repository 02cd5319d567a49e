#include "bgupload/transfer/transfer_types.hpp"

namespace bgupload::transfer {

const char* to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::NONE: return "none";
        case TransferStatus::TRANSFERRING: return "transferring";
        case TransferStatus::WAITING: return "waiting";
        case TransferStatus::WAITING_FOR_WIFI: return "waiting_for_wifi";
        case TransferStatus::WAITING_FOR_EXTERNAL_POWER: return "waiting_for_external_power";
        case TransferStatus::WAITING_FOR_NETWORK: return "waiting_for_network";
        case TransferStatus::PAUSED: return "paused";
        case TransferStatus::COMPLETED: return "completed";
        case TransferStatus::UNKNOWN: return "unknown";
    }
    return "unknown";
}

const char* to_string(TransferKind kind) {
    return kind == TransferKind::UPLOAD ? "upload" : "download";
}

bool is_success_status_code(int status_code) {
    return status_code >= 200 && status_code < 300;
}

}
