#pragma once

#include <string>
#include <optional>
#include <functional>
#include <cstdint>

namespace bgupload::transfer {

enum class TransferKind {
    UPLOAD,
    DOWNLOAD
};

enum class TransferStatus {
    NONE,
    TRANSFERRING,
    WAITING,
    WAITING_FOR_WIFI,
    WAITING_FOR_EXTERNAL_POWER,
    WAITING_FOR_NETWORK,
    PAUSED,
    COMPLETED,
    UNKNOWN
};

// Snapshot of a request owned by a TransferService. A failed transfer still
// ends in COMPLETED, with transfer_error set or a non-2xx status_code.
struct TransferRequest {
    std::string request_id;
    TransferKind kind = TransferKind::UPLOAD;
    std::string request_uri;
    std::string method = "PUT";
    std::string upload_location;
    
    TransferStatus status = TransferStatus::NONE;
    std::uint64_t bytes_sent = 0;
    std::uint64_t total_bytes_to_send = 0;
    
    int status_code = 0;
    std::optional<std::string> transfer_error;
    std::string response_body;
    
    bool is_upload() const { return kind == TransferKind::UPLOAD; }
    bool is_terminal() const { return status == TransferStatus::COMPLETED; }
};

struct StatusEvent {
    std::string request_id;
    TransferRequest request;
};

struct ProgressEvent {
    std::string request_id;
    std::uint64_t bytes_sent;
    std::uint64_t total_bytes_to_send;
};

using SubscriptionId = std::uint64_t;
constexpr SubscriptionId INVALID_SUBSCRIPTION = 0;

using StatusHandler = std::function<void(const StatusEvent&)>;
using ProgressHandler = std::function<void(const ProgressEvent&)>;

const char* to_string(TransferStatus status);
const char* to_string(TransferKind kind);

bool is_success_status_code(int status_code);

}
