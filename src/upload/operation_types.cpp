#include "bgupload/upload/operation_types.hpp"
#include <algorithm>

namespace bgupload::upload {

double OperationProgress::progress_percentage() const {
    if (total_bytes == 0) {
        return 0.0;
    }
    
    double percentage = (static_cast<double>(bytes_transferred) / total_bytes) * 100.0;
    return std::min(percentage, 100.0);
}

const char* to_string(FaultKind kind) {
    switch (kind) {
        case FaultKind::TRANSPORT: return "transport";
        case FaultKind::SERVER: return "server";
        case FaultKind::MALFORMED_RESPONSE: return "malformed_response";
        case FaultKind::INVALID_REQUEST: return "invalid_request";
        case FaultKind::NOT_FOUND: return "not_found";
    }
    return "unknown";
}

OperationCanceledError::OperationCanceledError(const std::string& request_id)
    : UploadError("Upload " + request_id + " was canceled")
    , request_id_(request_id) {
}

TransferFaultError::TransferFaultError(FaultKind kind, const std::string& message,
                                       int status_code, std::string error_code)
    : UploadError(message)
    , kind_(kind)
    , status_code_(status_code)
    , error_code_(std::move(error_code)) {
}

}
