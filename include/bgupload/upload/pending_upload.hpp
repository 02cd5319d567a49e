#pragma once

#include "upload_coordinator.hpp"
#include "bgupload/transfer/transfer_types.hpp"

namespace bgupload::upload {

// An upload that was handed to the transfer service, possibly by an earlier
// run of the process, and that a caller can attach to for its result.
class PendingUpload {
public:
    // Throws std::invalid_argument if the request is not an upload.
    PendingUpload(transfer::TransferService& service,
                  transfer::TransferRequest request,
                  UploadOptions options = {});
    
    std::future<OperationResult> attach();
    std::future<OperationResult> attach(std::stop_token cancel, ProgressSink progress);
    
    const transfer::TransferRequest& request() const { return request_; }
    
private:
    UploadCoordinator coordinator_;
    transfer::TransferRequest request_;
};

}
