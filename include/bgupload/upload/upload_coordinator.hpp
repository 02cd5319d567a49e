#pragma once

#include "operation_types.hpp"
#include "bgupload/transfer/transfer_service.hpp"
#include <future>
#include <stop_token>

namespace bgupload::core {
    class Config;
}

namespace bgupload::upload {

struct UploadOptions {
    // Remove the request from the service once its outcome is settled.
    bool remove_on_completion = true;
    
    static UploadOptions from_config(const core::Config& config);
};

// Attaches callers to uploads owned by a TransferService.
//
// attach() never blocks and never throws for a bad request: every outcome,
// including cancellation and faults, is delivered through the future.
class UploadCoordinator {
public:
    explicit UploadCoordinator(transfer::TransferService& service, UploadOptions options = {});
    
    std::future<OperationResult> attach(const transfer::TransferRequest& request,
                                        std::stop_token cancel = {},
                                        ProgressSink progress = {});
    
    const UploadOptions& options() const { return options_; }
    
private:
    transfer::TransferService& service_;
    UploadOptions options_;
};

}
