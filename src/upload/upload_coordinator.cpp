#include "bgupload/upload/upload_coordinator.hpp"
#include "bgupload/upload/completion_relay.hpp"
#include "bgupload/upload/progress_relay.hpp"
#include "bgupload/upload/result_slot.hpp"
#include "bgupload/core/config.hpp"
#include "bgupload/core/logger.hpp"
#include <functional>
#include <memory>
#include <optional>

namespace bgupload::upload {

namespace {

// Wiring for one attach() call: ties the cancellation registration to the
// relays. Owned by the completion relay's listener, so it lives until the
// request completes or the relay is dropped by the service.
class UploadOperation : public std::enable_shared_from_this<UploadOperation> {
public:
    UploadOperation(transfer::TransferService& service,
                    std::shared_ptr<ResultSlot> slot,
                    std::weak_ptr<CompletionRelay> completion,
                    std::weak_ptr<ProgressRelay> progress)
        : service_(service)
        , slot_(std::move(slot))
        , completion_(std::move(completion))
        , progress_(std::move(progress)) {
    }
    
    void register_cancellation(std::stop_token cancel) {
        if (!cancel.stop_possible()) {
            return;
        }
        
        // Runs inline when stop was already requested.
        std::weak_ptr<UploadOperation> weak = weak_from_this();
        cancel_registration_.emplace(std::move(cancel), [weak] {
            if (auto operation = weak.lock()) {
                operation->cancel();
            }
        });
    }
    
    void on_request_completed(const std::string& request_id) {
        if (auto progress = progress_.lock()) {
            progress->detach_from_completion(request_id);
        }
    }
    
    void cancel() {
        const auto& request_id = slot_->request_id();
        LOG_INFO("Cancellation requested for upload {}", request_id);
        
        bool won = slot_->try_set_canceled([this, &request_id] {
            service_.remove(request_id);
            
            if (auto completion = completion_.lock()) {
                completion->detach();
            } else {
                on_request_completed(request_id);
            }
        });
        
        if (!won) {
            LOG_DEBUG("Upload {} already {}, cancellation ignored",
                      request_id, to_string(slot_->state()));
        }
    }
    
private:
    transfer::TransferService& service_;
    std::shared_ptr<ResultSlot> slot_;
    std::weak_ptr<CompletionRelay> completion_;
    std::weak_ptr<ProgressRelay> progress_;
    std::optional<std::stop_callback<std::function<void()>>> cancel_registration_;
};

std::future<OperationResult> faulted(const std::string& request_id, FaultKind kind,
                                     const std::string& message) {
    ResultSlot slot(request_id);
    auto future = slot.get_future();
    slot.try_set_fault(std::make_exception_ptr(TransferFaultError(kind, message)));
    return future;
}

}

UploadOptions UploadOptions::from_config(const core::Config& config) {
    UploadOptions options;
    options.remove_on_completion = config.get_bool("upload.remove_on_completion",
                                                   options.remove_on_completion);
    return options;
}

UploadCoordinator::UploadCoordinator(transfer::TransferService& service, UploadOptions options)
    : service_(service)
    , options_(options) {
}

std::future<OperationResult> UploadCoordinator::attach(const transfer::TransferRequest& request,
                                                       std::stop_token cancel,
                                                       ProgressSink progress) {
    if (!request.is_upload()) {
        LOG_WARN("Refusing to attach to {} request {}", transfer::to_string(request.kind), request.request_id);
        return faulted(request.request_id, FaultKind::INVALID_REQUEST,
                       "Request " + request.request_id + " is not an upload");
    }
    
    LOG_DEBUG("Attaching to upload {} ({}progress sink)", request.request_id, progress ? "" : "no ");
    
    auto slot = std::make_shared<ResultSlot>(request.request_id);
    auto completion = CompletionRelay::create(service_, slot, options_.remove_on_completion);
    
    std::shared_ptr<ProgressRelay> progress_relay;
    if (progress) {
        progress_relay = ProgressRelay::create(service_, slot, std::move(progress));
    }
    
    auto operation = std::make_shared<UploadOperation>(service_, slot, completion, progress_relay);
    completion->add_completed_listener([operation](const std::string& request_id) {
        operation->on_request_completed(request_id);
    });
    
    // Progress subscribes first so nothing reported before the terminal
    // status can be missed.
    if (progress_relay) {
        progress_relay->bind(request.request_id);
    }
    auto future = completion->bind(request.request_id);
    
    operation->register_cancellation(std::move(cancel));
    
    return future;
}

}
