#pragma once

#include "relay_state.hpp"
#include "result_slot.hpp"
#include "bgupload/transfer/transfer_service.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace bgupload::upload {

// Forwards the progress stream of one request to a caller-supplied sink.
// The sink is called synchronously on the service's notification thread,
// under the same lock as detach: once detach_from_completion() returns, no
// sink call is running and none will start. A sink may cancel the operation
// from inside the call.
class ProgressRelay : public std::enable_shared_from_this<ProgressRelay> {
public:
    static std::shared_ptr<ProgressRelay> create(transfer::TransferService& service,
                                                 std::shared_ptr<const ResultSlot> slot,
                                                 ProgressSink sink);
    
    ProgressRelay(const ProgressRelay&) = delete;
    ProgressRelay& operator=(const ProgressRelay&) = delete;
    
    void bind(const std::string& request_id);
    
    // Called once the completion relay saw the terminal status. Idempotent;
    // returns false if already detached or bound to another request.
    bool detach_from_completion(const std::string& request_id);
    
    RelayState state() const { return state_.load(std::memory_order_acquire); }
    
    static OperationProgress translate(const transfer::ProgressEvent& event);
    
private:
    ProgressRelay(transfer::TransferService& service,
                  std::shared_ptr<const ResultSlot> slot,
                  ProgressSink sink);
    
    void on_progress_changed(const transfer::ProgressEvent& event);
    void release_subscription();
    
    transfer::TransferService& service_;
    std::shared_ptr<const ResultSlot> slot_;
    ProgressSink sink_;
    
    std::string request_id_;
    std::atomic<RelayState> state_;
    std::atomic<transfer::SubscriptionId> subscription_;
    std::recursive_mutex detach_mutex_;
};

}
