#pragma once

#include "relay_state.hpp"
#include "result_slot.hpp"
#include "bgupload/transfer/transfer_service.hpp"
#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <exception>
#include <string>
#include <vector>

namespace bgupload::upload {

// Watches the status stream of one request and settles the ResultSlot when
// the request reaches its terminal status.
//
// The terminal notification claims the slot. The winner detaches from the
// service and raises "request completed" to its listeners before the future
// becomes ready, so listeners run before the caller can observe the outcome.
// When a racing cancellation claimed the slot first, the relay still detaches
// and raises "request completed" once that settlement is published; a
// cancellation still inside its claim detaches the relay itself.
class CompletionRelay : public std::enable_shared_from_this<CompletionRelay> {
public:
    using CompletedListener = std::function<void(const std::string& request_id)>;
    
    static std::shared_ptr<CompletionRelay> create(transfer::TransferService& service,
                                                   std::shared_ptr<ResultSlot> slot,
                                                   bool remove_on_completion = true);
    
    CompletionRelay(const CompletionRelay&) = delete;
    CompletionRelay& operator=(const CompletionRelay&) = delete;
    
    // Listeners must be added before bind().
    void add_completed_listener(CompletedListener listener);
    
    // Subscribes to status changes and returns the slot's future. A request
    // that is already terminal, or unknown to the service, settles right away.
    std::future<OperationResult> bind(const std::string& request_id);
    
    // Returns false when the relay was already detached. Blocks while
    // another thread is detaching it.
    bool detach();
    
    RelayState state() const { return state_.load(std::memory_order_acquire); }
    const std::string& request_id() const { return request_id_; }
    
private:
    CompletionRelay(transfer::TransferService& service,
                    std::shared_ptr<ResultSlot> slot,
                    bool remove_on_completion);
    
    void on_status_changed(const transfer::StatusEvent& event);
    void handle_terminal(const transfer::TransferRequest& request);
    void handle_missing_request();
    void settle(std::optional<OperationResult> result, std::exception_ptr fault);
    void detach_after_lost_claim();
    void release_subscription();
    void raise_completed();
    
    transfer::TransferService& service_;
    std::shared_ptr<ResultSlot> slot_;
    bool remove_on_completion_;
    
    std::string request_id_;
    std::atomic<RelayState> state_;
    std::atomic<transfer::SubscriptionId> subscription_;
    std::mutex detach_mutex_;
    std::vector<CompletedListener> listeners_;
};

}
