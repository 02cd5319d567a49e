#pragma once

#include "operation_types.hpp"
#include <atomic>
#include <exception>
#include <functional>
#include <future>
#include <string>
#include <cstdint>

namespace bgupload::upload {

enum class SlotState : std::uint8_t {
    EMPTY,
    SUCCEEDED,
    CANCELED,
    FAULTED
};

// Single-assignment cell behind the future returned to the caller.
//
// The first try_set_* call wins a compare-and-swap on the slot state; every
// later call returns false and has no effect. The winner runs its optional
// ClaimAction after claiming and before the future becomes ready, so side
// effects that must happen once per operation (removing the request from
// the service) are tied to the settlement itself.
//
// A slot destroyed while still empty settles as a TRANSPORT fault, so a
// service that drops its handlers without a terminal status never leaves
// the caller with a broken promise.
class ResultSlot {
public:
    using ClaimAction = std::function<void()>;
    
    explicit ResultSlot(std::string request_id);
    ~ResultSlot();
    
    ResultSlot(const ResultSlot&) = delete;
    ResultSlot& operator=(const ResultSlot&) = delete;
    
    std::future<OperationResult> get_future();
    
    bool try_set_result(OperationResult result, const ClaimAction& on_claimed = {});
    bool try_set_canceled(const ClaimAction& on_claimed = {});
    bool try_set_fault(std::exception_ptr fault, const ClaimAction& on_claimed = {});
    
    bool is_settled() const { return state() != SlotState::EMPTY; }
    // True once the winner's claim action finished and the future is ready.
    bool is_published() const { return published_.load(std::memory_order_acquire); }
    SlotState state() const { return state_.load(std::memory_order_acquire); }
    const std::string& request_id() const { return request_id_; }
    
private:
    bool claim(SlotState outcome);
    void run_claim_action(const ClaimAction& action);
    void mark_published();
    
    std::string request_id_;
    std::atomic<SlotState> state_;
    std::atomic<bool> published_;
    std::promise<OperationResult> promise_;
};

const char* to_string(SlotState state);

}
