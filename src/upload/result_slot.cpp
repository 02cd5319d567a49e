#include "bgupload/upload/result_slot.hpp"
#include "bgupload/core/logger.hpp"

namespace bgupload::upload {

ResultSlot::ResultSlot(std::string request_id)
    : request_id_(std::move(request_id))
    , state_(SlotState::EMPTY)
    , published_(false) {
}

ResultSlot::~ResultSlot() {
    if (!claim(SlotState::FAULTED)) {
        return;
    }
    
    LOG_WARN("Upload {} was released before it reached a terminal status", request_id_);
    promise_.set_exception(std::make_exception_ptr(TransferFaultError(
        FaultKind::TRANSPORT, "Upload " + request_id_ + " was abandoned by the transfer service")));
}

std::future<OperationResult> ResultSlot::get_future() {
    return promise_.get_future();
}

bool ResultSlot::try_set_result(OperationResult result, const ClaimAction& on_claimed) {
    if (!claim(SlotState::SUCCEEDED)) {
        return false;
    }
    
    run_claim_action(on_claimed);
    promise_.set_value(std::move(result));
    mark_published();
    return true;
}

bool ResultSlot::try_set_canceled(const ClaimAction& on_claimed) {
    if (!claim(SlotState::CANCELED)) {
        return false;
    }
    
    run_claim_action(on_claimed);
    promise_.set_exception(std::make_exception_ptr(OperationCanceledError(request_id_)));
    mark_published();
    return true;
}

bool ResultSlot::try_set_fault(std::exception_ptr fault, const ClaimAction& on_claimed) {
    if (!claim(SlotState::FAULTED)) {
        return false;
    }
    
    run_claim_action(on_claimed);
    promise_.set_exception(std::move(fault));
    mark_published();
    return true;
}

bool ResultSlot::claim(SlotState outcome) {
    SlotState expected = SlotState::EMPTY;
    if (state_.compare_exchange_strong(expected, outcome,
                                       std::memory_order_acq_rel,
                                       std::memory_order_acquire)) {
        LOG_DEBUG("Result slot for {} settled as {}", request_id_, to_string(outcome));
        return true;
    }
    
    LOG_DEBUG("Result slot for {} already {}, dropping {} attempt",
              request_id_, to_string(expected), to_string(outcome));
    return false;
}

void ResultSlot::mark_published() {
    published_.store(true, std::memory_order_release);
}

void ResultSlot::run_claim_action(const ClaimAction& action) {
    if (!action) {
        return;
    }
    
    // The claim is already taken; a failing action must not leave the
    // future without a value.
    try {
        action();
    } catch (const std::exception& e) {
        LOG_ERROR("Settlement action for {} failed: {}", request_id_, e.what());
    }
}

const char* to_string(SlotState state) {
    switch (state) {
        case SlotState::EMPTY: return "empty";
        case SlotState::SUCCEEDED: return "succeeded";
        case SlotState::CANCELED: return "canceled";
        case SlotState::FAULTED: return "faulted";
    }
    return "unknown";
}

}
