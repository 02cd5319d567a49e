#include "bgupload/upload/completion_relay.hpp"
#include "bgupload/upload/response_parser.hpp"
#include "bgupload/core/logger.hpp"

namespace bgupload::upload {

std::shared_ptr<CompletionRelay> CompletionRelay::create(transfer::TransferService& service,
                                                         std::shared_ptr<ResultSlot> slot,
                                                         bool remove_on_completion) {
    return std::shared_ptr<CompletionRelay>(
        new CompletionRelay(service, std::move(slot), remove_on_completion));
}

CompletionRelay::CompletionRelay(transfer::TransferService& service,
                                 std::shared_ptr<ResultSlot> slot,
                                 bool remove_on_completion)
    : service_(service)
    , slot_(std::move(slot))
    , remove_on_completion_(remove_on_completion)
    , state_(RelayState::UNBOUND)
    , subscription_(transfer::INVALID_SUBSCRIPTION) {
}

void CompletionRelay::add_completed_listener(CompletedListener listener) {
    listeners_.push_back(std::move(listener));
}

std::future<OperationResult> CompletionRelay::bind(const std::string& request_id) {
    auto future = slot_->get_future();
    
    if (state() != RelayState::UNBOUND) {
        LOG_DEBUG("Completion relay for {} is {}, not binding", request_id, to_string(state()));
        return future;
    }
    
    request_id_ = request_id;
    
    RelayState expected = RelayState::UNBOUND;
    if (!state_.compare_exchange_strong(expected, RelayState::SUBSCRIBED)) {
        return future;
    }
    
    auto self = shared_from_this();
    auto subscription = service_.subscribe_status(request_id_,
        [self](const transfer::StatusEvent& event) {
            self->on_status_changed(event);
        });
    subscription_.store(subscription);
    
    // A terminal notification may have detached us before the id was stored.
    if (state() == RelayState::DETACHED) {
        release_subscription();
        return future;
    }
    
    LOG_DEBUG("Completion relay subscribed to {} (subscription {})", request_id_, subscription);
    
    // The request may have finished before anyone attached to it.
    auto snapshot = service_.find(request_id_);
    if (!snapshot) {
        handle_missing_request();
    } else if (snapshot->is_terminal()) {
        handle_terminal(*snapshot);
    }
    
    return future;
}

bool CompletionRelay::detach() {
    // A losing caller returns only after the winner finished detaching.
    std::lock_guard<std::mutex> lock(detach_mutex_);
    auto previous = state_.exchange(RelayState::DETACHED, std::memory_order_acq_rel);
    if (previous == RelayState::DETACHED) {
        return false;
    }
    
    release_subscription();
    LOG_DEBUG("Completion relay for {} detached", request_id_);
    
    raise_completed();
    return true;
}

void CompletionRelay::on_status_changed(const transfer::StatusEvent& event) {
    if (state() != RelayState::SUBSCRIBED) {
        LOG_DEBUG("Ignoring status {} for {}: relay already detached",
                  transfer::to_string(event.request.status), event.request_id);
        return;
    }
    
    if (!event.request.is_terminal()) {
        LOG_TRACE("Upload {} is {} ({} of {} bytes)", event.request_id,
                  transfer::to_string(event.request.status),
                  event.request.bytes_sent, event.request.total_bytes_to_send);
        return;
    }
    
    handle_terminal(event.request);
}

void CompletionRelay::handle_terminal(const transfer::TransferRequest& request) {
    std::optional<OperationResult> result;
    std::exception_ptr fault;
    
    try {
        result = ResponseParser::translate(request);
    } catch (const TransferFaultError& e) {
        LOG_WARN("Upload {} completed with a {} fault: {}", request.request_id, to_string(e.kind()), e.what());
        fault = std::current_exception();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to translate completed upload {}: {}", request.request_id, e.what());
        fault = std::make_exception_ptr(TransferFaultError(
            FaultKind::MALFORMED_RESPONSE, e.what(), request.status_code));
    }
    
    settle(std::move(result), fault);
}

void CompletionRelay::handle_missing_request() {
    LOG_WARN("Upload {} is not known to the transfer service", request_id_);
    
    bool won = slot_->try_set_fault(std::make_exception_ptr(TransferFaultError(
        FaultKind::NOT_FOUND, "Upload " + request_id_ + " is not known to the transfer service")),
        [this] { detach(); });
    
    if (!won) {
        detach_after_lost_claim();
    }
}

void CompletionRelay::settle(std::optional<OperationResult> result, std::exception_ptr fault) {
    // Observing the terminal status claims the slot. Detaching, and removing
    // the finished request, happen inside the claim so the future becomes
    // ready only after both relays let go.
    auto finish = [this] {
        detach();
        if (remove_on_completion_) {
            service_.remove(request_id_);
        }
    };
    
    bool won = result ? slot_->try_set_result(std::move(*result), finish)
                      : slot_->try_set_fault(fault, finish);
    
    if (won) {
        LOG_INFO("Upload {} finished: {}", request_id_, to_string(slot_->state()));
        return;
    }
    
    LOG_DEBUG("Upload {} completed after the operation was already {}",
              request_id_, to_string(slot_->state()));
    detach_after_lost_claim();
}

void CompletionRelay::detach_after_lost_claim() {
    // A winner still inside its claim action detaches this relay itself.
    // Waiting for it here can deadlock against a progress sink that cancels.
    if (slot_->is_published()) {
        detach();
    }
}

void CompletionRelay::release_subscription() {
    auto subscription = subscription_.exchange(transfer::INVALID_SUBSCRIPTION);
    if (subscription != transfer::INVALID_SUBSCRIPTION) {
        service_.unsubscribe(subscription);
    }
}

void CompletionRelay::raise_completed() {
    // Raised once per relay; the detach latch guarantees a single caller.
    auto listeners = std::move(listeners_);
    listeners_.clear();
    
    for (auto& listener : listeners) {
        try {
            listener(request_id_);
        } catch (const std::exception& e) {
            LOG_ERROR("Completion listener for {} threw: {}", request_id_, e.what());
        }
    }
}

}
