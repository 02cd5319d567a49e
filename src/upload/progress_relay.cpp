#include "bgupload/upload/progress_relay.hpp"
#include "bgupload/core/logger.hpp"
#include <algorithm>

namespace bgupload::upload {

std::shared_ptr<ProgressRelay> ProgressRelay::create(transfer::TransferService& service,
                                                     std::shared_ptr<const ResultSlot> slot,
                                                     ProgressSink sink) {
    return std::shared_ptr<ProgressRelay>(
        new ProgressRelay(service, std::move(slot), std::move(sink)));
}

ProgressRelay::ProgressRelay(transfer::TransferService& service,
                             std::shared_ptr<const ResultSlot> slot,
                             ProgressSink sink)
    : service_(service)
    , slot_(std::move(slot))
    , sink_(std::move(sink))
    , state_(RelayState::UNBOUND)
    , subscription_(transfer::INVALID_SUBSCRIPTION) {
}

void ProgressRelay::bind(const std::string& request_id) {
    if (state() != RelayState::UNBOUND) {
        LOG_DEBUG("Progress relay for {} is {}, not binding", request_id, to_string(state()));
        return;
    }
    
    request_id_ = request_id;
    
    RelayState expected = RelayState::UNBOUND;
    if (!state_.compare_exchange_strong(expected, RelayState::SUBSCRIBED)) {
        return;
    }
    
    auto self = shared_from_this();
    auto subscription = service_.subscribe_progress(request_id_,
        [self](const transfer::ProgressEvent& event) {
            self->on_progress_changed(event);
        });
    subscription_.store(subscription);
    
    if (state() == RelayState::DETACHED) {
        release_subscription();
        return;
    }
    
    LOG_DEBUG("Progress relay subscribed to {} (subscription {})", request_id_, subscription);
}

bool ProgressRelay::detach_from_completion(const std::string& request_id) {
    if (state() == RelayState::SUBSCRIBED && request_id != request_id_) {
        LOG_WARN("Progress relay for {} asked to detach from {}", request_id_, request_id);
        return false;
    }
    
    std::lock_guard<std::recursive_mutex> lock(detach_mutex_);
    auto previous = state_.exchange(RelayState::DETACHED, std::memory_order_acq_rel);
    if (previous == RelayState::DETACHED) {
        return false;
    }
    
    release_subscription();
    LOG_DEBUG("Progress relay for {} detached", request_id);
    return true;
}

OperationProgress ProgressRelay::translate(const transfer::ProgressEvent& event) {
    OperationProgress progress;
    progress.total_bytes = event.total_bytes_to_send;
    progress.bytes_transferred = event.total_bytes_to_send > 0
        ? std::min(event.bytes_sent, event.total_bytes_to_send)
        : event.bytes_sent;
    return progress;
}

void ProgressRelay::on_progress_changed(const transfer::ProgressEvent& event) {
    std::lock_guard<std::recursive_mutex> lock(detach_mutex_);
    
    if (state() != RelayState::SUBSCRIBED || slot_->is_settled()) {
        if (slot_->state() == SlotState::CANCELED) {
            LOG_DEBUG("Dropping progress for canceled upload {}", event.request_id);
        } else {
            LOG_WARN("Protocol violation: progress for {} delivered after completion (relay {}, upload {})",
                     event.request_id, to_string(state()), to_string(slot_->state()));
        }
        return;
    }
    
    if (event.total_bytes_to_send > 0 && event.bytes_sent > event.total_bytes_to_send) {
        LOG_WARN("Upload {} reported {} of {} bytes", event.request_id,
                 event.bytes_sent, event.total_bytes_to_send);
    }
    
    try {
        sink_(translate(event));
    } catch (const std::exception& e) {
        LOG_ERROR("Progress sink for {} threw: {}", event.request_id, e.what());
    }
}

void ProgressRelay::release_subscription() {
    auto subscription = subscription_.exchange(transfer::INVALID_SUBSCRIPTION);
    if (subscription != transfer::INVALID_SUBSCRIPTION) {
        service_.unsubscribe(subscription);
    }
}

}
