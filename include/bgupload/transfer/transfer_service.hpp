#pragma once

#include "transfer_types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace bgupload::transfer {

// Boundary to the background transfer service that owns the requests.
//
// Notifications arrive on the service's own threads. Implementations must
// serialize the notifications of one request and must not hold internal
// locks while invoking a handler: handlers call unsubscribe() from inside
// the callback.
class TransferService {
public:
    virtual ~TransferService() = default;
    
    virtual bool add(const TransferRequest& request) = 0;
    virtual std::optional<TransferRequest> find(const std::string& request_id) const = 0;
    virtual std::vector<TransferRequest> requests() const = 0;
    
    // Aborts the request if it is still running and forgets it.
    virtual void remove(const std::string& request_id) = 0;
    
    virtual SubscriptionId subscribe_status(const std::string& request_id, StatusHandler handler) = 0;
    virtual SubscriptionId subscribe_progress(const std::string& request_id, ProgressHandler handler) = 0;
    virtual void unsubscribe(SubscriptionId subscription) = 0;
};

}
