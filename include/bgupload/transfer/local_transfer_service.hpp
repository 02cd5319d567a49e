#pragma once

#include "transfer_service.hpp"
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/strand.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace bgupload::core {
    class Config;
}

namespace bgupload::transfer {

struct LocalServiceOptions {
    std::size_t worker_threads = 2;
    std::uint64_t chunk_size = 64 * 1024;
    std::chrono::milliseconds tick_interval{20};
    
    static LocalServiceOptions from_config(const core::Config& config);
};

struct SimulatedResponse {
    int status_code;
    std::string body;
};

// In-process transfer service that "uploads" by advancing a byte counter on
// a timer. Notifications for one request run on that request's strand, so
// progress and status events of a request are delivered in order.
class LocalTransferService : public TransferService {
public:
    using Responder = std::function<SimulatedResponse(const TransferRequest&)>;
    
    explicit LocalTransferService(LocalServiceOptions options = {});
    ~LocalTransferService() override;
    
    LocalTransferService(const LocalTransferService&) = delete;
    LocalTransferService& operator=(const LocalTransferService&) = delete;
    
    bool add(const TransferRequest& request) override;
    std::optional<TransferRequest> find(const std::string& request_id) const override;
    std::vector<TransferRequest> requests() const override;
    void remove(const std::string& request_id) override;
    
    SubscriptionId subscribe_status(const std::string& request_id, StatusHandler handler) override;
    SubscriptionId subscribe_progress(const std::string& request_id, ProgressHandler handler) override;
    void unsubscribe(SubscriptionId subscription) override;
    
    bool start(const std::string& request_id);
    bool pause(const std::string& request_id);
    bool resume(const std::string& request_id);
    
    // The transfer fails with `message` once `at_bytes` have been sent.
    bool inject_transfer_error(const std::string& request_id, std::uint64_t at_bytes, std::string message);
    
    void set_responder(Responder responder);
    static SimulatedResponse default_response(const TransferRequest& request);
    
    std::size_t subscription_count() const;
    
    void shutdown();
    
private:
    using Strand = boost::asio::strand<boost::asio::thread_pool::executor_type>;
    
    struct Entry {
        TransferRequest request;
        Strand strand;
        std::uint64_t generation = 0;
        std::optional<std::uint64_t> fail_at;
        std::string failure_message;
        bool removed = false;
        
        Entry(TransferRequest req, Strand s) : request(std::move(req)), strand(std::move(s)) {}
    };
    
    struct Subscription {
        std::string request_id;
        StatusHandler on_status;
        ProgressHandler on_progress;
    };
    
    std::shared_ptr<Entry> find_entry(const std::string& request_id) const;
    void schedule_tick(const std::shared_ptr<Entry>& entry, std::uint64_t generation);
    void on_tick(const std::shared_ptr<Entry>& entry, std::uint64_t generation);
    void finish(const std::shared_ptr<Entry>& entry);
    
    void publish_status(const TransferRequest& snapshot);
    void publish_progress(const ProgressEvent& event);
    
    boost::asio::thread_pool pool_;
    LocalServiceOptions options_;
    
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
    std::unordered_map<SubscriptionId, Subscription> subscriptions_;
    SubscriptionId next_subscription_;
    Responder responder_;
    bool running_;
};

}
