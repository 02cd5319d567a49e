#include "bgupload/transfer/local_transfer_service.hpp"
#include "bgupload/core/config.hpp"
#include "bgupload/core/logger.hpp"
#include "bgupload/core/utils.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <algorithm>
#include <filesystem>
#include <sstream>

namespace bgupload::transfer {

LocalServiceOptions LocalServiceOptions::from_config(const core::Config& config) {
    LocalServiceOptions options;
    options.worker_threads = static_cast<std::size_t>(
        std::max(1, config.get_int("service.worker_threads", static_cast<int>(options.worker_threads))));
    options.chunk_size = std::max<std::uint64_t>(1, config.get_uint64("service.chunk_size", options.chunk_size));
    options.tick_interval = std::chrono::milliseconds(
        std::max(0, config.get_int("service.tick_interval_ms", static_cast<int>(options.tick_interval.count()))));
    return options;
}

LocalTransferService::LocalTransferService(LocalServiceOptions options)
    : pool_(options.worker_threads)
    , options_(options)
    , next_subscription_(1)
    , responder_(&LocalTransferService::default_response)
    , running_(true) {
    LOG_INFO("Local transfer service started with {} worker threads", options_.worker_threads);
}

LocalTransferService::~LocalTransferService() {
    shutdown();
}

void LocalTransferService::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    
    LOG_INFO("Stopping local transfer service");
    
    // Pending ticks see running_ == false and end their chains.
    pool_.join();
    
    // Handlers own relays; they are destroyed outside the lock.
    std::unordered_map<SubscriptionId, Subscription> subscriptions;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscriptions.swap(subscriptions_);
        entries.swap(entries_);
    }
}

bool LocalTransferService::add(const TransferRequest& request) {
    if (request.request_id.empty()) {
        LOG_WARN("Rejecting transfer request without an id");
        return false;
    }
    
    TransferRequest stored = request;
    stored.status = TransferStatus::NONE;
    stored.bytes_sent = 0;
    stored.status_code = 0;
    stored.transfer_error.reset();
    stored.response_body.clear();
    
    if (!stored.upload_location.empty()) {
        auto size = core::utils::FileUtils::file_size(stored.upload_location);
        if (!size) {
            LOG_WARN("Rejecting request {}: cannot read {}", stored.request_id, stored.upload_location);
            return false;
        }
        if (stored.total_bytes_to_send == 0) {
            stored.total_bytes_to_send = *size;
        }
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
        return false;
    }
    if (entries_.count(stored.request_id) > 0) {
        LOG_WARN("Transfer request {} already exists", stored.request_id);
        return false;
    }
    
    auto id = stored.request_id;
    auto total = stored.total_bytes_to_send;
    entries_.emplace(id, std::make_shared<Entry>(std::move(stored), boost::asio::make_strand(pool_)));
    
    LOG_INFO("Queued {} request {} ({})", to_string(request.kind), id,
             core::utils::StringUtils::format_bytes(total));
    return true;
}

std::optional<TransferRequest> LocalTransferService::find(const std::string& request_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(request_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second->request;
}

std::vector<TransferRequest> LocalTransferService::requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::vector<TransferRequest> all;
    all.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        all.push_back(entry->request);
    }
    return all;
}

void LocalTransferService::remove(const std::string& request_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = entries_.find(request_id);
    if (it == entries_.end()) {
        LOG_DEBUG("Remove of unknown request {}", request_id);
        return;
    }
    
    it->second->removed = true;
    it->second->generation++;
    entries_.erase(it);
    
    LOG_INFO("Removed transfer request {}", request_id);
}

SubscriptionId LocalTransferService::subscribe_status(const std::string& request_id, StatusHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = next_subscription_++;
    subscriptions_[id] = Subscription{request_id, std::move(handler), nullptr};
    return id;
}

SubscriptionId LocalTransferService::subscribe_progress(const std::string& request_id, ProgressHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = next_subscription_++;
    subscriptions_[id] = Subscription{request_id, nullptr, std::move(handler)};
    return id;
}

void LocalTransferService::unsubscribe(SubscriptionId subscription) {
    Subscription released;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscriptions_.find(subscription);
        if (it == subscriptions_.end()) {
            return;
        }
        released = std::move(it->second);
        subscriptions_.erase(it);
    }
}

std::size_t LocalTransferService::subscription_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

void LocalTransferService::set_responder(Responder responder) {
    std::lock_guard<std::mutex> lock(mutex_);
    responder_ = std::move(responder);
}

bool LocalTransferService::inject_transfer_error(const std::string& request_id, std::uint64_t at_bytes,
                                                 std::string message) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(request_id);
    if (it == entries_.end()) {
        return false;
    }
    it->second->fail_at = at_bytes;
    it->second->failure_message = std::move(message);
    return true;
}

bool LocalTransferService::start(const std::string& request_id) {
    auto entry = find_entry(request_id);
    if (!entry) {
        LOG_WARN("Cannot start unknown request {}", request_id);
        return false;
    }
    
    boost::asio::post(entry->strand, [this, entry] {
        TransferRequest snapshot;
        std::uint64_t generation;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (entry->removed || !running_ || entry->request.status != TransferStatus::NONE) {
                return;
            }
            entry->request.status = TransferStatus::TRANSFERRING;
            generation = ++entry->generation;
            snapshot = entry->request;
        }
        
        LOG_DEBUG("Request {} is transferring", snapshot.request_id);
        publish_status(snapshot);
        schedule_tick(entry, generation);
    });
    
    return true;
}

bool LocalTransferService::pause(const std::string& request_id) {
    auto entry = find_entry(request_id);
    if (!entry) {
        return false;
    }
    
    boost::asio::post(entry->strand, [this, entry] {
        TransferRequest snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (entry->removed || entry->request.status != TransferStatus::TRANSFERRING) {
                return;
            }
            entry->request.status = TransferStatus::PAUSED;
            entry->generation++;
            snapshot = entry->request;
        }
        publish_status(snapshot);
    });
    
    return true;
}

bool LocalTransferService::resume(const std::string& request_id) {
    auto entry = find_entry(request_id);
    if (!entry) {
        return false;
    }
    
    boost::asio::post(entry->strand, [this, entry] {
        TransferRequest snapshot;
        std::uint64_t generation;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (entry->removed || !running_ || entry->request.status != TransferStatus::PAUSED) {
                return;
            }
            entry->request.status = TransferStatus::TRANSFERRING;
            generation = ++entry->generation;
            snapshot = entry->request;
        }
        publish_status(snapshot);
        schedule_tick(entry, generation);
    });
    
    return true;
}

SimulatedResponse LocalTransferService::default_response(const TransferRequest& request) {
    boost::property_tree::ptree body;
    body.put("id", "file." + request.request_id);
    body.put("name", std::filesystem::path(request.upload_location).filename().string());
    body.put("size", request.total_bytes_to_send);
    body.put("source", request.request_uri);
    
    std::ostringstream oss;
    boost::property_tree::write_json(oss, body, false);
    return SimulatedResponse{201, oss.str()};
}

std::shared_ptr<LocalTransferService::Entry> LocalTransferService::find_entry(const std::string& request_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(request_id);
    return it != entries_.end() ? it->second : nullptr;
}

void LocalTransferService::schedule_tick(const std::shared_ptr<Entry>& entry, std::uint64_t generation) {
    auto timer = std::make_shared<boost::asio::steady_timer>(entry->strand, options_.tick_interval);
    timer->async_wait([this, entry, generation, timer](const boost::system::error_code& ec) {
        if (ec) {
            LOG_DEBUG("Tick for {} aborted: {}", entry->request.request_id, ec.message());
            return;
        }
        on_tick(entry, generation);
    });
}

void LocalTransferService::on_tick(const std::shared_ptr<Entry>& entry, std::uint64_t generation) {
    ProgressEvent progress;
    bool failed = false;
    bool done = false;
    TransferRequest snapshot;
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ || entry->removed || entry->generation != generation) {
            return;
        }
        
        auto& request = entry->request;
        request.bytes_sent = std::min(request.total_bytes_to_send, request.bytes_sent + options_.chunk_size);
        
        if (entry->fail_at && request.bytes_sent >= *entry->fail_at) {
            request.bytes_sent = std::min(request.total_bytes_to_send, *entry->fail_at);
            request.status = TransferStatus::COMPLETED;
            request.transfer_error = entry->failure_message;
            failed = true;
        }
        
        done = request.bytes_sent >= request.total_bytes_to_send;
        progress = ProgressEvent{request.request_id, request.bytes_sent, request.total_bytes_to_send};
        snapshot = request;
    }
    
    publish_progress(progress);
    
    if (failed) {
        LOG_WARN("Request {} failed at {} bytes: {}", snapshot.request_id, snapshot.bytes_sent,
                 snapshot.transfer_error.value_or(""));
        publish_status(snapshot);
    } else if (done) {
        finish(entry);
    } else {
        schedule_tick(entry, generation);
    }
}

void LocalTransferService::finish(const std::shared_ptr<Entry>& entry) {
    Responder responder;
    TransferRequest snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        responder = responder_;
        snapshot = entry->request;
    }
    
    SimulatedResponse response;
    try {
        response = responder(snapshot);
    } catch (const std::exception& e) {
        LOG_ERROR("Responder for {} threw: {}", snapshot.request_id, e.what());
        response = SimulatedResponse{500, ""};
    }
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (entry->removed) {
            return;
        }
        entry->request.status = TransferStatus::COMPLETED;
        entry->request.status_code = response.status_code;
        entry->request.response_body = response.body;
        snapshot = entry->request;
    }
    
    LOG_INFO("Request {} completed with status {}", snapshot.request_id, snapshot.status_code);
    publish_status(snapshot);
}

void LocalTransferService::publish_status(const TransferRequest& snapshot) {
    std::vector<StatusHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, subscription] : subscriptions_) {
            if (subscription.on_status && subscription.request_id == snapshot.request_id) {
                handlers.push_back(subscription.on_status);
            }
        }
    }
    
    StatusEvent event{snapshot.request_id, snapshot};
    for (auto& handler : handlers) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            LOG_ERROR("Status handler for {} threw: {}", snapshot.request_id, e.what());
        }
    }
}

void LocalTransferService::publish_progress(const ProgressEvent& event) {
    std::vector<ProgressHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, subscription] : subscriptions_) {
            if (subscription.on_progress && subscription.request_id == event.request_id) {
                handlers.push_back(subscription.on_progress);
            }
        }
    }
    
    for (auto& handler : handlers) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            LOG_ERROR("Progress handler for {} threw: {}", event.request_id, e.what());
        }
    }
}

}
