#include <gtest/gtest.h>
#include "bgupload/upload/completion_relay.hpp"
#include "fake_transfer_service.hpp"

using namespace bgupload;
using namespace bgupload::upload;

class CompletionRelayTest : public ::testing::Test {
protected:
    void SetUp() override {
        request_ = test::make_upload("req-1", 1000);
        service_.add(request_);
        slot_ = std::make_shared<ResultSlot>(request_.request_id);
    }
    
    bool is_ready(std::future<OperationResult>& future) {
        return future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }
    
    test::FakeTransferService service_;
    transfer::TransferRequest request_;
    std::shared_ptr<ResultSlot> slot_;
};

TEST_F(CompletionRelayTest, IgnoresNonTerminalStatus) {
    auto relay = CompletionRelay::create(service_, slot_);
    auto future = relay->bind(request_.request_id);
    
    auto waiting = request_;
    waiting.status = transfer::TransferStatus::WAITING_FOR_NETWORK;
    service_.emit_status(waiting);
    
    auto paused = request_;
    paused.status = transfer::TransferStatus::PAUSED;
    service_.emit_status(paused);
    
    EXPECT_FALSE(is_ready(future));
    EXPECT_EQ(relay->state(), RelayState::SUBSCRIBED);
    EXPECT_EQ(service_.status_subscriber_count(), 1u);
}

TEST_F(CompletionRelayTest, TerminalSuccessSettlesAndDetaches) {
    auto relay = CompletionRelay::create(service_, slot_);
    auto future = relay->bind(request_.request_id);
    
    service_.emit_status(test::completed(request_, 201, R"({"id":"file.1"})"));
    
    ASSERT_TRUE(is_ready(future));
    auto result = future.get();
    EXPECT_EQ(result.status_code, 201);
    EXPECT_EQ(result.result.get<std::string>("id"), "file.1");
    
    EXPECT_EQ(relay->state(), RelayState::DETACHED);
    EXPECT_EQ(service_.status_subscriber_count(), 0u);
    EXPECT_EQ(service_.removed(), std::vector<std::string>{"req-1"});
}

TEST_F(CompletionRelayTest, TerminalFailureSettlesFault) {
    auto relay = CompletionRelay::create(service_, slot_);
    auto future = relay->bind(request_.request_id);
    
    service_.emit_status(test::failed(request_, "The network connection was lost"));
    
    ASSERT_TRUE(is_ready(future));
    try {
        future.get();
        FAIL() << "Expected TransferFaultError";
    } catch (const TransferFaultError& e) {
        EXPECT_EQ(e.kind(), FaultKind::TRANSPORT);
    }
    EXPECT_EQ(slot_->state(), SlotState::FAULTED);
    EXPECT_EQ(service_.status_subscriber_count(), 0u);
}

TEST_F(CompletionRelayTest, RaisesCompletedBeforeFutureIsReady) {
    auto relay = CompletionRelay::create(service_, slot_);
    
    std::future<OperationResult> future;
    std::vector<std::string> completed_ids;
    bool ready_when_raised = true;
    bool claimed_when_raised = false;
    relay->add_completed_listener([&](const std::string& request_id) {
        completed_ids.push_back(request_id);
        ready_when_raised = is_ready(future);
        claimed_when_raised = slot_->is_settled();
    });
    
    future = relay->bind(request_.request_id);
    service_.emit_status(test::completed(request_, 200, "{}"));
    
    EXPECT_EQ(completed_ids, std::vector<std::string>{"req-1"});
    EXPECT_FALSE(ready_when_raised);
    EXPECT_TRUE(claimed_when_raised);
    EXPECT_TRUE(is_ready(future));
}

TEST_F(CompletionRelayTest, DuplicateTerminalNotificationsDetachOnce) {
    auto relay = CompletionRelay::create(service_, slot_);
    
    int raised = 0;
    relay->add_completed_listener([&](const std::string&) { raised++; });
    auto future = relay->bind(request_.request_id);
    
    auto handlers = service_.snapshot_status_handlers(request_.request_id);
    ASSERT_EQ(handlers.size(), 1u);
    
    auto done = test::completed(request_, 201, "{}");
    transfer::StatusEvent event{done.request_id, done};
    handlers[0](event);
    handlers[0](event);
    handlers[0](event);
    
    EXPECT_EQ(raised, 1);
    EXPECT_EQ(service_.unsubscribed().size(), 1u);
    EXPECT_EQ(service_.removed().size(), 1u);
    EXPECT_EQ(future.get().status_code, 201);
}

TEST_F(CompletionRelayTest, CanceledSlotStillDetachesAndRaises) {
    auto relay = CompletionRelay::create(service_, slot_);
    
    int raised = 0;
    relay->add_completed_listener([&](const std::string&) { raised++; });
    auto future = relay->bind(request_.request_id);
    
    ASSERT_TRUE(slot_->try_set_canceled());
    service_.emit_status(test::completed(request_, 201, "{}"));
    
    EXPECT_EQ(raised, 1);
    EXPECT_EQ(relay->state(), RelayState::DETACHED);
    EXPECT_EQ(service_.status_subscriber_count(), 0u);
    EXPECT_TRUE(service_.removed().empty());
    EXPECT_THROW(future.get(), OperationCanceledError);
}

TEST_F(CompletionRelayTest, LeavesDetachToWinnerStillInsideItsClaim) {
    auto relay = CompletionRelay::create(service_, slot_);
    
    int raised = 0;
    relay->add_completed_listener([&](const std::string&) { raised++; });
    auto future = relay->bind(request_.request_id);
    
    RelayState state_inside_claim = RelayState::UNBOUND;
    ASSERT_TRUE(slot_->try_set_canceled([&] {
        service_.emit_status(test::completed(request_, 201, "{}"));
        state_inside_claim = relay->state();
        relay->detach();
    }));
    
    EXPECT_EQ(state_inside_claim, RelayState::SUBSCRIBED);
    EXPECT_EQ(raised, 1);
    EXPECT_EQ(service_.unsubscribed().size(), 1u);
    EXPECT_THROW(future.get(), OperationCanceledError);
}

TEST_F(CompletionRelayTest, AlreadyCompletedRequestSettlesOnBind) {
    service_.emit_status(test::completed(request_, 201, R"({"id":"file.9"})"));
    
    auto relay = CompletionRelay::create(service_, slot_);
    auto future = relay->bind(request_.request_id);
    
    ASSERT_TRUE(is_ready(future));
    EXPECT_EQ(future.get().result.get<std::string>("id"), "file.9");
    EXPECT_EQ(service_.status_subscriber_count(), 0u);
}

TEST_F(CompletionRelayTest, UnknownRequestFaultsNotFound) {
    auto slot = std::make_shared<ResultSlot>("missing");
    auto relay = CompletionRelay::create(service_, slot);
    auto future = relay->bind("missing");
    
    ASSERT_TRUE(is_ready(future));
    try {
        future.get();
        FAIL() << "Expected TransferFaultError";
    } catch (const TransferFaultError& e) {
        EXPECT_EQ(e.kind(), FaultKind::NOT_FOUND);
    }
    EXPECT_EQ(service_.status_subscriber_count(), 0u);
    EXPECT_TRUE(service_.removed().empty());
}

TEST_F(CompletionRelayTest, KeepsRequestWhenRemovalDisabled) {
    auto relay = CompletionRelay::create(service_, slot_, false);
    auto future = relay->bind(request_.request_id);
    
    service_.emit_status(test::completed(request_, 201, "{}"));
    
    EXPECT_EQ(future.get().status_code, 201);
    EXPECT_TRUE(service_.removed().empty());
    EXPECT_TRUE(service_.find(request_.request_id).has_value());
}

TEST_F(CompletionRelayTest, DetachIsIdempotent) {
    auto relay = CompletionRelay::create(service_, slot_);
    
    int raised = 0;
    relay->add_completed_listener([&](const std::string&) { raised++; });
    auto future = relay->bind(request_.request_id);
    
    EXPECT_TRUE(relay->detach());
    EXPECT_FALSE(relay->detach());
    
    EXPECT_EQ(raised, 1);
    EXPECT_EQ(service_.unsubscribed().size(), 1u);
    
    // Nothing settles the slot once the relay stopped listening.
    service_.emit_status(test::completed(request_, 201, "{}"));
    EXPECT_FALSE(is_ready(future));
}

TEST_F(CompletionRelayTest, BindAfterDetachDoesNotSubscribe) {
    auto relay = CompletionRelay::create(service_, slot_);
    relay->detach();
    
    auto future = relay->bind(request_.request_id);
    
    EXPECT_EQ(service_.status_subscriber_count(), 0u);
    EXPECT_EQ(relay->state(), RelayState::DETACHED);
}
