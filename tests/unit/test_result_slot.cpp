#include <gtest/gtest.h>
#include "bgupload/upload/result_slot.hpp"
#include <atomic>
#include <latch>
#include <memory>
#include <thread>
#include <vector>

using namespace bgupload::upload;

class ResultSlotTest : public ::testing::Test {
protected:
    OperationResult make_result(int status_code = 201) {
        OperationResult result;
        result.request_id = "req-1";
        result.status_code = status_code;
        result.raw_result = "{}";
        return result;
    }
};

TEST_F(ResultSlotTest, StartsEmpty) {
    ResultSlot slot("req-1");
    
    EXPECT_FALSE(slot.is_settled());
    EXPECT_EQ(slot.state(), SlotState::EMPTY);
    EXPECT_EQ(slot.request_id(), "req-1");
}

TEST_F(ResultSlotTest, FirstSettlementWins) {
    ResultSlot slot("req-1");
    auto future = slot.get_future();
    
    EXPECT_TRUE(slot.try_set_result(make_result(201)));
    EXPECT_FALSE(slot.try_set_canceled());
    EXPECT_FALSE(slot.try_set_fault(std::make_exception_ptr(
        TransferFaultError(FaultKind::SERVER, "late"))));
    EXPECT_FALSE(slot.try_set_result(make_result(500)));
    
    EXPECT_EQ(slot.state(), SlotState::SUCCEEDED);
    EXPECT_EQ(future.get().status_code, 201);
}

TEST_F(ResultSlotTest, CanceledFutureThrows) {
    ResultSlot slot("req-1");
    auto future = slot.get_future();
    
    EXPECT_TRUE(slot.try_set_canceled());
    EXPECT_FALSE(slot.try_set_result(make_result()));
    
    EXPECT_EQ(slot.state(), SlotState::CANCELED);
    try {
        future.get();
        FAIL() << "Expected OperationCanceledError";
    } catch (const OperationCanceledError& e) {
        EXPECT_EQ(e.request_id(), "req-1");
    }
}

TEST_F(ResultSlotTest, FaultIsPropagatedThroughFuture) {
    ResultSlot slot("req-1");
    auto future = slot.get_future();
    
    EXPECT_TRUE(slot.try_set_fault(std::make_exception_ptr(
        TransferFaultError(FaultKind::TRANSPORT, "connection reset"))));
    
    EXPECT_EQ(slot.state(), SlotState::FAULTED);
    EXPECT_THROW(future.get(), TransferFaultError);
}

TEST_F(ResultSlotTest, DestroyingEmptySlotFaultsFuture) {
    std::future<OperationResult> future;
    {
        auto slot = std::make_unique<ResultSlot>("req-1");
        future = slot->get_future();
    }
    
    ASSERT_EQ(future.wait_for(std::chrono::seconds(0)), std::future_status::ready);
    try {
        future.get();
        FAIL() << "Expected TransferFaultError";
    } catch (const TransferFaultError& e) {
        EXPECT_EQ(e.kind(), FaultKind::TRANSPORT);
    } catch (const std::future_error& e) {
        FAIL() << "Future was abandoned: " << e.what();
    }
}

TEST_F(ResultSlotTest, DestroyingSettledSlotKeepsOutcome) {
    std::future<OperationResult> future;
    {
        ResultSlot slot("req-1");
        future = slot.get_future();
        slot.try_set_result(make_result(201));
    }
    
    EXPECT_EQ(future.get().status_code, 201);
}

TEST_F(ResultSlotTest, ClaimActionRunsOnlyForWinner) {
    ResultSlot slot("req-1");
    int actions = 0;
    
    EXPECT_TRUE(slot.try_set_canceled([&] { actions++; }));
    EXPECT_FALSE(slot.try_set_result(make_result(), [&] { actions++; }));
    EXPECT_FALSE(slot.try_set_canceled([&] { actions++; }));
    
    EXPECT_EQ(actions, 1);
}

TEST_F(ResultSlotTest, ClaimActionRunsBeforeFutureIsReady) {
    ResultSlot slot("req-1");
    auto future = slot.get_future();
    bool ready_during_action = true;
    
    slot.try_set_result(make_result(), [&] {
        ready_during_action = future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    });
    
    EXPECT_FALSE(ready_during_action);
    EXPECT_EQ(future.wait_for(std::chrono::seconds(0)), std::future_status::ready);
}

TEST_F(ResultSlotTest, PublishedOnlyAfterClaimAction) {
    ResultSlot slot("req-1");
    auto future = slot.get_future();
    
    bool published_inside_action = true;
    EXPECT_TRUE(slot.try_set_canceled([&] { published_inside_action = slot.is_published(); }));
    
    EXPECT_FALSE(published_inside_action);
    EXPECT_TRUE(slot.is_published());
}

TEST_F(ResultSlotTest, FailingClaimActionStillPublishes) {
    ResultSlot slot("req-1");
    auto future = slot.get_future();
    
    EXPECT_TRUE(slot.try_set_result(make_result(), [] {
        throw std::runtime_error("service unavailable");
    }));
    
    ASSERT_EQ(future.wait_for(std::chrono::seconds(0)), std::future_status::ready);
    EXPECT_EQ(future.get().status_code, 201);
}

TEST_F(ResultSlotTest, ConcurrentSettlementHasExactlyOneWinner) {
    constexpr int kRounds = 200;
    constexpr int kThreads = 8;
    
    for (int round = 0; round < kRounds; ++round) {
        ResultSlot slot("req-race");
        auto future = slot.get_future();
        std::atomic<int> winners{0};
        std::atomic<int> actions{0};
        std::latch start(kThreads);
        
        std::vector<std::thread> threads;
        for (int i = 0; i < kThreads; ++i) {
            threads.emplace_back([&, i] {
                start.arrive_and_wait();
                bool won = false;
                switch (i % 3) {
                    case 0:
                        won = slot.try_set_result(make_result(), [&] { actions++; });
                        break;
                    case 1:
                        won = slot.try_set_canceled([&] { actions++; });
                        break;
                    default:
                        won = slot.try_set_fault(std::make_exception_ptr(
                            TransferFaultError(FaultKind::SERVER, "fault")), [&] { actions++; });
                        break;
                }
                if (won) {
                    winners++;
                }
            });
        }
        
        for (auto& thread : threads) {
            thread.join();
        }
        
        EXPECT_EQ(winners.load(), 1);
        EXPECT_EQ(actions.load(), 1);
        EXPECT_EQ(future.wait_for(std::chrono::seconds(0)), std::future_status::ready);
    }
}
