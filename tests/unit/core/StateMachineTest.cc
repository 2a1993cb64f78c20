#include "stride/core/StateMachine.hh"
#include "stride/utils/ErrorHandling.hh"
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace stride;

enum class DoorState {
    Closed,
    Opening,
    Open,
    Closing,
    Locked
};

static std::string doorStateToString(DoorState state) {
    switch (state) {
        case DoorState::Closed:
            return "Closed";
        case DoorState::Opening:
            return "Opening";
        case DoorState::Open:
            return "Open";
        case DoorState::Closing:
            return "Closing";
        case DoorState::Locked:
            return "Locked";
        default:
            return "Unknown";
    }
}

class StateMachineTest : public ::testing::Test {
  protected:
    void SetUp() override {
        sm = std::make_unique<StateMachine<DoorState>>(DoorState::Closed, doorStateToString);

        sm->addTransition(DoorState::Closed, DoorState::Opening);
        sm->addTransition(DoorState::Opening, DoorState::Open);
        sm->addTransition(DoorState::Open, DoorState::Closing);
        sm->addTransition(DoorState::Closing, DoorState::Closed);
        sm->addTransition(DoorState::Closed, DoorState::Locked);
    }

    std::unique_ptr<StateMachine<DoorState>> sm;
};

TEST_F(StateMachineTest, ValidTransitions) {
    EXPECT_EQ(sm->getState(), DoorState::Closed);

    EXPECT_TRUE(sm->transitionTo(DoorState::Opening));
    EXPECT_TRUE(sm->transitionTo(DoorState::Open));
    EXPECT_TRUE(sm->transitionTo(DoorState::Closing));
    EXPECT_TRUE(sm->transitionTo(DoorState::Closed));
    EXPECT_EQ(sm->getState(), DoorState::Closed);
}

TEST_F(StateMachineTest, InvalidTransitionLeavesStateUntouched) {
    int calls = 0;
    sm->addEnterHandler(DoorState::Open, [&calls](DoorState, DoorState) { calls++; });

    EXPECT_FALSE(sm->transitionTo(DoorState::Open));
    EXPECT_EQ(sm->getState(), DoorState::Closed);
    EXPECT_EQ(calls, 0);
}

TEST_F(StateMachineTest, SelfTransitionsAreNoOps) {
    int calls = 0;
    sm->addEnterHandler(DoorState::Closed, [&calls](DoorState, DoorState) { calls++; });
    sm->addExitHandler(DoorState::Closed, [&calls](DoorState, DoorState) { calls++; });

    EXPECT_TRUE(sm->transitionTo(DoorState::Closed));
    EXPECT_TRUE(sm->isValidTransition(DoorState::Open, DoorState::Open));
    EXPECT_EQ(calls, 0);
}

TEST_F(StateMachineTest, EnterRunsBeforeCommitExitAfter) {
    std::vector<std::string> log;

    sm->addEnterHandler(DoorState::Opening, [&](DoorState from, DoorState to) {
        log.push_back("enter:" + doorStateToString(sm->getState()));
        EXPECT_EQ(from, DoorState::Closed);
        EXPECT_EQ(to, DoorState::Opening);
    });
    sm->addExitHandler(DoorState::Closed, [&](DoorState from, DoorState to) {
        log.push_back("exit:" + doorStateToString(sm->getState()));
        EXPECT_EQ(from, DoorState::Closed);
        EXPECT_EQ(to, DoorState::Opening);
    });

    sm->transitionTo(DoorState::Opening);

    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[0], "enter:Closed");
    EXPECT_EQ(log[1], "exit:Opening");
}

TEST_F(StateMachineTest, MultipleHandlersRunInRegistrationOrder) {
    std::vector<int> order;
    sm->addEnterHandler(DoorState::Locked, [&](DoorState, DoorState) { order.push_back(1); });
    sm->addEnterHandler(DoorState::Locked, [&](DoorState, DoorState) { order.push_back(2); });

    sm->transitionTo(DoorState::Locked);
    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], 1);
    EXPECT_EQ(order[1], 2);
}

TEST_F(StateMachineTest, RemoveHandler) {
    int calls = 0;
    auto id = sm->addEnterHandler(DoorState::Opening, [&calls](DoorState, DoorState) { calls++; });

    EXPECT_TRUE(sm->removeHandler(id));
    EXPECT_FALSE(sm->removeHandler(id));

    sm->transitionTo(DoorState::Opening);
    EXPECT_EQ(calls, 0);
}

TEST_F(StateMachineTest, NullHandlerThrows) {
    EXPECT_THROW(sm->addEnterHandler(DoorState::Open, nullptr), StrideException);
    EXPECT_THROW(sm->addExitHandler(DoorState::Open, nullptr), StrideException);
}

TEST_F(StateMachineTest, ThrowingHandlerStillCommits) {
    int later = 0;
    sm->addEnterHandler(DoorState::Opening, [](DoorState, DoorState) { throw std::runtime_error("jammed"); });
    sm->addEnterHandler(DoorState::Opening, [&later](DoorState, DoorState) { later++; });

    EXPECT_TRUE(sm->transitionTo(DoorState::Opening));
    EXPECT_EQ(sm->getState(), DoorState::Opening);
    EXPECT_EQ(later, 1);
}

TEST_F(StateMachineTest, ResetSkipsHandlers) {
    int calls = 0;
    sm->addEnterHandler(DoorState::Open, [&calls](DoorState, DoorState) { calls++; });

    sm->reset(DoorState::Open);
    EXPECT_EQ(sm->getState(), DoorState::Open);
    EXPECT_EQ(calls, 0);
}

TEST_F(StateMachineTest, ToString) {
    EXPECT_EQ(sm->toString(DoorState::Closing), "Closing");
}
