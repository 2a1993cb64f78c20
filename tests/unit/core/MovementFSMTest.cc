#include "stride/core/MovementFSM.hh"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace stride;

class MovementFSMTest : public ::testing::Test {
  protected:
    MovementFSM fsm;
};

TEST_F(MovementFSMTest, DefaultStateIsGrounded) {
    EXPECT_EQ(fsm.currentState(), ControllerState::Grounded);
    EXPECT_TRUE(fsm.isGroundedFamily());
}

TEST_F(MovementFSMTest, GroundedToRisingToFalling) {
    EXPECT_TRUE(fsm.tryTransition(ControllerState::Rising));
    EXPECT_TRUE(fsm.isAirborne());
    EXPECT_TRUE(fsm.tryTransition(ControllerState::Falling));
    EXPECT_EQ(fsm.currentState(), ControllerState::Falling);
}

TEST_F(MovementFSMTest, AutoJumpPathGoesThroughFalling) {
    EXPECT_FALSE(fsm.tryTransition(ControllerState::Jumping));
    EXPECT_TRUE(fsm.tryTransition(ControllerState::Falling));
    EXPECT_TRUE(fsm.tryTransition(ControllerState::Jumping));
    EXPECT_TRUE(fsm.tryTransition(ControllerState::Rising));
}

TEST_F(MovementFSMTest, LadderSequence) {
    EXPECT_TRUE(fsm.tryTransition(ControllerState::LadderStart));
    EXPECT_TRUE(fsm.isLadder());
    EXPECT_TRUE(fsm.isClimbing());
    EXPECT_FALSE(fsm.isGroundedFamily());
    EXPECT_TRUE(fsm.tryTransition(ControllerState::LadderClimbing));
    EXPECT_TRUE(fsm.tryTransition(ControllerState::LadderEnd));
    EXPECT_TRUE(fsm.tryTransition(ControllerState::Grounded));
}

TEST_F(MovementFSMTest, FreeClimbSequence) {
    EXPECT_TRUE(fsm.tryTransition(ControllerState::FreeClimbStart));
    EXPECT_TRUE(fsm.isFreeClimb());
    EXPECT_TRUE(fsm.tryTransition(ControllerState::FreeClimbing));
    EXPECT_FALSE(fsm.tryTransition(ControllerState::LadderEnd));
    EXPECT_TRUE(fsm.tryTransition(ControllerState::Falling));
}

TEST_F(MovementFSMTest, RollAndCrash) {
    EXPECT_TRUE(fsm.tryTransition(ControllerState::Rolling));
    EXPECT_TRUE(fsm.isRolling());
    EXPECT_TRUE(fsm.tryTransition(ControllerState::RollingCrash));
    EXPECT_FALSE(fsm.isRolling());
    EXPECT_FALSE(fsm.tryTransition(ControllerState::Rolling));
    EXPECT_TRUE(fsm.tryTransition(ControllerState::Grounded));
}

TEST_F(MovementFSMTest, CrouchingIsGroundedFamily) {
    EXPECT_TRUE(fsm.tryTransition(ControllerState::Crouching));
    EXPECT_TRUE(fsm.isGroundedFamily());
    EXPECT_FALSE(fsm.tryTransition(ControllerState::Rolling));
    EXPECT_TRUE(fsm.tryTransition(ControllerState::Grounded));
}

TEST_F(MovementFSMTest, InvalidTransitionsRejected) {
    EXPECT_FALSE(fsm.tryTransition(ControllerState::LadderEnd));
    EXPECT_FALSE(fsm.tryTransition(ControllerState::RollingCrash));
    EXPECT_FALSE(fsm.tryTransition(ControllerState::FreeClimbing));
    EXPECT_EQ(fsm.currentState(), ControllerState::Grounded);

    fsm.tryTransition(ControllerState::Rising);
    EXPECT_FALSE(fsm.tryTransition(ControllerState::LadderStart));
    EXPECT_EQ(fsm.currentState(), ControllerState::Rising);
}

TEST_F(MovementFSMTest, SelfTransitionIsAccepted) {
    EXPECT_TRUE(fsm.tryTransition(ControllerState::Grounded));
    EXPECT_EQ(fsm.currentState(), ControllerState::Grounded);
}

TEST_F(MovementFSMTest, HandlersObserveTransition) {
    std::vector<std::string> log;
    fsm.addEnterHandler(ControllerState::Sliding, [&](ControllerState from, ControllerState) {
        log.push_back("enter from " + MovementFSM::stateToString(from));
    });
    fsm.addExitHandler(ControllerState::Grounded, [&](ControllerState, ControllerState to) {
        log.push_back("exit to " + MovementFSM::stateToString(to));
    });

    fsm.tryTransition(ControllerState::Sliding);
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[0], "enter from Grounded");
    EXPECT_EQ(log[1], "exit to Sliding");
}

TEST_F(MovementFSMTest, ResetBypassesTable) {
    fsm.reset(ControllerState::LadderEnd);
    EXPECT_EQ(fsm.currentState(), ControllerState::LadderEnd);
}

TEST_F(MovementFSMTest, KnownStates) {
    EXPECT_TRUE(MovementFSM::isKnownState(ControllerState::FreeClimbing));
    EXPECT_FALSE(MovementFSM::isKnownState(static_cast<ControllerState>(42)));
    EXPECT_EQ(MovementFSM::stateToString(static_cast<ControllerState>(42)), "Unknown");
}

TEST_F(MovementFSMTest, StateToString) {
    EXPECT_EQ(MovementFSM::stateToString(ControllerState::Grounded), "Grounded");
    EXPECT_EQ(MovementFSM::stateToString(ControllerState::LadderClimbing), "LadderClimbing");
    EXPECT_EQ(MovementFSM::stateToString(ControllerState::RollingCrash), "RollingCrash");
}
