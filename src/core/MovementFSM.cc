#include "stride/core/MovementFSM.hh"
#include "stride/core/Log.hh"

namespace stride {

std::string MovementFSM::stateToString(ControllerState state) {
    switch (state) {
        case ControllerState::Grounded:       return "Grounded";
        case ControllerState::Sliding:        return "Sliding";
        case ControllerState::Falling:        return "Falling";
        case ControllerState::Rising:         return "Rising";
        case ControllerState::Jumping:        return "Jumping";
        case ControllerState::Crouching:      return "Crouching";
        case ControllerState::LadderStart:    return "LadderStart";
        case ControllerState::LadderClimbing: return "LadderClimbing";
        case ControllerState::LadderEnd:      return "LadderEnd";
        case ControllerState::Rolling:        return "Rolling";
        case ControllerState::RollingCrash:   return "RollingCrash";
        case ControllerState::FreeClimbStart: return "FreeClimbStart";
        case ControllerState::FreeClimbing:   return "FreeClimbing";
        default:                              return "Unknown";
    }
}

MovementFSM::MovementFSM()
    : sm_(std::make_unique<StateMachine<ControllerState>>(ControllerState::Grounded, stateToString)) {
    using S = ControllerState;

    sm_->addTransition(S::Grounded, S::Crouching);
    sm_->addTransition(S::Grounded, S::Rolling);
    sm_->addTransition(S::Grounded, S::LadderStart);
    sm_->addTransition(S::Grounded, S::FreeClimbStart);
    sm_->addTransition(S::Grounded, S::Rising);
    sm_->addTransition(S::Grounded, S::Falling);
    sm_->addTransition(S::Grounded, S::Sliding);

    sm_->addTransition(S::Sliding, S::Rising);
    sm_->addTransition(S::Sliding, S::Falling);
    sm_->addTransition(S::Sliding, S::Grounded);

    sm_->addTransition(S::Falling, S::Jumping);
    sm_->addTransition(S::Falling, S::Rising);
    sm_->addTransition(S::Falling, S::Grounded);
    sm_->addTransition(S::Falling, S::Sliding);

    sm_->addTransition(S::Rising, S::Grounded);
    sm_->addTransition(S::Rising, S::Sliding);
    sm_->addTransition(S::Rising, S::Falling);

    sm_->addTransition(S::Jumping, S::Rising);
    sm_->addTransition(S::Jumping, S::Falling);

    sm_->addTransition(S::Crouching, S::Rising);
    sm_->addTransition(S::Crouching, S::Falling);
    sm_->addTransition(S::Crouching, S::Sliding);
    sm_->addTransition(S::Crouching, S::Grounded);

    sm_->addTransition(S::LadderStart, S::LadderClimbing);
    sm_->addTransition(S::LadderStart, S::Falling);
    sm_->addTransition(S::LadderStart, S::Grounded);

    sm_->addTransition(S::LadderClimbing, S::LadderEnd);
    sm_->addTransition(S::LadderClimbing, S::Falling);
    sm_->addTransition(S::LadderClimbing, S::Grounded);

    sm_->addTransition(S::LadderEnd, S::Falling);
    sm_->addTransition(S::LadderEnd, S::Grounded);

    sm_->addTransition(S::Rolling, S::RollingCrash);
    sm_->addTransition(S::Rolling, S::Falling);
    sm_->addTransition(S::Rolling, S::Grounded);

    sm_->addTransition(S::RollingCrash, S::Falling);
    sm_->addTransition(S::RollingCrash, S::Grounded);

    sm_->addTransition(S::FreeClimbStart, S::FreeClimbing);
    sm_->addTransition(S::FreeClimbStart, S::Falling);
    sm_->addTransition(S::FreeClimbStart, S::Grounded);

    sm_->addTransition(S::FreeClimbing, S::Falling);
    sm_->addTransition(S::FreeClimbing, S::Grounded);
}

bool MovementFSM::tryTransition(ControllerState target) {
    ControllerState current = sm_->getState();
    if (!sm_->isValidTransition(current, target)) {
        STRIDE_MOVEMENT_DEBUG("Movement transition rejected: {} -> {}", stateToString(current), stateToString(target));
        return false;
    }
    return sm_->transitionTo(target);
}

ControllerState MovementFSM::currentState() const {
    return sm_->getState();
}

void MovementFSM::reset(ControllerState state) {
    sm_->reset(state);
}

bool MovementFSM::isValidTransition(ControllerState from, ControllerState to) const {
    return sm_->isValidTransition(from, to);
}

std::string MovementFSM::addEnterHandler(ControllerState state, const Handler& handler) {
    return sm_->addEnterHandler(state, handler);
}

std::string MovementFSM::addExitHandler(ControllerState state, const Handler& handler) {
    return sm_->addExitHandler(state, handler);
}

bool MovementFSM::removeHandler(const std::string& handlerId) {
    return sm_->removeHandler(handlerId);
}

bool MovementFSM::isGroundedFamily(ControllerState state) {
    return state == ControllerState::Grounded || state == ControllerState::Sliding ||
           state == ControllerState::Crouching;
}

bool MovementFSM::isLadder(ControllerState state) {
    return state == ControllerState::LadderStart || state == ControllerState::LadderClimbing ||
           state == ControllerState::LadderEnd;
}

bool MovementFSM::isFreeClimb(ControllerState state) {
    return state == ControllerState::FreeClimbStart || state == ControllerState::FreeClimbing;
}

bool MovementFSM::isKnownState(ControllerState state) {
    return static_cast<int>(state) >= 0 && static_cast<int>(state) < kControllerStateCount;
}

bool MovementFSM::isGroundedFamily() const {
    return isGroundedFamily(sm_->getState());
}

bool MovementFSM::isAirborne() const {
    ControllerState s = sm_->getState();
    return s == ControllerState::Falling || s == ControllerState::Rising || s == ControllerState::Jumping;
}

bool MovementFSM::isLadder() const {
    return isLadder(sm_->getState());
}

bool MovementFSM::isFreeClimb() const {
    return isFreeClimb(sm_->getState());
}

bool MovementFSM::isClimbing() const {
    ControllerState s = sm_->getState();
    return isLadder(s) || isFreeClimb(s);
}

bool MovementFSM::isRolling() const {
    return sm_->getState() == ControllerState::Rolling;
}

} // namespace stride
