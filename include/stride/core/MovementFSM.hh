#pragma once

#include "stride/core/CharacterTypes.hh"
#include "stride/core/StateMachine.hh"
#include <memory>
#include <string>

namespace stride {

// The character's movement state table. Owns the registered transitions;
// the controller attaches its side effects as enter/exit handlers.
class MovementFSM {
  public:
    using Handler = StateMachine<ControllerState>::Handler;

    MovementFSM();

    bool tryTransition(ControllerState target);
    ControllerState currentState() const;

    // Hard reset, no handlers run
    void reset(ControllerState state);

    bool isValidTransition(ControllerState from, ControllerState to) const;

    std::string addEnterHandler(ControllerState state, const Handler& handler);
    std::string addExitHandler(ControllerState state, const Handler& handler);
    bool removeHandler(const std::string& handlerId);

    // Grounded, Sliding or Crouching
    bool isGroundedFamily() const;
    // Falling, Rising or Jumping
    bool isAirborne() const;
    bool isLadder() const;
    bool isFreeClimb() const;
    bool isClimbing() const;
    bool isRolling() const;

    static bool isGroundedFamily(ControllerState state);
    static bool isLadder(ControllerState state);
    static bool isFreeClimb(ControllerState state);
    static bool isKnownState(ControllerState state);

    static std::string stateToString(ControllerState state);

  private:
    std::unique_ptr<StateMachine<ControllerState>> sm_;
};

} // namespace stride
