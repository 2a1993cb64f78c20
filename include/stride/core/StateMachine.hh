#pragma once

#include "stride/core/Log.hh"
#include "stride/utils/ErrorHandling.hh"
#include "stride/utils/Utils.hh"
#include <algorithm>
#include <functional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace stride {

// Generic state machine with a registered transition table and per-state
// enter/exit handlers. Not thread-safe; owned by a single simulation thread.
//
// transitionTo() runs the target's enter handlers while the previous state is
// still current, commits the new state, then runs the previous state's exit
// handlers. Exit handlers therefore observe the already-updated state.
// Self-transitions are no-ops.
template <typename StateEnum> class StateMachine {
  public:
    // Called with (from, to) for every committed transition
    using Handler = std::function<void(StateEnum, StateEnum)>;
    using ToStringFn = std::function<std::string(StateEnum)>;

    StateMachine(StateEnum initialState, ToStringFn toStringFn)
        : currentState_(initialState), toStringFn_(std::move(toStringFn)) {}

    void addTransition(StateEnum from, StateEnum to) { transitions_.insert({from, to}); }

    bool isValidTransition(StateEnum from, StateEnum to) const {
        if (from == to)
            return true;
        return transitions_.count({from, to}) > 0;
    }

    // Returns false, leaving the state untouched, for unregistered transitions
    bool transitionTo(StateEnum target) {
        if (currentState_ == target) {
            return true;
        }

        if (transitions_.count({currentState_, target}) == 0) {
            STRIDE_LOG_DEBUG("Rejected state transition: {} -> {}", toStringFn_(currentState_), toStringFn_(target));
            return false;
        }

        StateEnum from = currentState_;

        invoke(enterHandlers_, target, from, target);
        currentState_ = target;
        invoke(exitHandlers_, from, from, target);

        STRIDE_LOG_DEBUG("State transition: {} -> {}", toStringFn_(from), toStringFn_(target));
        return true;
    }

    // Forces a state without running handlers
    void reset(StateEnum state) { currentState_ = state; }

    StateEnum getState() const { return currentState_; }

    std::string addEnterHandler(StateEnum state, const Handler& handler) {
        return addHandler(enterHandlers_, state, handler, "enter_");
    }

    std::string addExitHandler(StateEnum state, const Handler& handler) {
        return addHandler(exitHandlers_, state, handler, "exit_");
    }

    bool removeHandler(const std::string& handlerId) {
        return removeFrom(enterHandlers_, handlerId) || removeFrom(exitHandlers_, handlerId);
    }

    std::string toString(StateEnum state) const { return toStringFn_(state); }

  private:
    struct HandlerEntry {
        std::string id;
        Handler handler;
    };

    using HandlerMap = std::unordered_map<StateEnum, std::vector<HandlerEntry>>;

    std::string addHandler(HandlerMap& map, StateEnum state, const Handler& handler, const char* prefix) {
        if (!handler) {
            throwError("State handler cannot be null");
        }

        auto id = Utils::generateUniqueId(prefix);
        map[state].push_back(HandlerEntry{id, handler});
        STRIDE_LOG_DEBUG("Added handler for '{}' with ID '{}'", toStringFn_(state), id);
        return id;
    }

    static bool removeFrom(HandlerMap& map, const std::string& handlerId) {
        for (auto& [state, handlers] : map) {
            auto it = std::find_if(handlers.begin(), handlers.end(),
                                   [&handlerId](const HandlerEntry& e) { return e.id == handlerId; });
            if (it != handlers.end()) {
                handlers.erase(it);
                return true;
            }
        }
        return false;
    }

    void invoke(const HandlerMap& map, StateEnum key, StateEnum from, StateEnum to) {
        auto it = map.find(key);
        if (it == map.end())
            return;

        // Copy so handlers may register or remove handlers
        std::vector<HandlerEntry> handlers = it->second;
        for (const auto& entry : handlers) {
            try {
                entry.handler(from, to);
            } catch (const std::exception& e) {
                STRIDE_LOG_ERROR("Exception in state handler {} ({} -> {}): {}", entry.id, toStringFn_(from),
                                 toStringFn_(to), e.what());
            }
        }
    }

    StateEnum currentState_;
    ToStringFn toStringFn_;
    std::set<std::pair<StateEnum, StateEnum>> transitions_;

    HandlerMap enterHandlers_;
    HandlerMap exitHandlers_;
};

} // namespace stride
