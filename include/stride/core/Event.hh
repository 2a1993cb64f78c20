#pragma once

#include "stride/utils/ErrorHandling.hh"
#include <any>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace stride {

// Character notification channels
namespace events {
inline constexpr const char* kJump = "character.jump";
inline constexpr const char* kLand = "character.land";
inline constexpr const char* kRollCrash = "character.rollCrash";
inline constexpr const char* kLadderEnter = "character.ladderEnter";
inline constexpr const char* kLadderExit = "character.ladderExit";
inline constexpr const char* kFreeClimbEnter = "character.freeClimbEnter";
} // namespace events

class Event {
public:
  using DataValue = std::variant<bool, int, float, double, std::string>;

  Event(const std::string& type, const std::string& source);
  virtual ~Event() = default;

  const std::string& getType() const;
  const std::string& getSource() const;

  template <typename T>
  void setData(const std::string& key, const T& value);

  template <typename T>
  T getData(const std::string& key) const;

  bool hasData(const std::string& key) const;

  // Any-typed data for payloads such as vectors
  template <typename T>
  void setAnyData(const std::string& key, T value) {
    anyData[key] = std::any(std::move(value));
  }

  template <typename T>
  T getAnyData(const std::string& key) const {
    auto it = anyData.find(key);
    if (it == anyData.end()) {
      throwError("Event any-data key '" + key + "' not found");
    }
    const T* typed = std::any_cast<T>(&it->second);
    if (!typed) {
      throwError("Event any-data key '" + key + "' has incorrect type");
    }
    return *typed;
  }

  bool hasAnyData(const std::string& key) const;

  bool isHandled() const;
  void setHandled(bool handled = true);

private:
  std::string type;
  std::string source;
  std::unordered_map<std::string, DataValue> data;
  std::unordered_map<std::string, std::any> anyData;
  bool handled = false;
};

using EventHandler = std::function<void(Event&)>;

class EventDispatcher {
public:
  EventDispatcher() = default;

  // Subscribe with optional priority (lower runs first, default 0)
  std::string addEventListener(const std::string& eventType,
                               const EventHandler& handler,
                               int32_t priority = 0);

  bool removeEventListener(const std::string& eventType, const std::string& handlerId);

  // Returns true when a handler marked the event handled
  bool dispatchEvent(Event& event);

  size_t listenerCount(const std::string& eventType) const;

private:
  struct HandlerEntry {
    std::string id;
    EventHandler handler;
    int32_t priority = 0;
  };

  mutable std::mutex listenersMutex;
  std::unordered_map<std::string, std::vector<HandlerEntry>> listeners;
};

} // namespace stride
