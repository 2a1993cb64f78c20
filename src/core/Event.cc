#include "stride/core/Event.hh"
#include "stride/core/Log.hh"
#include "stride/utils/ErrorHandling.hh"
#include "stride/utils/Utils.hh"
#include <algorithm>
#include <type_traits>

namespace stride {

Event::Event(const std::string& type, const std::string& source) : type(type), source(source) {
    if (type.empty()) {
        throwError("Event type cannot be empty");
    }
}

const std::string& Event::getType() const {
    return type;
}

const std::string& Event::getSource() const {
    return source;
}

bool Event::hasData(const std::string& key) const {
    return data.find(key) != data.end();
}

template <typename T> void Event::setData(const std::string& key, const T& value) {
    static_assert(std::is_same_v<T, bool> || std::is_same_v<T, int> || std::is_same_v<T, float> ||
                      std::is_same_v<T, double> || std::is_same_v<T, std::string>,
                  "Data type not supported. Must be one of the types in DataValue.");
    data[key] = value;
}

template <typename T> T Event::getData(const std::string& key) const {
    static_assert(std::is_same_v<T, bool> || std::is_same_v<T, int> || std::is_same_v<T, float> ||
                      std::is_same_v<T, double> || std::is_same_v<T, std::string>,
                  "Data type not supported. Must be one of the types in DataValue.");

    auto it = data.find(key);
    if (it == data.end()) {
        throwError("Event data key '" + key + "' not found");
    }

    const T* typed = std::get_if<T>(&it->second);
    if (!typed) {
        throwError("Event data key '" + key + "' has incorrect type");
    }
    return *typed;
}

bool Event::hasAnyData(const std::string& key) const {
    return anyData.find(key) != anyData.end();
}

bool Event::isHandled() const {
    return handled;
}

void Event::setHandled(bool handled) {
    this->handled = handled;
}

// Explicit template instantiations
template void Event::setData<int>(const std::string&, const int&);
template void Event::setData<float>(const std::string&, const float&);
template void Event::setData<double>(const std::string&, const double&);
template void Event::setData<bool>(const std::string&, const bool&);
template void Event::setData<std::string>(const std::string&, const std::string&);

template int Event::getData<int>(const std::string&) const;
template float Event::getData<float>(const std::string&) const;
template double Event::getData<double>(const std::string&) const;
template bool Event::getData<bool>(const std::string&) const;
template std::string Event::getData<std::string>(const std::string&) const;

std::string EventDispatcher::addEventListener(const std::string& eventType, const EventHandler& handler,
                                              int32_t priority) {
    if (eventType.empty()) {
        throwError("Event type cannot be empty");
    }

    if (!handler) {
        throwError("Event handler cannot be null");
    }

    std::lock_guard<std::mutex> lock(listenersMutex);

    HandlerEntry entry;
    entry.id = Utils::generateUniqueId("h_");
    entry.handler = handler;
    entry.priority = priority;

    // upper_bound preserves insertion order for equal priorities.
    auto& vec = listeners[eventType];
    auto pos = std::upper_bound(vec.begin(), vec.end(), entry,
                                [](const HandlerEntry& a, const HandlerEntry& b) { return a.priority < b.priority; });
    vec.insert(pos, entry);

    STRIDE_LOG_DEBUG("Added event listener for type '{}' with ID '{}' (priority {})", eventType, entry.id, priority);

    return entry.id;
}

bool EventDispatcher::removeEventListener(const std::string& eventType, const std::string& handlerId) {
    std::lock_guard<std::mutex> lock(listenersMutex);

    auto it = listeners.find(eventType);
    if (it == listeners.end()) {
        return false;
    }

    auto& handlers = it->second;
    auto handlerIt = std::find_if(handlers.begin(), handlers.end(),
                                  [&handlerId](const HandlerEntry& entry) { return entry.id == handlerId; });

    if (handlerIt != handlers.end()) {
        handlers.erase(handlerIt);
        STRIDE_LOG_DEBUG("Removed event listener for type '{}' with ID '{}'", eventType, handlerId);
        return true;
    }

    return false;
}

bool EventDispatcher::dispatchEvent(Event& event) {
    std::vector<HandlerEntry> handlersToInvoke;

    {
        std::lock_guard<std::mutex> lock(listenersMutex);

        auto it = listeners.find(event.getType());
        if (it == listeners.end()) {
            return false;
        }

        handlersToInvoke = it->second;
    }

    // Handlers run outside the lock so they may subscribe or unsubscribe.
    for (const auto& entry : handlersToInvoke) {
        try {
            entry.handler(event);
        } catch (const std::exception& e) {
            STRIDE_LOG_ERROR("Exception in '{}' handler {}: {}", event.getType(), entry.id, e.what());
            continue;
        }
        if (event.isHandled()) {
            return true;
        }
    }

    return false;
}

size_t EventDispatcher::listenerCount(const std::string& eventType) const {
    std::lock_guard<std::mutex> lock(listenersMutex);
    auto it = listeners.find(eventType);
    return it == listeners.end() ? 0 : it->second.size();
}

} // namespace stride
