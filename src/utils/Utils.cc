#include "stride/utils/Utils.hh"
#include <mutex>
#include <random>
#include <sstream>

namespace stride {

std::string Utils::generateUniqueId(const std::string& prefix, int length) {
    // Listener ids may be requested from a driver thread while the
    // simulation thread is dispatching, so the PRNG is guarded.
    static std::mutex idMutex;
    std::lock_guard<std::mutex> lock(idMutex);

    static std::mt19937 gen(std::random_device{}());
    static std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    ss << prefix;

    for (int i = 0; i < length; i++) {
        ss << std::hex << dis(gen);
    }

    return ss.str();
}

} // namespace stride
