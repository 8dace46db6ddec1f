/**
 * @file packet.cpp
 * @brief JSON mapping for the packet container.
 */
#include "tap/mem/packet.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace tap::mem {

void to_json(nlohmann::json& j, const Packet& p) {
    j = nlohmann::json{{"id", p.id}, {"payload", p.payload}};
}

namespace {

// get_to() narrows with a static_cast; range-check through int64_t instead.
template <typename T>
T checked_integer(const nlohmann::json& v, const char* what) {
    if (!v.is_number_integer()) {
        throw std::invalid_argument(std::string(what) + " is not an integer");
    }
    if (v.is_number_unsigned()) {
        const auto u = v.get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
            throw std::out_of_range(std::string(what) + " out of range");
        }
        return static_cast<T>(u);
    }
    const auto i = v.get<int64_t>();
    if (i < static_cast<int64_t>(std::numeric_limits<T>::min()) ||
        i > static_cast<int64_t>(std::numeric_limits<T>::max())) {
        throw std::out_of_range(std::string(what) + " out of range");
    }
    return static_cast<T>(i);
}

} // namespace

// Throws nlohmann::json::exception for missing keys, std::invalid_argument for
// non-integer values and std::out_of_range for values that do not fit.
void from_json(const nlohmann::json& j, Packet& p) {
    p.id = checked_integer<PacketId>(j.at("id"), "packet id");

    const auto& bytes = j.at("payload");
    if (!bytes.is_array()) throw std::invalid_argument("packet payload is not an array");
    p.payload.clear();
    p.payload.reserve(bytes.size());
    for (const auto& b : bytes) p.payload.push_back(checked_integer<uint8_t>(b, "payload byte"));
}

} // namespace tap::mem
