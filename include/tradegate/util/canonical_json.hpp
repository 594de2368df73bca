#pragma once

#include <nlohmann/json.hpp>

#include <cmath>
#include <string>

namespace tradegate {
namespace util {

using json = nlohmann::json;

/**
 * Canonical JSON text: keys sorted (nlohmann objects are std::map backed),
 * no whitespace, non-ASCII escaped as \uXXXX, doubles in shortest round-trip
 * form with ".0" on integral values. Invalid UTF-8 is written as U+FFFD,
 * the same substitution the store applies, so a reloaded record hashes the
 * same as the one that was saved.
 */
inline std::string canonical_json(const json& value) {
    return value.dump(-1, ' ', true, json::error_handler_t::replace);
}

// Round half away from zero to a fixed number of decimal places
inline double round_to(double value, int places) {
    double scale = std::pow(10.0, places);
    return std::round(value * scale) / scale;
}

}  // namespace util
}  // namespace tradegate
