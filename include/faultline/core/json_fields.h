#pragma once

#include <faultline/core/types.h>

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace faultline {

/**
 * @brief Read an integer request field and check it against [lo, hi].
 *
 * The range check runs on the full 64-bit value, so out-of-range numbers are
 * rejected instead of being narrowed into range.
 */
inline Result<int> readBoundedInt(const nlohmann::json& value, const std::string& field, int lo,
                                  int hi, const std::string& unit = "") {
    if (!value.is_number_integer())
        return Error{ErrorCode::InvalidArgument, field + " must be an integer"};

    bool inRange = false;
    if (value.is_number_unsigned()) {
        const auto u = value.get<std::uint64_t>();
        inRange = hi >= 0 && u <= static_cast<std::uint64_t>(hi) &&
                  (lo <= 0 || u >= static_cast<std::uint64_t>(lo));
    } else {
        const auto s = value.get<std::int64_t>();
        inRange = s >= lo && s <= hi;
    }
    if (!inRange) {
        return Error{ErrorCode::InvalidArgument, field + " must be between " + std::to_string(lo) +
                                                     " and " + std::to_string(hi) +
                                                     (unit.empty() ? "" : " " + unit)};
    }
    return static_cast<int>(value.get<std::int64_t>());
}

} // namespace faultline
