// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#include "timestamp.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace beacon::model {

auto toEpochMillis(Timestamp tp) -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               tp.time_since_epoch())
        .count();
}

auto fromEpochMillis(int64_t millis) -> Timestamp {
    return Timestamp(std::chrono::milliseconds(millis));
}

auto formatIsoTimestamp(Timestamp tp) -> std::string {
    auto millis = toEpochMillis(tp);
    std::time_t seconds = static_cast<std::time_t>(millis / 1000);
    auto fraction = millis % 1000;
    if (fraction < 0) {
        fraction += 1000;
        --seconds;
    }

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << fraction << 'Z';
    return oss.str();
}

auto parseIsoTimestamp(const std::string& text) -> std::optional<Timestamp> {
    if (text.size() < 19) {
        return std::nullopt;
    }

    std::tm utc{};
    std::istringstream iss(text.substr(0, 19));
    iss >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }

    int64_t millis = 0;
    size_t pos = 19;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(
                                        text[pos]))) {
            if (digits < 3) {
                millis = millis * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (; digits < 3; ++digits) {
            millis *= 10;
        }
    }
    if (pos < text.size() && text[pos] == 'Z') {
        ++pos;
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    std::time_t seconds = timegm(&utc);
    return fromEpochMillis(static_cast<int64_t>(seconds) * 1000 + millis);
}

auto timestampFromJson(const nlohmann::json& value)
    -> std::optional<Timestamp> {
    if (value.is_number_integer()) {
        return fromEpochMillis(value.get<int64_t>());
    }
    if (value.is_number_float()) {
        return fromEpochMillis(static_cast<int64_t>(value.get<double>()));
    }
    if (value.is_string()) {
        return parseIsoTimestamp(value.get<std::string>());
    }
    return std::nullopt;
}

}  // namespace beacon::model
