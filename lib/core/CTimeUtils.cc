/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CTimeUtils.h>

#include <core/CStringUtils.h>

#include <cstdio>
#include <cstring>

#include <time.h>

namespace tsa {
namespace core {

core_t::TTime CTimeUtils::now() {
    return ::time(nullptr);
}

std::string CTimeUtils::toIso8601(core_t::TTime t) {
    struct tm parts;
    if (::gmtime_r(&t, &parts) == nullptr) {
        return std::string{};
    }
    char buf[32];
    ::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &parts);
    return buf;
}

bool CTimeUtils::fromIso8601(const std::string& str, core_t::TTime& result) {
    struct tm parts;
    std::memset(&parts, 0, sizeof(parts));

    int consumed{0};
    int year{0};
    int month{0};
    int day{0};
    if (::sscanf(str.c_str(), "%4d-%2d-%2d%n", &year, &month, &day, &consumed) != 3) {
        return false;
    }
    const char* rest{str.c_str() + consumed};
    int hour{0};
    int minute{0};
    int second{0};
    if (*rest == 'T' || *rest == ' ') {
        int timeConsumed{0};
        if (::sscanf(rest + 1, "%2d:%2d:%2d%n", &hour, &minute, &second, &timeConsumed) != 3) {
            return false;
        }
        rest += 1 + timeConsumed;
        // Fractional seconds are truncated
        if (*rest == '.') {
            ++rest;
            while (*rest >= '0' && *rest <= '9') {
                ++rest;
            }
        }
        if (std::strcmp(rest, "Z") == 0 || std::strcmp(rest, "+00:00") == 0) {
            rest += std::strlen(rest);
        }
    }
    if (*rest != '\0') {
        return false;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 ||
        minute > 59 || second > 60) {
        return false;
    }

    parts.tm_year = year - 1900;
    parts.tm_mon = month - 1;
    parts.tm_mday = day;
    parts.tm_hour = hour;
    parts.tm_min = minute;
    parts.tm_sec = second;
    result = ::timegm(&parts);

    return true;
}

bool CTimeUtils::parseTime(const std::string& str, core_t::TTime& result) {
    long long epoch{0};
    if (CStringUtils::stringToTypeSilent(str, epoch)) {
        result = static_cast<core_t::TTime>(epoch);
        return true;
    }
    return CTimeUtils::fromIso8601(str, result);
}

core_t::TTime CTimeUtils::floor(core_t::TTime t, core_t::TTime interval) {
    if (interval <= 0) {
        return t;
    }
    core_t::TTime remainder{t % interval};
    return remainder < 0 ? t - remainder - interval : t - remainder;
}
}
}
