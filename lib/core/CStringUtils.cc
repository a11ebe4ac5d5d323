/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CStringUtils.h>

#include <core/CLogger.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>

namespace tsa {
namespace core {

// Initialise statics
const std::string CStringUtils::WHITESPACE_CHARS(" \t\r\n\v\f");

std::string CStringUtils::typeToStringPrecise(double d, int precision) {
    // Don't print unnecessary exponents
    if (d == 0.0) {
        return "0";
    }
    char buf[64];
    ::snprintf(buf, sizeof(buf), "%.*g", precision, d);
    return buf;
}

std::string CStringUtils::toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return str;
}

void CStringUtils::trimWhitespace(std::string& str) {
    CStringUtils::trim(WHITESPACE_CHARS, str);
}

void CStringUtils::trim(const std::string& toTrim, std::string& str) {
    if (toTrim.empty() || str.empty()) {
        return;
    }

    std::string::size_type pos = str.find_last_not_of(toTrim);
    if (pos == std::string::npos) {
        // Special case - entire string is being trimmed
        str.clear();
        return;
    }

    str.erase(pos + 1);

    pos = str.find_first_not_of(toTrim);
    if (pos != std::string::npos && pos > 0) {
        str.erase(0, pos);
    }
}

void CStringUtils::tokenise(const std::string& delim,
                            const std::string& str,
                            TStrVec& tokens,
                            std::string& remainder) {
    std::string::size_type pos(0);

    for (;;) {
        std::string::size_type pos2(str.find(delim, pos));
        if (pos2 == std::string::npos) {
            remainder.assign(str, pos, str.size() - pos);
            break;
        } else {
            tokens.push_back(str.substr(pos, pos2 - pos));
            pos = pos2 + delim.size();
        }
    }
}

CStringUtils::TStrVec CStringUtils::splitList(const std::string& str) {
    TStrVec tokens;
    std::string remainder;
    CStringUtils::tokenise(",", str, tokens, remainder);
    tokens.push_back(remainder);

    TStrVec result;
    result.reserve(tokens.size());
    for (auto& token : tokens) {
        CStringUtils::trimWhitespace(token);
        if (token.empty() == false) {
            result.push_back(std::move(token));
        }
    }
    return result;
}

std::string CStringUtils::_typeToString(const unsigned long long& i) {
    return std::to_string(i);
}

std::string CStringUtils::_typeToString(const unsigned long& i) {
    return std::to_string(i);
}

std::string CStringUtils::_typeToString(const unsigned int& i) {
    return std::to_string(i);
}

std::string CStringUtils::_typeToString(const long long& i) {
    return std::to_string(i);
}

std::string CStringUtils::_typeToString(const long& i) {
    return std::to_string(i);
}

std::string CStringUtils::_typeToString(const int& i) {
    return std::to_string(i);
}

std::string CStringUtils::_typeToString(const bool& b) {
    return b ? "true" : "false";
}

std::string CStringUtils::_typeToString(const double& d) {
    // Round trip precision
    return CStringUtils::typeToStringPrecise(d, std::numeric_limits<double>::max_digits10);
}

std::string CStringUtils::_typeToString(const char* str) {
    return str == nullptr ? std::string{} : std::string{str};
}

const std::string& CStringUtils::_typeToString(const std::string& str) {
    return str;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, unsigned long long& i) {
    if (str.empty()) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert empty string to unsigned long long");
        }
        return false;
    }
    if (str[0] == '-') {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert negative string '" << str
                      << "' to unsigned long long");
        }
        return false;
    }

    char* endPtr(nullptr);
    errno = 0;
    unsigned long long ret(::strtoull(str.c_str(), &endPtr, 0));

    if (ret == ULLONG_MAX && errno == ERANGE) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str
                      << "' to unsigned long long: " << ::strerror(errno));
        }
        return false;
    }

    if (endPtr == str.c_str() || (endPtr != nullptr && *endPtr != '\0')) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str
                      << "' to unsigned long long: first invalid character " << endPtr);
        }
        return false;
    }

    i = ret;

    return true;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, unsigned long& i) {
    unsigned long long ret(0);
    if (CStringUtils::_stringToType(silent, str, ret) == false) {
        return false;
    }
    if (ret > ULONG_MAX) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str
                      << "' to unsigned long - out of range");
        }
        return false;
    }

    i = static_cast<unsigned long>(ret);

    return true;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, unsigned int& i) {
    unsigned long long ret(0);
    if (CStringUtils::_stringToType(silent, str, ret) == false) {
        return false;
    }
    if (ret > UINT_MAX) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str
                      << "' to unsigned int - out of range");
        }
        return false;
    }

    i = static_cast<unsigned int>(ret);

    return true;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, long long& i) {
    if (str.empty()) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert empty string to long long");
        }
        return false;
    }

    char* endPtr(nullptr);
    errno = 0;
    long long ret(::strtoll(str.c_str(), &endPtr, 10));

    if ((ret == LLONG_MIN || ret == LLONG_MAX) && errno == ERANGE) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str
                      << "' to long long: " << ::strerror(errno));
        }
        return false;
    }

    if (endPtr == str.c_str() || (endPtr != nullptr && *endPtr != '\0')) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str
                      << "' to long long: first invalid character " << endPtr);
        }
        return false;
    }

    i = ret;

    return true;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, long& i) {
    long long ret(0);
    if (CStringUtils::_stringToType(silent, str, ret) == false) {
        return false;
    }
    if (ret < LONG_MIN || ret > LONG_MAX) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str << "' to long - out of range");
        }
        return false;
    }

    i = static_cast<long>(ret);

    return true;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, int& i) {
    long long ret(0);
    if (CStringUtils::_stringToType(silent, str, ret) == false) {
        return false;
    }
    if (ret < INT_MIN || ret > INT_MAX) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str << "' to int - out of range");
        }
        return false;
    }

    i = static_cast<int>(ret);

    return true;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, bool& ret) {
    std::string lower{CStringUtils::toLower(str)};
    if (lower == "true" || lower == "t" || lower == "yes" || lower == "y" ||
        lower == "on" || lower == "1") {
        ret = true;
        return true;
    }
    if (lower == "false" || lower == "f" || lower == "no" || lower == "n" ||
        lower == "off" || lower == "0") {
        ret = false;
        return true;
    }

    if (!silent) {
        LOG_ERROR(<< "Unable to convert string '" << str << "' to bool");
    }
    return false;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, double& d) {
    if (str.empty()) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert empty string to double");
        }
        return false;
    }

    char* endPtr(nullptr);
    errno = 0;
    double ret(::strtod(str.c_str(), &endPtr));

    if ((ret == HUGE_VAL || ret == -HUGE_VAL) && errno == ERANGE) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str
                      << "' to double: " << ::strerror(errno));
        }
        return false;
    }

    if (endPtr == str.c_str() || (endPtr != nullptr && *endPtr != '\0')) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str
                      << "' to double: first invalid character " << endPtr);
        }
        return false;
    }

    d = ret;

    return true;
}

bool CStringUtils::_stringToType(bool /*silent*/, const std::string& str, std::string& ret) {
    ret = str;
    return true;
}
}
}
