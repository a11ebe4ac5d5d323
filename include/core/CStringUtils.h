/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_core_CStringUtils_h
#define INCLUDED_tsa_core_CStringUtils_h

#include <core/CNonInstantiatable.h>
#include <core/ImportExport.h>

#include <string>
#include <vector>

namespace tsa {
namespace core {

//! \brief
//! A holder of string utility methods.
//!
//! DESCRIPTION:\n
//! Conversions between strings and the numeric types used in configuration
//! files and series data, plus a few manipulation functions.
//!
//! IMPLEMENTATION DECISIONS:\n
//! The conversions use the C library strtoX functions, which are faster
//! than streams and let us detect trailing garbage. The public template
//! methods forward to a private overload set so that unsupported types
//! are a compile error.
//!
class CORE_EXPORT CStringUtils : private CNonInstantiatable {
public:
    using TStrVec = std::vector<std::string>;

public:
    //! We should only have one definition of whitespace across the whole
    //! product - this definition matches what ::isspace() considers whitespace
    //! in the "C" locale
    static const std::string WHITESPACE_CHARS;

public:
    //! Convert a type to a string
    template<typename T>
    static std::string typeToString(const T& type) {
        return CStringUtils::_typeToString(type);
    }

    //! Convert a double to a string with the specified number of significant
    //! figures
    static std::string typeToStringPrecise(double d, int precision);

    //! Convert a string to a type, logging on failure
    template<typename T>
    static bool stringToType(const std::string& str, T& ret) {
        return CStringUtils::_stringToType(false, str, ret);
    }

    //! Convert a string to a type without logging on failure
    template<typename T>
    static bool stringToTypeSilent(const std::string& str, T& ret) {
        return CStringUtils::_stringToType(true, str, ret);
    }

    //! Joins the strings in the container with the delimiter
    template<typename CONTAINER>
    static std::string join(const CONTAINER& strings, const std::string& delimiter) {
        std::string result;
        for (auto i = strings.begin(); i != strings.end(); ++i) {
            if (i != strings.begin()) {
                result += delimiter;
            }
            result += *i;
        }
        return result;
    }

    //! Convert a string to lower case
    static std::string toLower(std::string str);

    //! Trim whitespace from the beginning and end of a string
    static void trimWhitespace(std::string& str);

    //! Trim certain characters from the beginning and end of a string
    static void trim(const std::string& toTrim, std::string& str);

    //! Tokenise a string. Everything after the last delimiter is returned
    //! in \p remainder.
    static void tokenise(const std::string& delim,
                         const std::string& str,
                         TStrVec& tokens,
                         std::string& remainder);

    //! Split a comma separated list, trimming whitespace and dropping empty
    //! items, e.g. "a, b,,c" -> ["a", "b", "c"].
    static TStrVec splitList(const std::string& str);

private:
    static std::string _typeToString(const unsigned long long&);
    static std::string _typeToString(const unsigned long&);
    static std::string _typeToString(const unsigned int&);
    static std::string _typeToString(const long long&);
    static std::string _typeToString(const long&);
    static std::string _typeToString(const int&);
    static std::string _typeToString(const bool&);
    static std::string _typeToString(const double&);
    static std::string _typeToString(const char*);
    static const std::string& _typeToString(const std::string& str);

    static bool _stringToType(bool silent, const std::string&, unsigned long long&);
    static bool _stringToType(bool silent, const std::string&, unsigned long&);
    static bool _stringToType(bool silent, const std::string&, unsigned int&);
    static bool _stringToType(bool silent, const std::string&, long long&);
    static bool _stringToType(bool silent, const std::string&, long&);
    static bool _stringToType(bool silent, const std::string&, int&);
    static bool _stringToType(bool silent, const std::string&, bool&);
    static bool _stringToType(bool silent, const std::string&, double&);
    static bool _stringToType(bool silent, const std::string&, std::string&);
};
}
}

#endif // INCLUDED_tsa_core_CStringUtils_h
