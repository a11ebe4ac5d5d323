/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

// The lack of include guards is deliberate in this file, to allow per-file
// redefinition of logging macros

#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>

#include <sstream>

// Location info
#ifdef LOG_LOCATION_INFO
#undef LOG_LOCATION_INFO
#endif
#define LOG_LOCATION_INFO                                                      \
    << boost::log::add_value(tsa::core::CLogger::instance().lineAttributeName(), \
                             static_cast<int>(__LINE__))                       \
    << boost::log::add_value(tsa::core::CLogger::instance().fileAttributeName(), \
                             static_cast<const char*>(__FILE__))

// Log at a level known at compile time

#ifdef LOG_TRACE
#undef LOG_TRACE
#endif
#ifdef EXCLUDE_TRACE_LOGGING
// TRACE logging compiles to code the optimiser can remove entirely
#define LOG_TRACE(message)                                                     \
    static_cast<void>([&]() { std::ostringstream() << "" message; })
#else
#define LOG_TRACE(message)                                                                     \
    BOOST_LOG_STREAM_SEV(tsa::core::CLogger::instance().logger(), tsa::core::CLogger::E_Trace) \
    LOG_LOCATION_INFO                                                                          \
    message
#endif
#ifdef LOG_DEBUG
#undef LOG_DEBUG
#endif
#define LOG_DEBUG(message)                                                                     \
    BOOST_LOG_STREAM_SEV(tsa::core::CLogger::instance().logger(), tsa::core::CLogger::E_Debug) \
    LOG_LOCATION_INFO                                                                          \
    message
#ifdef LOG_INFO
#undef LOG_INFO
#endif
#define LOG_INFO(message)                                                                     \
    BOOST_LOG_STREAM_SEV(tsa::core::CLogger::instance().logger(), tsa::core::CLogger::E_Info) \
    LOG_LOCATION_INFO                                                                         \
    message
#ifdef LOG_WARN
#undef LOG_WARN
#endif
#define LOG_WARN(message)                                                                     \
    BOOST_LOG_STREAM_SEV(tsa::core::CLogger::instance().logger(), tsa::core::CLogger::E_Warn) \
    LOG_LOCATION_INFO                                                                         \
    message
#ifdef LOG_ERROR
#undef LOG_ERROR
#endif
#define LOG_ERROR(message)                                                                     \
    BOOST_LOG_STREAM_SEV(tsa::core::CLogger::instance().logger(), tsa::core::CLogger::E_Error) \
    LOG_LOCATION_INFO                                                                          \
    message
#ifdef LOG_FATAL
#undef LOG_FATAL
#endif
#define LOG_FATAL(message)                                                                     \
    BOOST_LOG_STREAM_SEV(tsa::core::CLogger::instance().logger(), tsa::core::CLogger::E_Fatal) \
    LOG_LOCATION_INFO                                                                          \
    message

// Log at a level specified at runtime, for example
// LOG_AT_LEVEL(tsa::core::CLogger::E_Warn, << "Stay away from here " << name)

#ifdef LOG_AT_LEVEL
#undef LOG_AT_LEVEL
#endif
#define LOG_AT_LEVEL(level, message)                                           \
    BOOST_LOG_STREAM_SEV(tsa::core::CLogger::instance().logger(), level)       \
    LOG_LOCATION_INFO                                                          \
    message
