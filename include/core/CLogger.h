/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_core_CLogger_h
#define INCLUDED_tsa_core_CLogger_h

#include <core/CNonCopyable.h>
#include <core/ImportExport.h>
#include <core/LogMacros.h>

#include <boost/log/attributes/attribute_name.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <atomic>
#include <iosfwd>
#include <string>

namespace tsa {
namespace core {

//! \brief
//! Core logging class.
//!
//! DESCRIPTION:\n
//! Access to the actual logging commands should be through the LOG_XXX
//! macros, e.g. LOG_DEBUG(<< "Aligned " << rows << " rows").
//!
//! Problems which mean a single pair, entity or file is skipped but the
//! analysis run carries on should be logged with LOG_WARN or LOG_ERROR.
//! LOG_FATAL is for conditions where the program is about to exit; it
//! does not itself change the program flow.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Wrapper around Boost.Log.
//!
//! Singleton for simplicity.
//!
//! By default, logging is at DEBUG level to stderr. It's possible to
//! reinitialise the logger from a Boost.Log settings file, which the
//! analysis program exposes as --logProperties. The custom severity type
//! is registered with the settings parser under the name "Severity" so
//! settings files may filter on it, e.g. Filter="%Severity% >= WARN".
//!
class CORE_EXPORT CLogger : private CNonCopyable {
public:
    //! Used to set the level we should log at
    enum ELevel { E_Trace, E_Debug, E_Info, E_Warn, E_Error, E_Fatal };

    using TLevelSeverityLogger = boost::log::sources::severity_logger_mt<ELevel>;

public:
    //! Access to singleton - use MACROS to get to this when logging
    //! messages
    static CLogger& instance();

    //! Reconfigure from a properties file if one is supplied, otherwise
    //! carry on logging to stderr.
    bool reconfigure(const std::string& propertiesFile);

    //! Tell the logger to reconfigure itself by reading a Boost.Log
    //! settings file.
    bool reconfigureFromFile(const std::string& propertiesFile);

    //! Set the logging level on the fly - useful when unit tests need to
    //! log at a different level to the shipped program
    bool setLoggingLevel(ELevel level);

    //! Get the current logging level.
    ELevel loggingLevel() const;

    //! Map the level enum to a string.
    static const std::string& levelToString(ELevel level);

    //! Map a string to the level enum.
    static bool stringToLevel(const std::string& str, ELevel& level);

    //! Has the logger been reconfigured?
    bool hasBeenReconfigured() const;

    //! Access to underlying logger (must only be called from macros)
    TLevelSeverityLogger& logger();

    //! Attribute names for efficient access to our custom attributes
    const boost::log::attribute_name& fileAttributeName() const;
    const boost::log::attribute_name& lineAttributeName() const;

    //! Reset to the default stderr configuration.  This is primarily a
    //! helper for unit testing as CLogger is a singleton.
    void reset();

private:
    //! Constructor for a singleton is private.
    CLogger();
    ~CLogger();

    void addConsoleSink();

private:
    TLevelSeverityLogger m_Logger;
    std::atomic<ELevel> m_Level;
    bool m_Reconfigured;
    boost::log::attribute_name m_FileAttributeName;
    boost::log::attribute_name m_LineAttributeName;
};

//! Write the level name, e.g. "DEBUG".
CORE_EXPORT
std::ostream& operator<<(std::ostream& strm, CLogger::ELevel level);

//! Read a level name, e.g. "WARN", as written by operator<<.
CORE_EXPORT
std::istream& operator>>(std::istream& strm, CLogger::ELevel& level);
}
}

#endif // INCLUDED_tsa_core_CLogger_h
