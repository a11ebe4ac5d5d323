/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CLogger.h>

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/date_time/posix_time/time_formatters.hpp>
#include <boost/log/attributes/current_process_id.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions/formatter.hpp>
#include <boost/log/expressions/message.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/filter_parser.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>
#include <boost/log/utility/setup/from_stream.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/make_shared.hpp>

#include <fstream>
#include <iostream>
#include <istream>
#include <ostream>

namespace {
// These must be constant initialised: instance() can be called during the
// static initialisation of other translation units.
const char* const SEVERITY_ATTRIBUTE_NAME{"Severity"};
const char* const TIME_STAMP_ATTRIBUTE_NAME{"TimeStamp"};
const char* const PROCESS_ID_ATTRIBUTE_NAME{"ProcessID"};
const char* const FILE_ATTRIBUTE_NAME{"File"};
const char* const LINE_ATTRIBUTE_NAME{"Line"};

using TTextSink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;

//! Strip the directories from a source file path.
const char* baseName(const char* path) {
    const char* result{path};
    for (const char* c = path; *c != '\0'; ++c) {
        if (*c == '/' || *c == '\\') {
            result = c + 1;
        }
    }
    return result;
}

//! Writes "<time> [<pid>] <LEVEL> <file>@<line> <message>".
void formatRecord(const boost::log::record_view& record,
                  boost::log::formatting_ostream& strm) {
    auto timeStamp = boost::log::extract<boost::posix_time::ptime>(
        TIME_STAMP_ATTRIBUTE_NAME, record);
    if (timeStamp) {
        strm << boost::posix_time::to_iso_extended_string(*timeStamp);
    }
    auto pid = boost::log::extract<boost::log::attributes::current_process_id::value_type>(
        PROCESS_ID_ATTRIBUTE_NAME, record);
    if (pid) {
        strm << " [" << *pid << ']';
    }
    auto level = boost::log::extract<tsa::core::CLogger::ELevel>(
        SEVERITY_ATTRIBUTE_NAME, record);
    if (level) {
        strm << ' ' << tsa::core::CLogger::levelToString(*level);
    }
    auto file = boost::log::extract<const char*>(FILE_ATTRIBUTE_NAME, record);
    auto line = boost::log::extract<int>(LINE_ATTRIBUTE_NAME, record);
    if (file && line) {
        strm << ' ' << baseName(*file) << '@' << *line;
    }
    strm << ' ' << record[boost::log::expressions::smessage];
}

// To ensure the singleton is constructed before multiple threads may require it
// call instance() during the static initialisation phase of the program.  Of
// course, the instance may already be constructed before this if another static
// object has used it.
const tsa::core::CLogger& DO_NOT_USE_THIS_VARIABLE = tsa::core::CLogger::instance();
}

namespace tsa {
namespace core {

CLogger::CLogger()
    : m_Level{E_Debug}, m_Reconfigured{false},
      m_FileAttributeName{FILE_ATTRIBUTE_NAME}, m_LineAttributeName{LINE_ATTRIBUTE_NAME} {
    boost::log::add_common_attributes();
    boost::log::register_simple_formatter_factory<ELevel, char>(SEVERITY_ATTRIBUTE_NAME);
    boost::log::register_simple_filter_factory<ELevel, char>(SEVERITY_ATTRIBUTE_NAME);
    this->reset();
}

CLogger::~CLogger() {
    boost::log::core::get()->flush();
}

CLogger& CLogger::instance() {
    static CLogger instance;
    return instance;
}

void CLogger::reset() {
    auto core = boost::log::core::get();
    core->flush();
    core->remove_all_sinks();
    this->addConsoleSink();
    m_Reconfigured = false;
    this->setLoggingLevel(E_Debug);
}

void CLogger::addConsoleSink() {
    auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
    backend->add_stream(boost::shared_ptr<std::ostream>(&std::cerr, boost::null_deleter()));
    backend->auto_flush(true);

    auto sink = boost::make_shared<TTextSink>(backend);
    sink->set_formatter(&formatRecord);
    boost::log::core::get()->add_sink(sink);
}

bool CLogger::setLoggingLevel(ELevel level) {
    m_Level.store(level);
    boost::log::core::get()->set_filter([this](const boost::log::attribute_value_set& attributes) {
        auto recordLevel = boost::log::extract<ELevel>(SEVERITY_ATTRIBUTE_NAME, attributes);
        return !recordLevel || *recordLevel >= m_Level.load();
    });
    return true;
}

CLogger::ELevel CLogger::loggingLevel() const {
    return m_Level.load();
}

bool CLogger::reconfigure(const std::string& propertiesFile) {
    if (propertiesFile.empty()) {
        // Nothing to do
        return true;
    }
    return this->reconfigureFromFile(propertiesFile);
}

bool CLogger::reconfigureFromFile(const std::string& propertiesFile) {
    std::ifstream strm{propertiesFile};
    if (strm.is_open() == false) {
        LOG_ERROR(<< "Unable to open logger properties file " << propertiesFile);
        return false;
    }

    auto core = boost::log::core::get();
    core->flush();
    core->remove_all_sinks();
    // A settings file carries its own filters
    core->reset_filter();
    try {
        boost::log::init_from_stream(strm);
    } catch (const std::exception& e) {
        this->reset();
        LOG_ERROR(<< "Unable to reconfigure logger from " << propertiesFile
                  << ": " << e.what());
        return false;
    }

    m_Reconfigured = true;
    LOG_DEBUG(<< "Logger reconfigured from " << propertiesFile);

    return true;
}

bool CLogger::hasBeenReconfigured() const {
    return m_Reconfigured;
}

CLogger::TLevelSeverityLogger& CLogger::logger() {
    return m_Logger;
}

const boost::log::attribute_name& CLogger::fileAttributeName() const {
    return m_FileAttributeName;
}

const boost::log::attribute_name& CLogger::lineAttributeName() const {
    return m_LineAttributeName;
}

const std::string& CLogger::levelToString(ELevel level) {
    static const std::string LEVEL_NAMES[]{"TRACE", "DEBUG", "INFO",
                                           "WARN",  "ERROR", "FATAL"};
    static const std::string UNKNOWN_LEVEL_NAME{"UNKNOWN"};
    if (level < E_Trace || level > E_Fatal) {
        return UNKNOWN_LEVEL_NAME;
    }
    return LEVEL_NAMES[level];
}

bool CLogger::stringToLevel(const std::string& str, ELevel& level) {
    for (int i = E_Trace; i <= E_Fatal; ++i) {
        if (str == levelToString(static_cast<ELevel>(i))) {
            level = static_cast<ELevel>(i);
            return true;
        }
    }
    return false;
}

std::ostream& operator<<(std::ostream& strm, CLogger::ELevel level) {
    return strm << CLogger::levelToString(level);
}

std::istream& operator>>(std::istream& strm, CLogger::ELevel& level) {
    std::string name;
    if (strm >> name) {
        if (CLogger::stringToLevel(name, level) == false) {
            strm.setstate(std::ios_base::failbit);
        }
    }
    return strm;
}
}
}
