/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_analyze_CCmdLineParser_h
#define INCLUDED_tsa_analyze_CCmdLineParser_h

#include <cstddef>
#include <string>

namespace tsa {
namespace analyze {

//! \brief
//! Very simple command line parser.
//!
//! DESCRIPTION:\n
//! Very simple command line parser.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Put in a class rather than main to allow testing.
//!
class CCmdLineParser {
public:
    //! Parse the arguments and return options if appropriate.
    static bool parse(int argc,
                      const char* const* argv,
                      std::string& configFile,
                      std::string& dataDirectory,
                      std::string& artifactDirectory,
                      std::string& endTime,
                      bool& force,
                      std::string& logProperties,
                      std::size_t& numberThreads);

private:
    static const std::string DESCRIPTION;
};
}
}

#endif // INCLUDED_tsa_analyze_CCmdLineParser_h
