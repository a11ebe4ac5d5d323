/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include "CCmdLineParser.h"

#include <boost/program_options.hpp>

#include <iostream>

namespace tsa {
namespace analyze {

const std::string CCmdLineParser::DESCRIPTION = "Usage: tsa_analyze [options]\n"
                                                "Options:";

bool CCmdLineParser::parse(int argc,
                           const char* const* argv,
                           std::string& configFile,
                           std::string& dataDirectory,
                           std::string& artifactDirectory,
                           std::string& endTime,
                           bool& force,
                           std::string& logProperties,
                           std::size_t& numberThreads) {
    try {
        boost::program_options::options_description desc(DESCRIPTION);
        // clang-format off
        desc.add_options()
            ("help", "Display this information and exit")
            ("config", boost::program_options::value<std::string>(),
                    "Analysis config file - not present means all defaults")
            ("dataDir", boost::program_options::value<std::string>(),
                    "Directory containing one <series>.csv file per series")
            ("artifactDir", boost::program_options::value<std::string>(),
                    "Directory to which artifacts are written")
            ("end", boost::program_options::value<std::string>(),
                    "End of the analysis window as seconds since the epoch or ISO 8601 - default is now")
            ("force", "Publish an artifact even if the inputs haven't changed")
            ("logProperties", boost::program_options::value<std::string>(),
                    "Optional logger properties file")
            ("numberThreads", boost::program_options::value<std::size_t>(),
                    "Number of threads to use for analysis - default is the hardware concurrency")
            ;
        // clang-format on

        boost::program_options::variables_map vm;
        boost::program_options::store(
            boost::program_options::parse_command_line(argc, argv, desc), vm);
        boost::program_options::notify(vm);

        if (vm.count("help") > 0) {
            std::cerr << desc << std::endl;
            return false;
        }
        if (vm.count("config") > 0) {
            configFile = vm["config"].as<std::string>();
        }
        if (vm.count("dataDir") > 0) {
            dataDirectory = vm["dataDir"].as<std::string>();
        }
        if (vm.count("artifactDir") > 0) {
            artifactDirectory = vm["artifactDir"].as<std::string>();
        }
        if (vm.count("end") > 0) {
            endTime = vm["end"].as<std::string>();
        }
        if (vm.count("force") > 0) {
            force = true;
        }
        if (vm.count("logProperties") > 0) {
            logProperties = vm["logProperties"].as<std::string>();
        }
        if (vm.count("numberThreads") > 0) {
            numberThreads = vm["numberThreads"].as<std::size_t>();
        }
    } catch (std::exception& e) {
        std::cerr << "Error processing command line: " << e.what() << std::endl;
        return false;
    }

    return true;
}
}
}
