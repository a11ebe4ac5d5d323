/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CStreamUtils.h>

#include <core/CLogger.h>

#include <fstream>
#include <istream>

namespace tsa {
namespace core {

void CStreamUtils::skipUtf8Bom(std::ifstream& strm) {
    if (strm.tellg() != std::streampos(0)) {
        return;
    }
    std::ios_base::iostate state{strm.rdstate()};
    // 0xEF, 0xBB, 0xBF is the UTF-8 byte order marker
    if (strm.get() == 0xEF && strm.get() == 0xBB && strm.get() == 0xBF) {
        LOG_DEBUG(<< "Skipping UTF-8 BOM");
        return;
    }
    strm.clear(state);
    strm.seekg(0);
}

bool CStreamUtils::getLine(std::istream& strm, std::string& line) {
    if (!std::getline(strm, line)) {
        return false;
    }
    if (line.empty() == false && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}
}
}
