/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_core_CStreamUtils_h
#define INCLUDED_tsa_core_CStreamUtils_h

#include <core/CNonInstantiatable.h>
#include <core/ImportExport.h>

#include <iosfwd>
#include <string>

namespace tsa {
namespace core {

//! \brief Stream utility functions for reading configuration and data files.
class CORE_EXPORT CStreamUtils : private CNonInstantiatable {
public:
    //! boost::ini_parser doesn't like UTF-8 ini files that begin
    //! with byte order markers.  This function advances the seek
    //! pointer of the stream over a UTF-8 BOM, but only if one
    //! exists.
    static void skipUtf8Bom(std::ifstream& strm);

    //! Read a line which may have been written with Windows line endings.
    //! The trailing carriage return, if any, is removed.
    static bool getLine(std::istream& strm, std::string& line);
};
}
}

#endif // INCLUDED_tsa_core_CStreamUtils_h
