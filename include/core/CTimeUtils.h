/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_core_CTimeUtils_h
#define INCLUDED_tsa_core_CTimeUtils_h

#include <core/CNonInstantiatable.h>
#include <core/CoreTypes.h>
#include <core/ImportExport.h>

#include <string>

namespace tsa {
namespace core {

//! \brief
//! A holder of time utility methods.
//!
//! DESCRIPTION:\n
//! A holder of time utility methods.  All methods are static; an object of
//! this class should never be constructed.
//!
//! IMPLEMENTATION DECISIONS:\n
//! All times are UTC; the analysis never deals in local time.
//!
class CORE_EXPORT CTimeUtils : private CNonInstantiatable {
public:
    //! Current time
    static core_t::TTime now();

    //! Date and time to string according to the ISO 8601 format, e.g.
    //! 2024-01-31T10:00:00Z
    static std::string toIso8601(core_t::TTime t);

    //! Parse an ISO 8601 UTC date time. Accepts "YYYY-MM-DDTHH:MM:SS"
    //! optionally followed by "Z" or "+00:00", a space in place of the "T"
    //! and a bare date "YYYY-MM-DD" (midnight).
    static bool fromIso8601(const std::string& str, core_t::TTime& result);

    //! Parse either integer seconds since the epoch or an ISO 8601 time.
    static bool parseTime(const std::string& str, core_t::TTime& result);

    //! Round \p t down to a multiple of \p interval.
    static core_t::TTime floor(core_t::TTime t, core_t::TTime interval);
};
}
}

#endif // INCLUDED_tsa_core_CTimeUtils_h
