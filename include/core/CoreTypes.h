/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_core_t_CoreTypes_h
#define INCLUDED_tsa_core_t_CoreTypes_h

#include <time.h>

namespace tsa {
namespace core_t {

//! Series timestamps, window bounds and sampling intervals are all whole
//! seconds since the epoch in UTC.
using TTime = time_t;

//! The standard line ending for the platform.
#ifdef Windows
const char* const LINE_ENDING = "\r\n";
#else
const char* const LINE_ENDING = "\n";
#endif
}
}

#endif // INCLUDED_tsa_core_t_CoreTypes_h
