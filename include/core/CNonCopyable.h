/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_core_CNonCopyable_h
#define INCLUDED_tsa_core_CNonCopyable_h

#include <core/ImportExport.h>

namespace tsa {
namespace core {

//! \brief
//! Mixin which suppresses copy construction and assignment.
//!
//! DESCRIPTION:\n
//! Classes which own a lock, a thread or a stream, e.g. the runner, the
//! versioner and the logger, inherit privately from this class.
//!
class CORE_EXPORT CNonCopyable {
protected:
    CNonCopyable() = default;
    ~CNonCopyable() = default;

public:
    CNonCopyable(const CNonCopyable&) = delete;
    CNonCopyable& operator=(const CNonCopyable&) = delete;
};
}
}

#endif // INCLUDED_tsa_core_CNonCopyable_h
