/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_core_CNonInstantiatable_h
#define INCLUDED_tsa_core_CNonInstantiatable_h

#include <core/ImportExport.h>

namespace tsa {
namespace core {

//! \brief
//! Base for classes which are just a collection of static functions.
//!
//! DESCRIPTION:\n
//! Inherit privately to make it a compile error to create an instance
//! of, for example, CStringUtils or CStatisticalTests.
//!
class CORE_EXPORT CNonInstantiatable {
private:
    CNonInstantiatable() = delete;
    CNonInstantiatable(const CNonInstantiatable&) = delete;
};
}
}

#endif // INCLUDED_tsa_core_CNonInstantiatable_h
