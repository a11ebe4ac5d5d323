/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_model_CAnalysisErrors_h
#define INCLUDED_tsa_model_CAnalysisErrors_h

#include <model/ImportExport.h>

#include <stdexcept>
#include <string>

namespace tsa {
namespace model {

//! \brief None of the series has any data in the requested window, or
//! the window itself is invalid. The run is abandoned.
class MODEL_EXPORT CInsufficientWindowError : public std::runtime_error {
public:
    explicit CInsufficientWindowError(const std::string& what)
        : std::runtime_error{what} {}
};

//! \brief A forecast model could not be fitted for one entity.
//!
//! This never escapes a run: it is converted to the entity's result status.
class MODEL_EXPORT CModelFitError : public std::runtime_error {
public:
    explicit CModelFitError(const std::string& what)
        : std::runtime_error{what} {}
};

//! \brief The series store failed to read or write.
class MODEL_EXPORT CStorageError : public std::runtime_error {
public:
    explicit CStorageError(const std::string& what)
        : std::runtime_error{what} {}
};
}
}

#endif // INCLUDED_tsa_model_CAnalysisErrors_h
