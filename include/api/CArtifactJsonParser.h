/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_api_CArtifactJsonParser_h
#define INCLUDED_tsa_api_CArtifactJsonParser_h

#include <core/CNonInstantiatable.h>

#include <model/CAnalysisArtifact.h>

#include <api/ImportExport.h>

#include <iosfwd>
#include <memory>
#include <string>

namespace tsa {
namespace api {

//! \brief Reads analysis artifacts written by CArtifactJsonWriter.
class API_EXPORT CArtifactJsonParser : private core::CNonInstantiatable {
public:
    using TArtifactCPtr = std::shared_ptr<const model::CAnalysisArtifact>;

public:
    //! Parse an artifact from \p strm.
    //!
    //! \return Null if \p strm doesn't contain a valid artifact.
    static TArtifactCPtr parse(std::istream& strm);

    //! Parse an artifact from \p json.
    static TArtifactCPtr parse(const std::string& json);
};
}
}

#endif // INCLUDED_tsa_api_CArtifactJsonParser_h
