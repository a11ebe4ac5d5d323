/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#ifndef INCLUDED_tsa_maths_CLinearAlgebraEigen_h
#define INCLUDED_tsa_maths_CLinearAlgebraEigen_h

#include <Eigen/Core>

namespace tsa {
namespace maths {

//! Dense column major matrix.
template<typename SCALAR>
using CDenseMatrix = Eigen::Matrix<SCALAR, Eigen::Dynamic, Eigen::Dynamic>;

//! Dense column vector.
template<typename SCALAR>
using CDenseVector = Eigen::Matrix<SCALAR, Eigen::Dynamic, 1>;

using TDenseMatrix = CDenseMatrix<double>;
using TDenseVector = CDenseVector<double>;
}
}

#endif // INCLUDED_tsa_maths_CLinearAlgebraEigen_h
