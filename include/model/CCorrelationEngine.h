/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_model_CCorrelationEngine_h
#define INCLUDED_tsa_model_CCorrelationEngine_h

#include <model/ImportExport.h>

#include <cstddef>
#include <string>
#include <vector>

namespace tsa {
namespace model {
class CAlignedFrame;

//! \brief One cell of a correlation matrix.
struct MODEL_EXPORT SCorrelationCell {
    enum EStatus { E_Ok = 0, E_InsufficientData, E_Undefined };

    EStatus s_Status = E_InsufficientData;
    //! Only meaningful if s_Status is E_Ok.
    double s_Coefficient = 0.0;
    //! The number of rows where both columns have a value.
    std::size_t s_Samples = 0;

    bool ok() const { return s_Status == E_Ok; }

    static std::string print(EStatus status);
    static bool parse(const std::string& name, EStatus& status);
};

//! \brief A symmetric matrix of pairwise correlations between named columns.
class MODEL_EXPORT CCorrelationMatrix {
public:
    using TStrVec = std::vector<std::string>;
    using TCellVec = std::vector<SCorrelationCell>;

public:
    CCorrelationMatrix() = default;
    explicit CCorrelationMatrix(TStrVec names);

    const TStrVec& names() const;
    std::size_t size() const;

    const SCorrelationCell& at(std::size_t i, std::size_t j) const;
    //! \throws std::out_of_range if either name is unknown.
    const SCorrelationCell& at(const std::string& a, const std::string& b) const;

    //! Set both (\p i, \p j) and (\p j, \p i).
    void set(std::size_t i, std::size_t j, const SCorrelationCell& cell);

private:
    std::size_t index(const std::string& name) const;

private:
    TStrVec m_Names;
    //! Row major n x n.
    TCellVec m_Cells;
};

//! \brief Computes Pearson correlations between every pair of columns of
//! an aligned frame.
//!
//! DESCRIPTION:\n
//! Each pair uses the rows where both columns have a value. If there are
//! fewer than the minimum number of such rows the cell is insufficient
//! data, and if either column is constant over them it is undefined.
//! The diagonal is exactly one for every column with enough values.
class MODEL_EXPORT CCorrelationEngine {
public:
    explicit CCorrelationEngine(std::size_t minimumSamples);

    CCorrelationMatrix compute(const CAlignedFrame& frame) const;

    std::size_t minimumSamples() const;

private:
    std::size_t m_MinimumSamples;
};
}
}

#endif // INCLUDED_tsa_model_CCorrelationEngine_h
