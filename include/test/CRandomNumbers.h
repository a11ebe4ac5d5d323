/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_test_CRandomNumbers_h
#define INCLUDED_tsa_test_CRandomNumbers_h

#include <test/ImportExport.h>

#include <boost/random/mersenne_twister.hpp>

#include <cstddef>
#include <vector>

namespace tsa {
namespace test {

//! \brief Creates random numbers from a variety of distributions.
//!
//! DESCRIPTION:\n
//! All tests which need random data should use this so that they are
//! reproducible. The generator is seeded with a fixed value on
//! construction and Boost.Random distributions are used because, unlike
//! the std:: ones, they produce the same sequence on every platform.
class TEST_EXPORT CRandomNumbers {
public:
    using TDoubleVec = std::vector<double>;
    using TSizeVec = std::vector<std::size_t>;
    using TGenerator = boost::random::mt19937_64;

public:
    CRandomNumbers() = default;

    //! Generate normal random samples with the specified mean and
    //! variance.
    void generateNormalSamples(double mean,
                               double variance,
                               std::size_t numberSamples,
                               TDoubleVec& samples);

    //! Generate uniform random samples in the interval [a,b).
    void generateUniformSamples(double a, double b, std::size_t numberSamples, TDoubleVec& samples);

    //! Generate uniform integer samples from the the set [a, a+1, ..., b).
    void generateUniformSamples(std::size_t a,
                                std::size_t b,
                                std::size_t numberSamples,
                                TSizeVec& samples);

    //! Generate a Gaussian random walk starting at \p start.
    void generateRandomWalk(double start,
                            double variance,
                            std::size_t numberSamples,
                            TDoubleVec& samples);

    //! Throw away \p n random numbers.
    void discard(std::size_t n);

private:
    TGenerator m_Generator;
};
}
}

#endif // INCLUDED_tsa_test_CRandomNumbers_h
