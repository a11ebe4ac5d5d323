/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <test/CRandomNumbers.h>

#include <boost/random/normal_distribution.hpp>
#include <boost/random/uniform_int_distribution.hpp>
#include <boost/random/uniform_real_distribution.hpp>

#include <cmath>

namespace tsa {
namespace test {
namespace {
template<typename RNG, typename DISTRIBUTION, typename CONTAINER>
void generateSamples(RNG& generator,
                     DISTRIBUTION& distribution,
                     std::size_t numberSamples,
                     CONTAINER& samples) {
    samples.clear();
    samples.reserve(numberSamples);
    for (std::size_t i = 0; i < numberSamples; ++i) {
        samples.push_back(distribution(generator));
    }
}
}

void CRandomNumbers::generateNormalSamples(double mean,
                                           double variance,
                                           std::size_t numberSamples,
                                           TDoubleVec& samples) {
    boost::random::normal_distribution<> normal{mean, std::sqrt(variance)};
    generateSamples(m_Generator, normal, numberSamples, samples);
}

void CRandomNumbers::generateUniformSamples(double a,
                                            double b,
                                            std::size_t numberSamples,
                                            TDoubleVec& samples) {
    boost::random::uniform_real_distribution<> uniform{a, b};
    generateSamples(m_Generator, uniform, numberSamples, samples);
}

void CRandomNumbers::generateUniformSamples(std::size_t a,
                                            std::size_t b,
                                            std::size_t numberSamples,
                                            TSizeVec& samples) {
    boost::random::uniform_int_distribution<std::size_t> uniform{a, b - 1};
    generateSamples(m_Generator, uniform, numberSamples, samples);
}

void CRandomNumbers::generateRandomWalk(double start,
                                        double variance,
                                        std::size_t numberSamples,
                                        TDoubleVec& samples) {
    this->generateNormalSamples(0.0, variance, numberSamples, samples);
    double level{start};
    for (auto& sample : samples) {
        level += sample;
        sample = level;
    }
}

void CRandomNumbers::discard(std::size_t n) {
    m_Generator.discard(n);
}
}
}
