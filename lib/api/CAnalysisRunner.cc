/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <api/CAnalysisRunner.h>

#include <core/CLogger.h>
#include <core/CStopWatch.h>
#include <core/CTimeUtils.h>
#include <core/Concurrency.h>

#include <model/CAlignedFrame.h>
#include <model/CAligner.h>
#include <model/CCausalityEngine.h>
#include <model/CCorrelationEngine.h>
#include <model/CForecastEngine.h>
#include <model/CSeries.h>
#include <model/CSeriesStore.h>

#include <memory>
#include <vector>

namespace tsa {
namespace api {
namespace {
using TVerdictVec = model::CAnalysisArtifact::TVerdictVec;
using TForecastResultVec = model::CAnalysisArtifact::TForecastResultVec;
}

CAnalysisRunner::CAnalysisRunner(const CAnalysisConfig& config, model::CSeriesStore& store)
    : m_Config{config}, m_Store{store}, m_Versioner{store, config.retention()},
      m_Cancelled{false} {
}

void CAnalysisRunner::initialize() {
    m_Versioner.initialize();
}

CAnalysisRunner::EOutcome CAnalysisRunner::run(core_t::TTime end, bool force) {
    m_Cancelled.store(false);

    core::CStopWatch watch{true};
    core_t::TTime start{end - m_Config.lookback()};
    LOG_INFO(<< "Starting analysis of [" << core::CTimeUtils::toIso8601(start) << ", "
             << core::CTimeUtils::toIso8601(end) << "]");

    std::vector<model::CSeries> series;
    for (const auto& name : m_Config.seriesNames()) {
        series.push_back(m_Store.readSeries(name, start, end));
    }

    auto frame = std::make_shared<const model::CAlignedFrame>(
        m_Config.aligner().align(series, start, end));
    series.clear();

    std::string fingerprint{model::CArtifactVersioner::fingerprint(*frame)};
    if (force == false && m_Versioner.isUnchanged(fingerprint)) {
        LOG_INFO(<< "Inputs unchanged since run " << m_Versioner.latest()->runId()
                 << ", skipping");
        return E_Skipped;
    }
    if (m_Cancelled.load()) {
        LOG_INFO(<< "Run cancelled before analysis");
        return E_Cancelled;
    }

    model::CCorrelationEngine correlationEngine{m_Config.minimumSamples()};
    model::CCausalityEngine causalityEngine{m_Config.causalityParams()};
    model::CForecastEngine forecastEngine{m_Config.forecastParams()};

    auto& executor = core::defaultAsyncExecutor();

    auto correlations = core::async(executor, [frame, correlationEngine]() {
        return std::make_shared<const model::CCorrelationMatrix>(
            correlationEngine.compute(*frame));
    });
    auto causality = core::async(executor, [frame, causalityEngine]() {
        return std::make_shared<const TVerdictVec>(causalityEngine.compute(*frame));
    });
    std::vector<core::future<model::SForecastResult>> forecasts;
    for (const auto& entity : m_Config.entities()) {
        forecasts.push_back(core::async(executor, [frame, forecastEngine, entity]() {
            return forecastEngine.forecastOrFail(*frame, entity);
        }));
    }

    correlations.wait();
    causality.wait();
    core::wait_for_all(forecasts);

    model::CAnalysisArtifact::SContents contents;
    contents.s_Correlations = correlations.get();
    contents.s_Causality = causality.get();
    auto results = std::make_shared<TForecastResultVec>();
    results->reserve(forecasts.size());
    for (auto& forecast : forecasts) {
        results->push_back(forecast.get());
    }
    contents.s_Forecasts = std::move(results);

    if (m_Cancelled.load()) {
        LOG_INFO(<< "Run cancelled before publication");
        return E_Cancelled;
    }

    contents.s_RunTime = core::CTimeUtils::now();
    contents.s_WindowStart = start;
    contents.s_WindowEnd = end;
    contents.s_Interval = frame->interval();
    contents.s_Fingerprint = std::move(fingerprint);
    contents.s_Parameters = m_Config.parameters();

    auto artifact = m_Versioner.publish(std::move(contents));
    LOG_INFO(<< "Run " << artifact->runId() << " took " << watch.lap() << "ms");

    return E_Published;
}

void CAnalysisRunner::cancel() {
    m_Cancelled.store(true);
}

bool CAnalysisRunner::cancelled() const {
    return m_Cancelled.load();
}

const model::CArtifactVersioner& CAnalysisRunner::versioner() const {
    return m_Versioner;
}

std::string CAnalysisRunner::print(EOutcome outcome) {
    switch (outcome) {
    case E_Published:
        return "published";
    case E_Skipped:
        return "skipped";
    case E_Cancelled:
        return "cancelled";
    }
    return "unknown";
}
}
}
