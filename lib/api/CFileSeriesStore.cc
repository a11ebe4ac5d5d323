/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <api/CFileSeriesStore.h>

#include <core/CLogger.h>
#include <core/CStreamUtils.h>
#include <core/CStringUtils.h>
#include <core/CTimeUtils.h>

#include <model/CAnalysisArtifact.h>
#include <model/CAnalysisErrors.h>

#include <api/CArtifactJsonParser.h>
#include <api/CArtifactJsonWriter.h>

#include <boost/filesystem.hpp>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>

namespace tsa {
namespace api {

const std::string CFileSeriesStore::SERIES_FILE_EXTENSION{".csv"};
const std::string CFileSeriesStore::ARTIFACT_FILE_PREFIX{"artifact_"};
const std::string CFileSeriesStore::ARTIFACT_FILE_EXTENSION{".json"};
const std::string CFileSeriesStore::LATEST_FILE_NAME{"latest"};

CFileSeriesStore::CFileSeriesStore(std::string dataDirectory,
                                   std::string artifactDirectory,
                                   TStrKindMap kinds)
    : m_DataDirectory{std::move(dataDirectory)},
      m_ArtifactDirectory{std::move(artifactDirectory)}, m_Kinds{std::move(kinds)} {
}

model::CSeries CFileSeriesStore::readSeries(const std::string& name,
                                            core_t::TTime start,
                                            core_t::TTime end) {
    auto kind = m_Kinds.find(name);
    model::CSeries::EKind kind_{kind != m_Kinds.end() ? kind->second
                                                      : model::CSeries::E_Other};

    boost::filesystem::path path{m_DataDirectory};
    path /= name + SERIES_FILE_EXTENSION;

    try {
        if (boost::filesystem::exists(path) == false) {
            LOG_WARN(<< "No data file " << path.string() << " for series '" << name << "'");
            return model::CSeries{name, kind_, {}};
        }
    } catch (const boost::filesystem::filesystem_error& e) {
        throw model::CStorageError{"failed to access " + path.string() + ": " + e.what()};
    }

    std::ifstream strm{path.string()};
    if (strm.is_open() == false) {
        throw model::CStorageError{"unable to open " + path.string()};
    }
    core::CStreamUtils::skipUtf8Bom(strm);

    TTimeDoublePrVec values;
    std::size_t skipped{parseSeries(strm, name, start, end, values)};
    if (strm.bad()) {
        throw model::CStorageError{"error reading " + path.string()};
    }
    if (skipped > 0) {
        LOG_WARN(<< "Skipped or replaced " << skipped << " rows of " << path.string());
    }
    LOG_DEBUG(<< "Read " << values.size() << " values of '" << name << "'");

    return model::CSeries{name, kind_, std::move(values)};
}

void CFileSeriesStore::writeArtifact(const model::CAnalysisArtifact& artifact) {
    try {
        boost::filesystem::create_directories(boost::filesystem::path{m_ArtifactDirectory});
    } catch (const boost::filesystem::filesystem_error& e) {
        throw model::CStorageError{"failed to create " + m_ArtifactDirectory + ": " + e.what()};
    }

    // Write the artifact before moving the pointer to it.
    this->writeAtomically(this->artifactFileName(artifact.runId()),
                          CArtifactJsonWriter::toString(artifact));
    this->writeAtomically(
        (boost::filesystem::path{m_ArtifactDirectory} / LATEST_FILE_NAME).string(),
        core::CStringUtils::typeToString(artifact.runId()) + '\n');
}

CFileSeriesStore::TArtifactCPtr CFileSeriesStore::readLatestArtifact() {
    boost::filesystem::path latest{m_ArtifactDirectory};
    latest /= LATEST_FILE_NAME;

    try {
        if (boost::filesystem::exists(latest) == false) {
            LOG_DEBUG(<< "No artifacts in " << m_ArtifactDirectory);
            return nullptr;
        }
    } catch (const boost::filesystem::filesystem_error& e) {
        throw model::CStorageError{"failed to access " + latest.string() + ": " + e.what()};
    }

    std::ifstream latestStrm{latest.string()};
    std::string line;
    std::uint64_t runId{0};
    if (latestStrm.is_open() == false || core::CStreamUtils::getLine(latestStrm, line) == false) {
        throw model::CStorageError{"unable to read " + latest.string()};
    }
    core::CStringUtils::trimWhitespace(line);
    if (core::CStringUtils::stringToType(line, runId) == false) {
        throw model::CStorageError{"invalid run identifier '" + line + "' in " + latest.string()};
    }

    std::string fileName{this->artifactFileName(runId)};
    std::ifstream strm{fileName};
    if (strm.is_open() == false) {
        throw model::CStorageError{"unable to open " + fileName};
    }
    TArtifactCPtr result{CArtifactJsonParser::parse(strm)};
    if (result == nullptr) {
        throw model::CStorageError{"invalid artifact " + fileName};
    }
    return result;
}

std::string CFileSeriesStore::artifactFileName(std::uint64_t runId) const {
    boost::filesystem::path path{m_ArtifactDirectory};
    path /= ARTIFACT_FILE_PREFIX + core::CStringUtils::typeToString(runId) + ARTIFACT_FILE_EXTENSION;
    return path.string();
}

std::size_t CFileSeriesStore::parseSeries(std::istream& strm,
                                          const std::string& name,
                                          core_t::TTime start,
                                          core_t::TTime end,
                                          TTimeDoublePrVec& values) {
    values.clear();

    std::size_t skipped{0};
    std::size_t lineNumber{0};
    bool first{true};
    std::string line;
    while (core::CStreamUtils::getLine(strm, line)) {
        ++lineNumber;
        core::CStringUtils::trimWhitespace(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        std::size_t comma{line.find(',')};
        std::string timeField{line.substr(0, comma)};
        std::string valueField{comma == std::string::npos ? "" : line.substr(comma + 1)};
        // Ignore any further columns.
        valueField = valueField.substr(0, valueField.find(','));
        core::CStringUtils::trimWhitespace(timeField);
        core::CStringUtils::trimWhitespace(valueField);

        core_t::TTime time;
        double value;
        if (core::CTimeUtils::parseTime(timeField, time) == false) {
            if (first == false) {
                LOG_DEBUG(<< "Unparsable time '" << timeField << "' in " << name
                          << " line " << lineNumber);
                ++skipped;
            }
            first = false;
            continue;
        }
        first = false;
        if (core::CStringUtils::stringToTypeSilent(valueField, value) == false ||
            std::isfinite(value) == false) {
            LOG_DEBUG(<< "Unparsable value '" << valueField << "' in " << name
                      << " line " << lineNumber);
            ++skipped;
            continue;
        }
        if (time < start || time > end) {
            continue;
        }
        values.emplace_back(time, value);
    }

    // The stable sort keeps rows for the same time in file order so taking
    // the last of each run keeps the last value written.
    if (std::is_sorted(values.begin(), values.end(),
                       [](const auto& lhs, const auto& rhs) {
                           return lhs.first < rhs.first;
                       }) == false) {
        LOG_DEBUG(<< "Sorting rows of " << name);
        std::stable_sort(values.begin(), values.end(), [](const auto& lhs, const auto& rhs) {
            return lhs.first < rhs.first;
        });
    }
    std::size_t n{0};
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i + 1 < values.size() && values[i + 1].first == values[i].first) {
            ++skipped;
            continue;
        }
        values[n++] = values[i];
    }
    values.resize(n);

    return skipped;
}

void CFileSeriesStore::writeAtomically(const std::string& fileName,
                                       const std::string& contents) const {
    std::string tmpFileName{fileName + ".tmp"};
    {
        std::ofstream strm{tmpFileName, std::ios::out | std::ios::trunc};
        if (strm.is_open() == false) {
            throw model::CStorageError{"unable to open " + tmpFileName};
        }
        strm << contents;
        strm.flush();
        if (!strm) {
            throw model::CStorageError{"error writing " + tmpFileName};
        }
    }
    try {
        boost::filesystem::rename(tmpFileName, fileName);
    } catch (const boost::filesystem::filesystem_error& e) {
        boost::system::error_code ignored;
        boost::filesystem::remove(tmpFileName, ignored);
        throw model::CStorageError{"failed to rename " + tmpFileName + " to " +
                                   fileName + ": " + e.what()};
    }
}
}
}
