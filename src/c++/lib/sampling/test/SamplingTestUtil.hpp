//
// wrsample - Weighted Random Sampling Tool
// Copyright (c) 2013-2019 Illumina, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//

/// \file
/// \brief test doubles for the sampling engine collaborators
///

#pragma once

#include "common/Exceptions.hpp"
#include "sampling/RandomSource.hpp"
#include "sampling/RecordStream.hpp"
#include "sampling/SamplingDiagnostics.hpp"

#include <deque>
#include <string>
#include <vector>

/// \brief RandomSource replaying fixed sequences of draws
///
/// throws if the test consumes more draws than were scripted
struct ScriptedRandomSource : public wrsample::RandomSource {
  ScriptedRandomSource(const std::vector<double>& uniforms, const std::vector<bool>& coins = std::vector<bool>())
    : uniformCount(0),
      coinCount(0),
      _uniforms(uniforms.begin(), uniforms.end()),
      _coins(coins.begin(), coins.end())
  {
  }

  double uniform() override
  {
    if (_uniforms.empty()) {
      BOOST_THROW_EXCEPTION(wrsample::common::GeneralException("scripted uniform draws exhausted"));
    }
    const double val(_uniforms.front());
    _uniforms.pop_front();
    uniformCount++;
    return val;
  }

  bool coinFlip() override
  {
    if (_coins.empty()) {
      BOOST_THROW_EXCEPTION(wrsample::common::GeneralException("scripted coin flips exhausted"));
    }
    const bool val(_coins.front());
    _coins.pop_front();
    coinCount++;
    return val;
  }

  unsigned uniformCount;
  unsigned coinCount;

private:
  std::deque<double> _uniforms;
  std::deque<bool>   _coins;
};

/// \brief RecordSource over an in-memory table, first row is the header
struct VectorRecordSource : public wrsample::RecordSource {
  explicit VectorRecordSource(const std::vector<std::vector<std::string>>& table)
    : _schema(table.at(0)), _rows(table.begin() + 1, table.end()), _rowIndex(0)
  {
  }

  const wrsample::RecordSchema& schema() const override { return _schema; }

  bool next(wrsample::Record& record) override
  {
    if (_rowIndex >= _rows.size()) return false;
    record.fields = _rows[_rowIndex++];
    return true;
  }

private:
  wrsample::RecordSchema                _schema;
  std::vector<std::vector<std::string>> _rows;
  unsigned                              _rowIndex;
};

struct VectorRecordSink : public wrsample::RecordSink {
  VectorRecordSink() : isSchemaWritten(false), isFlushed(false) {}

  void writeSchema(const wrsample::RecordSchema& schema) override
  {
    header          = schema.fieldNames();
    isSchemaWritten = true;
  }

  void writeRecord(const wrsample::Record& record) override { records.push_back(record); }

  void flush() override { isFlushed = true; }

  /// identifiers from the first column of each written record
  std::vector<std::string> ids() const
  {
    std::vector<std::string> result;
    for (const wrsample::Record& record : records) result.push_back(record.fields.at(0));
    return result;
  }

  bool                          isSchemaWritten;
  bool                          isFlushed;
  std::vector<std::string>      header;
  std::vector<wrsample::Record> records;
};

struct CountingDiagnostics : public wrsample::SamplingDiagnostics {
  CountingDiagnostics() : excludedCount(0), forcedIncludeCount(0), evictedCount(0), tieBreakCount(0) {}

  void identityConflict(const std::string& id) override { conflictIds.push_back(id); }

  void excluded(const wrsample::Record&) override { excludedCount++; }

  void forcedInclude(const wrsample::Record&) override { forcedIncludeCount++; }

  void evicted(const wrsample::SampleCandidate&) override { evictedCount++; }

  void tieBreak(const wrsample::SampleCandidate&, const wrsample::SampleCandidate&, const bool) override
  {
    tieBreakCount++;
  }

  std::vector<std::string> conflictIds;
  unsigned                 excludedCount;
  unsigned                 forcedIncludeCount;
  unsigned                 evictedCount;
  unsigned                 tieBreakCount;
};

/// build a two column (id, weight) table
inline std::vector<std::vector<std::string>> makeWeightTable(
    const std::vector<std::string>& ids, const std::vector<std::string>& weights)
{
  std::vector<std::vector<std::string>> table;
  table.push_back({"id", "weight"});
  for (unsigned i(0); i < ids.size(); ++i) {
    table.push_back({ids[i], weights[i]});
  }
  return table;
}
