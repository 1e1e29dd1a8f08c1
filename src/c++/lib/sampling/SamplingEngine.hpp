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
///

#pragma once

#include "sampling/BoundedSelector.hpp"
#include "sampling/IdentityFilter.hpp"
#include "sampling/RandomSource.hpp"
#include "sampling/RecordStream.hpp"
#include "sampling/SamplingDiagnostics.hpp"
#include "sampling/SamplingOptions.hpp"

#include "boost/optional.hpp"
#include "boost/utility.hpp"

#include <cstdint>

#include <iosfwd>
#include <vector>

namespace wrsample {

namespace EngineState {
enum index_t { INIT, STREAMING, FINALIZING, DONE, FAILED };

inline const char* label(const index_t i)
{
  switch (i) {
  case INIT:
    return "init";
  case STREAMING:
    return "streaming";
  case FINALIZING:
    return "finalizing";
  case DONE:
    return "done";
  case FAILED:
    return "failed";
  default:
    return "";
  }
}
}  // namespace EngineState

/// \brief record counts accumulated over one sampling run
struct SamplingSummary {
  SamplingSummary()
    : recordCount(0),
      excludedCount(0),
      forcedIncludeCount(0),
      offeredCount(0),
      evictedCount(0),
      retainedCount(0),
      tieBreakCount(0)
  {
  }

  uint64_t recordCount;
  uint64_t excludedCount;
  uint64_t forcedIncludeCount;

  /// weighted and forced include records offered to the selector
  uint64_t offeredCount;

  /// candidates removed from the selector, including those rejected on arrival
  uint64_t evictedCount;
  uint64_t retainedCount;
  unsigned tieBreakCount;
};

std::ostream& operator<<(std::ostream& os, const SamplingSummary& summary);

/// \brief single pass weighted random sampling without replacement
///
/// Records pass through the identity filter, weighted records receive a sampling key from one
/// uniform draw, forced includes receive the forced include sentinel key, and all candidates
/// compete for a slot in a bounded selector. Once the source is exhausted, the retained
/// records are written to the sink in arrival order.
///
/// Any error aborts the run before the sink is touched, so a failed run produces no output.
/// The engine is single use.
struct SamplingEngine : private boost::noncopyable {
  /// \param[in] randomSource all key draws and tie-break coin flips are taken from this source
  SamplingEngine(const SamplingOptions& opt, RandomSource& randomSource, SamplingDiagnostics& diagnostics);

  /// \brief sample source into sink
  SamplingSummary run(RecordSource& source, RecordSink& sink);

  EngineState::index_t state() const { return _state; }

private:
  /// validate options and resolve field names against the input schema
  void init(const RecordSchema& schema);

  void streamRecords(RecordSource& source, BoundedSelector& selector);

  void processRecord(Record& record, BoundedSelector& selector);

  double getWeight(const Record& record) const;

  std::vector<SampleCandidate> finalize(BoundedSelector& selector);

  void emit(const RecordSchema& schema, const std::vector<SampleCandidate>& sample, RecordSink& sink);

  const SamplingOptions        _opt;
  RandomSource&                _randomSource;
  SamplingDiagnostics&         _diagnostics;
  EngineState::index_t         _state;
  IdentityFilter               _filter;
  unsigned                     _fieldCount;
  unsigned                     _idFieldIndex;
  boost::optional<unsigned>    _weightFieldIndex;
  SamplingSummary              _summary;
};

}  // namespace wrsample
