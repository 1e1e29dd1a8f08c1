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

#include "sampling/RandomSource.hpp"
#include "sampling/SampleCandidate.hpp"
#include "sampling/SamplingDiagnostics.hpp"

#include "boost/utility.hpp"

#include <vector>

namespace wrsample {

namespace OfferResult {
enum index_t { INSERTED, REPLACED, REJECTED };
}  // namespace OfferResult

/// \brief retains the candidates with the largest sampling keys among all candidates offered
///
/// Candidates are held in a binary min-heap, so the current minimum is checked in constant
/// time and replaced in O(log capacity).
/// Heap storage grows with the number of candidates retained, not with capacity.
///
/// When a new candidate's key can't be strictly ordered against the current minimum key, one
/// coin flip from the random source decides which of the two is retained. Within the heap,
/// candidates with equal keys are ordered by arrival index so that heap order remains a strict
/// weak ordering, only the admission decision is randomized.
///
/// The selector is single use: once drained it rejects further use.
struct BoundedSelector : private boost::noncopyable {
  /// \param[in] capacity maximum number of retained candidates, must be at least one
  BoundedSelector(const unsigned capacity, RandomSource& randomSource, SamplingDiagnostics& diagnostics);

  OfferResult::index_t offer(SampleCandidate&& candidate);

  /// \brief return all retained candidates in no particular order
  std::vector<SampleCandidate> drain();

  unsigned size() const { return _heap.size(); }

  bool empty() const { return _heap.empty(); }

  unsigned capacity() const { return _capacity; }

  bool isDrained() const { return _isDrained; }

  /// the retained candidate which will be evicted next, selector must be non-empty
  const SampleCandidate& minCandidate() const;

  /// number of offers resolved by coin flip
  unsigned tieBreakCount() const { return _tieBreakCount; }

private:
  void assertNotDrained(const char* method) const;

  void replaceMin(SampleCandidate&& candidate);

  unsigned                     _capacity;
  RandomSource&                _randomSource;
  SamplingDiagnostics&         _diagnostics;
  std::vector<SampleCandidate> _heap;
  bool                         _isDrained;
  unsigned                     _tieBreakCount;
};

}  // namespace wrsample
