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

#include "sampling/BoundedSelector.hpp"
#include "sampling/SamplingKey.hpp"

#include "common/Exceptions.hpp"

#include <cmath>

#include <algorithm>
#include <sstream>

namespace wrsample {

/// strict weak ordering of candidates, worst first
///
/// NaN keys sort below every other key, equal keys put the later arrival first
static bool isWorseCandidate(const SampleCandidate& a, const SampleCandidate& b)
{
  const bool isANan(std::isnan(a.key));
  const bool isBNan(std::isnan(b.key));
  if (isANan != isBNan) return isANan;
  if ((!isANan) && (a.key != b.key)) return (a.key < b.key);
  return (a.arrivalIndex() > b.arrivalIndex());
}

/// heap comparator which puts the worst candidate at the front of a std heap
static bool isBetterCandidate(const SampleCandidate& a, const SampleCandidate& b)
{
  return isWorseCandidate(b, a);
}

BoundedSelector::BoundedSelector(
    const unsigned capacity, RandomSource& randomSource, SamplingDiagnostics& diagnostics)
  : _capacity(capacity),
    _randomSource(randomSource),
    _diagnostics(diagnostics),
    _isDrained(false),
    _tieBreakCount(0)
{
  if (0 == _capacity) {
    BOOST_THROW_EXCEPTION(common::PreConditionException("Bounded selector capacity must be at least one"));
  }
}

void BoundedSelector::assertNotDrained(const char* method) const
{
  if (!_isDrained) return;
  std::ostringstream oss;
  oss << "BoundedSelector::" << method << "() called after the selector was drained";
  BOOST_THROW_EXCEPTION(common::PreConditionException(oss.str()));
}

const SampleCandidate& BoundedSelector::minCandidate() const
{
  if (_heap.empty()) {
    BOOST_THROW_EXCEPTION(common::PreConditionException("BoundedSelector::minCandidate() called on empty selector"));
  }
  return _heap.front();
}

void BoundedSelector::replaceMin(SampleCandidate&& candidate)
{
  std::pop_heap(_heap.begin(), _heap.end(), isBetterCandidate);
  _diagnostics.evicted(_heap.back());
  _heap.back() = std::move(candidate);
  std::push_heap(_heap.begin(), _heap.end(), isBetterCandidate);
}

OfferResult::index_t BoundedSelector::offer(SampleCandidate&& candidate)
{
  assertNotDrained("offer");

  if (_heap.size() < _capacity) {
    _heap.push_back(std::move(candidate));
    std::push_heap(_heap.begin(), _heap.end(), isBetterCandidate);
    return OfferResult::INSERTED;
  }

  const SampleCandidate& incumbent(_heap.front());
  bool                   isChallengerKept(false);
  switch (compareSamplingKeys(candidate.key, incumbent.key)) {
  case KeyOrder::GREATER:
    isChallengerKept = true;
    break;
  case KeyOrder::LESS:
    isChallengerKept = false;
    break;
  default:
    isChallengerKept = _randomSource.coinFlip();
    _tieBreakCount++;
    _diagnostics.tieBreak(candidate, incumbent, isChallengerKept);
    break;
  }

  if (!isChallengerKept) {
    _diagnostics.evicted(candidate);
    return OfferResult::REJECTED;
  }

  replaceMin(std::move(candidate));
  return OfferResult::REPLACED;
}

std::vector<SampleCandidate> BoundedSelector::drain()
{
  assertNotDrained("drain");
  _isDrained = true;

  std::vector<SampleCandidate> retained;
  retained.swap(_heap);
  return retained;
}

}  // namespace wrsample
