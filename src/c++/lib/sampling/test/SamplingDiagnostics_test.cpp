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

#include "boost/test/unit_test.hpp"

#include "sampling/SamplingDiagnostics.hpp"
#include "sampling/SamplingKey.hpp"

#include <sstream>

BOOST_AUTO_TEST_SUITE(test_SamplingDiagnostics)

using namespace wrsample;

static SampleCandidate makeForcedCandidate(const uint64_t arrivalIndex)
{
  SampleCandidate candidate;
  candidate.record.arrivalIndex = arrivalIndex;
  candidate.isForcedInclude     = true;
  candidate.key                 = forcedIncludeSamplingKey();
  return candidate;
}

static SampleCandidate makeWeightedCandidate(const uint64_t arrivalIndex, const double key)
{
  SampleCandidate candidate;
  candidate.record.arrivalIndex = arrivalIndex;
  candidate.weight              = 1.;
  candidate.randomness          = 0.5;
  candidate.key                 = key;
  return candidate;
}

BOOST_AUTO_TEST_CASE(test_LogDiagnostics_weightedTieIsWarning)
{
  std::ostringstream oss;
  LogDiagnostics     diag(oss, false);
  diag.tieBreak(makeWeightedCandidate(3, -1.), makeWeightedCandidate(1, -1.), true);

  BOOST_REQUIRE_EQUAL(oss.str().find("WARNING:"), 0u);
  BOOST_REQUIRE(oss.str().find("in favor of record 3") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_LogDiagnostics_forcedIncludeTieIsTrace)
{
  // many forced includes beyond the sample count produce one tie each, none are warnings:
  {
    std::ostringstream oss;
    LogDiagnostics     diag(oss, false);
    for (uint64_t arrivalIndex(2); arrivalIndex < 100; ++arrivalIndex) {
      diag.tieBreak(makeForcedCandidate(arrivalIndex), makeForcedCandidate(1), false);
    }
    BOOST_REQUIRE(oss.str().empty());
  }

  {
    std::ostringstream oss;
    LogDiagnostics     diag(oss, true);
    diag.tieBreak(makeForcedCandidate(2), makeForcedCandidate(1), false);
    BOOST_REQUIRE_EQUAL(oss.str().find("TRACE:"), 0u);
    BOOST_REQUIRE(oss.str().find("in favor of record 1") != std::string::npos);
  }
}

BOOST_AUTO_TEST_CASE(test_LogDiagnostics_traceEvents)
{
  Record record;
  record.fields = {"A", "1"};

  {
    std::ostringstream oss;
    LogDiagnostics     diag(oss, false);
    diag.excluded(record);
    diag.forcedInclude(record);
    diag.evicted(makeWeightedCandidate(0, -2.));
    BOOST_REQUIRE(oss.str().empty());

    diag.identityConflict("A");
    BOOST_REQUIRE_EQUAL(oss.str().find("WARNING:"), 0u);
  }

  {
    std::ostringstream oss;
    LogDiagnostics     diag(oss, true);
    diag.excluded(record);
    BOOST_REQUIRE_EQUAL(oss.str().find("TRACE: excluding"), 0u);
  }
}

BOOST_AUTO_TEST_SUITE_END()
