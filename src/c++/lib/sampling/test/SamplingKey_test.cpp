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

#include "sampling/SamplingKey.hpp"

#include <cmath>

#include <limits>
#include <stdexcept>

BOOST_AUTO_TEST_SUITE(test_SamplingKey)

using namespace wrsample;

static const double tol(0.0001);

BOOST_AUTO_TEST_CASE(test_computeSamplingKey)
{
  BOOST_REQUIRE_CLOSE(computeSamplingKey(1., 0.5), -1., tol);
  BOOST_REQUIRE_CLOSE(computeSamplingKey(1., 0.25), -2., tol);
  BOOST_REQUIRE_CLOSE(computeSamplingKey(2., 0.25), -1., tol);
  BOOST_REQUIRE_CLOSE(computeSamplingKey(0.5, 0.5), -2., tol);
}

BOOST_AUTO_TEST_CASE(test_computeSamplingKey_higherWeightCloserToZero)
{
  // for the same draw, increasing weight always moves the key towards zero:
  const double u(0.3);
  double       lastKey(-std::numeric_limits<double>::infinity());
  for (double weight(0.001); weight < 1000.; weight *= 10.) {
    const double key(computeSamplingKey(weight, u));
    BOOST_REQUIRE(key < 0.);
    BOOST_REQUIRE(key > lastKey);
    lastKey = key;
  }
}

BOOST_AUTO_TEST_CASE(test_computeSamplingKey_extremeWeights)
{
  // no NaN for extreme but valid weights:
  const double tinyKey(computeSamplingKey(1e-300, 0.5));
  BOOST_REQUIRE(!std::isnan(tinyKey));
  BOOST_REQUIRE(tinyKey < 0.);

  const double hugeKey(computeSamplingKey(1e300, 0.5));
  BOOST_REQUIRE(!std::isnan(hugeKey));
  BOOST_REQUIRE(hugeKey <= 0.);
}

BOOST_AUTO_TEST_CASE(test_computeSamplingKey_badWeight)
{
  BOOST_REQUIRE_THROW(computeSamplingKey(0., 0.5), std::runtime_error);
  BOOST_REQUIRE_THROW(computeSamplingKey(-1., 0.5), std::runtime_error);
  BOOST_REQUIRE_THROW(computeSamplingKey(std::numeric_limits<double>::quiet_NaN(), 0.5), std::runtime_error);
  BOOST_REQUIRE_THROW(computeSamplingKey(std::numeric_limits<double>::infinity(), 0.5), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_computeSamplingKey_badDraw)
{
  BOOST_REQUIRE_THROW(computeSamplingKey(1., 0.), std::logic_error);
  BOOST_REQUIRE_THROW(computeSamplingKey(1., 1.), std::logic_error);
}

BOOST_AUTO_TEST_CASE(test_isValidSamplingWeight)
{
  BOOST_REQUIRE(isValidSamplingWeight(1.));
  BOOST_REQUIRE(isValidSamplingWeight(0.0001));
  BOOST_REQUIRE(!isValidSamplingWeight(0.));
  BOOST_REQUIRE(!isValidSamplingWeight(-0.));
  BOOST_REQUIRE(!isValidSamplingWeight(-2.));
}

BOOST_AUTO_TEST_CASE(test_forcedIncludeKeyOutranksComputedKeys)
{
  const double forcedKey(forcedIncludeSamplingKey());
  BOOST_REQUIRE_EQUAL(compareSamplingKeys(forcedKey, computeSamplingKey(1e300, 0.999)), KeyOrder::GREATER);
  BOOST_REQUIRE_EQUAL(compareSamplingKeys(computeSamplingKey(1000., 0.9), forcedKey), KeyOrder::LESS);
}

BOOST_AUTO_TEST_CASE(test_compareSamplingKeys)
{
  const double nan(std::numeric_limits<double>::quiet_NaN());
  const double inf(std::numeric_limits<double>::infinity());

  BOOST_REQUIRE_EQUAL(compareSamplingKeys(-1., -2.), KeyOrder::GREATER);
  BOOST_REQUIRE_EQUAL(compareSamplingKeys(-2., -1.), KeyOrder::LESS);
  BOOST_REQUIRE_EQUAL(compareSamplingKeys(-1., -1.), KeyOrder::UNORDERED);
  BOOST_REQUIRE_EQUAL(compareSamplingKeys(0., -0.), KeyOrder::UNORDERED);
  BOOST_REQUIRE_EQUAL(compareSamplingKeys(inf, inf), KeyOrder::UNORDERED);
  BOOST_REQUIRE_EQUAL(compareSamplingKeys(nan, -1.), KeyOrder::UNORDERED);
  BOOST_REQUIRE_EQUAL(compareSamplingKeys(-1., nan), KeyOrder::UNORDERED);
}

BOOST_AUTO_TEST_SUITE_END()
