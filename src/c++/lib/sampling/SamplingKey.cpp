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

#include "sampling/SamplingKey.hpp"

#include "common/Exceptions.hpp"

#include <cmath>

#include <sstream>

namespace wrsample {

bool isValidSamplingWeight(const double weight)
{
  return (std::isfinite(weight) && (weight > 0.));
}

double computeSamplingKey(const double weight, const double u)
{
  if (!isValidSamplingWeight(weight)) {
    std::ostringstream oss;
    if (weight == 0.) {
      oss << "Sampling weight is zero, non-zero weights are required to compute a sampling key";
    } else {
      oss << "Sampling weight '" << weight << "' is not a finite positive number";
    }
    BOOST_THROW_EXCEPTION(common::WeightException(oss.str()));
  }

  if (!((u > 0.) && (u < 1.))) {
    std::ostringstream oss;
    oss << "Random draw '" << u << "' for sampling key is outside of the open interval (0,1)";
    BOOST_THROW_EXCEPTION(common::PreConditionException(oss.str()));
  }

  return (1. / weight) * std::log2(u);
}

KeyOrder::index_t compareSamplingKeys(const double a, const double b)
{
  if (a < b) return KeyOrder::LESS;
  if (a > b) return KeyOrder::GREATER;
  return KeyOrder::UNORDERED;
}

}  // namespace wrsample
