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
/// \brief sampling keys for weighted random sampling without replacement
///
/// Each weighted record receives key = log2(u) / w, with u drawn uniformly from (0,1). This is
/// the log of the classic u^(1/w) order statistic key, so keeping the K largest keys of a
/// stream gives a weighted sample of size K without replacement.
/// Computed keys are never positive, and a higher weight moves the key towards zero.
///

#pragma once

#include <limits>

namespace wrsample {

/// \brief key assigned to forced include records, this outranks every computed key
inline double forcedIncludeSamplingKey()
{
  return std::numeric_limits<double>::infinity();
}

/// \brief true if weight can be used to compute a sampling key
///
/// weights must be finite and strictly positive
bool isValidSamplingWeight(const double weight);

/// \brief compute the sampling key for one weighted record
///
/// throws WeightException if weight is not valid
///
/// \param[in] weight record weight
/// \param[in] u uniform random draw from the open interval (0,1)
double computeSamplingKey(const double weight, const double u);

namespace KeyOrder {
enum index_t { LESS, GREATER, UNORDERED };
}  // namespace KeyOrder

/// \brief compare key a to key b
///
/// Equal keys, including +0 vs. -0 and two forced include sentinels, and any comparison
/// involving NaN are reported as UNORDERED
KeyOrder::index_t compareSamplingKeys(const double a, const double b);

}  // namespace wrsample
