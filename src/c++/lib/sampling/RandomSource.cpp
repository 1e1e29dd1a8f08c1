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

#include "sampling/RandomSource.hpp"

#include <limits>

namespace wrsample {

// uniform_real_distribution samples [a,b), starting from the smallest positive double
// excludes zero, for which log2 is undefined
MersenneRandomSource::MersenneRandomSource(const uint64_t seed)
  : _rng(seed), _uniform(std::numeric_limits<double>::denorm_min(), 1.), _coin(0.5)
{
}

double MersenneRandomSource::uniform()
{
  return _uniform(_rng);
}

bool MersenneRandomSource::coinFlip()
{
  return _coin(_rng);
}

}  // namespace wrsample
