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

#include <cstdint>

#include <random>

namespace wrsample {

/// \brief sequential source of all randomness consumed by one sampling run
///
/// Draws are consumed in strict call order, so a run is reproduced exactly by
/// replaying the same sequence of draws.
struct RandomSource {
  virtual ~RandomSource() = default;

  /// uniform draw from the open interval (0,1)
  virtual double uniform() = 0;

  /// unbiased coin flip
  virtual bool coinFlip() = 0;
};

/// \brief RandomSource driven by a seeded 64-bit mersenne twister
struct MersenneRandomSource : public RandomSource {
  explicit MersenneRandomSource(const uint64_t seed);

  double uniform() override;

  bool coinFlip() override;

private:
  std::mt19937_64                        _rng;
  std::uniform_real_distribution<double> _uniform;
  std::bernoulli_distribution            _coin;
};

}  // namespace wrsample
