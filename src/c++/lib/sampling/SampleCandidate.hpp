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

#include "sampling/Record.hpp"

#include <iosfwd>

namespace wrsample {

/// \brief a record competing for a slot in the sample
struct SampleCandidate {
  SampleCandidate() : weight(0), randomness(0), key(0), isForcedInclude(false) {}

  uint64_t arrivalIndex() const { return record.arrivalIndex; }

  Record record;

  /// weight and randomness are only set for weighted candidates, forced includes leave them zero
  double weight;
  double randomness;
  double key;
  bool   isForcedInclude;
};

std::ostream& operator<<(std::ostream& os, const SampleCandidate& candidate);

}  // namespace wrsample
