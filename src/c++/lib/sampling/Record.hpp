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

#include <iosfwd>
#include <string>
#include <vector>

namespace wrsample {

/// \brief one data line of the input stream
///
/// field values are kept as text, the only fields the sampler interprets are the
/// identifier and weight fields
struct Record {
  Record() : arrivalIndex(0) {}

  void clear()
  {
    fields.clear();
    arrivalIndex = 0;
  }

  std::vector<std::string> fields;

  /// 0-indexed position of this record among all records read from the stream
  uint64_t arrivalIndex;
};

std::ostream& operator<<(std::ostream& os, const Record& record);

}  // namespace wrsample
