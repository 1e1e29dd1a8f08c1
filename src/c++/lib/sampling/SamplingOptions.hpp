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

#include "boost/optional.hpp"

#include <string>
#include <vector>

namespace wrsample {

/// \brief configuration of one sampling run
struct SamplingOptions {
  SamplingOptions() : sampleCount(0) {}

  /// requested sample size, must be greater than zero
  unsigned sampleCount;

  /// name of the weight column, all records get weight 1 if unset
  boost::optional<std::string> weightField;

  /// name of the identifier column, the first column is used if unset
  boost::optional<std::string> idField;

  std::vector<std::string> includeIds;
  std::vector<std::string> excludeIds;
};

}  // namespace wrsample
