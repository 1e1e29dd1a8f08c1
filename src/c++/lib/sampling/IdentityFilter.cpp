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

#include "sampling/IdentityFilter.hpp"

namespace wrsample {

IdentityFilter::IdentityFilter(
    const std::vector<std::string>& includeIds, const std::vector<std::string>& excludeIds)
  : _include(includeIds.begin(), includeIds.end()), _exclude(excludeIds.begin(), excludeIds.end())
{
  std::unordered_set<std::string> reported;
  for (const std::string& id : includeIds) {
    if (!_exclude.count(id)) continue;
    if (!reported.insert(id).second) continue;
    _conflictIds.push_back(id);
  }
}

}  // namespace wrsample
