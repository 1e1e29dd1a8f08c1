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

#include <string>
#include <unordered_set>
#include <vector>

namespace wrsample {

namespace IdentityClass {
enum index_t { NORMAL, EXCLUDED, FORCED_INCLUDE };
}  // namespace IdentityClass

/// \brief classify record identifiers against fixed include and exclude sets
///
/// An identifier found in both sets is EXCLUDED.
struct IdentityFilter {
  IdentityFilter() {}

  IdentityFilter(const std::vector<std::string>& includeIds, const std::vector<std::string>& excludeIds);

  IdentityClass::index_t classify(const std::string& id) const
  {
    if (_exclude.count(id)) return IdentityClass::EXCLUDED;
    if (_include.count(id)) return IdentityClass::FORCED_INCLUDE;
    return IdentityClass::NORMAL;
  }

  /// identifiers which occur in both the include and exclude sets, in include order
  const std::vector<std::string>& conflictIds() const { return _conflictIds; }

  unsigned includeCount() const { return _include.size(); }

  unsigned excludeCount() const { return _exclude.size(); }

private:
  std::unordered_set<std::string> _include;
  std::unordered_set<std::string> _exclude;
  std::vector<std::string>        _conflictIds;
};

}  // namespace wrsample
