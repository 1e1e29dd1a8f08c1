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

#include <iosfwd>
#include <string>
#include <vector>

namespace wrsample {

/// \brief ordered field names of a record stream
struct RecordSchema {
  RecordSchema() {}

  /// \param[in] fieldNames must be non-empty
  explicit RecordSchema(const std::vector<std::string>& fieldNames);

  unsigned size() const { return _fieldNames.size(); }

  bool empty() const { return _fieldNames.empty(); }

  const std::vector<std::string>& fieldNames() const { return _fieldNames; }

  const std::string& fieldName(const unsigned fieldIndex) const { return _fieldNames.at(fieldIndex); }

  /// \brief translate a field name into its 0-indexed position
  ///
  /// throws ConfigurationException if the name is not found, or if it is ambiguous because
  /// it occurs more than once in the schema
  ///
  /// \param[in] fieldLabel describes the role of the field in error messages (eg. "weight")
  unsigned resolveField(const std::string& fieldName, const char* fieldLabel) const;

private:
  std::vector<std::string> _fieldNames;
};

std::ostream& operator<<(std::ostream& os, const RecordSchema& schema);

}  // namespace wrsample
