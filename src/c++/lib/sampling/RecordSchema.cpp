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

#include "sampling/RecordSchema.hpp"

#include "common/Exceptions.hpp"

#include <iostream>
#include <sstream>

namespace wrsample {

RecordSchema::RecordSchema(const std::vector<std::string>& fieldNames) : _fieldNames(fieldNames)
{
  if (_fieldNames.empty()) {
    BOOST_THROW_EXCEPTION(common::ConfigurationException("Record schema must contain at least one field"));
  }
}

unsigned RecordSchema::resolveField(const std::string& fieldName, const char* fieldLabel) const
{
  const unsigned fieldCount(size());
  unsigned       matchCount(0);
  unsigned       matchIndex(0);
  for (unsigned fieldIndex(0); fieldIndex < fieldCount; ++fieldIndex) {
    if (_fieldNames[fieldIndex] != fieldName) continue;
    if (0 == matchCount) matchIndex = fieldIndex;
    matchCount++;
  }

  if (1 == matchCount) return matchIndex;

  std::ostringstream oss;
  if (0 == matchCount) {
    oss << "Can't find " << fieldLabel << " column '" << fieldName << "' in input header";
  } else {
    oss << fieldLabel << " column '" << fieldName << "' occurs " << matchCount
        << " times in input header";
  }
  BOOST_THROW_EXCEPTION(common::ConfigurationException(oss.str()) << common::FieldNameInfo(fieldName));
}

std::ostream& operator<<(std::ostream& os, const RecordSchema& schema)
{
  os << "RecordSchema fieldCount: " << schema.size() << " fields:";
  for (const std::string& name : schema.fieldNames()) {
    os << " '" << name << "'";
  }
  return os;
}

}  // namespace wrsample
