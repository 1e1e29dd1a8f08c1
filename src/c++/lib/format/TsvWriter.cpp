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

#include "format/TsvWriter.hpp"

#include "common/Exceptions.hpp"

#include <iostream>
#include <sstream>

void TsvWriter::writeLine(const std::vector<std::string>& words)
{
  // fields are written unquoted, so a separator inside a field would change the record shape:
  for (const std::string& word : words) {
    if (word.find_first_of("\t\n") == std::string::npos) continue;
    std::ostringstream oss;
    oss << "Can't write field containing a tab or newline to tab-delimited output: '" << word << "'";
    BOOST_THROW_EXCEPTION(wrsample::common::GeneralException(oss.str()));
  }

  std::ostream& os(_outs.getStream());
  bool          isFirst(true);
  for (const std::string& word : words) {
    if (!isFirst) os << '\t';
    os << word;
    isFirst = false;
  }
  os << '\n';
}

void TsvWriter::writeSchema(const wrsample::RecordSchema& schema)
{
  if (_isSchemaWritten) {
    BOOST_THROW_EXCEPTION(wrsample::common::PreConditionException("TsvWriter schema written twice"));
  }
  writeLine(schema.fieldNames());
  _isSchemaWritten = true;
}

void TsvWriter::writeRecord(const wrsample::Record& record)
{
  if (!_isSchemaWritten) {
    BOOST_THROW_EXCEPTION(wrsample::common::PreConditionException("TsvWriter record written before schema"));
  }
  writeLine(record.fields);
}

void TsvWriter::flush()
{
  std::ostream& os(_outs.getStream());
  os.flush();
  if (!os) {
    std::ostringstream oss;
    oss << "Failed to write sample output";
    if (!_outs.name().empty()) oss << " to file '" << _outs.name() << "'";
    BOOST_THROW_EXCEPTION(wrsample::common::GeneralException(oss.str()));
  }
}
