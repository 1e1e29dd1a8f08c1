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

#include "format/TsvRecordSource.hpp"

#include "common/Exceptions.hpp"

#include <sstream>

TsvRecordSource::TsvRecordSource(const std::string& filename) : _streamer(filename.c_str())
{
  if (!_streamer.next()) {
    std::ostringstream oss;
    oss << "Input file '" << filename << "' has no header line";
    BOOST_THROW_EXCEPTION(wrsample::common::ConfigurationException(oss.str()));
  }

  std::vector<std::string> fieldNames;
  _streamer.get_words(fieldNames);
  _schema = wrsample::RecordSchema(fieldNames);
}

bool TsvRecordSource::next(wrsample::Record& record)
{
  if (!_streamer.next()) return false;
  _streamer.get_words(record.fields);
  return true;
}
