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

#include "format/IdentifierList.hpp"

#include "htsapi/tsv_streamer.hpp"

void readIdentifierList(const std::string& filename, std::vector<std::string>& ids)
{
  tsv_streamer idStream(filename.c_str());
  while (idStream.next()) {
    const char* id(idStream.word(0));
    if (('#' == *id) || ('\0' == *id)) continue;
    ids.push_back(id);
  }
}
