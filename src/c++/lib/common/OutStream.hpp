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

#include "boost/utility.hpp"

#include <ios>
#include <iosfwd>
#include <memory>
#include <string>

/// \brief output stream which is stdout if fileName is empty, and otherwise the named file
///
/// the file is checked for write access on construction, but not opened (truncated) until
/// the stream is first requested, so that a run which fails before writing output leaves an
/// existing file untouched
struct OutStream : private boost::noncopyable {
  explicit OutStream(const std::string& fileName);

  ~OutStream();

  std::ostream& getStream()
  {
    if (!_isInit) initStream();
    return *_osptr;
  }

  const std::string& name() const { return _fileName; }

private:
  void initStream();

  static void openFile(const std::string& filename, std::ofstream& ofs, const std::ios_base::openmode mode);

  bool                           _isInit;
  std::string                    _fileName;
  std::ostream*                  _osptr;
  std::unique_ptr<std::ofstream> _ofsptr;
};
