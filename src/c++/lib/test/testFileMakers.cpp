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

#include "testFileMakers.hpp"

#include "test/testUtil.hpp"

#include "htslib/bgzf.h"

#include "boost/filesystem.hpp"

#include <cassert>
#include <fstream>

TestFileMakerBase::~TestFileMakerBase()
{
  using namespace boost::filesystem;
  if (exists(_tempFilename)) {
    remove(_tempFilename);
  }
}

TestFilenameMaker::TestFilenameMaker()
{
  _tempFilename = getNewTempFile();
}

TestTextFileMaker::TestTextFileMaker(const std::string& content)
{
  _tempFilename = getNewTempFile() + ".tsv";
  std::ofstream os(_tempFilename);
  assert(os);
  os << content;
}

TestGzipTextFileMaker::TestGzipTextFileMaker(const std::string& content)
{
  _tempFilename = getNewTempFile() + ".tsv.gz";
  BGZF* bgzfPtr(bgzf_open(_tempFilename.c_str(), "w"));
  assert(bgzfPtr);
  const ssize_t writeSize(bgzf_write(bgzfPtr, content.c_str(), content.size()));
  assert(writeSize == static_cast<ssize_t>(content.size()));
  (void)writeSize;
  bgzf_close(bgzfPtr);
}
