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

#include "htsapi/tsv_streamer.hpp"
#include "common/Exceptions.hpp"

#include "htslib/kseq.h"

#include <cstdlib>

#include <iostream>
#include <sstream>

static const kstring_t kinit = {0, 0, 0};

tsv_streamer::tsv_streamer(const char* filename, const char word_separator)
  : _is_stream_end(false), _line_no(0), _stream_name(), _sep(word_separator), _hfp(nullptr), _kstr(kinit)
{
  using namespace wrsample::common;

  if (!filename) {
    BOOST_THROW_EXCEPTION(GeneralException("tsv filename is null ptr"));
  }

  if ('\0' == *filename) {
    BOOST_THROW_EXCEPTION(GeneralException("tsv filename is empty string"));
  }

  _stream_name = filename;

  _hfp = hts_open(filename, "r");
  if (!_hfp) {
    std::ostringstream oss;
    oss << "Failed to open tsv file: '" << filename << "'";
    BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
  }
}

tsv_streamer::~tsv_streamer()
{
  if (_hfp) hts_close(_hfp);
  if (_kstr.s) free(_kstr.s);
}

bool tsv_streamer::next()
{
  _words.clear();
  if (_is_stream_end || (!_hfp)) return false;

  while (true) {
    const int retval(hts_getline(_hfp, KS_SEP_LINE, &_kstr));
    if (retval == -1) {
      _is_stream_end = true;
      return false;
    } else if (retval < -1) {
      std::ostringstream oss;
      oss << "Unexpected failure while attempting to read tsv line " << (_line_no + 1) << "\n";
      report_state(oss);
      BOOST_THROW_EXCEPTION(
          wrsample::common::GeneralException(oss.str()) << wrsample::common::StreamLineInfo(_line_no + 1));
    }

    _line_no++;
    if (_kstr.l == 0) continue;
    break;
  }

  split_line();
  return true;
}

void tsv_streamer::split_line()
{
  char* p(_kstr.s);
  _words.push_back(p);
  for (; *p != '\0'; ++p) {
    if (*p != _sep) continue;
    *p = '\0';
    _words.push_back(p + 1);
  }
}

void tsv_streamer::get_words(std::vector<std::string>& words) const
{
  words.assign(_words.begin(), _words.end());
}

void tsv_streamer::report_state(std::ostream& os) const
{
  os << "\ttsv_stream_label: " << name() << "\n";
  os << "\ttsv_stream_line_no: " << line_no() << "\n";
  if (!_words.empty()) {
    os << "\ttsv_line:";
    for (const char* w : _words) os << ' ' << w;
    os << "\n";
  } else {
    os << "\tno tsv line currently set\n";
  }
}
