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

#include "htslib/hts.h"
#include "htslib/kstring.h"

#include "boost/utility.hpp"

#include <iosfwd>
#include <string>
#include <vector>

/// \brief stream delimited text lines from any text input htslib can open
///
/// plain, gzip and bgzip compressed files are all accepted, "-" reads stdin. Empty lines are
/// skipped. Words are only valid until the next call to next()
struct tsv_streamer : private boost::noncopyable {
  /// \param[in] filename (required)
  explicit tsv_streamer(const char* filename, const char word_separator = '\t');

  ~tsv_streamer();

  const char* name() const { return _stream_name.c_str(); }

  /// line number of the current line in the file, including skipped lines
  unsigned line_no() const { return _line_no; }

  /// \brief advance to the next non-empty line
  ///
  /// \return false at the end of the stream
  bool next();

  unsigned n_word() const { return _words.size(); }

  const char* word(const unsigned index) const { return _words[index]; }

  /// copy all words of the current line into words
  void get_words(std::vector<std::string>& words) const;

  void report_state(std::ostream& os) const;

private:
  void split_line();

  bool                     _is_stream_end;
  unsigned                 _line_no;
  std::string              _stream_name;
  char                     _sep;
  htsFile*                 _hfp;
  kstring_t                _kstr;
  std::vector<const char*> _words;
};
