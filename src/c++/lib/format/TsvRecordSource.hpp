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

#include "htsapi/tsv_streamer.hpp"
#include "sampling/RecordStream.hpp"

#include <string>

/// \brief RecordSource reading a tab-delimited file with a header line
///
/// The first non-empty line names the fields, every following non-empty line is a record.
/// Fields are split on every tab, quote characters have no special meaning.
struct TsvRecordSource : public wrsample::RecordSource {
  /// \param[in] filename input path, or "-" for stdin
  explicit TsvRecordSource(const std::string& filename);

  const wrsample::RecordSchema& schema() const override { return _schema; }

  bool next(wrsample::Record& record) override;

  /// line number of the most recently read record
  unsigned lineNumber() const { return _streamer.line_no(); }

private:
  tsv_streamer           _streamer;
  wrsample::RecordSchema _schema;
};
