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

#include "common/OutStream.hpp"
#include "sampling/RecordStream.hpp"

/// \brief RecordSink writing tab-delimited text, header line first
///
/// nothing is written to the stream until the schema is received. Fields are written without
/// quoting, a field containing a tab or newline is an error.
struct TsvWriter : public wrsample::RecordSink {
  explicit TsvWriter(OutStream& outs) : _outs(outs), _isSchemaWritten(false) {}

  void writeSchema(const wrsample::RecordSchema& schema) override;

  void writeRecord(const wrsample::Record& record) override;

  void flush() override;

private:
  void writeLine(const std::vector<std::string>& words);

  OutStream& _outs;
  bool       _isSchemaWritten;
};
