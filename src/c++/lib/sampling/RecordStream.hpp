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
/// \brief input and output collaborators of the sampling engine
///

#pragma once

#include "sampling/Record.hpp"
#include "sampling/RecordSchema.hpp"

namespace wrsample {

/// \brief finite, single pass sequence of records sharing one schema
struct RecordSource {
  virtual ~RecordSource() = default;

  virtual const RecordSchema& schema() const = 0;

  /// \brief read the next record into record.fields
  ///
  /// \return false at the end of the stream
  virtual bool next(Record& record) = 0;
};

/// \brief destination for the sampled records
///
/// receives the schema once, then each retained record, then a final flush
struct RecordSink {
  virtual ~RecordSink() = default;

  virtual void writeSchema(const RecordSchema& schema) = 0;

  virtual void writeRecord(const Record& record) = 0;

  virtual void flush() = 0;
};

}  // namespace wrsample
