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

#include "sampling/Record.hpp"
#include "sampling/SampleCandidate.hpp"

#include <iosfwd>
#include <string>

namespace wrsample {

/// \brief receives advisory events from a sampling run
///
/// Implementations must not influence selection, events are reported after each decision has
/// been made.
struct SamplingDiagnostics {
  virtual ~SamplingDiagnostics() = default;

  /// an identifier is in both the include and exclude sets, it will be excluded
  virtual void identityConflict(const std::string& id) = 0;

  virtual void excluded(const Record& record) = 0;

  virtual void forcedInclude(const Record& record) = 0;

  /// candidate left the selector, either evicted or rejected on arrival
  virtual void evicted(const SampleCandidate& candidate) = 0;

  /// keys of challenger and incumbent could not be strictly ordered, resolved by coin flip
  virtual void tieBreak(
      const SampleCandidate& challenger, const SampleCandidate& incumbent, const bool isChallengerKept) = 0;
};

/// \brief write sampling events to a log stream
///
/// conflicts and tie-breaks are written as warnings, all other events only in trace mode. Ties
/// between two forced includes are treated as trace events.
struct LogDiagnostics : public SamplingDiagnostics {
  LogDiagnostics(std::ostream& os, const bool isTrace) : _os(os), _isTrace(isTrace) {}

  void identityConflict(const std::string& id) override;

  void excluded(const Record& record) override;

  void forcedInclude(const Record& record) override;

  void evicted(const SampleCandidate& candidate) override;

  void tieBreak(
      const SampleCandidate& challenger, const SampleCandidate& incumbent, const bool isChallengerKept) override;

private:
  std::ostream& _os;
  bool          _isTrace;
};

}  // namespace wrsample
