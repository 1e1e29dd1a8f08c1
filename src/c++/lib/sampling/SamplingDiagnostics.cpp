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

#include "sampling/SamplingDiagnostics.hpp"

#include <iostream>

namespace wrsample {

void LogDiagnostics::identityConflict(const std::string& id)
{
  _os << "WARNING: identifier '" << id << "' is listed for both inclusion and exclusion, it will be excluded\n";
}

void LogDiagnostics::excluded(const Record& record)
{
  if (!_isTrace) return;
  _os << "TRACE: excluding " << record << "\n";
}

void LogDiagnostics::forcedInclude(const Record& record)
{
  if (!_isTrace) return;
  _os << "TRACE: forcing inclusion of " << record << "\n";
}

void LogDiagnostics::evicted(const SampleCandidate& candidate)
{
  if (!_isTrace) return;
  _os << "TRACE: removing " << candidate << "\n";
}

void LogDiagnostics::tieBreak(
    const SampleCandidate& challenger, const SampleCandidate& incumbent, const bool isChallengerKept)
{
  // forced includes tie whenever they outnumber the sample count:
  const bool isForcedTie(challenger.isForcedInclude && incumbent.isForcedInclude);
  if (isForcedTie) {
    if (!_isTrace) return;
    _os << "TRACE: forced include records " << challenger.arrivalIndex() << " and "
        << incumbent.arrivalIndex() << " compete for a sample slot, resolved randomly in favor of record "
        << (isChallengerKept ? challenger.arrivalIndex() : incumbent.arrivalIndex()) << "\n";
    return;
  }

  _os << "WARNING: sampling keys of records " << challenger.arrivalIndex() << " and "
      << incumbent.arrivalIndex() << " can't be ordered (" << challenger.key << " vs. " << incumbent.key
      << "), resolved randomly in favor of record "
      << (isChallengerKept ? challenger.arrivalIndex() : incumbent.arrivalIndex()) << "\n";
}

}  // namespace wrsample
