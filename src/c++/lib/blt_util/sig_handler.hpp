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

/// install SIGTERM/SIGINT handlers which report the interrupted program, its current
/// activity and command-line before exiting with failure status
void initialize_wrsample_signals(const char* progname, const char* cmdline);

/// describe what the program is doing, reported if a termination signal arrives
///
/// \param[in] activity must point to storage which outlives the program, typically a string literal
void set_signal_activity(const char* activity);
