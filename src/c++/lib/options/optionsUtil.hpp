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

#include <string>

/// check if input file exists and is usable as input, if so canonicalize the name
///
/// "-" is accepted as stdin when isStdinAllowed is set
///
/// In case of error return true and provide error message
bool checkAndStandardizeRequiredInputFilePath(
    std::string& filename, const char* fileLabel, std::string& errorMsg, const bool isStdinAllowed = false);
