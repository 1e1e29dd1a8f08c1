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

#include "common/Program.hpp"
#include "sampling/SamplingOptions.hpp"

#include <cstdint>

#include <string>

struct WSOptions {
  WSOptions() : isSeedSet(false), seed(0), isVerbose(false) {}

  std::string               inputFilename;
  std::string               outputFilename;
  wrsample::SamplingOptions sampling;
  bool                      isSeedSet;
  uint64_t                  seed;
  bool                      isVerbose;
};

void parseWSOptions(const wrsample::Program& prog, int argc, char* argv[], WSOptions& opt);
