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

#include "sampling/SamplingOptions.hpp"

#include "boost/program_options.hpp"

#include <string>

boost::program_options::options_description getOptionsDescription(wrsample::SamplingOptions& opt);

/// \brief transfer sampling options from vm into opt
///
/// identifier list files are read during this step
///
/// \return true on error, with errorMsg set
bool parseOptions(
    const boost::program_options::variables_map& vm, wrsample::SamplingOptions& opt, std::string& errorMsg);
