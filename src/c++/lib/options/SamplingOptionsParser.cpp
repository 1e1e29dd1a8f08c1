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

#include "options/SamplingOptionsParser.hpp"

#include "blt_util/parse_util.hpp"
#include "common/Exceptions.hpp"
#include "format/IdentifierList.hpp"
#include "options/optionsUtil.hpp"

#include <sstream>

typedef std::vector<std::string> ids_t;

boost::program_options::options_description getOptionsDescription(wrsample::SamplingOptions& /*opt*/)
{
  namespace po = boost::program_options;
  po::options_description desc("sampling");
  // clang-format off
  desc.add_options()
  ("sample-count", po::value<std::string>(),
   "number of records to sample (required)")
  ("weight-column", po::value<std::string>(),
   "name of the column holding record weights (default: all records have weight 1)")
  ("id-column", po::value<std::string>(),
   "name of the column holding record identifiers (default: first column)")
  ("include", po::value<ids_t>()->multitoken(),
   "always sample records with this identifier (may be specified multiple times)")
  ("exclude", po::value<ids_t>()->multitoken(),
   "never sample records with this identifier, takes precedence over --include (may be specified multiple times)")
  ("include-file", po::value<ids_t>(),
   "file listing identifiers to include, one per line (may be specified multiple times)")
  ("exclude-file", po::value<ids_t>(),
   "file listing identifiers to exclude, one per line (may be specified multiple times)")
  ;
  // clang-format on

  return desc;
}

static bool getIds(
    const boost::program_options::variables_map& vm,
    const char*                                  listKey,
    const char*                                  fileKey,
    const char*                                  fileLabel,
    ids_t&                                       ids,
    std::string&                                 errorMsg)
{
  ids.clear();
  if (vm.count(listKey)) {
    ids = vm[listKey].as<ids_t>();
  }

  if (vm.count(fileKey)) {
    ids_t files(vm[fileKey].as<ids_t>());
    for (std::string& idFile : files) {
      if (checkAndStandardizeRequiredInputFilePath(idFile, fileLabel, errorMsg)) return true;
      readIdentifierList(idFile, ids);
    }
  }
  return false;
}

bool parseOptions(
    const boost::program_options::variables_map& vm, wrsample::SamplingOptions& opt, std::string& errorMsg)
{
  errorMsg.clear();

  if (!vm.count("sample-count")) {
    errorMsg = "Must specify sample count";
    return true;
  }

  try {
    opt.sampleCount = wrsample::blt_util::parse_unsigned_str(vm["sample-count"].as<std::string>());
  } catch (const wrsample::common::GeneralException& e) {
    errorMsg = std::string("Invalid sample count: ") + e.what();
    return true;
  }
  if (0 == opt.sampleCount) {
    errorMsg = "Sample count must be greater than zero";
    return true;
  }

  opt.weightField.reset();
  if (vm.count("weight-column")) {
    opt.weightField = vm["weight-column"].as<std::string>();
  }

  opt.idField.reset();
  if (vm.count("id-column")) {
    opt.idField = vm["id-column"].as<std::string>();
  }

  if (getIds(vm, "include", "include-file", "include identifier list", opt.includeIds, errorMsg)) return true;
  if (getIds(vm, "exclude", "exclude-file", "exclude identifier list", opt.excludeIds, errorMsg)) return true;

  return false;
}
