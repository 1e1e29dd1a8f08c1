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

#include "WSOptions.hpp"

#include "blt_util/log.hpp"
#include "blt_util/parse_util.hpp"
#include "common/Exceptions.hpp"
#include "common/ProgramUtil.hpp"
#include "options/SamplingOptionsParser.hpp"
#include "options/optionsUtil.hpp"

#include "boost/program_options.hpp"

#include <iostream>

static void usage(
    std::ostream&                                      os,
    const wrsample::Program&                           prog,
    const boost::program_options::options_description& visible,
    const char*                                        msg = nullptr)
{
  usage(
      os,
      prog,
      visible,
      "draw a weighted random sample of records from a tab-delimited file without replacement",
      " [ > output]",
      msg);
}

void parseWSOptions(const wrsample::Program& prog, int argc, char* argv[], WSOptions& opt)
{
  namespace po = boost::program_options;
  po::options_description req("configuration");
  // clang-format off
  req.add_options()
  ("input-file", po::value(&opt.inputFilename),
   "tab-delimited input file with a header line, may be gzip or bgzip compressed, '-' for stdin (required)")
  ("output-file", po::value(&opt.outputFilename),
   "write sampled records to filename (default: stdout)")
  ("seed", po::value<std::string>(),
   "random seed, set to reproduce a previous run (default: drawn from the system random device)")
  ("verbose", po::bool_switch(&opt.isVerbose),
   "log every exclusion, forced inclusion and eviction")
  ;
  // clang-format on

  const po::options_description sampling(getOptionsDescription(opt.sampling));

  po::options_description help("help");
  help.add_options()("help,h", "print this message");

  po::options_description visible("options");
  visible.add(req).add(sampling).add(help);

  bool              po_parse_fail(false);
  po::variables_map vm;
  try {
    po::store(
        po::parse_command_line(
            argc, argv, visible, po::command_line_style::unix_style ^ po::command_line_style::allow_short),
        vm);
    po::notify(vm);
  } catch (const po::error& e) {
    log_os << "\nERROR: Exception thrown by option parser: " << e.what() << "\n";
    po_parse_fail = true;
  }

  if ((argc <= 1) || (vm.count("help")) || po_parse_fail) {
    usage(log_os, prog, visible);
  }

  std::string errorMsg;
  if (checkAndStandardizeRequiredInputFilePath(opt.inputFilename, "input", errorMsg, true)) {
    usage(log_os, prog, visible, errorMsg.c_str());
  }

  if (parseOptions(vm, opt.sampling, errorMsg)) {
    usage(log_os, prog, visible, errorMsg.c_str());
  }

  opt.isSeedSet = vm.count("seed");
  if (opt.isSeedSet) {
    try {
      opt.seed = wrsample::blt_util::parse_unsigned_str(vm["seed"].as<std::string>());
    } catch (const wrsample::common::GeneralException& e) {
      const std::string seedMsg(std::string("Invalid random seed: ") + e.what());
      usage(log_os, prog, visible, seedMsg.c_str());
    }
  }
}
