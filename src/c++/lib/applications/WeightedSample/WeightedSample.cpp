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

#include "WeightedSample.hpp"
#include "WSOptions.hpp"

#include "blt_util/log.hpp"
#include "blt_util/sig_handler.hpp"
#include "common/OutStream.hpp"
#include "format/TsvRecordSource.hpp"
#include "format/TsvWriter.hpp"
#include "sampling/RandomSource.hpp"
#include "sampling/SamplingDiagnostics.hpp"
#include "sampling/SamplingEngine.hpp"

#include <iostream>
#include <random>

static void runWS(const WSOptions& opt)
{
  uint64_t seed(opt.seed);
  if (!opt.isSeedSet) {
    std::random_device rd;
    seed = rd();
  }
  log_os << "INFO: random seed: " << seed << "\n";

  set_signal_activity("reading input records");

  TsvRecordSource source(opt.inputFilename);
  OutStream       outs(opt.outputFilename);
  TsvWriter       sink(outs);

  wrsample::MersenneRandomSource randomSource(seed);
  wrsample::LogDiagnostics       diagnostics(log_os, opt.isVerbose);
  wrsample::SamplingEngine       engine(opt.sampling, randomSource, diagnostics);

  const wrsample::SamplingSummary summary(engine.run(source, sink));
  set_signal_activity("shutting down");

  if (summary.retainedCount < opt.sampling.sampleCount) {
    log_os << "WARNING: requested " << opt.sampling.sampleCount << " records, but only "
           << summary.retainedCount << " records were available for sampling\n";
  }
  if (summary.forcedIncludeCount > opt.sampling.sampleCount) {
    log_os << "WARNING: " << summary.forcedIncludeCount << " records matched the include list, "
           << "which is more than the sample count " << opt.sampling.sampleCount << "\n";
  }
  if (opt.isVerbose) {
    log_os << summary;
  }
}

void WeightedSample::runInternal(int argc, char* argv[]) const
{
  WSOptions opt;

  parseWSOptions(*this, argc, argv, opt);
  runWS(opt);
}
