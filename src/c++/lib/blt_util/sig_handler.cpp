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

#include "blt_util/sig_handler.hpp"
#include "blt_util/log.hpp"

#include <signal.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <iostream>
#include <string>

static std::string           _progname;
static std::string           _cmdline;
static const char* volatile _activity("starting up");

static void wrsample_sig_handler(int sig)
{
  const char* sigLabel((sig == SIGTERM) ? "termination" : "interrupt");
  log_os << "ERROR: " << _progname << " received " << sigLabel << " signal while " << _activity
         << ". cmdline: " << _cmdline << std::endl;
  exit(EXIT_FAILURE);
}

static void install_handler(const int sig, const struct sigaction& action)
{
  if (0 == sigaction(sig, &action, nullptr)) return;
  log_os << "WARNING: " << _progname << " failed to install handler for signal no: " << sig << ": "
         << strerror(errno) << "\n";
}

void initialize_wrsample_signals(const char* progname, const char* cmdline)
{
  _progname = progname;
  _cmdline  = cmdline;

  struct sigaction action;
  memset(&action, 0, sizeof(action));
  action.sa_handler = wrsample_sig_handler;
  sigemptyset(&action.sa_mask);

  install_handler(SIGTERM, action);
  install_handler(SIGINT, action);
}

void set_signal_activity(const char* activity)
{
  _activity = activity;
}
