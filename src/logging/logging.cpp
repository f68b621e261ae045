// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <string>

#include <glog/logging.h>

#include <process/once.hpp>

#include <stout/error.hpp>
#include <stout/os.hpp>

#include "logging/logging.hpp"

using process::Once;

using std::string;

namespace thermos {
namespace internal {
namespace logging {

Try<google::LogSeverity> severity(const string& level)
{
  if (level == "INFO") {
    return google::INFO;
  } else if (level == "WARNING") {
    return google::WARNING;
  } else if (level == "ERROR") {
    return google::ERROR;
  }

  return Error(
      "'" + level + "' is not a valid logging level, expecting one of "
      "'INFO', 'WARNING' or 'ERROR'");
}


Try<Nothing> initialize(
    const string& argv0,
    const Flags& flags,
    bool installFailureSignalHandler)
{
  static Once* initialized = new Once();

  if (initialized->once()) {
    return Nothing();
  }

  // glog keeps the pointer passed to `InitGoogleLogging`.
  static string* name = new string(argv0);

  Try<google::LogSeverity> level = severity(flags.logging_level);
  if (level.isError()) {
    initialized->done();
    return Error(level.error());
  }

  if (flags.log_dir.isSome()) {
    Try<Nothing> mkdir = os::mkdir(flags.log_dir.get());
    if (mkdir.isError()) {
      initialized->done();
      return Error(
          "Failed to create log directory '" + flags.log_dir.get() + "': " +
          mkdir.error());
    }

    FLAGS_log_dir = flags.log_dir.get();
  }

  // Without a log directory everything goes to stderr, where
  // `stderrthreshold` has no effect and `minloglevel` has to silence
  // a quiet process instead.
  FLAGS_logtostderr = flags.log_dir.isNone();
  FLAGS_logbufsecs = flags.logbufsecs;
  FLAGS_minloglevel = level.get();
  FLAGS_stderrthreshold = level.get();

  if (flags.quiet) {
    FLAGS_stderrthreshold = google::FATAL;

    if (FLAGS_logtostderr) {
      FLAGS_minloglevel = google::FATAL;
    }
  }

  google::InitGoogleLogging(name->c_str());

  if (installFailureSignalHandler) {
    google::InstallFailureSignalHandler();
  }

  VLOG(1) << "Logging to "
          << (flags.log_dir.isSome() ? flags.log_dir.get() : "stderr");

  initialized->done();

  return Nothing();
}

} // namespace logging {
} // namespace internal {
} // namespace thermos {
