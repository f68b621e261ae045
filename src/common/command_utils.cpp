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

#include <string.h>

#include <sys/wait.h>

#include <tuple>
#include <vector>

#include <process/collect.hpp>
#include <process/io.hpp>
#include <process/subprocess.hpp>

#include <stout/none.hpp>
#include <stout/option.hpp>
#include <stout/os.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>

#include <stout/os/constants.hpp>

#include "common/command_utils.hpp"

using std::string;
using std::tuple;
using std::vector;

using process::Failure;
using process::Future;
using process::Subprocess;

namespace thermos {
namespace internal {
namespace command {

// Describes how a reaped child ended, or returns none if it exited
// with status 0.
static Option<string> describe(int status)
{
  if (WIFEXITED(status)) {
    if (WEXITSTATUS(status) == 0) {
      return None();
    }

    return "exited with status " + stringify(WEXITSTATUS(status));
  }

  if (WIFSIGNALED(status)) {
    return string("terminated with signal ") + strsignal(WTERMSIG(status));
  }

  return "ended with wait status " + stringify(status);
}


// Runs the command to completion and returns its stdout. Both stdout
// and stderr are captured so that they can be reported on failure.
static Future<string> launch(
    const string& path,
    const vector<string>& argv)
{
  Try<Subprocess> s = subprocess(
      path,
      argv,
      Subprocess::PATH(os::DEV_NULL),
      Subprocess::PIPE(),
      Subprocess::PIPE());

  const string command = strings::join(" ", argv);

  if (s.isError()) {
    return Failure(
        "Failed to execute the subprocess '" + command + "': " + s.error());
  }

  return await(
      s->status(),
      process::io::read(s->out().get()),
      process::io::read(s->err().get()))
    .then([command](const tuple<
        Future<Option<int>>,
        Future<string>,
        Future<string>>& t) -> Future<string> {
      const Future<Option<int>>& status = std::get<0>(t);
      if (!status.isReady()) {
        return Failure(
            "Failed to get the exit status of the subprocess: " +
            (status.isFailed() ? status.failure() : "discarded"));
      }

      if (status->isNone()) {
        return Failure("Failed to reap the subprocess");
      }

      const Future<string>& output = std::get<1>(t);
      const Future<string>& error = std::get<2>(t);

      const Option<string> failure = describe(status->get());
      if (failure.isSome()) {
        string captured;
        if (output.isReady()) {
          captured += output.get();
        }
        if (error.isReady()) {
          captured += error.get();
        }

        return Failure(
            "Subprocess '" + command + "' " + failure.get() +
            ": " + strings::trim(captured));
      }

      if (!output.isReady()) {
        return Failure(
            "Failed to read stdout from '" + command + "': " +
            (output.isFailed() ? output.failure() : "discarded"));
      }

      return output;
    });
}


Future<Nothing> useradd(
    const string& home,
    uid_t uid,
    const string& user,
    const string& command)
{
  vector<string> argv = {
    command,
    "-d",  // Home directory.
    home,
    "-l",  // Do not add the user to the lastlog and faillog databases.
    "-m",  // Create the home directory.
    "-u",  // User id.
    stringify(uid),
    user
  };

  return launch(command, argv)
    .then([]() { return Nothing(); });
}

} // namespace command {
} // namespace internal {
} // namespace thermos {
