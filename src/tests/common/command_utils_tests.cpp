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

#include <gtest/gtest.h>

#include <process/future.hpp>
#include <process/gtest.hpp>

#include <stout/gtest.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>

#include "common/command_utils.hpp"

#include "tests/utils.hpp"

using std::string;

using process::Future;

namespace thermos {
namespace internal {
namespace tests {

class UseraddTest : public TemporaryDirectoryTest
{
protected:
  // Writes a script standing in for `useradd` which records its
  // arguments, writes to both stdout and stderr and exits with the
  // given status.
  Try<string> createScript(int status)
  {
    const string script = path::join(sandbox.get(), "useradd");
    const string arguments = path::join(sandbox.get(), "arguments");

    Try<Nothing> write = os::write(
        script,
        "#!/bin/sh\n"
        "echo \"$@\" > " + arguments + "\n"
        "echo 'to stdout'\n"
        "echo 'to stderr' 1>&2\n"
        "exit " + stringify(status) + "\n");

    if (write.isError()) {
      return Error("Failed to write script: " + write.error());
    }

    Try<Nothing> chmod = os::chmod(script, 0755);
    if (chmod.isError()) {
      return Error("Failed to chmod script: " + chmod.error());
    }

    return script;
  }
};


TEST_F(UseraddTest, Arguments)
{
  Try<string> script = createScript(0);
  ASSERT_SOME(script);

  AWAIT_ASSERT_READY(
      command::useradd("/mnt/mesos/sandbox", 1234, "www-data", script.get()));

  EXPECT_SOME_EQ(
      "-d /mnt/mesos/sandbox -l -m -u 1234 www-data\n",
      os::read(path::join(sandbox.get(), "arguments")));
}


TEST_F(UseraddTest, ExitStatus)
{
  Try<string> script = createScript(4);
  ASSERT_SOME(script);

  Future<Nothing> useradd =
    command::useradd("/mnt/mesos/sandbox", 1234, "www-data", script.get());

  AWAIT_ASSERT_FAILED(useradd);

  EXPECT_TRUE(strings::contains(useradd.failure(), "exited with status 4"))
    << useradd.failure();
  EXPECT_TRUE(strings::contains(useradd.failure(), "to stdout"))
    << useradd.failure();
  EXPECT_TRUE(strings::contains(useradd.failure(), "to stderr"))
    << useradd.failure();
}


TEST_F(UseraddTest, Signaled)
{
  const string script = path::join(sandbox.get(), "useradd");

  ASSERT_SOME(os::write(script, "#!/bin/sh\nkill -KILL $$\n"));
  ASSERT_SOME(os::chmod(script, 0755));

  Future<Nothing> useradd =
    command::useradd("/mnt/mesos/sandbox", 1234, "www-data", script);

  AWAIT_ASSERT_FAILED(useradd);

  EXPECT_TRUE(strings::contains(useradd.failure(), "terminated with signal"))
    << useradd.failure();
}


TEST_F(UseraddTest, MissingCommand)
{
  AWAIT_ASSERT_FAILED(command::useradd(
      "/mnt/mesos/sandbox",
      1234,
      "www-data",
      path::join(sandbox.get(), "missing")));
}

} // namespace tests {
} // namespace internal {
} // namespace thermos {
