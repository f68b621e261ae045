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

#include <stout/error.hpp>
#include <stout/none.hpp>
#include <stout/numify.hpp>
#include <stout/strings.hpp>

#include "sandbox/flags.hpp"

using std::string;

namespace thermos {
namespace internal {
namespace sandbox {

static Try<Option<uid_t>> parseUid(const Option<string>& value)
{
  if (value.isNone()) {
    return None();
  }

  const string uid = strings::trim(value.get());
  if (uid.empty()) {
    return None();
  }

  Try<uid_t> parse = numify<uid_t>(uid);
  if (parse.isError()) {
    return Error("Invalid uid '" + uid + "': " + parse.error());
  }

  return parse.get();
}


Flags::Flags()
{
  add(&Flags::directory,
      "directory",
      "Path of the executor sandbox on the host. For tasks running in a\n"
      "filesystem image the task sandbox is placed below this path and\n"
      "the path itself is replaced by a symlink to the container sandbox.\n"
      "(Example: `[work_dir]/slaves/S1/frameworks/F1/executors/E1/runs/R1`)");

  add(&Flags::sandbox,
      "sandbox",
      "Path of the executor sandbox as mounted inside the container.\n"
      "Also used as the home directory of users created for the task.\n"
      "(Example: `/mnt/mesos/sandbox`)");

  add(&Flags::command_uid,
      "command_uid",
      "UID the containerizer launches the task command as. When set, an\n"
      "account with this UID is created for the task's role before the\n"
      "sandbox is handed over to it. An empty value is the same as\n"
      "leaving it unset.",
      [](const Option<string>& value) -> Option<Error> {
        Try<Option<uid_t>> uid = parseUid(value);
        if (uid.isError()) {
          return Error(uid.error());
        }

        return None();
      });
}


Try<Option<uid_t>> Flags::commandUid() const
{
  return parseUid(command_uid);
}

} // namespace sandbox {
} // namespace internal {
} // namespace thermos {
