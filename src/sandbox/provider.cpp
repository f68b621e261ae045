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

#include <stout/error.hpp>
#include <stout/option.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>

#include "sandbox/constants.hpp"
#include "sandbox/directory.hpp"
#include "sandbox/filesystem_image.hpp"
#include "sandbox/provider.hpp"

using std::string;

using process::Owned;

namespace thermos {
namespace internal {
namespace sandbox {

DefaultSandboxProvider::DefaultSandboxProvider(const Flags& _flags)
  : flags(_flags) {}


Try<Owned<Sandbox>> DefaultSandboxProvider::fromAssignedTask(
    const AssignedTask& assignedTask) const
{
  const Container& container = assignedTask.task().container();

  const bool docker = container.has_docker();
  const bool image = container.has_mesos() && container.mesos().has_image();

  if (!docker && !image) {
    Try<string> user = sandboxUser(assignedTask);
    if (user.isError()) {
      return Error(user.error());
    }

    const string root = path::join(os::getcwd(), SANDBOX_NAME);

    VLOG(1) << "Using directory sandbox '" << root << "' for task "
            << assignedTask.task_id();

    return Owned<Sandbox>(new DirectorySandbox(root, user.get()));
  }

  if (flags.directory.isNone()) {
    return Error(
        "Cannot place the sandbox of task " + assignedTask.task_id() +
        ": MESOS_DIRECTORY is not set");
  }

  Option<string> user;
  Option<uid_t> uid;

  if (docker) {
    Try<Option<uid_t>> commandUid = flags.commandUid();
    if (commandUid.isError()) {
      return Error("Invalid MESOS_COMMAND_UID: " + commandUid.error());
    }

    // Without a command uid the task runs as whatever user the image
    // defines, so the sandbox is left to the process user.
    if (commandUid->isSome()) {
      Try<string> _user = sandboxUser(assignedTask);
      if (_user.isError()) {
        return Error(_user.error());
      }

      user = _user.get();
      uid = commandUid->get();
    }
  } else {
    Try<string> _user = sandboxUser(assignedTask);
    if (_user.isError()) {
      return Error(_user.error());
    }

    user = _user.get();
  }

  VLOG(1) << "Using filesystem image sandbox '"
          << path::join(flags.directory.get(), SANDBOX_NAME)
          << "' for task " << assignedTask.task_id();

  return Owned<Sandbox>(new FileSystemImageSandbox(
      flags.directory.get(),
      flags.sandbox,
      SANDBOX_NAME,
      user,
      uid));
}

} // namespace sandbox {
} // namespace internal {
} // namespace thermos {
