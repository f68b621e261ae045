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

#include <process/future.hpp>

#include <stout/check.hpp>
#include <stout/fs.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/stringify.hpp>

#include "common/command_utils.hpp"

#include "sandbox/filesystem_image.hpp"

using std::string;

using process::Future;

namespace thermos {
namespace internal {
namespace sandbox {

FileSystemImageSandbox::FileSystemImageSandbox(
    const string& _mesosHostSandbox,
    const Option<string>& _containerSandbox,
    const string& sandboxName,
    const Option<string>& user,
    const Option<uid_t>& _uid,
    const string& _useraddCommand)
  : mesosHostSandbox_(_mesosHostSandbox),
    containerSandbox(_containerSandbox),
    uid_(_uid),
    useraddCommand(_useraddCommand),
    directory(path::join(_mesosHostSandbox, sandboxName), user) {}


const string& FileSystemImageSandbox::root() const
{
  return directory.root();
}


bool FileSystemImageSandbox::chrooted() const
{
  return false;
}


bool FileSystemImageSandbox::exists() const
{
  return directory.exists();
}


// Takes `mesosHostSandbox` (e.g. "[work_dir]/.../runs/RUN1"), creates
// its parent (e.g. "[work_dir]/.../runs") and symlinks it to the
// container sandbox (e.g. "/mnt/mesos/sandbox").
Try<Nothing, CreationError> FileSystemImageSandbox::createSymlinks()
{
  if (containerSandbox.isNone()) {
    return CreationError(
        "Failed to create the sandbox root: "
        "the container sandbox path is not set");
  }

  const string parent = Path(mesosHostSandbox_).dirname();

  Try<Nothing> mkdir = os::mkdir(parent);
  if (mkdir.isError()) {
    return CreationError(
        "Failed to create the sandbox root: Failed to create '" + parent +
        "': " + mkdir.error());
  }

  VLOG(1) << "FileSystemImageSandbox: symlink " << mesosHostSandbox_
          << " -> " << containerSandbox.get();

  Try<Nothing> symlink =
    ::fs::symlink(containerSandbox.get(), mesosHostSandbox_);
  if (symlink.isError()) {
    return CreationError(
        "Failed to create the sandbox root: Failed to symlink '" +
        containerSandbox.get() + "' to '" + mesosHostSandbox_ + "': " +
        symlink.error());
  }

  return Nothing();
}


Try<Nothing, CreationError> FileSystemImageSandbox::createUser()
{
  if (uid_.isNone()) {
    VLOG(1) << "No UID found in environment, not creating new user";
    return Nothing();
  }

  const Option<string>& user = directory.user();
  if (user.isNone()) {
    return CreationError(
        "Failed to create user with uid " + stringify(uid_.get()) +
        ": no user name was given");
  }

  // `createSymlinks()` has already failed if there is no container
  // sandbox to use as the home directory.
  CHECK_SOME(containerSandbox);

  LOG(INFO) << "Executing '" << useraddCommand
            << " -d " << containerSandbox.get()
            << " -l -m -u " << uid_.get() << " " << user.get() << "'";

  // Blocks until the command exits; there is no timeout.
  Future<Nothing> useradd = command::useradd(
      containerSandbox.get(),
      uid_.get(),
      user.get(),
      useraddCommand);

  useradd.await();

  if (!useradd.isReady()) {
    return CreationError(
        "Failed to create user " + user.get() + ": " +
        (useradd.isFailed() ? useradd.failure() : "discarded"));
  }

  return Nothing();
}


Try<Nothing, CreationError> FileSystemImageSandbox::create()
{
  Try<Nothing, CreationError> symlinks = createSymlinks();
  if (symlinks.isError()) {
    return symlinks;
  }

  Try<Nothing, CreationError> user = createUser();
  if (user.isError()) {
    return user;
  }

  return directory.create();
}


Try<Nothing, DeletionError> FileSystemImageSandbox::destroy()
{
  return directory.destroy();
}

} // namespace sandbox {
} // namespace internal {
} // namespace thermos {
