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

#include <grp.h>

#include <string>

#include <glog/logging.h>

#include <stout/os.hpp>
#include <stout/result.hpp>
#include <stout/stringify.hpp>

#include "sandbox/constants.hpp"
#include "sandbox/directory.hpp"

using std::string;

namespace thermos {
namespace internal {
namespace sandbox {

// Returns the name of the group for log messages, or the gid itself
// if the group cannot be found.
static string groupname(gid_t gid)
{
  struct group* g = ::getgrgid(gid);
  if (g != nullptr) {
    return g->gr_name;
  }

  return stringify(gid);
}


DirectorySandbox::DirectorySandbox(
    const string& _root,
    const Option<string>& _user)
  : root_(_root),
    user_(_user) {}


const string& DirectorySandbox::root() const
{
  return root_;
}


bool DirectorySandbox::chrooted() const
{
  return false;
}


bool DirectorySandbox::exists() const
{
  return os::exists(root_);
}


Try<Nothing, CreationError> DirectorySandbox::create()
{
  VLOG(1) << "DirectorySandbox: mkdir " << root_;

  Try<Nothing> mkdir = os::mkdir(root_);
  if (mkdir.isError()) {
    return CreationError("Failed to create the sandbox: " + mkdir.error());
  }

  if (user_.isNone()) {
    return Nothing();
  }

  // NOTE: The directory created above is left in place on any of the
  // failures below.
  Result<uid_t> uid = os::getuid(user_.get());
  Result<gid_t> gid = os::getgid(user_.get());

  if (uid.isNone() || gid.isNone()) {
    return CreationError(
        "Could not create sandbox because user does not exist: " +
        user_.get());
  }

  if (uid.isError() || gid.isError()) {
    return CreationError(
        "Failed to look up user '" + user_.get() + "': " +
        (uid.isError() ? uid.error() : gid.error()));
  }

  LOG(INFO) << "DirectorySandbox: chown " << user_.get() << ":"
            << groupname(gid.get()) << " " << root_;

  Try<Nothing> chown = os::chown(uid.get(), gid.get(), root_, false);
  if (chown.isError()) {
    return CreationError("Failed to chown/chmod the sandbox: " + chown.error());
  }

  VLOG(1) << "DirectorySandbox: chmod 700 " << root_;

  Try<Nothing> chmod = os::chmod(root_, SANDBOX_MODE);
  if (chmod.isError()) {
    return CreationError("Failed to chown/chmod the sandbox: " + chmod.error());
  }

  return Nothing();
}


Try<Nothing, DeletionError> DirectorySandbox::destroy()
{
  if (!os::exists(root_)) {
    VLOG(1) << "DirectorySandbox: nothing to remove at " << root_;
    return Nothing();
  }

  VLOG(1) << "DirectorySandbox: rmdir " << root_;

  Try<Nothing> rmdir = os::rmdir(root_);
  if (rmdir.isError()) {
    return DeletionError("Failed to destroy sandbox: " + rmdir.error());
  }

  return Nothing();
}

} // namespace sandbox {
} // namespace internal {
} // namespace thermos {
