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

#ifndef __SANDBOX_FILESYSTEM_IMAGE_HPP__
#define __SANDBOX_FILESYSTEM_IMAGE_HPP__

#include <sys/types.h>

#include <string>

#include <thermos/sandbox.hpp>

#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

#include "sandbox/constants.hpp"
#include "sandbox/directory.hpp"

namespace thermos {
namespace internal {
namespace sandbox {

// A sandbox for tasks provisioned from a filesystem image.
//
// The containerizer mounts the executor sandbox at `containerSandbox`
// (typically `/mnt/mesos/sandbox`) inside the container, while the
// executor is told its host path `mesosHostSandbox` (e.g.
// `[work_dir]/.../runs/RUN1`). `create()` recreates the host layout
// inside the container by symlinking `mesosHostSandbox` to
// `containerSandbox`, so that the task sandbox is reachable at
// `mesosHostSandbox/<name>` both inside and outside the container.
//
// If a uid is given, an account for `user` with that uid is created
// before the sandbox is handed over to the user, for images that do
// not already contain the task user.
class FileSystemImageSandbox : public Sandbox
{
public:
  FileSystemImageSandbox(
      const std::string& mesosHostSandbox,
      const Option<std::string>& containerSandbox,
      const std::string& sandboxName,
      const Option<std::string>& user = None(),
      const Option<uid_t>& uid = None(),
      const std::string& useraddCommand = USERADD);

  ~FileSystemImageSandbox() override {}

  const std::string& root() const override;
  bool chrooted() const override;
  bool exists() const override;

  Try<Nothing, CreationError> create() override;
  Try<Nothing, DeletionError> destroy() override;

  const std::string& mesosHostSandbox() const { return mesosHostSandbox_; }
  const Option<std::string>& user() const { return directory.user(); }
  const Option<uid_t>& uid() const { return uid_; }

private:
  Try<Nothing, CreationError> createSymlinks();
  Try<Nothing, CreationError> createUser();

  const std::string mesosHostSandbox_;
  const Option<std::string> containerSandbox;
  const Option<uid_t> uid_;
  const std::string useraddCommand;

  DirectorySandbox directory;
};

} // namespace sandbox {
} // namespace internal {
} // namespace thermos {

#endif // __SANDBOX_FILESYSTEM_IMAGE_HPP__
