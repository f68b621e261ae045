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

#ifndef __SANDBOX_PROVIDER_HPP__
#define __SANDBOX_PROVIDER_HPP__

#include <thermos/sandbox.hpp>

#include <process/owned.hpp>

#include <stout/try.hpp>

#include "sandbox/flags.hpp"

namespace thermos {
namespace internal {
namespace sandbox {

// Picks the sandbox from the task's container:
//   * Docker: a `FileSystemImageSandbox`. The task user is provisioned
//     (and owns the sandbox) only if the agent exported a command uid.
//   * Mesos with an image: a `FileSystemImageSandbox` owned by the
//     task user.
//   * Otherwise: a `DirectorySandbox` named `SANDBOX_NAME` in the
//     current working directory, owned by the task user.
class DefaultSandboxProvider : public SandboxProvider
{
public:
  explicit DefaultSandboxProvider(const Flags& flags);

  ~DefaultSandboxProvider() override {}

  Try<process::Owned<Sandbox>> fromAssignedTask(
      const AssignedTask& assignedTask) const override;

private:
  const Flags flags;
};

} // namespace sandbox {
} // namespace internal {
} // namespace thermos {

#endif // __SANDBOX_PROVIDER_HPP__
