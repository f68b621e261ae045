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

#ifndef __THERMOS_SANDBOX_HPP__
#define __THERMOS_SANDBOX_HPP__

#include <string>

#include <thermos/thermos.hpp>

#include <process/owned.hpp>

#include <stout/error.hpp>
#include <stout/nothing.hpp>
#include <stout/try.hpp>

namespace thermos {

// Base class of the errors reported by a sandbox. The message is the
// human readable cause of the failure.
class SandboxError : public Error
{
public:
  explicit SandboxError(const std::string& message) : Error(message) {}
};


// Returned when any step of `Sandbox::create()` fails. The sandbox may
// have been partially created; no cleanup is attempted.
class CreationError : public SandboxError
{
public:
  explicit CreationError(const std::string& message) : SandboxError(message) {}
};


// Returned when `Sandbox::destroy()` fails to remove the sandbox.
class DeletionError : public SandboxError
{
public:
  explicit DeletionError(const std::string& message) : SandboxError(message) {}
};


/**
 * The per-task working directory of the executor.
 *
 * A sandbox is constructed by a `SandboxProvider` for exactly one task,
 * created before the task is launched and destroyed after it finishes.
 * Implementations are not thread-safe: the caller guarantees at most one
 * `create()` followed by at most one `destroy()`.
 */
class Sandbox
{
public:
  virtual ~Sandbox() {}

  /**
   * Returns the absolute path of the sandbox root.
   */
  virtual const std::string& root() const = 0;

  /**
   * Returns whether the sandbox is a chroot.
   *
   * NOTE: none of the sandboxes perform a chroot or any other filesystem
   * isolation, so this is `false` for all of them. Callers must not
   * assume any containment from this value.
   */
  virtual bool chrooted() const = 0;

  /**
   * Returns true if something exists at the sandbox root.
   */
  virtual bool exists() const = 0;

  /**
   * Creates the sandbox. Re-running it on an existing sandbox re-applies
   * the ownership and permissions of the root.
   */
  virtual Try<Nothing, CreationError> create() = 0;

  /**
   * Recursively removes the sandbox root. Removing a sandbox that does
   * not exist succeeds.
   */
  virtual Try<Nothing, DeletionError> destroy() = 0;
};


/**
 * Decides which `Sandbox` implementation an assigned task runs in.
 */
class SandboxProvider
{
public:
  virtual ~SandboxProvider() {}

  /**
   * Returns the sandbox for the given task. No filesystem changes are
   * made until `Sandbox::create()` is called on the result.
   */
  virtual Try<process::Owned<Sandbox>> fromAssignedTask(
      const AssignedTask& assignedTask) const = 0;

protected:
  /**
   * Returns the OS user that should own the sandbox of the task.
   *
   * Defaults to the role of the task's job. When the role is empty the
   * user running this process is used, looked up at call time.
   */
  virtual Try<std::string> sandboxUser(const AssignedTask& assignedTask) const;
};

} // namespace thermos {

#endif // __THERMOS_SANDBOX_HPP__
