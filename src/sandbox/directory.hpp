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

#ifndef __SANDBOX_DIRECTORY_HPP__
#define __SANDBOX_DIRECTORY_HPP__

#include <string>

#include <thermos/sandbox.hpp>

#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

namespace thermos {
namespace internal {
namespace sandbox {

// A sandbox backed by a plain directory on the host.
//
// If a user is given, `create()` hands the directory over to that user
// (its uid and primary gid) and restricts it to mode 0700 so that tasks
// of other users on the same agent cannot access it. This requires the
// executor to be privileged enough to chown.
class DirectorySandbox : public Sandbox
{
public:
  DirectorySandbox(
      const std::string& root,
      const Option<std::string>& user);

  ~DirectorySandbox() override {}

  const std::string& root() const override;
  bool chrooted() const override;
  bool exists() const override;

  Try<Nothing, CreationError> create() override;
  Try<Nothing, DeletionError> destroy() override;

  const Option<std::string>& user() const { return user_; }

private:
  const std::string root_;
  const Option<std::string> user_;
};

} // namespace sandbox {
} // namespace internal {
} // namespace thermos {

#endif // __SANDBOX_DIRECTORY_HPP__
