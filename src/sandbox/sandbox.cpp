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

#include <thermos/sandbox.hpp>

#include <stout/error.hpp>
#include <stout/os.hpp>
#include <stout/result.hpp>

using std::string;

namespace thermos {

Try<string> SandboxProvider::sandboxUser(
    const AssignedTask& assignedTask) const
{
  const string& role = assignedTask.task().job().role();
  if (!role.empty()) {
    return role;
  }

  Result<string> user = os::user();
  if (!user.isSome()) {
    return Error(
        "Failed to determine the current user: " +
        (user.isError() ? user.error() : "not found"));
  }

  return user.get();
}

} // namespace thermos {
