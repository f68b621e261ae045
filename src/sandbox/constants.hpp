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

#ifndef __SANDBOX_CONSTANTS_HPP__
#define __SANDBOX_CONSTANTS_HPP__

namespace thermos {
namespace internal {
namespace sandbox {

// Name of the task sandbox directory, relative to the executor's
// working directory or to the host sandbox of a containerized task.
constexpr char SANDBOX_NAME[] = "sandbox";

// Prefix of the environment variables injected by the Mesos agent.
constexpr char MESOS_ENVIRONMENT_PREFIX[] = "MESOS_";

// Utility used to provision task users inside filesystem images.
constexpr char USERADD[] = "useradd";

// Mode of a sandbox owned by a task user.
constexpr int SANDBOX_MODE = 0700;

} // namespace sandbox {
} // namespace internal {
} // namespace thermos {

#endif // __SANDBOX_CONSTANTS_HPP__
