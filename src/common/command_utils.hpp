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

#ifndef __COMMON_COMMAND_UTILS_HPP__
#define __COMMON_COMMAND_UTILS_HPP__

#include <sys/types.h>

#include <string>

#include <process/future.hpp>

#include <stout/nothing.hpp>

namespace thermos {
namespace internal {
namespace command {

/**
 * Creates an OS account by running `useradd`.
 *
 * The account gets the given uid and home directory. The home directory
 * is created if missing and the user is not added to the lastlog and
 * faillog databases. The returned future fails if the command cannot be
 * launched or exits with a non-zero status; the failure message carries
 * the wait status and everything the command wrote to stdout and stderr.
 *
 * @param home home directory of the new user.
 * @param uid numeric user id of the new user.
 * @param user name of the new user.
 * @param command path (or name looked up in PATH) of the utility.
 */
process::Future<Nothing> useradd(
    const std::string& home,
    uid_t uid,
    const std::string& user,
    const std::string& command = "useradd");

} // namespace command {
} // namespace internal {
} // namespace thermos {

#endif // __COMMON_COMMAND_UTILS_HPP__
