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

#ifndef __SANDBOX_FLAGS_HPP__
#define __SANDBOX_FLAGS_HPP__

#include <sys/types.h>

#include <string>

#include <stout/flags.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

namespace thermos {
namespace internal {
namespace sandbox {

// The sandbox related variables the Mesos agent exports into the
// executor's environment. Load them with `load(MESOS_ENVIRONMENT_PREFIX)`
// so that e.g. `MESOS_DIRECTORY` populates `directory`.
class Flags : public virtual flags::FlagsBase
{
public:
  Flags();

  // Returns the parsed `command_uid`, or none if it is unset or blank.
  Try<Option<uid_t>> commandUid() const;

  Option<std::string> directory;
  Option<std::string> sandbox;

  // Kept as text since the agent may export an empty value.
  Option<std::string> command_uid;
};

} // namespace sandbox {
} // namespace internal {
} // namespace thermos {

#endif // __SANDBOX_FLAGS_HPP__
