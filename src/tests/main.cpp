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

#include <iostream>
#include <string>

#include <gmock/gmock.h>

#include <gtest/gtest.h>

#include <google/protobuf/stubs/common.h>

#include <process/process.hpp>

#include <stout/exit.hpp>
#include <stout/flags.hpp>
#include <stout/foreach.hpp>
#include <stout/try.hpp>

#include "logging/logging.hpp"

#include "tests/flags.hpp"

using namespace thermos::internal;
using namespace thermos::internal::tests;

using std::cerr;
using std::cout;
using std::endl;


int main(int argc, char** argv)
{
  GOOGLE_PROTOBUF_VERIFY_VERSION;

  using thermos::internal::tests::flags; // Needed to disambiguate.

  // Load flags from environment and command line but allow unknown
  // flags (since we might have gtest/gmock flags as well).
  Try<flags::Warnings> load = flags.load("THERMOS_", argc, argv, true);

  if (flags.help) {
    cout << flags.usage() << endl;
    testing::InitGoogleMock(&argc, argv); // Get usage from gtest too.
    return EXIT_SUCCESS;
  }

  if (load.isError()) {
    cerr << flags.usage(load.error()) << endl;
    return EXIT_FAILURE;
  }

  // Be quiet by default!
  if (!flags.verbose) {
    flags.quiet = true;
  }

  Try<Nothing> initialized = logging::initialize(argv[0], flags);
  if (initialized.isError()) {
    EXIT(EXIT_FAILURE) << "Failed to initialize logging: "
                       << initialized.error();
  }

  // Log any flag warnings (after logging is initialized).
  foreach (const flags::Warning& warning, load->warnings) {
    LOG(WARNING) << warning.message;
  }

  // Subprocesses are reaped by libprocess.
  process::initialize();

  // Initialize gmock/gtest.
  testing::InitGoogleMock(&argc, argv);

  const int test_results = RUN_ALL_TESTS();

  process::finalize();

  return test_results;
}
