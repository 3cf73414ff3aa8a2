// Copyright 2019-present MongoDB Inc.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
// http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <iostream>

#include <driver/ResolveDriver.hpp>

int main(int argc, char** argv) {
    auto opts = safewrite::driver::ResolveDriver::ProgramOptions(argc, argv);
    if (opts.runMode == safewrite::driver::ResolveDriver::RunMode::kHelp) {
        std::cout << opts.description << std::endl;
        return static_cast<int>(opts.parseOutcome);
    }

    safewrite::driver::ResolveDriver d;

    auto code = d.run(opts);

    return static_cast<int>(code);
}
