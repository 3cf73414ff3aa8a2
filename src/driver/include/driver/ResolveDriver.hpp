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

#ifndef HEADER_6E14C2A9_53B8_4F0D_A7E1_C90B3D58F26A_INCLUDED
#define HEADER_6E14C2A9_53B8_4F0D_A7E1_C90B3D58F26A_INCLUDED

#include <iostream>
#include <optional>
#include <ostream>
#include <string>

#include <boost/log/trivial.hpp>

namespace safewrite::driver {

/**
 * Loads a persistence config and prints the write concern a call would use.
 */
class ResolveDriver {
public:
    enum class RunMode {
        kNormal,
        kHelp,
    };

    enum class OutcomeCode {
        kSuccess = 0,
        kStandardException = 1,
        kBoostException = 2,
        kUserException = 4,
    };

    struct ProgramOptions {
        explicit ProgramOptions() = default;

        /**
         * @param argc c-style argc
         * @param argv c-style argv
         */
        ProgramOptions(int argc, char** argv);

        std::string configFile;

        // Each is yaml: an integer node count, a mode name, or a map.
        std::string explicitOptions = "{}";
        std::optional<std::string> safely;
        bool unsafely = false;

        std::string description;
        RunMode runMode = RunMode::kNormal;
        OutcomeCode parseOutcome = OutcomeCode::kSuccess;
        boost::log::trivial::severity_level logVerbosity = boost::log::trivial::info;
    };

    /**
     * Writes the effective options to `out` as relaxed extended JSON.
     *
     * @return c-style exit code
     */
    OutcomeCode run(const ProgramOptions& options, std::ostream& out = std::cout) const;
};

}  // namespace safewrite::driver

#endif  // HEADER_6E14C2A9_53B8_4F0D_A7E1_C90B3D58F26A_INCLUDED
