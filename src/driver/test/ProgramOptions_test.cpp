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

#include <string>
#include <vector>

#include <testlib/helpers.hpp>

#include <driver/ResolveDriver.hpp>

namespace {
using safewrite::driver::ResolveDriver;

ResolveDriver::ProgramOptions parse(std::vector<const char*> args) {
    args.insert(args.begin(), "safewrite-resolve");
    return ResolveDriver::ProgramOptions(static_cast<int>(args.size()),
                                         const_cast<char**>(args.data()));
}

TEST_CASE("ProgramOptions behavior") {
    SECTION("missing config file") {
        auto opts = parse({});
        REQUIRE(opts.parseOutcome == ResolveDriver::OutcomeCode::kUserException);
        REQUIRE(opts.runMode == ResolveDriver::RunMode::kHelp);
    }

    SECTION("config file only") {
        auto opts = parse({"persistence.yml"});
        REQUIRE(opts.parseOutcome == ResolveDriver::OutcomeCode::kSuccess);
        REQUIRE(opts.runMode == ResolveDriver::RunMode::kNormal);
        REQUIRE(opts.configFile == "persistence.yml");
        REQUIRE(opts.explicitOptions == "{}");
        REQUIRE(!opts.safely);
        REQUIRE(!opts.unsafely);
        REQUIRE(opts.logVerbosity == boost::log::trivial::info);
    }

    SECTION("all options") {
        auto opts = parse({"--explicit",
                           "{comment: audit}",
                           "--safely",
                           "{w: majority}",
                           "-v",
                           "debug",
                           "-c",
                           "persistence.yml"});
        REQUIRE(opts.parseOutcome == ResolveDriver::OutcomeCode::kSuccess);
        REQUIRE(opts.configFile == "persistence.yml");
        REQUIRE(opts.explicitOptions == "{comment: audit}");
        REQUIRE(opts.safely == std::string{"{w: majority}"});
        REQUIRE(opts.logVerbosity == boost::log::trivial::debug);
    }

    SECTION("unsafely") {
        auto opts = parse({"--unsafely", "persistence.yml"});
        REQUIRE(opts.parseOutcome == ResolveDriver::OutcomeCode::kSuccess);
        REQUIRE(opts.unsafely);
    }

    SECTION("safely and unsafely together") {
        auto opts = parse({"--unsafely", "--safely", "2", "persistence.yml"});
        REQUIRE(opts.parseOutcome == ResolveDriver::OutcomeCode::kUserException);
    }

    SECTION("invalid verbosity") {
        auto opts = parse({"-v", "chatty", "persistence.yml"});
        REQUIRE(opts.parseOutcome == ResolveDriver::OutcomeCode::kUserException);
    }

    SECTION("unknown option") {
        auto opts = parse({"--use-postgresql", "persistence.yml"});
        REQUIRE(opts.parseOutcome == ResolveDriver::OutcomeCode::kUserException);
    }

    SECTION("help") {
        auto opts = parse({"--help"});
        REQUIRE(opts.runMode == ResolveDriver::RunMode::kHelp);
        REQUIRE(opts.parseOutcome == ResolveDriver::OutcomeCode::kSuccess);
        REQUIRE_THAT(
            opts.description,
            safewrite::MultilineMatch(R"(.*safewrite-resolve \[options\] <config-file>.*)"));
    }
}

}  // namespace
