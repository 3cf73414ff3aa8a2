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

#include <safewrite/WriteConcernOptions.hpp>

#include <chrono>
#include <sstream>
#include <string>

#include <safewrite/conventions.hpp>

#include <testlib/helpers.hpp>

namespace safewrite {
namespace {
using namespace std::chrono_literals;

TEST_CASE("WriteConcernOptions construction") {
    SECTION("Default is empty") {
        WriteConcernOptions options;
        REQUIRE(options.empty());
        REQUIRE(!options.hasAcknowledgmentKeys());
        REQUIRE(toString(options.toBson()) == "{ }");
    }

    SECTION("nodes() only sets w") {
        auto options = WriteConcernOptions::nodes(3);
        REQUIRE(options.w() == WriteConcernOptions::W{3});
        REQUIRE(!options.wtimeout());
        REQUIRE(!options.fsync());
        REQUIRE(!options.journal());
        REQUIRE(toString(options.toBson()) == R"({ "w" : 3 })");
    }

    SECTION("Setters chain") {
        auto options = WriteConcernOptions{}.w("majority").wtimeout(500ms).fsync(true).journal(
            false);
        REQUIRE(options.w() == WriteConcernOptions::W{std::string{"majority"}});
        REQUIRE(options.wtimeout() == 500ms);
        REQUIRE(options.fsync() == true);
        REQUIRE(options.journal() == false);
        REQUIRE(toString(options.toBson()) ==
                R"({ "w" : "majority", "wtimeout" : 500, "fsync" : true, "j" : false })");
    }
}

TEST_CASE("WriteConcernOptions from BSON") {
    SECTION("Recognized keys are typed") {
        auto options =
            WriteConcernOptions::fromBson(bson(R"({"w": 2, "wtimeout": 100, "j": true})").view());
        REQUIRE(options == WriteConcernOptions::nodes(2).wtimeout(100ms).journal(true));
        REQUIRE(options.passthrough().empty());
    }

    SECTION("journal is an alias for j") {
        auto options = WriteConcernOptions::fromBson(bson(R"({"journal": true})").view());
        REQUIRE(options.journal() == true);
        REQUIRE(options.hasAcknowledgmentKeys());
    }

    SECTION("Integral doubles and int64 count as integers") {
        auto options = WriteConcernOptions::fromBson(
            bson(R"({"w": 2.0, "wtimeout": {"$numberLong": "250"}})").view());
        REQUIRE(options == WriteConcernOptions::nodes(2).wtimeout(250ms));
    }

    SECTION("Unrecognized keys pass through in order") {
        auto options = WriteConcernOptions::fromBson(
            bson(R"({"comment": "hi", "w": 1, "maxTimeMS": 10})").view());
        REQUIRE(options.w() == WriteConcernOptions::W{1});
        REQUIRE(toString(options.passthrough()) == R"({ "comment" : "hi", "maxTimeMS" : 10 })");
        REQUIRE(toString(options.toBson()) ==
                R"({ "w" : 1, "comment" : "hi", "maxTimeMS" : 10 })");
    }

    SECTION("Recognized keys with the wrong type pass through but still count") {
        auto options =
            WriteConcernOptions::fromBson(bson(R"({"fsync": "yes", "w": 1.5})").view());
        REQUIRE(!options.fsync());
        REQUIRE(!options.w());
        REQUIRE(toString(options.passthrough()) == R"({ "fsync" : "yes", "w" : 1.5 })");
        REQUIRE(options.hasAcknowledgmentKeys());
        REQUIRE(!options.empty());
    }

    SECTION("A false flag is still an opinion") {
        auto options = WriteConcernOptions::fromBson(bson(R"({"fsync": false})").view());
        REQUIRE(options.fsync() == false);
        REQUIRE(options.hasAcknowledgmentKeys());
    }

    SECTION("Only passthrough keys has no acknowledgment keys") {
        auto options = WriteConcernOptions::fromBson(bson(R"({"comment": "x"})").view());
        REQUIRE(!options.hasAcknowledgmentKeys());
        REQUIRE(!options.empty());
    }
}

TEST_CASE("WriteConcernOptions merge") {
    SECTION("Right-hand keys win, left-only keys stay") {
        auto lhs = WriteConcernOptions::nodes(1).wtimeout(100ms);
        lhs.merge(WriteConcernOptions::nodes(2).fsync(true));
        REQUIRE(lhs == WriteConcernOptions::nodes(2).wtimeout(100ms).fsync(true));
    }

    SECTION("Merging empty changes nothing") {
        auto lhs = WriteConcernOptions{}.w("majority");
        lhs.merge(WriteConcernOptions{});
        REQUIRE(lhs == WriteConcernOptions{}.w("majority"));
    }

    SECTION("Passthrough keys from both sides survive") {
        auto lhs = WriteConcernOptions::fromBson(bson(R"({"comment": "a", "x": 1})").view());
        lhs.merge(WriteConcernOptions::fromBson(bson(R"({"w": 0, "x": 2})").view()));
        REQUIRE(toString(lhs.toBson()) == R"({ "w" : 0, "comment" : "a", "x" : 2 })");
    }

    SECTION("A malformed key on the right replaces the typed one on the left") {
        auto lhs = WriteConcernOptions::nodes(1);
        lhs.merge(WriteConcernOptions::fromBson(bson(R"({"w": true})").view()));
        REQUIRE(!lhs.w());
        REQUIRE(toString(lhs.toBson()) == R"({ "w" : true })");
    }

    SECTION("A typed key on the right replaces the malformed one on the left") {
        auto lhs = WriteConcernOptions::fromBson(bson(R"({"j": "sure"})").view());
        lhs.merge(WriteConcernOptions{}.journal(true));
        REQUIRE(lhs == WriteConcernOptions{}.journal(true));
    }

    SECTION("Extra keys added to typed options never duplicate a recognized key") {
        auto lhs = WriteConcernOptions::nodes(1).journal(true);
        lhs.merge(WriteConcernOptions::fromBson(bson(R"({"w": 2, "comment": "x"})").view()));
        REQUIRE(toString(lhs.toBson()) == R"({ "w" : 2, "j" : true, "comment" : "x" })");
        REQUIRE_NOTHROW(toWriteConcern(lhs));
    }
}

TEST_CASE("WriteConcernOptions streams as relaxed JSON") {
    std::stringstream out;
    out << WriteConcernOptions::nodes(2).wtimeout(5ms);
    REQUIRE(out.str() == R"({ "w" : 2, "wtimeout" : 5 })");
}

}  // namespace
}  // namespace safewrite
