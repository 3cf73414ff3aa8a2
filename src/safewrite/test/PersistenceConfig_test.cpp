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

#include <safewrite/PersistenceConfig.hpp>

#include <chrono>
#include <string>

#include <config/Node.hpp>

#include <safewrite/InvalidConfigurationException.hpp>

#include <testlib/helpers.hpp>

namespace safewrite {
namespace {
using namespace std::chrono_literals;

PersistenceConfig load(const std::string& yaml) {
    NodeSource source{yaml, "persistence.yml"};
    return PersistenceConfig{source.root()};
}

TEST_CASE("PersistenceConfig loads from YAML") {
    SECTION("Empty config has no default and is unsafe") {
        auto config = load("{}");
        REQUIRE(!config.defaultWriteConcern());
        REQUIRE(!config.persistInSafeMode());
    }

    SECTION("Null default write concern means none") {
        auto config = load(R"(
        PersistInSafeMode: true
        DefaultWriteConcern: ~
        )");
        REQUIRE(!config.defaultWriteConcern());
        REQUIRE(config.persistInSafeMode());
    }

    SECTION("Safe mode alone") {
        auto config = load("PersistInSafeMode: true");
        REQUIRE(!config.defaultWriteConcern());
        REQUIRE(config.persistInSafeMode());
    }

    SECTION("Default write concern map") {
        auto config = load(R"(
        PersistInSafeMode: false
        DefaultWriteConcern:
          w: 2
          wtimeout: 500
          fsync: true
        )");
        REQUIRE(*config.defaultWriteConcern() ==
                WriteConcernOptions::nodes(2).wtimeout(500ms).fsync(true));
        REQUIRE(!config.persistInSafeMode());
    }

    SECTION("Default write concern as a bare integer") {
        auto config = load("DefaultWriteConcern: 3");
        REQUIRE(*config.defaultWriteConcern() == WriteConcernOptions::nodes(3));
    }

    SECTION("Default write concern as a mode name") {
        auto config = load("DefaultWriteConcern: majority");
        REQUIRE(*config.defaultWriteConcern() == WriteConcernOptions{}.w("majority"));
    }

    SECTION("Quoted numbers stay tag names") {
        auto config = load(R"(DefaultWriteConcern: {w: "2"})");
        REQUIRE(*config.defaultWriteConcern() == WriteConcernOptions{}.w("2"));
    }

    SECTION("journal is read as j") {
        auto config = load("DefaultWriteConcern: {journal: true}");
        REQUIRE(*config.defaultWriteConcern() == WriteConcernOptions{}.journal(true));
    }

    SECTION("Extra keys are kept") {
        auto config = load("DefaultWriteConcern: {w: 1, provenance: clientSupplied}");
        REQUIRE(toString(config.defaultWriteConcern()->toBson()) ==
                R"({ "w" : 1, "provenance" : "clientSupplied" })");
    }
}

TEST_CASE("PersistenceConfig rejects bad YAML") {
    SECTION("Sequence write concern") {
        REQUIRE_THROWS_AS(load("DefaultWriteConcern: [1, 2]"), InvalidConfigurationException);
    }

    SECTION("Non-boolean safe mode") {
        REQUIRE_THROWS_AS(load("PersistInSafeMode: sometimes"), InvalidConversionException);
    }

    SECTION("Unparseable YAML") {
        REQUIRE_THROWS_AS(load("DefaultWriteConcern: {w: 1"), InvalidYAMLException);
    }
}

}  // namespace
}  // namespace safewrite
