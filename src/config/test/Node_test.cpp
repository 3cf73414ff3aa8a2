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

#include <config/Node.hpp>

#include <catch2/catch.hpp>

#include <map>
#include <string>
#include <vector>

namespace safewrite {
namespace {

struct ExtractsLevel {
    std::string level;
    explicit ExtractsLevel(const Node& node) : level{node["Level"].to<std::string>()} {}
};

struct NodesWithDelta {
    int nodes;
};

}  // namespace

template <>
struct NodeConvert<NodesWithDelta> {
    using type = NodesWithDelta;
    static type convert(const Node& node, int delta) {
        return {node["w"].to<int>() + delta};
    }
};

namespace {

TEST_CASE("Node basics") {
    NodeSource ns{"{PersistInSafeMode: true, DefaultWriteConcern: {w: 2, fsync: false}}",
                  "persistence.yml"};
    auto root = ns.root();

    SECTION("Present keys are truthy") {
        REQUIRE(root);
        REQUIRE(root.isMap());
        REQUIRE(root["PersistInSafeMode"]);
        REQUIRE(root["PersistInSafeMode"].isScalar());
        REQUIRE(root["DefaultWriteConcern"].isMap());
        REQUIRE(root["DefaultWriteConcern"].size() == 2);
    }

    SECTION("Missing keys are falsy and can be chained") {
        REQUIRE(!root["Missing"]);
        REQUIRE(!root["Missing"]["Deeper"][0]);
        REQUIRE(root["Missing"].maybe<int>() == std::nullopt);
        REQUIRE(root["Missing"].type() == Node::Type::Undefined);
    }

    SECTION("Built-in conversions") {
        REQUIRE(root["PersistInSafeMode"].to<bool>() == true);
        REQUIRE(root["DefaultWriteConcern"]["w"].to<int>() == 2);
        REQUIRE(root["DefaultWriteConcern"]["fsync"].to<bool>() == false);
        REQUIRE(root["DefaultWriteConcern"]["wtimeout"].maybe<int>().value_or(7) == 7);
    }

    SECTION("Paths are joined with slashes") {
        REQUIRE(root["DefaultWriteConcern"]["w"].path() == "persistence.yml/DefaultWriteConcern/w");
        REQUIRE(root["DefaultWriteConcern"]["w"].key() == "w");
    }
}

TEST_CASE("Node conversions") {
    SECTION("Constructor conversion") {
        NodeSource ns{"Level: majority", ""};
        REQUIRE(ns.root().to<ExtractsLevel>().level == "majority");
    }

    SECTION("NodeConvert conversion with extra args") {
        NodeSource ns{"w: 2", ""};
        REQUIRE(ns.root().to<NodesWithDelta>(3).nodes == 5);
    }

    SECTION("Bad conversions throw") {
        NodeSource ns{"w: majority", ""};
        REQUIRE_THROWS_AS(ns.root()["w"].to<int>(), InvalidConversionException);
    }

    SECTION("Missing values throw with to<T>()") {
        NodeSource ns{"{}", ""};
        REQUIRE_THROWS_AS(ns.root()["w"].to<int>(), InvalidKeyException);
    }

    SECTION("Quoted scalars are tagged") {
        NodeSource ns{"{a: '1', b: 1}", ""};
        REQUIRE(ns.root()["a"].tag() == "!");
        REQUIRE(ns.root()["b"].tag() != "!");
    }
}

TEST_CASE("Invalid YAML") {
    REQUIRE_THROWS_AS(NodeSource("{w: [}", "bad.yml"), InvalidYAMLException);
    try {
        NodeSource("{w: [}", "bad.yml");
        FAIL("expected InvalidYAMLException");
    } catch (const InvalidYAMLException& x) {
        REQUIRE_THAT(x.what(), Catch::Contains("bad.yml"));
    }
}

TEST_CASE("Error messages name the path") {
    NodeSource ns{"DefaultWriteConcern: {w: majority}", "persistence.yml"};
    auto w = ns.root()["DefaultWriteConcern"]["w"];

    SECTION("Conversion") {
        try {
            w.to<int>();
            FAIL("expected InvalidConversionException");
        } catch (const InvalidConversionException& x) {
            REQUIRE_THAT(x.what(), Catch::Contains("persistence.yml/DefaultWriteConcern/w"));
        }
    }

    SECTION("Missing key") {
        try {
            ns.root()["DefaultWriteConcern"]["wtimeout"].to<int>();
            FAIL("expected InvalidKeyException");
        } catch (const InvalidKeyException& x) {
            REQUIRE_THAT(x.what(),
                         Catch::Contains("persistence.yml/DefaultWriteConcern/wtimeout"));
        }
    }
}

TEST_CASE("Node children") {
    SECTION("Maps list entries in document order") {
        NodeSource ns{"{w: 1, wtimeout: 50, comment: hi}", ""};
        std::vector<std::string> keys;
        for (auto&& entry : ns.root().children()) {
            keys.push_back(entry.key());
            REQUIRE(entry);
        }
        REQUIRE(keys == std::vector<std::string>{"w", "wtimeout", "comment"});
    }

    SECTION("Sequences list items by index") {
        NodeSource ns{"tags: [3, 4, 5]", ""};
        std::map<std::string, int> seen;
        for (auto&& item : ns.root()["tags"].children()) {
            seen.emplace(item.key(), item.to<int>());
        }
        REQUIRE(seen == std::map<std::string, int>{{"0", 3}, {"1", 4}, {"2", 5}});
        REQUIRE(ns.root()["tags"][1].to<int>() == 4);
        REQUIRE(ns.root()["tags"][1].path() == "tags/1");
        REQUIRE(!ns.root()["tags"][3]);
    }

    SECTION("Scalars have no children") {
        NodeSource ns{"1", ""};
        REQUIRE(ns.root().children().empty());
        REQUIRE(ns.root().size() == 0);
    }
}

}  // namespace
}  // namespace safewrite
