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

#ifndef HEADER_87581CDD_73C2_4B29_9390_8D3658CC4891_INCLUDED
#define HEADER_87581CDD_73C2_4B29_9390_8D3658CC4891_INCLUDED

#include <catch2/catch.hpp>

#include <sstream>
#include <string>

#include <boost/regex.hpp>

#include <bsoncxx/document/value.hpp>
#include <bsoncxx/document/view_or_value.hpp>
#include <bsoncxx/json.hpp>

namespace safewrite {

/**
 * Relaxed extended JSON so that integers read as plain numbers in failure messages.
 */
inline std::string toString(const bsoncxx::document::view_or_value& t) {
    return bsoncxx::to_json(t, bsoncxx::ExtendedJsonMode::k_relaxed);
}

/**
 * Shorthand for building BSON in tests: `bson(R"({"w": 2})")`.
 */
inline bsoncxx::document::value bson(const std::string& json) {
    return bsoncxx::from_json(json);
}

// The matcher class
class MultiLineRegexMatch : public Catch::MatcherBase<std::string> {
    std::string regex;

public:
    explicit MultiLineRegexMatch(std::string regex) : regex{std::move(regex)} {}

    bool match(const std::string& matchee) const override {
        try {
            boost::regex reg(
                regex, boost::regex::ECMAScript | boost::regex::newline_alt | boost::regex::icase);
            return boost::regex_match(matchee, reg);
        } catch (const std::exception& x) {
            FAIL("Invalid regex: " << x.what());
            return false;
        }
    }

    std::string describe() const override {
        std::ostringstream ss;
        ss << "matches ECMAScript,newline,icase regex /" << regex << "/";
        return ss.str();
    }
};

// The builder function
inline MultiLineRegexMatch MultilineMatch(std::string regex) {
    return MultiLineRegexMatch{std::move(regex)};
}

}  // namespace safewrite

#endif  // HEADER_87581CDD_73C2_4B29_9390_8D3658CC4891_INCLUDED
