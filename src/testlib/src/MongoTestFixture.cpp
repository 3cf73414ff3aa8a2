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

#include <testlib/MongoTestFixture.hpp>

#include <cstdlib>
#include <string_view>

#include <boost/log/trivial.hpp>

#include <mongocxx/options/apm.hpp>
#include <mongocxx/options/client.hpp>

namespace safewrite::testing {
namespace {

mongocxx::options::client clientOptions(mongocxx::options::apm apm) {
    mongocxx::options::client out;
    out.apm_opts(std::move(apm));
    return out;
}

}  // namespace

MongoTestFixture::MongoTestFixture()
    : instance{mongocxx::instance::current()},
      events{},
      client{connectionUri(), clientOptions([this]() {
                 mongocxx::options::apm apm;
                 apm.on_command_started(makeApmCallback(events));
                 return apm;
             }())} {}

mongocxx::uri MongoTestFixture::connectionUri() {
    const char* connChar = std::getenv("MONGO_CONNECTION_STRING");

    if (connChar != nullptr) {
        return mongocxx::uri(connChar);
    }

    auto& connStr = mongocxx::uri::k_default_uri;
    BOOST_LOG_TRIVIAL(info) << "MONGO_CONNECTION_STRING not set, using default value: " << connStr;
    return mongocxx::uri(connStr);
}

void MongoTestFixture::dropAllDatabases() {
    for (auto&& dbDoc : client.list_databases()) {
        const auto dbName = dbDoc["name"].get_utf8().value;
        const auto dbNameString = std::string(dbName);
        if (dbNameString != "admin" && dbNameString != "config" && dbNameString != "local") {
            client.database(dbName).drop();
        }
    }
    events.clear();
}

MongoTestFixture::ApmEvents MongoTestFixture::commandsNamed(const std::string& commandName) const {
    ApmEvents out;
    for (auto&& event : events) {
        if (event.command_name == commandName) {
            out.emplace_back(event.command_name, event.value);
        }
    }
    return out;
}

MongoTestFixture::ApmCallback MongoTestFixture::makeApmCallback(
    MongoTestFixture::ApmEvents& events) {
    return [&](const mongocxx::events::command_started_event& event) {
        std::string command_name{event.command_name().data(), event.command_name().size()};

        // Ignore auth commands like "saslStart", and handshakes with "isMaster" or "hello".
        std::string sasl{"sasl"};
        if (command_name.compare(0, sasl.size(), sasl) == 0 || command_name == "isMaster" ||
            command_name == "hello") {
            return;
        }

        events.emplace_back(command_name, bsoncxx::document::value(event.command()));
    };
}

}  // namespace safewrite::testing
