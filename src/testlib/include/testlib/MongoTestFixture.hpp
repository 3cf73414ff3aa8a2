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

#ifndef HEADER_541F6FFA_7366_4D21_9461_E79E76893EA4_INCLUDED
#define HEADER_541F6FFA_7366_4D21_9461_E79E76893EA4_INCLUDED

#include <functional>
#include <string>
#include <vector>

#include <bsoncxx/document/value.hpp>
#include <bsoncxx/document/view.hpp>

#include <mongocxx/client.hpp>
#include <mongocxx/events/command_started_event.hpp>
#include <mongocxx/instance.hpp>
#include <mongocxx/uri.hpp>

namespace safewrite::testing {

/**
 * Connects to `MONGO_CONNECTION_STRING` (or the driver's default URI) and
 * records every command the client sends.
 *
 * Tests using this fixture need a running mongod and are tagged `[standalone]`.
 */
class MongoTestFixture {
public:
    MongoTestFixture();

    void dropAllDatabases();

    static mongocxx::uri connectionUri();

private:
    mongocxx::instance& instance;

protected:
    class ApmEvent {
    public:
        ApmEvent(const std::string& command_name_, const bsoncxx::document::value& document_)
            : command_name(command_name_), value(document_) {}

        bsoncxx::document::view command() const {
            return value.view();
        }

        std::string command_name;
        bsoncxx::document::value value;
    };

    using ApmCallback = std::function<void(const mongocxx::events::command_started_event&)>;
    using ApmEvents = std::vector<ApmEvent>;
    static ApmCallback makeApmCallback(ApmEvents& events);

    /**
     * @return events named `commandName`, in the order they were sent.
     */
    ApmEvents commandsNamed(const std::string& commandName) const;

    ApmEvents events;
    mongocxx::client client;
};

}  // namespace safewrite::testing

#endif  // HEADER_541F6FFA_7366_4D21_9461_E79E76893EA4_INCLUDED
