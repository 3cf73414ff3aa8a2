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

#include <boost/log/trivial.hpp>

#include <safewrite/conventions.hpp>

namespace safewrite {
namespace {

// `DefaultWriteConcern: ~` means no default, same as leaving the key out.
std::optional<WriteConcernOptions> defaultWriteConcernAt(const Node& node) {
    if (node.isNull()) {
        return std::nullopt;
    }
    return node.maybe<WriteConcernOptions>();
}

}  // namespace

PersistenceConfig::PersistenceConfig(std::optional<WriteConcernOptions> defaultWriteConcern,
                                     bool persistInSafeMode)
    : _defaultWriteConcern{std::move(defaultWriteConcern)},
      _persistInSafeMode{persistInSafeMode} {}

PersistenceConfig::PersistenceConfig(const Node& node)
    : _defaultWriteConcern{defaultWriteConcernAt(node["DefaultWriteConcern"])},
      _persistInSafeMode{node["PersistInSafeMode"].maybe<bool>().value_or(false)} {
    BOOST_LOG_TRIVIAL(debug) << "Loaded persistence config from '" << node.path()
                             << "': PersistInSafeMode=" << std::boolalpha << _persistInSafeMode
                             << " DefaultWriteConcern="
                             << (_defaultWriteConcern ? *_defaultWriteConcern
                                                      : WriteConcernOptions{});
}

}  // namespace safewrite
