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

#ifndef HEADER_C1D7E0B4_8A26_4F93_B5E8_0D4A7F2361C9_INCLUDED
#define HEADER_C1D7E0B4_8A26_4F93_B5E8_0D4A7F2361C9_INCLUDED

#include <optional>

#include <config/Node.hpp>

#include <safewrite/WriteConcernOptions.hpp>

namespace safewrite {

/**
 * Process-wide persistence settings. Loaded once at startup and
 * read-only thereafter; share it by const reference.
 *
 * ```yaml
 * PersistInSafeMode: true
 * DefaultWriteConcern:
 *   w: majority
 *   wtimeout: 5000
 * ```
 *
 * Both keys are optional and a null `DefaultWriteConcern` counts as absent.
 * Without them writes are fire-and-forget (`w: 0`).
 */
class PersistenceConfig {
public:
    PersistenceConfig() = default;

    PersistenceConfig(std::optional<WriteConcernOptions> defaultWriteConcern,
                      bool persistInSafeMode);

    /**
     * @throws InvalidConfigurationException if `DefaultWriteConcern` is not a map or integer.
     */
    explicit PersistenceConfig(const Node& node);

    /**
     * @return the write concern used when neither the call nor its execution context has one.
     */
    const std::optional<WriteConcernOptions>& defaultWriteConcern() const {
        return _defaultWriteConcern;
    }

    /**
     * @return if the last-resort default is `{w: 1}` rather than `{w: 0}`.
     */
    bool persistInSafeMode() const {
        return _persistInSafeMode;
    }

private:
    std::optional<WriteConcernOptions> _defaultWriteConcern;
    bool _persistInSafeMode = false;
};

}  // namespace safewrite

#endif  // HEADER_C1D7E0B4_8A26_4F93_B5E8_0D4A7F2361C9_INCLUDED
