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

#ifndef HEADER_7A2E5C93_0F1B_4D86_9E4C_B38D61A0F2E7_INCLUDED
#define HEADER_7A2E5C93_0F1B_4D86_9E4C_B38D61A0F2E7_INCLUDED

#include <optional>

#include <safewrite/PersistenceConfig.hpp>
#include <safewrite/WriteConcernOptions.hpp>

namespace safewrite {

/**
 * Per-thread (or per-task) state for issuing persistence operations.
 *
 * Each thread or task owns exactly one ExecutionContext and passes it to every
 * persistence operation it runs. The context holds at most one pending write
 * concern override; since nothing is shared between contexts there is no locking
 * and an override set on one context is never visible on another.
 *
 * Prefer `OverrideScope` or `SafeOperation::execute()` to calling
 * `setWriteConcernOverride()` directly: both clear the override once the
 * operation that needed it is done.
 */
class ExecutionContext final {
public:
    /**
     * @param config
     *   process-wide settings; must outlive this context.
     */
    explicit ExecutionContext(const PersistenceConfig& config);

    // No move or copy
    ExecutionContext(const ExecutionContext&) = delete;
    void operator=(const ExecutionContext&) = delete;
    ExecutionContext(ExecutionContext&&) = delete;
    void operator=(ExecutionContext&&) = delete;

    ~ExecutionContext();

    const PersistenceConfig& config() const {
        return _config;
    }

    /**
     * @return the pending override, if any.
     */
    const std::optional<WriteConcernOptions>& writeConcernOverride() const {
        return _override;
    }

    /**
     * Replace the pending override. It stays until cleared.
     */
    void setWriteConcernOverride(WriteConcernOptions writeConcern);

    void clearWriteConcernOverride();

private:
    friend class OverrideScope;

    const PersistenceConfig& _config;
    std::optional<WriteConcernOptions> _override;
};


/**
 * Installs a write concern override on a context for the lifetime of the scope.
 *
 * On destruction, normal or by exception, the context's previous override
 * (or absence of one) is restored, so scopes nest:
 *
 * ```c++
 * {
 *     OverrideScope scope{context, WriteConcernOptions::nodes(2)};
 *     collection.insertOne(context, doc);   // w: 2
 * }
 * collection.insertOne(context, doc);       // back to the configured default
 * ```
 */
class OverrideScope final {
public:
    OverrideScope(ExecutionContext& context, WriteConcernOptions writeConcern);

    ~OverrideScope();

    OverrideScope(const OverrideScope&) = delete;
    void operator=(const OverrideScope&) = delete;
    OverrideScope(OverrideScope&&) = delete;
    void operator=(OverrideScope&&) = delete;

private:
    ExecutionContext& _context;
    std::optional<WriteConcernOptions> _previous;
};

}  // namespace safewrite

#endif  // HEADER_7A2E5C93_0F1B_4D86_9E4C_B38D61A0F2E7_INCLUDED
