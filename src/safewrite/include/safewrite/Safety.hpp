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

#ifndef HEADER_46B1F9D3_7E0C_4C2A_B6D8_95A3E7C0F1D2_INCLUDED
#define HEADER_46B1F9D3_7E0C_4C2A_B6D8_95A3E7C0F1D2_INCLUDED

#include <cstdint>
#include <functional>
#include <utility>

#include <safewrite/ExecutionContext.hpp>
#include <safewrite/WriteConcernOptions.hpp>

namespace safewrite {

/**
 * A receiver (an entity or a collection) paired with the write concern
 * its next persistence operation should use.
 *
 * Created by `safely()` and `unsafely()`. Nothing happens until `execute()`:
 *
 * ```c++
 * safely(people, 2).execute(context, [&](Collection& c, ExecutionContext& ctx) {
 *     c.insertOne(ctx, person);
 * });
 * ```
 *
 * @tparam Receiver
 *   the entity or collection type the operation runs against.
 */
template <typename Receiver>
class SafeOperation final {
public:
    SafeOperation(Receiver& receiver, WriteConcernOptions writeConcern)
        : _receiver{receiver}, _writeConcern{std::move(writeConcern)} {}

    Receiver& receiver() const {
        return _receiver;
    }

    const WriteConcernOptions& writeConcern() const {
        return _writeConcern;
    }

    /**
     * Run one persistence operation with this write concern installed on `context`.
     *
     * The override is visible to `mergeSafetyOptions(..., context)` calls made
     * by `op` and is removed when `op` returns or throws.
     *
     * @param op
     *   callable as `op(Receiver&, ExecutionContext&)`.
     * @return whatever `op` returns.
     */
    template <typename F>
    decltype(auto) execute(ExecutionContext& context, F&& op) const {
        OverrideScope scope{context, _writeConcern};
        return std::invoke(std::forward<F>(op), _receiver, context);
    }

private:
    Receiver& _receiver;
    WriteConcernOptions _writeConcern;
};

/**
 * Run the next operation on `receiver` requiring `nodes` acknowledgments.
 */
template <typename Receiver>
SafeOperation<Receiver> safely(Receiver& receiver, int32_t nodes = 1) {
    return {receiver, WriteConcernOptions::nodes(nodes)};
}

/**
 * Run the next operation on `receiver` with exactly `writeConcern`.
 */
template <typename Receiver>
SafeOperation<Receiver> safely(Receiver& receiver, WriteConcernOptions writeConcern) {
    return {receiver, std::move(writeConcern)};
}

/**
 * Run the next operation on `receiver` without waiting for acknowledgment (`w: 0`),
 * even if the configuration asks to persist in safe mode.
 */
template <typename Receiver>
SafeOperation<Receiver> unsafely(Receiver& receiver) {
    return {receiver, WriteConcernOptions::nodes(0)};
}


/**
 * Mixin giving entity and collection types `safely()`/`unsafely()` members.
 *
 * ```c++
 * class Person : public Safety<Person> { ... };
 *
 * person.safely(WriteConcernOptions{}.w(2).fsync(true)).execute(context, save);
 * ```
 */
template <typename Derived>
class Safety {
public:
    SafeOperation<Derived> safely(int32_t nodes = 1) {
        return ::safewrite::safely(self(), nodes);
    }

    SafeOperation<Derived> safely(WriteConcernOptions writeConcern) {
        return ::safewrite::safely(self(), std::move(writeConcern));
    }

    SafeOperation<Derived> unsafely() {
        return ::safewrite::unsafely(self());
    }

protected:
    Safety() = default;
    ~Safety() = default;

private:
    Derived& self() {
        return static_cast<Derived&>(*this);
    }
};

}  // namespace safewrite

#endif  // HEADER_46B1F9D3_7E0C_4C2A_B6D8_95A3E7C0F1D2_INCLUDED
