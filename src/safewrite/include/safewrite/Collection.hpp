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

#ifndef HEADER_3F6D0A8B_91C4_4E27_A5B3_0D7E2C96F418_INCLUDED
#define HEADER_3F6D0A8B_91C4_4E27_A5B3_0D7E2C96F418_INCLUDED

#include <bsoncxx/document/view_or_value.hpp>
#include <bsoncxx/stdx/optional.hpp>

#include <mongocxx/collection.hpp>
#include <mongocxx/result/delete.hpp>
#include <mongocxx/result/insert_one.hpp>
#include <mongocxx/result/replace_one.hpp>

#include <safewrite/ExecutionContext.hpp>
#include <safewrite/Safety.hpp>
#include <safewrite/WriteConcernOptions.hpp>

namespace safewrite {

/**
 * A `mongocxx::collection` whose writes resolve their write concern
 * through `mergeSafetyOptions()`.
 *
 * ```c++
 * Collection people{client["test"]["people"]};
 * people.safely(2).execute(context, [&](Collection& c, ExecutionContext& ctx) {
 *     c.insertOne(ctx, doc);   // writeConcern: {w: 2}
 * });
 * people.insertOne(context, doc);  // configured default
 * ```
 *
 * Every write takes `explicitOptions` last. If they set an acknowledgment
 * key they win over any override or configured default.
 */
class Collection final : public Safety<Collection> {
public:
    explicit Collection(mongocxx::collection collection);

    const mongocxx::collection& collection() const {
        return _collection;
    }

    bsoncxx::stdx::optional<mongocxx::result::insert_one> insertOne(
        ExecutionContext& context,
        bsoncxx::document::view_or_value document,
        const WriteConcernOptions& explicitOptions = {});

    /**
     * Replace the first document matching `filter`, inserting `replacement`
     * if nothing matches.
     */
    bsoncxx::stdx::optional<mongocxx::result::replace_one> replaceOne(
        ExecutionContext& context,
        bsoncxx::document::view_or_value filter,
        bsoncxx::document::view_or_value replacement,
        const WriteConcernOptions& explicitOptions = {});

    bsoncxx::stdx::optional<mongocxx::result::delete_result> deleteOne(
        ExecutionContext& context,
        bsoncxx::document::view_or_value filter,
        const WriteConcernOptions& explicitOptions = {});

    bsoncxx::stdx::optional<mongocxx::result::delete_result> deleteMany(
        ExecutionContext& context,
        bsoncxx::document::view_or_value filter,
        const WriteConcernOptions& explicitOptions = {});

private:
    mongocxx::collection _collection;
};

}  // namespace safewrite

#endif  // HEADER_3F6D0A8B_91C4_4E27_A5B3_0D7E2C96F418_INCLUDED
