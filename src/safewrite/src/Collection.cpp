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

#include <safewrite/Collection.hpp>

#include <boost/log/trivial.hpp>

#include <mongocxx/options/delete.hpp>
#include <mongocxx/options/insert.hpp>
#include <mongocxx/options/replace.hpp>

#include <safewrite/OptionsResolver.hpp>
#include <safewrite/conventions.hpp>

namespace safewrite {
namespace {

mongocxx::write_concern resolve(const ExecutionContext& context,
                                const WriteConcernOptions& explicitOptions) {
    return toWriteConcern(mergeSafetyOptions(explicitOptions, context));
}

}  // namespace

Collection::Collection(mongocxx::collection collection) : _collection{std::move(collection)} {}

bsoncxx::stdx::optional<mongocxx::result::insert_one> Collection::insertOne(
    ExecutionContext& context,
    bsoncxx::document::view_or_value document,
    const WriteConcernOptions& explicitOptions) {
    mongocxx::options::insert options;
    options.write_concern(resolve(context, explicitOptions));
    BOOST_LOG_TRIVIAL(trace) << "insertOne into " << _collection.name();
    return _collection.insert_one(std::move(document), options);
}

bsoncxx::stdx::optional<mongocxx::result::replace_one> Collection::replaceOne(
    ExecutionContext& context,
    bsoncxx::document::view_or_value filter,
    bsoncxx::document::view_or_value replacement,
    const WriteConcernOptions& explicitOptions) {
    mongocxx::options::replace options;
    options.upsert(true);
    options.write_concern(resolve(context, explicitOptions));
    BOOST_LOG_TRIVIAL(trace) << "replaceOne in " << _collection.name();
    return _collection.replace_one(std::move(filter), std::move(replacement), options);
}

bsoncxx::stdx::optional<mongocxx::result::delete_result> Collection::deleteOne(
    ExecutionContext& context,
    bsoncxx::document::view_or_value filter,
    const WriteConcernOptions& explicitOptions) {
    mongocxx::options::delete_options options;
    options.write_concern(resolve(context, explicitOptions));
    BOOST_LOG_TRIVIAL(trace) << "deleteOne in " << _collection.name();
    return _collection.delete_one(std::move(filter), options);
}

bsoncxx::stdx::optional<mongocxx::result::delete_result> Collection::deleteMany(
    ExecutionContext& context,
    bsoncxx::document::view_or_value filter,
    const WriteConcernOptions& explicitOptions) {
    mongocxx::options::delete_options options;
    options.write_concern(resolve(context, explicitOptions));
    BOOST_LOG_TRIVIAL(trace) << "deleteMany in " << _collection.name();
    return _collection.delete_many(std::move(filter), options);
}

}  // namespace safewrite
