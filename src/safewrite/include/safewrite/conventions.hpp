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

#ifndef HEADER_B83C2E17_4F6A_4D05_9A1E_E7D52C08B6F4_INCLUDED
#define HEADER_B83C2E17_4F6A_4D05_9A1E_E7D52C08B6F4_INCLUDED

#include <bsoncxx/document/value.hpp>

#include <mongocxx/write_concern.hpp>

#include <config/Node.hpp>

#include <safewrite/InvalidConfigurationException.hpp>
#include <safewrite/WriteConcernOptions.hpp>

namespace safewrite {

/**
 * Convert a YAML map into BSON. Scalars become the narrowest of
 * int32/int64/double/bool that parses, falling back to string; quoted
 * scalars always stay strings.
 *
 * @throws InvalidConfigurationException if node isn't a map
 */
bsoncxx::document::value toDocumentBson(const Node& node);

/**
 * Build the driver's write concern from resolved options.
 *
 * - integer `w`: that many nodes; `0` is unacknowledged.
 * - `w: majority`: majority, with `wtimeout` as its timeout.
 * - any other string `w`: a replica-set tag.
 * - `fsync: true` and `j: true` both require a journal commit.
 *
 * Keys the driver doesn't know are ignored.
 *
 * @throws InvalidConfigurationException
 *   for a negative `w` or `wtimeout`, or a recognized key holding a value of the wrong type.
 */
mongocxx::write_concern toWriteConcern(const WriteConcernOptions& options);


/**
 * Accepts either an integer (`2` is `{w: 2}`), a bare mode name
 * (`majority` is `{w: majority}`), or a map:
 *
 * ```yaml
 * DefaultWriteConcern:
 *   w: 2
 *   wtimeout: 500
 *   j: true
 * ```
 */
template <>
struct NodeConvert<WriteConcernOptions> {
    using type = WriteConcernOptions;

    static type convert(const Node& node);
};

}  // namespace safewrite

#endif  // HEADER_B83C2E17_4F6A_4D05_9A1E_E7D52C08B6F4_INCLUDED
