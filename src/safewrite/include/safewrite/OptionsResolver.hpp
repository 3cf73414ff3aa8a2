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

#ifndef HEADER_E0B8F4C6_25D9_4A71_83F0_6C9E1D7B4A25_INCLUDED
#define HEADER_E0B8F4C6_25D9_4A71_83F0_6C9E1D7B4A25_INCLUDED

#include <optional>

#include <safewrite/ExecutionContext.hpp>
#include <safewrite/PersistenceConfig.hpp>
#include <safewrite/WriteConcernOptions.hpp>

namespace safewrite {

/**
 * Compute the write concern a persistence call should use.
 *
 * The first matching rule wins:
 *
 * 1. `explicitOptions` sets any of `w`, `j`, `fsync` or `wtimeout`: it is returned as-is
 *    and nothing is merged into it.
 * 2. A context override is present: `explicitOptions` with the override applied on top.
 * 3. The config has a default write concern: `explicitOptions` with the default applied on top.
 * 4. Otherwise `explicitOptions` with `{w: 1}` if persisting in safe mode, else `{w: 0}`.
 *
 * Only rule 4 guarantees that `w` is set. Keys that are not write-concern related are
 * carried through in every case. Never throws for well-formed inputs and has no side
 * effects other than logging.
 */
WriteConcernOptions mergeSafetyOptions(const WriteConcernOptions& explicitOptions,
                                       const std::optional<WriteConcernOptions>& contextOverride,
                                       const PersistenceConfig& config);

/**
 * Same as above, taking the override and config from `context`.
 */
WriteConcernOptions mergeSafetyOptions(const WriteConcernOptions& explicitOptions,
                                       const ExecutionContext& context);

}  // namespace safewrite

#endif  // HEADER_E0B8F4C6_25D9_4A71_83F0_6C9E1D7B4A25_INCLUDED
