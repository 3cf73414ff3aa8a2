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

#include <safewrite/ExecutionContext.hpp>

#include <boost/log/trivial.hpp>

namespace safewrite {

ExecutionContext::ExecutionContext(const PersistenceConfig& config) : _config{config} {}

ExecutionContext::~ExecutionContext() {
    if (_override) {
        BOOST_LOG_TRIVIAL(debug) << "Execution context destroyed with unused override "
                                 << *_override;
    }
}

void ExecutionContext::setWriteConcernOverride(WriteConcernOptions writeConcern) {
    BOOST_LOG_TRIVIAL(trace) << "Setting write concern override " << writeConcern;
    _override = std::move(writeConcern);
}

void ExecutionContext::clearWriteConcernOverride() {
    _override.reset();
}


OverrideScope::OverrideScope(ExecutionContext& context, WriteConcernOptions writeConcern)
    : _context{context}, _previous{context.writeConcernOverride()} {
    _context.setWriteConcernOverride(std::move(writeConcern));
}

// Must not log: a failed log record here would terminate.
OverrideScope::~OverrideScope() {
    _context._override = std::move(_previous);
}

}  // namespace safewrite
