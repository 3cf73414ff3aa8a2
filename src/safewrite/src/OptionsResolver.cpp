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

#include <safewrite/OptionsResolver.hpp>

#include <boost/log/trivial.hpp>

namespace safewrite {

WriteConcernOptions mergeSafetyOptions(const WriteConcernOptions& explicitOptions,
                                       const std::optional<WriteConcernOptions>& contextOverride,
                                       const PersistenceConfig& config) {
    if (explicitOptions.hasAcknowledgmentKeys()) {
        BOOST_LOG_TRIVIAL(debug) << "Using explicit write concern " << explicitOptions;
        return explicitOptions;
    }

    auto out = explicitOptions;
    if (contextOverride) {
        out.merge(*contextOverride);
        BOOST_LOG_TRIVIAL(debug) << "Using overridden write concern " << out;
    } else if (const auto& defaultWriteConcern = config.defaultWriteConcern()) {
        out.merge(*defaultWriteConcern);
        BOOST_LOG_TRIVIAL(debug) << "Using default write concern " << out;
    } else {
        out.merge(WriteConcernOptions::nodes(config.persistInSafeMode() ? 1 : 0));
        BOOST_LOG_TRIVIAL(debug) << "Using " << (config.persistInSafeMode() ? "safe" : "unsafe")
                                 << " mode write concern " << out;
    }
    return out;
}

WriteConcernOptions mergeSafetyOptions(const WriteConcernOptions& explicitOptions,
                                       const ExecutionContext& context) {
    return mergeSafetyOptions(explicitOptions, context.writeConcernOverride(), context.config());
}

}  // namespace safewrite
