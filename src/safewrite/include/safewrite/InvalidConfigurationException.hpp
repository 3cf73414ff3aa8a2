// Copyright 2018 MongoDB Inc.
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

#ifndef HEADER_3F8A6D21_C47E_4B09_A2D5_71E0B9C3F584_INCLUDED
#define HEADER_3F8A6D21_C47E_4B09_A2D5_71E0B9C3F584_INCLUDED

#include <stdexcept>

namespace safewrite {

/**
 * Throw this to indicate a write concern or persistence setting that
 * parses but cannot be used, e.g. `w: -1` or `DefaultWriteConcern: [1, 2]`.
 */
class InvalidConfigurationException : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

}  // namespace safewrite

#endif  // HEADER_3F8A6D21_C47E_4B09_A2D5_71E0B9C3F584_INCLUDED
