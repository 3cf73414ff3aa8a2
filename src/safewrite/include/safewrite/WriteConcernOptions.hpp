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

#ifndef HEADER_9E3D41A2_6C0B_4F5E_8B7A_2F1C94D0E6B3_INCLUDED
#define HEADER_9E3D41A2_6C0B_4F5E_8B7A_2F1C94D0E6B3_INCLUDED

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>

#include <bsoncxx/document/value.hpp>
#include <bsoncxx/document/view.hpp>

namespace safewrite {

/**
 * The write-concern related options of a single persistence call.
 *
 * Every recognized key is independently optional and an unset key means
 * "no opinion" for that dimension:
 *
 * - `w`: number of acknowledging nodes, or a mode/tag name such as `"majority"`.
 * - `wtimeout`: how long to wait for acknowledgment.
 * - `fsync`: flush to disk before acknowledging.
 * - `j`: commit to the journal before acknowledging. `journal` is accepted as an alias
 *   when reading BSON.
 *
 * Any other key is carried verbatim in `passthrough()`. So is a recognized key whose
 * value has the wrong BSON type; validating those is the job of whoever hands the
 * options to the driver (see `toWriteConcern()`).
 *
 * Setters return `*this` so options can be built up fluently:
 *
 * ```c++
 * auto opts = WriteConcernOptions{}.w("majority").wtimeout(std::chrono::milliseconds{500});
 * ```
 */
class WriteConcernOptions {
public:
    using W = std::variant<int32_t, std::string>;

    WriteConcernOptions();

    /**
     * @return `{w: nodes}`
     */
    static WriteConcernOptions nodes(int32_t nodes);

    /**
     * @param doc
     *   document such as `{w: 2, wtimeout: 100, comment: "x"}`.
     * @return the options with recognized keys typed and the rest in `passthrough()`.
     */
    static WriteConcernOptions fromBson(bsoncxx::document::view doc);

    WriteConcernOptions& w(W w);
    const std::optional<W>& w() const;

    WriteConcernOptions& wtimeout(std::chrono::milliseconds wtimeout);
    const std::optional<std::chrono::milliseconds>& wtimeout() const;

    WriteConcernOptions& fsync(bool fsync);
    const std::optional<bool>& fsync() const;

    WriteConcernOptions& journal(bool journal);
    const std::optional<bool>& journal() const;

    /**
     * @return the keys this class does not interpret. Only `fromBson()` and `merge()` fill it.
     */
    bsoncxx::document::view passthrough() const;

    /**
     * @return if any of `w`, `j`, `fsync` or `wtimeout` is present, typed or not.
     */
    bool hasAcknowledgmentKeys() const;

    /**
     * @return if no key at all is set.
     */
    bool empty() const;

    /**
     * Apply every key set in `rhs` on top of this. Keys only set here are kept.
     *
     * @return *this
     */
    WriteConcernOptions& merge(const WriteConcernOptions& rhs);

    /**
     * @return `{w, wtimeout, fsync, j}` for the keys that are set followed by the passthrough keys.
     */
    bsoncxx::document::value toBson() const;

    friend bool operator==(const WriteConcernOptions& lhs, const WriteConcernOptions& rhs);

    friend bool operator!=(const WriteConcernOptions& lhs, const WriteConcernOptions& rhs) {
        return !(lhs == rhs);
    }

    friend std::ostream& operator<<(std::ostream& out, const WriteConcernOptions& options);

private:
    // Is `key` present in either typed or passthrough form.
    bool sets(std::string_view key) const;

    std::optional<W> _w;
    std::optional<std::chrono::milliseconds> _wtimeout;
    std::optional<bool> _fsync;
    std::optional<bool> _journal;
    bsoncxx::document::value _passthrough;
};

}  // namespace safewrite

#endif  // HEADER_9E3D41A2_6C0B_4F5E_8B7A_2F1C94D0E6B3_INCLUDED
