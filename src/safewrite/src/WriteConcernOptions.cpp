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

#include <safewrite/WriteConcernOptions.hpp>

#include <array>
#include <cmath>
#include <limits>

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/json.hpp>
#include <bsoncxx/types.hpp>

namespace safewrite {
namespace {

namespace bson = bsoncxx::builder::basic;

constexpr std::array<std::string_view, 4> kAcknowledgmentKeys{"w", "j", "fsync", "wtimeout"};

std::string_view keyOf(const bsoncxx::document::element& element) {
    auto key = element.key();
    return std::string_view{key.data(), key.size()};
}

// `journal` and `j` name the same option.
std::string_view canonicalKey(std::string_view key) {
    return key == "journal" ? std::string_view{"j"} : key;
}

std::optional<int64_t> asInteger(const bsoncxx::document::element& element) {
    switch (element.type()) {
        case bsoncxx::type::k_int32:
            return element.get_int32().value;
        case bsoncxx::type::k_int64:
            return element.get_int64().value;
        case bsoncxx::type::k_double: {
            auto value = element.get_double().value;
            if (std::isfinite(value) && std::trunc(value) == value && std::abs(value) < 9e18) {
                return static_cast<int64_t>(value);
            }
            return std::nullopt;
        }
        default:
            return std::nullopt;
    }
}

}  // namespace


WriteConcernOptions::WriteConcernOptions() : _passthrough{bson::make_document()} {}

WriteConcernOptions WriteConcernOptions::nodes(int32_t nodes) {
    WriteConcernOptions out;
    out.w(nodes);
    return out;
}

WriteConcernOptions WriteConcernOptions::fromBson(bsoncxx::document::view doc) {
    WriteConcernOptions out;
    bson::document unrecognized;

    for (auto&& element : doc) {
        const auto key = canonicalKey(keyOf(element));

        if (key == "w") {
            auto nodes = asInteger(element);
            if (nodes && *nodes >= std::numeric_limits<int32_t>::min() &&
                *nodes <= std::numeric_limits<int32_t>::max()) {
                out._w = static_cast<int32_t>(*nodes);
                continue;
            }
            if (element.type() == bsoncxx::type::k_utf8) {
                auto mode = element.get_utf8().value;
                out._w = std::string{mode.data(), mode.size()};
                continue;
            }
        } else if (key == "wtimeout") {
            if (auto millis = asInteger(element)) {
                out._wtimeout = std::chrono::milliseconds{*millis};
                continue;
            }
        } else if (key == "fsync" && element.type() == bsoncxx::type::k_bool) {
            out._fsync = element.get_bool().value;
            continue;
        } else if (key == "j" && element.type() == bsoncxx::type::k_bool) {
            out._journal = element.get_bool().value;
            continue;
        }

        unrecognized.append(bson::kvp(std::string{keyOf(element)}, element.get_value()));
    }

    out._passthrough = unrecognized.extract();
    return out;
}

WriteConcernOptions& WriteConcernOptions::w(W w) {
    _w = std::move(w);
    return *this;
}

const std::optional<WriteConcernOptions::W>& WriteConcernOptions::w() const {
    return _w;
}

WriteConcernOptions& WriteConcernOptions::wtimeout(std::chrono::milliseconds wtimeout) {
    _wtimeout = wtimeout;
    return *this;
}

const std::optional<std::chrono::milliseconds>& WriteConcernOptions::wtimeout() const {
    return _wtimeout;
}

WriteConcernOptions& WriteConcernOptions::fsync(bool fsync) {
    _fsync = fsync;
    return *this;
}

const std::optional<bool>& WriteConcernOptions::fsync() const {
    return _fsync;
}

WriteConcernOptions& WriteConcernOptions::journal(bool journal) {
    _journal = journal;
    return *this;
}

const std::optional<bool>& WriteConcernOptions::journal() const {
    return _journal;
}

bsoncxx::document::view WriteConcernOptions::passthrough() const {
    return _passthrough.view();
}

bool WriteConcernOptions::sets(std::string_view key) const {
    key = canonicalKey(key);
    if ((key == "w" && _w) || (key == "wtimeout" && _wtimeout) || (key == "fsync" && _fsync) ||
        (key == "j" && _journal)) {
        return true;
    }
    for (auto&& element : _passthrough.view()) {
        if (canonicalKey(keyOf(element)) == key) {
            return true;
        }
    }
    return false;
}

bool WriteConcernOptions::hasAcknowledgmentKeys() const {
    for (auto key : kAcknowledgmentKeys) {
        if (sets(key)) {
            return true;
        }
    }
    return false;
}

bool WriteConcernOptions::empty() const {
    return !_w && !_wtimeout && !_fsync && !_journal && _passthrough.view().empty();
}

WriteConcernOptions& WriteConcernOptions::merge(const WriteConcernOptions& rhs) {
    // A key given either way on the right replaces both forms on the left.
    if (rhs.sets("w")) {
        _w = rhs._w;
    }
    if (rhs.sets("wtimeout")) {
        _wtimeout = rhs._wtimeout;
    }
    if (rhs.sets("fsync")) {
        _fsync = rhs._fsync;
    }
    if (rhs.sets("j")) {
        _journal = rhs._journal;
    }

    bson::document merged;
    for (auto&& element : _passthrough.view()) {
        if (!rhs.sets(keyOf(element))) {
            merged.append(bson::kvp(std::string{keyOf(element)}, element.get_value()));
        }
    }
    for (auto&& element : rhs._passthrough.view()) {
        merged.append(bson::kvp(std::string{keyOf(element)}, element.get_value()));
    }
    _passthrough = merged.extract();

    return *this;
}

bsoncxx::document::value WriteConcernOptions::toBson() const {
    bson::document doc;
    if (_w) {
        std::visit([&](auto&& w) { doc.append(bson::kvp("w", w)); }, *_w);
    }
    if (_wtimeout) {
        doc.append(bson::kvp("wtimeout", static_cast<int64_t>(_wtimeout->count())));
    }
    if (_fsync) {
        doc.append(bson::kvp("fsync", *_fsync));
    }
    if (_journal) {
        doc.append(bson::kvp("j", *_journal));
    }
    for (auto&& element : _passthrough.view()) {
        doc.append(bson::kvp(std::string{keyOf(element)}, element.get_value()));
    }
    return doc.extract();
}

bool operator==(const WriteConcernOptions& lhs, const WriteConcernOptions& rhs) {
    return lhs._w == rhs._w && lhs._wtimeout == rhs._wtimeout && lhs._fsync == rhs._fsync &&
        lhs._journal == rhs._journal && lhs._passthrough.view() == rhs._passthrough.view();
}

std::ostream& operator<<(std::ostream& out, const WriteConcernOptions& options) {
    return out << bsoncxx::to_json(options.toBson().view(), bsoncxx::ExtendedJsonMode::k_relaxed);
}

}  // namespace safewrite
