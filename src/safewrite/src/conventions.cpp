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

#include <safewrite/conventions.hpp>

#include <chrono>
#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <variant>

#include <boost/throw_exception.hpp>

#include <bsoncxx/array/value.hpp>
#include <bsoncxx/builder/basic/array.hpp>
#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/types.hpp>

namespace safewrite {
namespace {

namespace bson = bsoncxx::builder::basic;

class Value {
public:
    explicit Value(bool value) : _value{value} {}
    explicit Value(int32_t value) : _value{value} {}
    explicit Value(int64_t value) : _value{value} {}
    explicit Value(double value) : _value{value} {}
    explicit Value(std::string value) : _value{std::move(value)} {}
    explicit Value(bsoncxx::types::b_null value) : _value{value} {}

    void appendToBuilder(bson::document& doc, std::string key) {
        std::visit([&](auto&& arg) { doc.append(bson::kvp(std::move(key), arg)); },
                   std::move(_value));
    }

    void appendToBuilder(bson::array& arr) {
        std::visit([&](auto&& arg) { arr.append(arg); }, std::move(_value));
    }

private:
    using VariantType =
        std::variant<bool, int32_t, int64_t, double, std::string, bsoncxx::types::b_null>;
    VariantType _value;
};

Value parseScalar(const Node& node) {
    if (node.isNull()) {
        return Value{bsoncxx::types::b_null{}};
    }

    // `tag() == "!"` means the scalar was quoted; keep numeric-looking strings as strings.
    if (node.tag() != "!") {
        try {
            return Value{node.to<int32_t>()};
        } catch (const InvalidConversionException&) {
        }
        try {
            return Value{node.to<int64_t>()};
        } catch (const InvalidConversionException&) {
        }
        try {
            return Value{node.to<double>()};
        } catch (const InvalidConversionException&) {
        }
        try {
            return Value{node.to<bool>()};
        } catch (const InvalidConversionException&) {
        }
    }

    return Value{node.to<std::string>()};
}

bsoncxx::array::value toArrayBson(const Node& node);

void appendToBuilder(const Node& node, const std::string& key, bson::document& doc) {
    if (node.isMap()) {
        doc.append(bson::kvp(key, toDocumentBson(node)));
    } else if (node.isSequence()) {
        doc.append(bson::kvp(key, toArrayBson(node)));
    } else {
        parseScalar(node).appendToBuilder(doc, key);
    }
}

void appendToBuilder(const Node& node, bson::array& arr) {
    if (node.isMap()) {
        arr.append(toDocumentBson(node));
    } else if (node.isSequence()) {
        arr.append(toArrayBson(node));
    } else {
        parseScalar(node).appendToBuilder(arr);
    }
}

bsoncxx::array::value toArrayBson(const Node& node) {
    bson::array arr{};
    for (auto&& item : node.children()) {
        appendToBuilder(item, arr);
    }
    return arr.extract();
}

// Recognized keys left in the passthrough document had values of the wrong type.
void checkNoMalformedKeys(const WriteConcernOptions& options) {
    for (std::string_view key : {"w", "wtimeout", "fsync", "j", "journal"}) {
        auto element = options.passthrough()[bsoncxx::stdx::string_view{key.data(), key.size()}];
        if (element) {
            std::stringstream msg;
            msg << "Write concern key '" << key << "' has a value of unsupported type in "
                << options;
            BOOST_THROW_EXCEPTION(InvalidConfigurationException(msg.str()));
        }
    }
}

}  // namespace


bsoncxx::document::value toDocumentBson(const Node& node) {
    if (!node.isMap()) {
        std::stringstream msg;
        msg << "Wanted map at '" << node.path() << "' got: " << node;
        BOOST_THROW_EXCEPTION(InvalidConfigurationException(msg.str()));
    }

    bson::document doc{};
    for (auto&& entry : node.children()) {
        appendToBuilder(entry, entry.key(), doc);
    }
    return doc.extract();
}

mongocxx::write_concern toWriteConcern(const WriteConcernOptions& options) {
    checkNoMalformedKeys(options);

    mongocxx::write_concern out{};
    const auto timeout = options.wtimeout().value_or(std::chrono::milliseconds{0});
    if (timeout.count() < 0) {
        std::stringstream msg;
        msg << "Negative wtimeout in write concern " << options;
        BOOST_THROW_EXCEPTION(InvalidConfigurationException(msg.str()));
    }

    bool unacknowledged = false;
    if (const auto& w = options.w()) {
        if (const auto* nodes = std::get_if<int32_t>(&*w)) {
            if (*nodes < 0) {
                std::stringstream msg;
                msg << "Negative w in write concern " << options;
                BOOST_THROW_EXCEPTION(InvalidConfigurationException(msg.str()));
            }
            if (*nodes == 0) {
                unacknowledged = true;
                out.acknowledge_level(mongocxx::write_concern::level::k_unacknowledged);
            } else {
                out.nodes(*nodes);
            }
        } else {
            const auto& mode = std::get<std::string>(*w);
            if (mode == "majority") {
                out.majority(timeout);
            } else {
                out.tag(mode);
            }
        }
    }

    if (options.wtimeout()) {
        out.timeout(timeout);
    }

    // The server treats fsync as a journal commit when journaling is enabled.
    if (options.journal() || options.fsync()) {
        const bool journal = options.journal().value_or(false) || options.fsync().value_or(false);
        if (journal && unacknowledged) {
            std::stringstream msg;
            msg << "Unacknowledged write concern cannot require journaling: " << options;
            BOOST_THROW_EXCEPTION(InvalidConfigurationException(msg.str()));
        }
        out.journal(journal);
    }

    return out;
}

WriteConcernOptions NodeConvert<WriteConcernOptions>::convert(const Node& node) {
    if (node.isScalar()) {
        if (node.tag() != "!") {
            try {
                return WriteConcernOptions::nodes(node.to<int32_t>());
            } catch (const InvalidConversionException&) {
            }
        }
        return WriteConcernOptions{}.w(node.to<std::string>());
    }
    if (node.isMap()) {
        return WriteConcernOptions::fromBson(toDocumentBson(node).view());
    }

    std::stringstream msg;
    msg << "Write concern at '" << node.path()
        << "' must be an integer, a mode name, or a map. Got: " << node;
    BOOST_THROW_EXCEPTION(InvalidConfigurationException(msg.str()));
}

}  // namespace safewrite
