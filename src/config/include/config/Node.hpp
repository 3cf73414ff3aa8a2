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

#ifndef HEADER_5B0C7F0E_2D7A_4E61_9C3B_8A51D2E64F17_INCLUDED
#define HEADER_5B0C7F0E_2D7A_4E61_9C3B_8A51D2E64F17_INCLUDED

#include <cstddef>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

#include <boost/log/trivial.hpp>
#include <boost/throw_exception.hpp>

#include <yaml-cpp/yaml.h>

namespace safewrite {

class Node;

/**
 * Specialize to read `T` from configuration when `T` can't have a
 * `T(const Node&, Args...)` constructor:
 *
 * ```c++
 * template <>
 * struct NodeConvert<Foo> {
 *     using type = Foo;
 *     static Foo convert(const Node& node, Args... args);
 * };
 * ```
 */
template <typename T>
struct NodeConvert {};

/**
 * A value could not be converted to the requested type.
 */
class InvalidConversionException : public std::invalid_argument {
public:
    InvalidConversionException(const Node& node,
                               const YAML::BadConversion& yamlException,
                               const std::type_info& destType);
};

/**
 * The document is not valid YAML.
 */
class InvalidYAMLException : public std::invalid_argument {
public:
    InvalidYAMLException(const std::string& source, const YAML::ParserException& yamlException);
};

/**
 * A required key is missing.
 */
class InvalidKeyException : public std::invalid_argument {
public:
    explicit InvalidKeyException(const Node& node);
};


/**
 * Read-only view of one position in a YAML document.
 *
 * Nodes are cheap to copy and remember how they were reached, so
 * conversion errors name the offending key:
 *
 * ```c++
 * NodeSource source{yaml, "persistence.yml"};
 * auto root = source.root();
 *
 * if (root["DefaultWriteConcern"]) { ... }
 * bool safe = root["PersistInSafeMode"].maybe<bool>().value_or(false);
 * ```
 *
 * Looking up a key or index that isn't there yields an undefined node
 * rather than throwing; lookups on it can be chained.
 */
class Node {
public:
    enum class Type {
        Undefined,
        Null,
        Scalar,
        Sequence,
        Map,
    };

    Node(YAML::Node yaml, std::string path, std::string key);

    Node operator[](const std::string& key) const;

    Node operator[](std::size_t index) const;

    /**
     * @return if the node was given in the document.
     */
    explicit operator bool() const {
        return type() != Type::Undefined;
    }

    Type type() const;

    bool isScalar() const {
        return type() == Type::Scalar;
    }

    bool isNull() const {
        return type() == Type::Null;
    }

    bool isMap() const {
        return type() == Type::Map;
    }

    bool isSequence() const {
        return type() == Type::Sequence;
    }

    /**
     * @return number of map entries or sequence items; 0 for anything else.
     */
    std::size_t size() const;

    /**
     * @return map key or sequence index of this node within its parent.
     */
    const std::string& key() const {
        return _key;
    }

    /**
     * @return slash-separated keys from the source name down to this node.
     */
    const std::string& path() const {
        return _path;
    }

    /**
     * @return the yaml tag. `"!"` if the scalar was quoted.
     */
    std::string tag() const;

    /**
     * @return map entries in document order, or sequence items in index order.
     */
    std::vector<Node> children() const;

    /**
     * Convert using, in order of preference, a `O(const Node&, Args...)`
     * constructor, a `NodeConvert<O>` specialization, or `YAML::convert<O>`.
     *
     * @return `nullopt` if this node isn't defined.
     * @throws InvalidConversionException if the value cannot be converted to O.
     */
    template <typename O, typename... Args>
    std::optional<O> maybe(Args&&... args) const {
        if (!*this) {
            return std::nullopt;
        }
        try {
            if constexpr (isNodeConstructible<O, Args...>()) {
                return std::make_optional<O>(*this, std::forward<Args>(args)...);
            } else if constexpr (hasNodeConvert<O, Args...>(0)) {
                return std::make_optional<O>(
                    NodeConvert<O>::convert(*this, std::forward<Args>(args)...));
            } else {
                static_assert(sizeof...(Args) == 0,
                              "Extra arguments need a constructor or a NodeConvert specialization");
                return std::make_optional<O>(_yaml.as<O>());
            }
        } catch (const YAML::BadConversion& x) {
            BOOST_THROW_EXCEPTION(InvalidConversionException(*this, x, typeid(O)));
        }
    }

    /**
     * Like `maybe<O>()` for values that must be given.
     *
     * @throws InvalidKeyException if this node isn't defined.
     * @throws InvalidConversionException if the value cannot be converted to O.
     */
    template <typename O, typename... Args>
    O to(Args&&... args) const {
        auto out = maybe<O>(std::forward<Args>(args)...);
        if (!out) {
            InvalidKeyException x{*this};
            BOOST_LOG_TRIVIAL(error) << x.what();
            BOOST_THROW_EXCEPTION(x);
        }
        return std::move(*out);
    }

    friend std::ostream& operator<<(std::ostream& out, const Node& node);

private:
    template <typename O, typename... Args>
    static constexpr bool isNodeConstructible() {
        // primitives report as constructible from anything convertible to them
        return !std::is_trivially_constructible_v<O> &&
            std::is_constructible_v<O, const Node&, Args...>;
    }

    template <typename O,
              typename... Args,
              typename = std::enable_if_t<std::is_same_v<
                  O,
                  decltype(NodeConvert<O>::convert(std::declval<const Node&>(),
                                                   std::declval<Args>()...))>>>
    static constexpr bool hasNodeConvert(int) {
        return true;
    }

    template <typename O, typename... Args>
    static constexpr bool hasNodeConvert(...) {
        return false;
    }

    Node child(YAML::Node yaml, std::string key) const;

    YAML::Node _yaml;
    std::string _path;
    std::string _key;
};


/**
 * Parses a YAML document and hands out its root.
 */
class NodeSource final {
public:
    /**
     * @param yaml
     *   The full yaml document
     * @param name
     *   Where the yaml came from, usually a file path. Starts every `Node::path()`.
     * @throws InvalidYAMLException if `yaml` doesn't parse.
     */
    NodeSource(std::string yaml, std::string name);

    Node root() const {
        return Node{_yaml, _name, ""};
    }

private:
    std::string _name;
    YAML::Node _yaml;
};

}  // namespace safewrite

#endif  // HEADER_5B0C7F0E_2D7A_4E61_9C3B_8A51D2E64F17_INCLUDED
