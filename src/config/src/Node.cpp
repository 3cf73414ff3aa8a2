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

#include <config/Node.hpp>

#include <sstream>

#include <boost/core/demangle.hpp>

namespace safewrite {
namespace {

YAML::Node parse(const std::string& yaml, const std::string& name) {
    try {
        return YAML::Load(yaml);
    } catch (const YAML::ParserException& x) {
        BOOST_THROW_EXCEPTION(InvalidYAMLException(name, x));
    }
}

std::string describe(const YAML::Mark& mark) {
    std::stringstream out;
    out << "at (Line:Column)=(" << mark.line << ":" << mark.column << ")";
    return out.str();
}

std::string conversionMessage(const Node& node,
                              const YAML::BadConversion& yamlException,
                              const std::type_info& destType) {
    std::stringstream out;
    out << "Couldn't convert '" << node.path() << "' to '"
        << boost::core::demangle(destType.name()) << "' " << describe(yamlException.mark)
        << ": " << node;
    return out.str();
}

std::string yamlMessage(const std::string& source, const YAML::ParserException& yamlException) {
    std::stringstream out;
    out << "Invalid YAML in '" << source << "' " << describe(yamlException.mark) << ": "
        << yamlException.msg;
    return out.str();
}

std::string keyMessage(const Node& node) {
    return "Missing required key '" + node.path() + "'";
}

}  // namespace


InvalidConversionException::InvalidConversionException(const Node& node,
                                                       const YAML::BadConversion& yamlException,
                                                       const std::type_info& destType)
    : std::invalid_argument{conversionMessage(node, yamlException, destType)} {}

InvalidYAMLException::InvalidYAMLException(const std::string& source,
                                           const YAML::ParserException& yamlException)
    : std::invalid_argument{yamlMessage(source, yamlException)} {}

InvalidKeyException::InvalidKeyException(const Node& node)
    : std::invalid_argument{keyMessage(node)} {}


NodeSource::NodeSource(std::string yaml, std::string name)
    : _name{std::move(name)}, _yaml{parse(yaml, _name)} {}


Node::Node(YAML::Node yaml, std::string path, std::string key)
    : _yaml{std::move(yaml)}, _path{std::move(path)}, _key{std::move(key)} {}

Node Node::child(YAML::Node yaml, std::string key) const {
    auto path = _path.empty() ? key : _path + "/" + key;
    return Node{std::move(yaml), std::move(path), std::move(key)};
}

Node Node::operator[](const std::string& key) const {
    if (isMap()) {
        // Only the const lookup leaves the document untouched for a missing key.
        const YAML::Node& map = _yaml;
        for (auto&& entry : map) {
            if (entry.first.Scalar() == key) {
                return child(entry.second, key);
            }
        }
    }
    return child(YAML::Node{YAML::NodeType::Undefined}, key);
}

Node Node::operator[](std::size_t index) const {
    if (isSequence() && index < _yaml.size()) {
        const YAML::Node& sequence = _yaml;
        return child(sequence[index], std::to_string(index));
    }
    return child(YAML::Node{YAML::NodeType::Undefined}, std::to_string(index));
}

Node::Type Node::type() const {
    // Lookups that miss in yaml-cpp give invalid nodes that throw on Type().
    if (!_yaml.IsDefined()) {
        return Type::Undefined;
    }
    switch (_yaml.Type()) {
        case YAML::NodeType::Null:
            return Type::Null;
        case YAML::NodeType::Scalar:
            return Type::Scalar;
        case YAML::NodeType::Sequence:
            return Type::Sequence;
        case YAML::NodeType::Map:
            return Type::Map;
        case YAML::NodeType::Undefined:
            break;
    }
    return Type::Undefined;
}

std::size_t Node::size() const {
    return isMap() || isSequence() ? _yaml.size() : 0;
}

std::string Node::tag() const {
    return *this ? _yaml.Tag() : std::string{};
}

std::vector<Node> Node::children() const {
    std::vector<Node> out;
    if (isMap()) {
        for (auto&& entry : _yaml) {
            out.push_back(child(entry.second, entry.first.Scalar()));
        }
    } else if (isSequence()) {
        std::size_t index = 0;
        for (auto&& item : _yaml) {
            out.push_back(child(item, std::to_string(index++)));
        }
    }
    return out;
}

std::ostream& operator<<(std::ostream& out, const Node& node) {
    if (!node) {
        return out << "<undefined>";
    }
    return out << YAML::Dump(node._yaml);
}

}  // namespace safewrite
