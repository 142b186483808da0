// ---------------------------------------------------------------------------
// variable_value.cpp
//
// yaml-cpp 노드 → VariableValue 변환.
// yaml-cpp 예외는 이 파일 밖으로 나가지 않는다.
// ---------------------------------------------------------------------------

#include "validator/variable_value.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace {

ValidationError unsupported(std::string message, std::string path) {
    return ValidationError{
        ValidationErrorCode::kUnsupportedVariableType,
        std::move(message),
        std::move(path)
    };
}

VariableValue convert_scalar(const YAML::Node& node) {
    // 따옴표 스칼라는 태그가 "!" 로 고정된다
    if (node.Tag() == "!") {
        return VariableValue{node.Scalar()};
    }
    if (bool b = false; YAML::convert<bool>::decode(node, b)) {
        return VariableValue{b};
    }
    if (std::int64_t i = 0; YAML::convert<std::int64_t>::decode(node, i)) {
        return VariableValue{i};
    }
    if (double d = 0.0; YAML::convert<double>::decode(node, d)) {
        return VariableValue{d};
    }
    return VariableValue{node.Scalar()};
}

std::expected<VariableValue, ValidationError>
convert_node(const YAML::Node& node, const std::string& path) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
            return VariableValue{nullptr};

        case YAML::NodeType::Scalar:
            return convert_scalar(node);

        case YAML::NodeType::Sequence: {
            VariableList list;
            list.reserve(node.size());
            std::size_t index = 0;
            for (const auto& item : node) {
                auto value = convert_node(item, path + "[" + std::to_string(index) + "]");
                if (!value) {
                    return std::unexpected(std::move(value.error()));
                }
                list.push_back(std::move(*value));
                ++index;
            }
            return VariableValue{std::move(list)};
        }

        case YAML::NodeType::Map: {
            VariableMap map;
            for (auto it = node.begin(); it != node.end(); ++it) {
                if (!it->first.IsScalar()) {
                    return std::unexpected(unsupported("non-scalar object key", path));
                }
                const std::string key = it->first.Scalar();
                auto value = convert_node(it->second, path.empty() ? key : path + "." + key);
                if (!value) {
                    return std::unexpected(std::move(value.error()));
                }
                map.emplace_back(key, std::move(*value));
            }
            return VariableValue{std::move(map)};
        }

        case YAML::NodeType::Undefined:
            break;
    }
    return std::unexpected(unsupported("undefined variable value", path));
}

}  // namespace

std::string_view VariableValue::type_name() const noexcept {
    switch (data.index()) {
        case 0: return "null";
        case 1: return "bool";
        case 2: return "int";
        case 3: return "float";
        case 4: return "string";
        case 5: return "list";
        case 6: return "map";
        default: return "unknown";
    }
}

std::expected<VariableMap, ValidationError> variables_from_yaml(const YAML::Node& root) {
    if (!root.IsDefined()) {
        return std::unexpected(unsupported("undefined variables document", ""));
    }
    if (root.IsNull()) {
        return VariableMap{};
    }
    if (!root.IsMap()) {
        return std::unexpected(unsupported("variables must be an object", ""));
    }

    auto converted = convert_node(root, "");
    if (!converted) {
        return std::unexpected(std::move(converted.error()));
    }
    return std::get<VariableMap>(std::move(converted->data));
}

std::expected<VariableMap, ValidationError> variables_from_string(std::string_view text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(text));
    } catch (const YAML::Exception& e) {
        return std::unexpected(unsupported(
            std::string("variables parse error: ") + e.what(), ""));
    }
    return variables_from_yaml(root);
}
