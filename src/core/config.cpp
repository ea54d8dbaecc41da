#include <rtvoice/core/config.hpp>
#include <nlohmann/json.hpp>
#include <fstream>

namespace rtvoice::core {

namespace {

nlohmann::json toJson(const ConfigValue& value) {
    return std::visit([](const auto& v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return nullptr;
        }
        else if constexpr (std::is_same_v<T, ConfigNodePtr>) {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& [key, val] : v->values()) {
                obj[key] = toJson(val);
            }
            return obj;
        }
        else if constexpr (std::is_same_v<T, std::vector<ConfigValue>>) {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : v) {
                arr.push_back(toJson(item));
            }
            return arr;
        }
        else {
            return v;
        }
    }, value);
}

ConfigValue fromJson(const nlohmann::json& json) {
    switch (json.type()) {
        case nlohmann::json::value_t::null:
            return nullptr;
        case nlohmann::json::value_t::boolean:
            return json.get<bool>();
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
            return json.get<int64_t>();
        case nlohmann::json::value_t::number_float:
            return json.get<double>();
        case nlohmann::json::value_t::string:
            return json.get<std::string>();
        case nlohmann::json::value_t::array: {
            std::vector<ConfigValue> arr;
            arr.reserve(json.size());
            for (const auto& item : json) {
                arr.push_back(fromJson(item));
            }
            return arr;
        }
        case nlohmann::json::value_t::object: {
            ConfigNode::Map values;
            for (auto it = json.begin(); it != json.end(); ++it) {
                values[it.key()] = fromJson(it.value());
            }
            return ConfigNode::create(std::move(values));
        }
        default:
            break;
    }

    throw_error(ErrorCode::InvalidData, "Unsupported JSON value in configuration");
}

// Root harus object; dipakai oleh loadFromFile dan loadFromString
Result<ConfigNodePtr> rootFromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        return {ErrorCode::InvalidData, "Root configuration must be an object"};
    }
    return std::get<ConfigNodePtr>(fromJson(json));
}

nlohmann::json rootToJson(const ConfigNodePtr& root) {
    nlohmann::json json = nlohmann::json::object();
    for (const auto& [key, value] : root->values()) {
        json[key] = toJson(value);
    }
    return json;
}

} // namespace

Result<void> Config::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return {ErrorCode::FileNotFound, "Failed to open config file: " + path.string()};
    }

    try {
        auto root = rootFromJson(nlohmann::json::parse(file));
        if (!root) {
            return root.error();
        }
        root_ = root.value();
        return {};
    }
    catch (const nlohmann::json::exception& e) {
        return {ErrorCode::InvalidData, "Failed to parse config file " + path.string() + ": " + e.what()};
    }
}

Result<void> Config::saveToFile(const std::filesystem::path& path) const {
    std::ofstream file(path);
    if (!file) {
        return {ErrorCode::FileAccessDenied, "Failed to create config file: " + path.string()};
    }

    file << rootToJson(root_).dump(2);
    return {};
}

Result<void> Config::loadFromString(std::string_view data) {
    try {
        auto root = rootFromJson(nlohmann::json::parse(data));
        if (!root) {
            return root.error();
        }
        root_ = root.value();
        return {};
    }
    catch (const nlohmann::json::exception& e) {
        return {ErrorCode::InvalidData, "Failed to parse config string: " + std::string(e.what())};
    }
}

Result<std::string> Config::saveToString() const {
    try {
        return rootToJson(root_).dump(2);
    }
    catch (const nlohmann::json::exception& e) {
        return {ErrorCode::InvalidData, "Failed to serialize config: " + std::string(e.what())};
    }
}

} // namespace rtvoice::core
