#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>
#include <memory>
#include <optional>
#include <filesystem>
#include <cstdint>

#include <rtvoice/core/error.hpp>

namespace rtvoice::core {

class ConfigNode;
using ConfigNodePtr = std::shared_ptr<ConfigNode>;

// Tipe nilai yang didukung dalam konfigurasi (mengikuti tipe JSON)
using ConfigValue = std::variant<
    std::nullptr_t,
    bool,
    int64_t,
    double,
    std::string,
    std::vector<ConfigValue>,
    ConfigNodePtr
>;

class ConfigNode : public std::enable_shared_from_this<ConfigNode> {
public:
    using Map = std::unordered_map<std::string, ConfigValue>;

    ConfigNode() = default;
    explicit ConfigNode(Map values) : values_(std::move(values)) {}

    static ConfigNodePtr create() {
        return std::make_shared<ConfigNode>();
    }

    static ConfigNodePtr create(Map values) {
        return std::make_shared<ConfigNode>(std::move(values));
    }

    // Integer values are accepted where a double is requested, JSON does
    // not distinguish "30" from "30.0" for the user.
    template<typename T>
    Result<T> get(const std::string& key) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return {ErrorCode::ResourceNotFound, "Configuration key not found: " + key};
        }

        if constexpr (std::is_same_v<T, double>) {
            if (auto* i = std::get_if<int64_t>(&it->second)) {
                return static_cast<double>(*i);
            }
        }

        if (auto* v = std::get_if<T>(&it->second)) {
            return *v;
        }
        return {ErrorCode::InvalidData, "Invalid type for key: " + key};
    }

    // Nilai default hanya dipakai kalau key tidak ada; tipe salah tetap error
    template<typename T>
    Result<T> getOr(const std::string& key, T fallback) const {
        if (!has(key)) {
            return fallback;
        }
        return get<T>(key);
    }

    template<typename T>
    void set(const std::string& key, T&& value) {
        values_[key] = std::forward<T>(value);
    }

    bool has(const std::string& key) const {
        return values_.find(key) != values_.end();
    }

    void remove(const std::string& key) {
        values_.erase(key);
    }

    Result<ConfigNodePtr> getObject(const std::string& key) const {
        return get<ConfigNodePtr>(key);
    }

    ConfigNodePtr getOrCreateObject(const std::string& key) {
        auto it = values_.find(key);
        if (it != values_.end()) {
            if (auto* node = std::get_if<ConfigNodePtr>(&it->second)) {
                return *node;
            }
        }
        auto node = create();
        values_[key] = node;
        return node;
    }

    const Map& values() const { return values_; }
    Map& values() { return values_; }

private:
    Map values_;
};

class Config {
public:
    static Config& instance() {
        static Config instance;
        return instance;
    }

    Config() : root_(ConfigNode::create()) {}

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    Config(Config&&) = delete;
    Config& operator=(Config&&) = delete;

    Result<void> loadFromFile(const std::filesystem::path& path);
    Result<void> saveToFile(const std::filesystem::path& path) const;
    Result<void> loadFromString(std::string_view data);
    Result<std::string> saveToString() const;

    ConfigNodePtr root() { return root_; }
    const ConfigNodePtr root() const { return root_; }

    template<typename T>
    Result<T> get(const std::string& key) const {
        return root_->get<T>(key);
    }

    template<typename T>
    Result<T> getOr(const std::string& key, T fallback) const {
        return root_->getOr<T>(key, std::move(fallback));
    }

    template<typename T>
    void set(const std::string& key, T&& value) {
        root_->set(key, std::forward<T>(value));
    }

    bool has(const std::string& key) const {
        return root_->has(key);
    }

    void remove(const std::string& key) {
        root_->remove(key);
    }

    void clear() {
        root_ = ConfigNode::create();
    }

private:
    ConfigNodePtr root_;
};

inline Config& config() {
    return Config::instance();
}

} // namespace rtvoice::core
