#include "kickqr/core/config.hpp"
#include "kickqr/core/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace kickqr {

// ============================================================================
// Implementation details
// ============================================================================

struct Config::Impl {
    YAML::Node root;

    YAML::Node navigate(const std::string& key) const {
        std::vector<std::string> parts;
        std::stringstream ss(key);
        std::string part;
        while (std::getline(ss, part, '.')) {
            parts.push_back(part);
        }

        // yaml-cpp's [] operator can modify the tree even on const nodes
        YAML::Node current = YAML::Clone(root);

        for (const auto& p : parts) {
            if (!current || !current.IsMap()) {
                return YAML::Node(YAML::NodeType::Undefined);
            }
            if (!current[p]) {
                return YAML::Node(YAML::NodeType::Undefined);
            }
            current = current[p];
        }

        return current;
    }
};

namespace {

template<typename T, typename Parse>
T parse_override(const std::string& key, const std::string& text, T default_value, Parse parse) {
    try {
        return parse(text);
    } catch (const std::invalid_argument&) {
        LOG_WARN("Config override {}='{}' is not a valid number, using {}", key, text, default_value);
    } catch (const std::out_of_range&) {
        LOG_WARN("Config override {}='{}' is out of range, using {}", key, text, default_value);
    }
    return default_value;
}

}  // namespace

// ============================================================================
// Config Implementation
// ============================================================================

Config::Config() = default;
Config::~Config() = default;
Config::Config(Config&&) noexcept = default;
Config& Config::operator=(Config&&) noexcept = default;

bool Config::load(const std::string& path) {
    try {
        auto impl = std::make_unique<Impl>();
        impl->root = YAML::LoadFile(path);
        impl_ = std::move(impl);
        file_path_ = path;

        LOG_INFO("Loaded configuration from: {}", path);
        return true;
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Failed to load config from {}: {}", path, e.what());
        return false;
    }
}

std::string Config::get_string(const std::string& key,
                               const std::string& default_value) const {
    // Check overrides first
    auto it = overrides_.find(key);
    if (it != overrides_.end()) {
        return it->second;
    }

    if (!impl_) return default_value;

    try {
        auto node = impl_->navigate(key);
        if (node && node.IsScalar()) {
            return node.as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        LOG_WARN("Config key {} unreadable as string: {}", key, e.what());
    }

    return default_value;
}

int Config::get_int(const std::string& key, int default_value) const {
    auto it = overrides_.find(key);
    if (it != overrides_.end()) {
        return parse_override(key, it->second, default_value,
                              [](const std::string& s) { return std::stoi(s); });
    }

    if (!impl_) return default_value;

    try {
        auto node = impl_->navigate(key);
        if (node && node.IsScalar()) {
            return node.as<int>();
        }
    } catch (const YAML::Exception& e) {
        LOG_WARN("Config key {} unreadable as int: {}", key, e.what());
    }

    return default_value;
}

double Config::get_double(const std::string& key, double default_value) const {
    auto it = overrides_.find(key);
    if (it != overrides_.end()) {
        return parse_override(key, it->second, default_value,
                              [](const std::string& s) { return std::stod(s); });
    }

    if (!impl_) return default_value;

    try {
        auto node = impl_->navigate(key);
        if (node && node.IsScalar()) {
            return node.as<double>();
        }
    } catch (const YAML::Exception& e) {
        LOG_WARN("Config key {} unreadable as double: {}", key, e.what());
    }

    return default_value;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto it = overrides_.find(key);
    if (it != overrides_.end()) {
        std::string val = it->second;
        std::transform(val.begin(), val.end(), val.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return val == "true" || val == "1" || val == "yes";
    }

    if (!impl_) return default_value;

    try {
        auto node = impl_->navigate(key);
        if (node && node.IsScalar()) {
            return node.as<bool>();
        }
    } catch (const YAML::Exception& e) {
        LOG_WARN("Config key {} unreadable as bool: {}", key, e.what());
    }

    return default_value;
}

std::vector<int> Config::get_int_list(const std::string& key) const {
    std::vector<int> result;

    auto it = overrides_.find(key);
    if (it != overrides_.end()) {
        std::stringstream ss(it->second);
        std::string item;
        while (std::getline(ss, item, ',')) {
            result.push_back(parse_override(key, item, 0,
                                            [](const std::string& s) { return std::stoi(s); }));
        }
        return result;
    }

    if (!impl_) return result;

    try {
        auto node = impl_->navigate(key);
        if (node && node.IsSequence()) {
            for (const auto& item : node) {
                result.push_back(item.as<int>());
            }
        }
    } catch (const YAML::Exception& e) {
        LOG_WARN("Config key {} unreadable as int list: {}", key, e.what());
        result.clear();
    }

    return result;
}

bool Config::has(const std::string& key) const {
    if (overrides_.find(key) != overrides_.end()) {
        return true;
    }

    if (!impl_) return false;

    auto node = impl_->navigate(key);
    return node && node.IsDefined();
}

void Config::override(const std::string& key, const std::string& value) {
    overrides_[key] = value;
}

void Config::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.substr(0, 2) != "--") {
            continue;
        }

        arg = arg.substr(2);
        auto eq_pos = arg.find('=');

        std::string key, value;

        if (eq_pos != std::string::npos) {
            key = arg.substr(0, eq_pos);
            value = arg.substr(eq_pos + 1);
        } else if (i + 1 < argc && argv[i + 1][0] != '-') {
            key = arg;
            value = argv[++i];
        } else {
            // Boolean flag
            key = arg;
            value = "true";
        }

        // Convert dashes to dots for nested keys
        std::replace(key.begin(), key.end(), '-', '.');

        override(key, value);
        LOG_DEBUG("Config override: {} = {}", key, value);
    }
}

}  // namespace kickqr
