#include <tid/config.hpp>
#include <tid/typeid.hpp>
#include <tomlplusplus/toml.hpp>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace tid {

static Status check_prefix(const std::string& prefix, const char* key) {
    auto st = validate_prefix(prefix);
    if (st.is_err()) {
        return TidError{TidError::Config,
            std::string("invalid prefix '") + prefix + "' in [typeid] " + key,
            st.error().message};
    }
    return ok_status();
}

static TidError wrong_type(const char* section, const char* key, const char* expected) {
    return TidError{TidError::Config,
        std::string("[") + section + "] " + key + " must be " + expected};
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return TidError{TidError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto node = (*lg)["level"]) {
            auto v = node.value_exact<std::string>();
            if (!v) return wrong_type("log", "level", "a string");
            TID_TRY_ASSIGN(lvl, log::parse_level(*v));
            cfg.log_level = lvl;
            cfg.log_level_set = true;
        }
        if (auto node = (*lg)["color"]) {
            auto v = node.value_exact<bool>();
            if (!v) return wrong_type("log", "color", "a boolean");
            cfg.log_color = *v;
            cfg.log_color_set = true;
        }
    }

    // [typeid] section
    if (auto ti = doc["typeid"].as_table()) {
        if (auto node = (*ti)["default-prefix"]) {
            auto v = node.value_exact<std::string>();
            if (!v) return wrong_type("typeid", "default-prefix", "a string");
            TID_TRY(check_prefix(*v, "default-prefix"));
            cfg.default_prefix = *v;
            cfg.default_prefix_set = true;
        }
        if (auto node = (*ti)["prefixes"]) {
            auto arr = node.as_array();
            if (!arr) return wrong_type("typeid", "prefixes", "an array of strings");
            for (const auto& elem : *arr) {
                auto s = elem.value_exact<std::string>();
                if (!s) return wrong_type("typeid", "prefixes", "an array of strings");
                TID_TRY(check_prefix(*s, "prefixes"));
                cfg.prefixes.push_back(*s);
            }
            cfg.prefixes_set = true;
        }
    }

    if (!cfg.prefixes.empty() && cfg.default_prefix_set && !cfg.allows(cfg.default_prefix)) {
        return TidError{TidError::Config,
            "[typeid] default-prefix '" + cfg.default_prefix + "' is not listed in prefixes"};
    }

    log::debug("parsed config: level=%s default-prefix='%s' prefixes=%zu",
               log::level_name(cfg.log_level), cfg.default_prefix.c_str(),
               cfg.prefixes.size());
    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return TidError{TidError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto r = Config::parse(ss.str());
    if (r.is_err() && r.error().file.empty()) {
        r.error().file = path;
    }
    return r;
}

void Config::merge(const Config& other) {
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        log_color = other.log_color;
        log_color_set = true;
    }
    if (other.default_prefix_set) {
        default_prefix = other.default_prefix;
        default_prefix_set = true;
    }
    if (other.prefixes_set) {
        prefixes = other.prefixes;
        prefixes_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

bool Config::allows(const std::string& prefix) const {
    if (prefixes.empty()) return true;
    return std::find(prefixes.begin(), prefixes.end(), prefix) != prefixes.end();
}

void Config::apply_logging() const {
    log::set_level(log_level);
    if (log_color_set) {
        log::set_color_enabled(log_color);
    }
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.tid/config.toml";
}

} // namespace tid
