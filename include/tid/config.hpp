#pragma once

#include <tid/log.hpp>
#include <tid/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace tid {

// Layered configuration: global < local (local wins)
//
//     [log]
//     level = "warn"
//     color = false
//
//     [typeid]
//     default-prefix = "user"
//     prefixes = ["user", "org"]
struct Config {
    log::Level log_level = log::Info;
    bool log_color = false;
    std::string default_prefix;
    // Allow-list; empty means any valid prefix
    std::vector<std::string> prefixes;

    // Track which fields were explicitly set (for merge)
    bool log_level_set = false;
    bool log_color_set = false;
    bool default_prefix_set = false;
    bool prefixes_set = false;

    static Result<Config> load(const std::string& path);
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicit values override this)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    bool allows(const std::string& prefix) const;

    // Push the [log] settings into the process-wide logger
    void apply_logging() const;
};

// ~/.tid/config.toml, or empty if HOME is unset
std::string global_config_path();

} // namespace tid
