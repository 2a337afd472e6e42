#pragma once

#include <treecopy/copier.hpp>
#include <treecopy/log.hpp>
#include <treecopy/result.hpp>
#include <optional>
#include <string>

namespace treecopy {

// Settings from a TOML config file:
//
//   [copy]
//   marker-file = ".ignorecopy"
//   verbose = false
//   filtered-total = false
//   progress = true
//
//   [log]
//   level = "info"
//   color = true
//
// Layering: defaults < config file < command line.
struct Config {
    std::string marker_file = kDefaultMarkerName;
    bool verbose = false;
    bool filtered_total = false;
    bool progress = true;
    log::Level log_level = log::Info;
    std::optional<bool> log_color;   // unset: detect from the terminal

    // Track which fields were explicitly set (for merge)
    bool marker_file_set = false;
    bool verbose_set = false;
    bool filtered_total_set = false;
    bool progress_set = false;
    bool log_level_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicitly set values win)
    void merge(const Config& other);

    CopyOptions copy_options() const;

    // Apply log level and colour to the global logger
    void apply_logging() const;
};

// ~/.treecopy/config.toml, or "" when HOME is unset
std::string global_config_path();

} // namespace treecopy
