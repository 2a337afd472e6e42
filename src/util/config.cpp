#include <treecopy/config.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <sstream>

namespace treecopy {

static std::string qualified(const std::string& section, const std::string& key) {
    return section.empty() ? key : section + "." + key;
}

static TreecopyError type_error(const std::string& section, const std::string& key,
                                const char* expected) {
    return TreecopyError{TreecopyError::Config,
        "config key '" + qualified(section, key) + "' must be a " + expected};
}

// Read an optional key of type T. Absent keys leave `out` alone.
template<typename T>
static Status read_key(const toml::table& tbl, const std::string& section,
                       const std::string& key, T& out, bool& set,
                       const char* expected) {
    auto node = tbl[key];
    if (!node) return ok_status();
    auto v = node.template value<T>();
    if (!v) return type_error(section, key, expected);
    out = *v;
    set = true;
    return ok_status();
}

static Status check_known_keys(const toml::table& tbl, const std::string& section,
                               std::initializer_list<const char*> known) {
    for (const auto& [key, val] : tbl) {
        (void)val;
        bool found = false;
        for (const char* k : known) {
            if (key.str() == k) found = true;
        }
        if (!found) {
            return TreecopyError{TreecopyError::Config,
                "unknown config key '" + qualified(section, std::string(key.str())) + "'"};
        }
    }
    return ok_status();
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return TreecopyError{TreecopyError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "",
            "",
            static_cast<int>(e.source().begin.line)};
    }

    Config cfg;
    TREECOPY_TRY(check_known_keys(doc, "", {"copy", "log"}));

    // [copy] section
    if (auto node = doc["copy"]) {
        auto copy = node.as_table();
        if (!copy) return type_error("", "copy", "table");
        TREECOPY_TRY(check_known_keys(*copy, "copy",
            {"marker-file", "verbose", "filtered-total", "progress"}));

        TREECOPY_TRY(read_key(*copy, "copy", "marker-file", cfg.marker_file,
                              cfg.marker_file_set, "string"));
        TREECOPY_TRY(read_key(*copy, "copy", "verbose", cfg.verbose,
                              cfg.verbose_set, "boolean"));
        TREECOPY_TRY(read_key(*copy, "copy", "filtered-total", cfg.filtered_total,
                              cfg.filtered_total_set, "boolean"));
        TREECOPY_TRY(read_key(*copy, "copy", "progress", cfg.progress,
                              cfg.progress_set, "boolean"));

        if (cfg.marker_file_set &&
            (cfg.marker_file.empty() || cfg.marker_file.find('/') != std::string::npos)) {
            return TreecopyError{TreecopyError::Config,
                "copy.marker-file must be a plain file name: '" + cfg.marker_file + "'"};
        }
    }

    // [log] section
    if (auto node = doc["log"]) {
        auto logt = node.as_table();
        if (!logt) return type_error("", "log", "table");
        TREECOPY_TRY(check_known_keys(*logt, "log", {"level", "color"}));

        std::string level_name;
        bool level_set = false;
        TREECOPY_TRY(read_key(*logt, "log", "level", level_name, level_set, "string"));
        if (level_set) {
            auto lvl = log::level_from_name(level_name);
            if (!lvl) {
                return TreecopyError{TreecopyError::Config,
                    "unknown log level '" + level_name + "'",
                    "expected one of: trace, debug, info, warn, error"};
            }
            cfg.log_level = *lvl;
            cfg.log_level_set = true;
        }

        bool color = false;
        bool color_set = false;
        TREECOPY_TRY(read_key(*logt, "log", "color", color, color_set, "boolean"));
        if (color_set) cfg.log_color = color;
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return TreecopyError{TreecopyError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) cfg.error().file = path;
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.marker_file_set) {
        marker_file = other.marker_file;
        marker_file_set = true;
    }
    if (other.verbose_set) {
        verbose = other.verbose;
        verbose_set = true;
    }
    if (other.filtered_total_set) {
        filtered_total = other.filtered_total;
        filtered_total_set = true;
    }
    if (other.progress_set) {
        progress = other.progress;
        progress_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.log_color.has_value()) log_color = other.log_color;
}

CopyOptions Config::copy_options() const {
    CopyOptions opts;
    opts.verbose = verbose;
    opts.marker_name = marker_file;
    opts.filtered_total = filtered_total;
    return opts;
}

void Config::apply_logging() const {
    // --verbose implies at least debug output
    log::Level lvl = log_level;
    if (verbose && lvl > log::Debug) lvl = log::Debug;
    log::set_level(lvl);
    if (log_color.has_value()) log::set_color_enabled(*log_color);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.treecopy/config.toml";
}

} // namespace treecopy
