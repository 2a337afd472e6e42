#include <catch2/catch.hpp>
#include <treecopy/config.hpp>
#include "test_util.hpp"

using namespace treecopy;
using treecopy::test::TempDir;

// ===== Parsing =====

TEST_CASE("parse config with copy section", "[config]") {
    auto r = Config::parse(R"(
[copy]
marker-file = ".nocopy"
verbose = true
filtered-total = true
progress = false
)");
    REQUIRE(r.is_ok());
    const auto& cfg = r.value();
    REQUIRE(cfg.marker_file == ".nocopy");
    REQUIRE(cfg.verbose);
    REQUIRE(cfg.filtered_total);
    REQUIRE_FALSE(cfg.progress);
    REQUIRE(cfg.marker_file_set);
    REQUIRE(cfg.progress_set);
}

TEST_CASE("parse config with log section", "[config]") {
    auto r = Config::parse(R"(
[log]
level = "warn"
color = false
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().log_level == log::Warn);
    REQUIRE(r.value().log_level_set);
    REQUIRE(r.value().log_color == false);
}

TEST_CASE("parse empty config keeps defaults", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    const auto& cfg = r.value();
    REQUIRE(cfg.marker_file == ".ignorecopy");
    REQUIRE_FALSE(cfg.verbose);
    REQUIRE_FALSE(cfg.filtered_total);
    REQUIRE(cfg.progress);
    REQUIRE(cfg.log_level == log::Info);
    REQUIRE_FALSE(cfg.log_color.has_value());
    REQUIRE_FALSE(cfg.verbose_set);
}

TEST_CASE("parse invalid TOML config", "[config]") {
    auto r = Config::parse("not valid [toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TreecopyError::Parse);
    REQUIRE(r.error().line > 0);
}

TEST_CASE("wrong value type is a config error", "[config]") {
    auto r = Config::parse(R"(
[copy]
verbose = "yes"
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TreecopyError::Config);
    REQUIRE(r.error().message.find("copy.verbose") != std::string::npos);
}

TEST_CASE("unknown keys are rejected", "[config]") {
    auto section = Config::parse("[network]\nport = 1\n");
    REQUIRE(section.is_err());
    REQUIRE(section.error().message.find("'network'") != std::string::npos);

    auto key = Config::parse("[copy]\nfollow-links = true\n");
    REQUIRE(key.is_err());
    REQUIRE(key.error().message.find("copy.follow-links") != std::string::npos);
}

TEST_CASE("unknown log level is rejected", "[config]") {
    auto r = Config::parse("[log]\nlevel = \"chatty\"\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TreecopyError::Config);
    REQUIRE_FALSE(r.error().hint.empty());
}

TEST_CASE("marker file must be a plain name", "[config]") {
    REQUIRE(Config::parse("[copy]\nmarker-file = \"sub/.ignore\"\n").is_err());
    REQUIRE(Config::parse("[copy]\nmarker-file = \"\"\n").is_err());
}

// ===== Merge =====

TEST_CASE("merge overrides only explicitly set fields", "[config]") {
    auto base = Config::parse(R"(
[copy]
marker-file = ".nocopy"
verbose = true

[log]
level = "debug"
)").value();

    auto overlay = Config::parse(R"(
[copy]
verbose = false
)").value();

    base.merge(overlay);
    REQUIRE(base.marker_file == ".nocopy");   // preserved
    REQUIRE_FALSE(base.verbose);              // overridden
    REQUIRE(base.log_level == log::Debug);    // preserved
}

TEST_CASE("merge of an empty config changes nothing", "[config]") {
    auto base = Config::parse("[copy]\nfiltered-total = true\n[log]\ncolor = true\n").value();
    base.merge(Config{});
    REQUIRE(base.filtered_total);
    REQUIRE(base.log_color == true);
}

// ===== Derived settings =====

TEST_CASE("copy_options carries copy settings", "[config]") {
    auto cfg = Config::parse(R"(
[copy]
marker-file = ".skip"
verbose = true
filtered-total = true
)").value();

    auto opts = cfg.copy_options();
    REQUIRE(opts.marker_name == ".skip");
    REQUIRE(opts.verbose);
    REQUIRE(opts.filtered_total);
}

TEST_CASE("apply_logging lowers the level for verbose runs", "[config]") {
    Config cfg;
    cfg.verbose = true;
    cfg.apply_logging();
    REQUIRE(log::get_level() == log::Debug);

    cfg.log_level = log::Trace;
    cfg.apply_logging();
    REQUIRE(log::get_level() == log::Trace);

    Config quiet;
    quiet.log_level = log::Error;
    quiet.apply_logging();
    REQUIRE(log::get_level() == log::Error);

    log::set_level(log::Info);
}

// ===== Files =====

TEST_CASE("load reads a config file", "[config]") {
    TempDir td;
    auto path = td.write_file("config.toml", "[copy]\nprogress = false\n");
    auto r = Config::load(path.string());
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().progress);
}

TEST_CASE("load of a missing file is an IO error", "[config]") {
    TempDir td;
    auto r = Config::load((td.path / "nope.toml").string());
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TreecopyError::IO);
}

TEST_CASE("load errors name the offending file", "[config]") {
    TempDir td;
    auto path = td.write_file("bad.toml", "[copy]\nverbose = \"three\"\n");
    auto r = Config::load(path.string());
    REQUIRE(r.is_err());
    REQUIRE(r.error().file == path.string());
}

TEST_CASE("global config path lives under HOME", "[config]") {
    auto path = global_config_path();
    if (std::getenv("HOME")) {
        REQUIRE(path.size() > std::string("/.treecopy/config.toml").size());
        REQUIRE(path.find("/.treecopy/config.toml") != std::string::npos);
    } else {
        REQUIRE(path.empty());
    }
}
