#include <catch2/catch.hpp>
#include <treecopy/cli.hpp>
#include <treecopy/log.hpp>
#include "test_util.hpp"

#include <vector>

using namespace treecopy;
using treecopy::test::TempDir;
using treecopy::test::read_file;
namespace fs = std::filesystem;

static Result<CliArgs> parse(std::vector<std::string> args) {
    std::vector<const char*> argv{"treecopy"};
    for (const auto& a : args) argv.push_back(a.c_str());
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

static int run_with(std::vector<std::string> args) {
    std::vector<const char*> argv{"treecopy"};
    for (const auto& a : args) argv.push_back(a.c_str());
    int status = run(static_cast<int>(argv.size()), argv.data());
    log::set_level(log::Info);
    return status;
}

// ===== Argument parsing =====

TEST_CASE("parse positional source and destination", "[cli]") {
    auto r = parse({"src", "dst"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().source == "src");
    REQUIRE(r.value().destination == "dst");
    REQUIRE_FALSE(r.value().ignore_copy);
    REQUIRE_FALSE(r.value().verbose);
}

TEST_CASE("parse flags in any position", "[cli]") {
    auto r = parse({"--verbose", "src", "--ignore-copy", "dst", "--no-progress"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().verbose);
    REQUIRE(r.value().ignore_copy);
    REQUIRE(r.value().no_progress);
    REQUIRE(r.value().source == "src");
    REQUIRE(r.value().destination == "dst");
}

TEST_CASE("parse options with values", "[cli]") {
    auto spaced = parse({"--config", "/etc/tc.toml", "--marker", ".skip", "a", "b"});
    REQUIRE(spaced.is_ok());
    REQUIRE(spaced.value().config_path == std::string("/etc/tc.toml"));
    REQUIRE(spaced.value().marker == std::string(".skip"));

    auto joined = parse({"--config=/etc/tc.toml", "--marker=.skip", "a", "b"});
    REQUIRE(joined.is_ok());
    REQUIRE(joined.value().config_path == std::string("/etc/tc.toml"));
    REQUIRE(joined.value().marker == std::string(".skip"));
}

TEST_CASE("double dash ends option parsing", "[cli]") {
    auto r = parse({"--", "-weird-src", "dst"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().source == "-weird-src");
}

TEST_CASE("help needs no positional arguments", "[cli]") {
    auto r = parse({"-h"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().help);
    REQUIRE(usage().find("--ignore-copy") != std::string::npos);
}

TEST_CASE("argument errors", "[cli]") {
    auto missing = parse({"only-one"});
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == TreecopyError::InvalidArg);

    REQUIRE(parse({"a", "b", "c"}).is_err());
    REQUIRE(parse({"--bogus", "a", "b"}).is_err());
    REQUIRE(parse({"a", "b", "--config"}).is_err());
    REQUIRE(parse({"--marker", "x/y", "a", "b"}).is_err());
}

// ===== Path validation =====

TEST_CASE("validate_paths resolves and creates the destination", "[cli]") {
    TempDir td;
    td.make_dir("src");

    auto r = validate_paths((td.path / "src").string(), (td.path / "out/nested").string());
    REQUIRE(r.is_ok());
    REQUIRE(r.value().source.is_absolute());
    REQUIRE(fs::is_directory(r.value().destination));
    REQUIRE(r.value().destination.filename() == "nested");
}

TEST_CASE("validate_paths rejects a missing or non-directory source", "[cli]") {
    TempDir td;
    auto missing = validate_paths((td.path / "nope").string(), (td.path / "out").string());
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == TreecopyError::NotFound);

    auto file = td.write_file("plain.txt", "x");
    auto not_dir = validate_paths(file.string(), (td.path / "out").string());
    REQUIRE(not_dir.is_err());
    REQUIRE(not_dir.error().code == TreecopyError::InvalidArg);
}

TEST_CASE("validate_paths rejects a destination inside the source", "[cli]") {
    TempDir td;
    td.make_dir("src");

    auto inside = validate_paths((td.path / "src").string(), (td.path / "src/backup").string());
    REQUIRE(inside.is_err());
    REQUIRE(inside.error().code == TreecopyError::InvalidArg);
    REQUIRE_FALSE(fs::exists(td.path / "src/backup"));

    auto same = validate_paths((td.path / "src").string(), (td.path / "src/.").string());
    REQUIRE(same.is_err());

    // A sibling whose name merely starts with the source name is fine
    auto sibling = validate_paths((td.path / "src").string(), (td.path / "src-copy").string());
    REQUIRE(sibling.is_ok());
}

TEST_CASE("validate_paths fails when the destination is a file", "[cli]") {
    TempDir td;
    td.make_dir("src");
    auto file = td.write_file("taken", "x");

    auto r = validate_paths((td.path / "src").string(), file.string());
    REQUIRE(r.is_err());
}

// ===== End to end =====

TEST_CASE("run copies a tree and honours marker files", "[cli]") {
    TempDir td;
    td.write_file("src/.ignorecopy", "secrets/\n*.tmp\n");
    td.write_file("src/secrets/a.txt", "s");
    td.write_file("src/data/b.tmp", "t");
    td.write_file("src/data/c.txt", "c");
    auto cfg = td.write_file("config.toml", "[copy]\nprogress = false\n[log]\nlevel = \"error\"\n");

    int status = run_with({"--config", cfg.string(),
                           (td.path / "src").string(), (td.path / "dst").string()});
    REQUIRE(status == ExitOk);
    REQUIRE(read_file(td.path / "dst/data/c.txt") == "c");
    REQUIRE_FALSE(fs::exists(td.path / "dst/secrets"));
    REQUIRE_FALSE(fs::exists(td.path / "dst/data/b.tmp"));
}

TEST_CASE("run with --ignore-copy and a custom marker", "[cli]") {
    TempDir td;
    td.write_file("src/.skip", "*.tmp\n");
    td.write_file("src/a.tmp", "t");
    auto cfg = td.write_file("config.toml", "[log]\nlevel = \"error\"\n");

    REQUIRE(run_with({"--config", cfg.string(), "--no-progress", "--marker", ".skip",
                      (td.path / "src").string(), (td.path / "dst1").string()}) == ExitOk);
    REQUIRE_FALSE(fs::exists(td.path / "dst1/a.tmp"));

    REQUIRE(run_with({"--config", cfg.string(), "--no-progress", "--marker", ".skip",
                      "--ignore-copy",
                      (td.path / "src").string(), (td.path / "dst2").string()}) == ExitOk);
    REQUIRE(fs::exists(td.path / "dst2/a.tmp"));
}

TEST_CASE("run reports usage, config and path errors as failure", "[cli]") {
    TempDir td;
    td.make_dir("src");
    auto bad_cfg = td.write_file("bad.toml", "[copy\n");

    REQUIRE(run_with({"--help"}) == ExitOk);
    REQUIRE(run_with({"only-one"}) == ExitFailure);
    REQUIRE(run_with({"--config", (td.path / "missing.toml").string(),
                      (td.path / "src").string(), (td.path / "dst").string()}) == ExitFailure);
    REQUIRE(run_with({"--config", bad_cfg.string(),
                      (td.path / "src").string(), (td.path / "dst").string()}) == ExitFailure);
    REQUIRE(run_with({"--no-progress", (td.path / "absent").string(),
                      (td.path / "dst").string()}) == ExitFailure);
}
