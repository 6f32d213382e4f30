#include <catch2/catch.hpp>
#include <tid/config.hpp>
#include <cstdio>
#include <fstream>
#include <string>

using namespace tid;

// ===== Parsing =====

TEST_CASE("parse config with log section", "[config]") {
    auto r = Config::parse(R"(
[log]
level = "debug"
color = true
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().log_level == log::Debug);
    REQUIRE(r.value().log_level_set);
    REQUIRE(r.value().log_color);
}

TEST_CASE("parse config with typeid section", "[config]") {
    auto r = Config::parse(R"(
[typeid]
default-prefix = "user"
prefixes = ["user", "org"]
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().default_prefix == "user");
    REQUIRE(r.value().prefixes.size() == 2);
    REQUIRE(r.value().allows("org"));
    REQUIRE_FALSE(r.value().allows("team"));
}

TEST_CASE("parse empty config", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().log_level == log::Info);
    REQUIRE(r.value().default_prefix.empty());
    REQUIRE(r.value().allows("anything"));
}

TEST_CASE("parse invalid TOML config", "[config]") {
    auto r = Config::parse("not valid [toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TidError::Parse);
}

TEST_CASE("parse rejects unknown log level", "[config]") {
    auto r = Config::parse("[log]\nlevel = \"loud\"\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TidError::Config);
}

TEST_CASE("parse rejects invalid prefixes", "[config]") {
    auto r = Config::parse("[typeid]\ndefault-prefix = \"User\"\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TidError::Config);

    auto list = Config::parse("[typeid]\nprefixes = [\"ok\", \"not_ok\"]\n");
    REQUIRE(list.is_err());
    REQUIRE(list.error().code == TidError::Config);

    auto mixed = Config::parse("[typeid]\nprefixes = [\"ok\", 3]\n");
    REQUIRE(mixed.is_err());
    REQUIRE(mixed.error().code == TidError::Config);
}

TEST_CASE("parse rejects keys of the wrong type", "[config]") {
    for (const char* text : {
             "[log]\nlevel = 5\n",
             "[log]\ncolor = \"yes\"\n",
             "[typeid]\ndefault-prefix = 3\n",
             "[typeid]\nprefixes = \"user\"\n"}) {
        INFO(text);
        auto r = Config::parse(text);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == TidError::Config);
    }

    auto r = Config::parse("[log]\ncolor = 1\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message == "[log] color must be a boolean");
}

TEST_CASE("parse rejects default prefix outside the allow-list", "[config]") {
    auto r = Config::parse(R"(
[typeid]
default-prefix = "team"
prefixes = ["user", "org"]
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TidError::Config);
}

// ===== Merge =====

TEST_CASE("merge overrides only explicitly set fields", "[config]") {
    auto global = Config::parse(R"(
[log]
level = "warn"
color = true

[typeid]
default-prefix = "user"
)").value();
    auto local = Config::parse(R"(
[log]
level = "trace"
)").value();

    auto eff = Config::effective(global, local);
    REQUIRE(eff.log_level == log::Trace);
    REQUIRE(eff.log_color);
    REQUIRE(eff.default_prefix == "user");
}

TEST_CASE("effective with no layers is the default config", "[config]") {
    auto eff = Config::effective(std::nullopt, std::nullopt);
    REQUIRE(eff.log_level == log::Info);
    REQUIRE(eff.prefixes.empty());
}

TEST_CASE("apply_logging sets the process log level", "[config]") {
    auto cfg = Config::parse("[log]\nlevel = \"error\"\ncolor = false\n").value();
    cfg.apply_logging();
    REQUIRE(log::get_level() == log::Error);
    REQUIRE_FALSE(log::is_color_enabled());
    log::set_level(log::Info);
}

// ===== Files =====

TEST_CASE("load reads a config file", "[config]") {
    std::string path = "tid_test_config.toml";
    {
        std::ofstream out(path);
        out << "[typeid]\ndefault-prefix = \"org\"\n";
    }
    auto r = Config::load(path);
    std::remove(path.c_str());
    REQUIRE(r.is_ok());
    REQUIRE(r.value().default_prefix == "org");
}

TEST_CASE("load reports missing files and tags parse errors with the path", "[config]") {
    auto missing = Config::load("definitely/not/here.toml");
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == TidError::IO);

    std::string path = "tid_test_bad_config.toml";
    {
        std::ofstream out(path);
        out << "[log\n";
    }
    auto bad = Config::load(path);
    std::remove(path.c_str());
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == TidError::Parse);
    REQUIRE(bad.error().file == path);
}

TEST_CASE("global_config_path lives under HOME", "[config]") {
    auto p = global_config_path();
    if (!p.empty()) {
        REQUIRE(p.find("/.tid/config.toml") != std::string::npos);
    }
}
