#include <catch2/catch.hpp>
#include <tid/log.hpp>
#include <cstdio>
#include <functional>
#include <string>

using namespace tid::log;

// Helper: capture log output from a callable
static std::string capture(const std::function<void()>& fn) {
    std::FILE* tmp = std::tmpfile();
    REQUIRE(tmp != nullptr);
    set_output(tmp);
    fn();
    set_output(nullptr);

    std::fflush(tmp);
    std::rewind(tmp);
    std::string output;
    char buf[512];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), tmp)) > 0) {
        output.append(buf, n);
    }
    std::fclose(tmp);
    return output;
}

TEST_CASE("set_level / get_level roundtrip", "[log]") {
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        set_level(lvl);
        REQUIRE(get_level() == lvl);
    }
    set_level(Info);
}

TEST_CASE("level_name and parse_level agree", "[log]") {
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        auto r = parse_level(level_name(lvl));
        REQUIRE(r.is_ok());
        REQUIRE(r.value() == lvl);
    }
    REQUIRE(std::string(level_name(Warn)) == "warn");
}

TEST_CASE("parse_level rejects unknown names", "[log]") {
    auto r = parse_level("verbose");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == tid::TidError::Config);

    REQUIRE(parse_level("INFO").is_err());
}

TEST_CASE("set_color_enabled / is_color_enabled", "[log]") {
    set_color_enabled(true);
    REQUIRE(is_color_enabled());
    set_color_enabled(false);
    REQUIRE_FALSE(is_color_enabled());
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    set_color_enabled(false);
    auto output = capture([] { info("should not appear"); });
    REQUIRE(output.empty());
    set_level(Info);
}

TEST_CASE("Messages at or above threshold are emitted", "[log]") {
    set_level(Warn);
    set_color_enabled(false);
    auto output = capture([] {
        warn("this is a warning");
        error("this is an error");
    });
    REQUIRE(output == "warn: this is a warning\nerror: this is an error\n");
    set_level(Info);
}

TEST_CASE("Colored output wraps the level name", "[log]") {
    set_level(Info);
    set_color_enabled(true);
    auto output = capture([] { info("hello"); });
    REQUIRE(output == "\033[32minfo\033[0m: hello\n");
    set_color_enabled(false);
}

TEST_CASE("Format string substitution", "[log]") {
    set_level(Info);
    set_color_enabled(false);
    auto output = capture([] { info("value: %d, name: %s", 42, "test"); });
    REQUIRE(output == "info: value: 42, name: test\n");
}
