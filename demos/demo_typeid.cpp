// demo_typeid.cpp
//
// A small standalone program that exercises TypeId, Config and the logger.
// Run it with:
//
//     ./demo_typeid                                   # generate one id, no prefix
//     ./demo_typeid --config tid.toml                 # use [typeid] default-prefix
//     ./demo_typeid user_01h455vb4pex5vsknk084sn02q   # parse and show the UUID
//     ./demo_typeid User_01h455vb4pex5vsknk084sn02q   # InvalidPrefix error
//
// Each argument that is not an option is parsed as a TypeID.

#include <tid/config.hpp>
#include <tid/log.hpp>
#include <tid/typeid.hpp>
#include <tid/typed_id.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace tid;

namespace {

struct UserTag { static constexpr const char* prefix = "user"; };
using UserId = TypedId<UserTag>;

struct Args {
    std::optional<std::string> config_path;
    std::vector<std::string> ids;
};

Result<Args> parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--config") {
            if (i + 1 >= argc) {
                return TidError{TidError::Config,
                    "--config requires a path",
                    "usage: demo_typeid [--config <file.toml>] [typeid...]"};
            }
            args.config_path = argv[++i];
        } else {
            args.ids.push_back(a);
        }
    }
    return Result<Args>::ok(std::move(args));
}

Result<Config> load_config(const Args& args) {
    std::optional<Config> global;
    std::string gpath = global_config_path();
    if (!gpath.empty()) {
        auto g = Config::load(gpath);
        if (g.is_ok()) {
            global = std::move(g).value();
        } else if (g.error().code != TidError::IO) {
            return std::move(g).error();
        }
    }

    std::optional<Config> local;
    if (args.config_path) {
        TID_TRY_ASSIGN(cfg, Config::load(*args.config_path));
        local = std::move(cfg);
    }
    return Result<Config>::ok(Config::effective(global, local));
}

void show(const TypeId& id) {
    std::cout << id << "\n"
              << "  prefix: " << (id.has_prefix() ? id.prefix() : "(none)") << "\n"
              << "  suffix: " << id.suffix() << "\n"
              << "  uuid:   " << id.to_uuid_string() << "\n";
    Uuid u = id.to_uuid();
    if (u.version() == 7) {
        std::cout << "  time:   " << u.timestamp_ms() << " ms since epoch\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    if (args.is_err()) {
        std::cerr << args.error().format() << "\n";
        return 2;
    }

    auto cfg = load_config(args.value());
    if (cfg.is_err()) {
        std::cerr << cfg.error().format() << "\n";
        return 1;
    }
    cfg.value().apply_logging();

    if (args.value().ids.empty()) {
        const std::string& prefix = cfg.value().default_prefix;
        auto id = TypeId::generate(prefix);
        if (id.is_err()) {
            std::cerr << id.error().format() << "\n";
            return 1;
        }
        show(id.value());

        auto user = UserId::generate();
        if (user.is_ok()) {
            log::info("typed id example: %s", user.value().to_string().c_str());
        }
        return 0;
    }

    int status = 0;
    for (const auto& text : args.value().ids) {
        auto id = TypeId::from_string(text);
        if (id.is_err()) {
            std::cerr << id.error().format() << "\n";
            status = 1;
            continue;
        }
        if (!cfg.value().allows(id.value().prefix())) {
            log::warn("prefix '%s' is not in the configured allow-list",
                      id.value().prefix().c_str());
        }
        show(id.value());
    }
    return status;
}
