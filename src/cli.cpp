#include "cli.hpp"
#include "cdi/apply.hpp"
#include "cdi/hooks.hpp"
#include "cdi/path_resolver.hpp"
#include "config.hpp"
#include "defs.hpp"
#include "log.hpp"
#include "utils.hpp"

#include <unistd.h>
#include <cstdio>
#include <cstdlib>

namespace cdihook {

void CliParser::add_option(const CliOption& opt) {
    options_.push_back(opt);
}

const CliOption* CliParser::find_long(const std::string& name) const {
    for (const auto& opt : options_) {
        if (opt.long_name == name)
            return &opt;
    }
    return nullptr;
}

const CliOption* CliParser::find_short(char name) const {
    for (const auto& opt : options_) {
        if (opt.short_name != '\0' && opt.short_name == name)
            return &opt;
    }
    return nullptr;
}

bool CliParser::parse(int argc, char* argv[]) {
    bool options_done = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg.empty())
            continue;

        if (!options_done && arg == "--") {
            options_done = true;
            continue;
        }

        if (!options_done && arg.size() > 1 && arg[0] == '-') {
            const CliOption* opt = nullptr;
            std::string opt_value;
            bool has_inline_value = false;

            // Long option
            if (arg[1] == '-') {
                std::string long_opt = arg.substr(2);
                size_t eq_pos = long_opt.find('=');
                if (eq_pos != std::string::npos) {
                    opt_value = long_opt.substr(eq_pos + 1);
                    long_opt = long_opt.substr(0, eq_pos);
                    has_inline_value = true;
                }
                opt = find_long(long_opt);
            }
            // Short option
            else if (arg.size() == 2) {
                opt = find_short(arg[1]);
            }

            if (!opt) {
                LOGE("Unknown option: %s", arg.c_str());
                return false;
            }

            if (opt->takes_value) {
                if (!has_inline_value) {
                    if (i + 1 >= argc) {
                        LOGE("Option --%s needs a value", opt->long_name.c_str());
                        return false;
                    }
                    opt_value = argv[++i];
                }
                parsed_options_[opt->long_name] = opt_value;
            } else {
                parsed_options_[opt->long_name] = "true";
            }
            continue;
        }

        // Positional argument
        if (subcommand_.empty()) {
            subcommand_ = arg;
        } else {
            positional_args_.push_back(arg);
        }
    }

    return true;
}

std::optional<std::string> CliParser::get_option(const std::string& name) const {
    auto it = parsed_options_.find(name);
    if (it != parsed_options_.end()) {
        return it->second;
    }

    // Return default value if exists
    const CliOption* opt = find_long(name);
    if (opt && !opt->default_value.empty()) {
        return opt->default_value;
    }

    return std::nullopt;
}

bool CliParser::has_option(const std::string& name) const {
    return parsed_options_.find(name) != parsed_options_.end();
}

static void print_usage() {
    printf("Applies CDI hooks to a container root filesystem\n\n");
    printf("USAGE: cdi-hook [OPTIONS] <COMMAND>\n\n");
    printf("COMMANDS:\n");
    printf("  apply <HOOKS_FILE>      Create symlinks and update the linker cache\n");
    printf("  resolve <LINK> <TARGET> Print TARGET relative to LINK's directory\n");
    printf("  devices <FILE>          Show a CDI config devices file\n");
    printf("  help                    Show this help\n");
    printf("  version                 Show version\n\n");
    printf("OPTIONS:\n");
    printf("  -r, --rootfs <DIR>      Container rootfs (default: $%s)\n", LXC_ROOTFS_MOUNT_ENV);
    printf("  -c, --config <FILE>     Config file (default: %s if present)\n",
           DEFAULT_CONFIG_PATH);
    printf("  -d, --dir <DIR>         Directory holding the hooks file\n");
    printf("  -n, --device <NAME>     Device name, used with --dir instead of HOOKS_FILE\n");
    printf("  -v, --verbose           Enable debug logging\n");
}

static void print_version() {
    printf("cdi-hook version %s (code: %d)\n", CDIHOOK_VERSION, CDIHOOK_VERSION_CODE);
}

static bool load_config(const CliParser& parser, HookConfig& config) {
    auto path = parser.get_option("config");
    std::string config_path = path ? *path : DEFAULT_CONFIG_PATH;

    if (!path && access(config_path.c_str(), F_OK) != 0) {
        LOGD("No config file at %s, using defaults", config_path.c_str());
        return true;
    }

    if (auto err = load_hook_config(config_path, config)) {
        LOGE("%s: %s", error_kind_name(err->kind), err->to_string().c_str());
        return false;
    }

    return true;
}

static int cmd_apply(const CliParser& parser, const HookConfig& config) {
    const auto& args = parser.positional();

    std::string hooks_file;
    auto dir = parser.get_option("dir");
    auto device = parser.get_option("device");
    if (!args.empty()) {
        hooks_file = args[0];
    } else if (dir && device) {
        hooks_file = join_path(*dir, hooks_file_name(config, *device));
    } else {
        printf("USAGE: cdi-hook apply [--rootfs DIR] <HOOKS_FILE>\n");
        printf("       cdi-hook apply [--rootfs DIR] --dir DIR --device NAME\n");
        return 1;
    }

    std::string rootfs;
    if (auto opt = parser.get_option("rootfs")) {
        rootfs = *opt;
    } else if (const char* env = getenv(LXC_ROOTFS_MOUNT_ENV)) {
        rootfs = env;
    }
    if (rootfs.empty()) {
        LOGE("No container rootfs given and %s is not set", LXC_ROOTFS_MOUNT_ENV);
        return 1;
    }

    HostCommandRunner runner;
    if (auto err = apply_hooks_to_container(hooks_file, rootfs, config, runner)) {
        LOGE("%s: %s", error_kind_name(err->kind), err->to_string().c_str());
        return 1;
    }

    return 0;
}

static int cmd_resolve(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        printf("USAGE: cdi-hook resolve <LINK> <TARGET>\n");
        return 1;
    }

    std::string target;
    if (auto err = resolve_target_relative_to_link(args[0], args[1], target)) {
        LOGE("%s: %s", error_kind_name(err->kind), err->to_string().c_str());
        return 1;
    }

    printf("%s\n", target.c_str());
    return 0;
}

static void print_string_maps(const char* name,
                              const std::vector<std::map<std::string, std::string>>& maps) {
    printf("%s:\n", name);
    for (const auto& entry : maps) {
        const char* sep = "  - ";
        for (const auto& [key, value] : entry) {
            printf("%s%s: %s\n", sep, key.c_str(), value.c_str());
            sep = "    ";
        }
        if (entry.empty()) {
            printf("  - {}\n");
        }
    }
}

static int cmd_devices(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        printf("USAGE: cdi-hook devices <FILE>\n");
        return 1;
    }

    ConfigDevices devices;
    if (auto err = load_config_devices(args[0], devices)) {
        LOGE("%s: %s", error_kind_name(err->kind), err->to_string().c_str());
        return 1;
    }

    print_string_maps("unix_char_devs", devices.unix_char_devs);
    print_string_maps("bind_mounts", devices.bind_mounts);
    return 0;
}

int cli_run(int argc, char* argv[]) {
    log_init("cdi-hook");

    CliParser parser;
    parser.add_option({"rootfs", 'r', "Container rootfs", true, ""});
    parser.add_option({"config", 'c', "Config file", true, ""});
    parser.add_option({"dir", 'd', "Directory holding the hooks file", true, ""});
    parser.add_option({"device", 'n', "Device name", true, ""});
    parser.add_option({"verbose", 'v', "Enable debug logging", false, ""});
    parser.add_option({"help", 'h', "Show help", false, ""});

    if (!parser.parse(argc, argv)) {
        print_usage();
        return 1;
    }

    const std::string& cmd = parser.subcommand();
    if (cmd == "help" || parser.has_option("help")) {
        print_usage();
        return 0;
    }
    if (cmd.empty()) {
        print_usage();
        return 1;
    }
    if (cmd == "version") {
        print_version();
        return 0;
    }

    bool verbose = parser.has_option("verbose");
    log_set_level(verbose ? LogLevel::DEBUG : LogLevel::INFO);

    if (cmd == "apply") {
        // Only apply reads the config file
        HookConfig config;
        if (!load_config(parser, config)) {
            return 1;
        }
        if (!verbose) {
            log_set_level(config.log_level);
        }
        return cmd_apply(parser, config);
    } else if (cmd == "resolve") {
        return cmd_resolve(parser.positional());
    } else if (cmd == "devices") {
        return cmd_devices(parser.positional());
    }

    LOGE("Unknown command: %s", cmd.c_str());
    print_usage();
    return 1;
}

}  // namespace cdihook
