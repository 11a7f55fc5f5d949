#include "scsi_device.hpp"
#include "device_node.hpp"
#include "utils.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>

#include <iostream>
#include <map>
#include <string>
#include <vector>

using namespace iscsi_dev;

namespace {

/**
 * @brief Разобранная командная строка
 */
struct Options {
    std::vector<std::string> args;             ///< Позиционные аргументы
    std::map<std::string, std::string> flags;   ///< --flag value
    bool verbose = false;
};

// Флаги, принимающие значение
const char* const VALUE_FLAGS[] = {"--bs-type", "--bs-opts", "--link", "--ns"};

bool takes_value(const std::string& flag) {
    for (const char* name : VALUE_FLAGS) {
        if (flag == name) {
            return true;
        }
    }
    return false;
}

Options parse_options(int argc, char* argv[]) {
    Options opts;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (takes_value(arg)) {
            if (i + 1 >= argc) {
                throw IscsiError("Missing value for " + arg);
            }
            opts.flags[arg] = argv[++i];
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw IscsiError("Unknown option " + arg);
        } else {
            opts.args.push_back(arg);
        }
    }
    return opts;
}

std::string flag(const Options& opts, const std::string& name) {
    auto it = opts.flags.find(name);
    return it == opts.flags.end() ? std::string() : it->second;
}

void apply_namespace(const Options& opts, ScsiDevice& dev) {
    std::string ns = flag(opts, "--ns");
    if (!ns.empty()) {
        dev.set_namespace_dir(ns);
    }
}

} // namespace

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [arguments] [options]\n"
              << "\n"
              << "Commands:\n"
              << "  start <name> <backing-file>  Export a file over iSCSI and attach it locally\n"
              << "  stop <name>                  Detach the device and delete its target\n"
              << "  duplicate <src> <dest>       Create a block node with the major:minor of src\n"
              << "  remove <path>                Remove a device node (30s timeout)\n"
              << "\n"
              << "Options:\n"
              << "  --bs-type <type>   Backing store type (start)\n"
              << "  --bs-opts <opts>   Backing store options (start)\n"
              << "  --link <path>      Expose the attached device at <path> (start, stop)\n"
              << "  --ns <dir>         Namespace directory for iscsiadm (default "
              << ScsiDevice::HOST_NAMESPACE << ")\n"
              << "  -v, --verbose      Debug logging (or set SPDLOG_LEVEL)\n"
              << "\n"
              << "Examples:\n"
              << "  " << program_name << " start vol1 /var/lib/vol1.img --link /dev/longhorn/vol1\n"
              << "  " << program_name << " stop vol1 --link /dev/longhorn/vol1\n"
              << "  " << program_name << " duplicate /dev/sdb /dev/longhorn/vol1\n"
              << "  " << program_name << " remove /dev/longhorn/vol1\n";
}

int cmd_start(const char* program_name, const Options& opts) {
    if (opts.args.size() < 2) {
        std::cerr << "Error: Missing device name or backing file\n";
        std::cerr << "Usage: " << program_name << " start <name> <backing-file>\n";
        return 1;
    }

    const std::string& name = opts.args[0];
    ScsiDevice dev(name, opts.args[1], flag(opts, "--bs-type"), flag(opts, "--bs-opts"));
    apply_namespace(opts, dev);

    std::cout << "Starting '" << name << "' (" << dev.target() << " at " << dev.portal() << ")...\n";
    dev.startup();
    std::cout << "Device '" << name << "' attached as " << dev.device() << "\n";

    std::string link = flag(opts, "--link");
    if (!link.empty()) {
        remove_device(link);
        duplicate_device(dev.device(), link);
        std::cout << "  Exposed at " << link << "\n";
    }

    return 0;
}

int cmd_stop(const char* program_name, const Options& opts) {
    if (opts.args.empty()) {
        std::cerr << "Error: Missing device name\n";
        std::cerr << "Usage: " << program_name << " stop <name>\n";
        return 1;
    }

    const std::string& name = opts.args[0];

    std::string link = flag(opts, "--link");
    if (!link.empty()) {
        remove_device(link);
    }

    // Имя backing store для shutdown не требуется
    ScsiDevice dev(name, "", "", "");
    apply_namespace(opts, dev);

    std::cout << "Stopping '" << name << "'...\n";
    dev.reattach();
    dev.shutdown();
    std::cout << "Device '" << name << "' stopped.\n";

    return 0;
}

int cmd_duplicate(const char* program_name, const Options& opts) {
    if (opts.args.size() < 2) {
        std::cerr << "Error: Missing source or destination\n";
        std::cerr << "Usage: " << program_name << " duplicate <src> <dest>\n";
        return 1;
    }

    duplicate_device(opts.args[0], opts.args[1]);
    std::cout << "Created " << opts.args[1] << " from " << opts.args[0] << "\n";
    return 0;
}

int cmd_remove(const char* program_name, const Options& opts) {
    if (opts.args.empty()) {
        std::cerr << "Error: Missing path\n";
        std::cerr << "Usage: " << program_name << " remove <path>\n";
        return 1;
    }

    remove_device(opts.args[0]);
    std::cout << "Removed " << opts.args[0] << "\n";
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];

    if (command == "-h" || command == "--help" || command == "help") {
        print_usage(argv[0]);
        return 0;
    }

    if (command != "start" && command != "stop" &&
        command != "duplicate" && command != "remove") {
        std::cerr << "Error: Unknown command '" << command << "'\n\n";
        print_usage(argv[0]);
        return 1;
    }

    spdlog::cfg::load_env_levels();

    try {
        Options opts = parse_options(argc, argv);
        if (opts.verbose) {
            spdlog::set_level(spdlog::level::debug);
        }

        if (!is_root()) {
            throw PreconditionError("This operation requires root privileges");
        }

        if (command == "start") {
            return cmd_start(argv[0], opts);
        } else if (command == "stop") {
            return cmd_stop(argv[0], opts);
        } else if (command == "duplicate") {
            return cmd_duplicate(argv[0], opts);
        }
        return cmd_remove(argv[0], opts);
    } catch (const IscsiError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
