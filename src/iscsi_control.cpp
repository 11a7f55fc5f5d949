#include "iscsi_control.hpp"
#include "utils.hpp"

#include <spdlog/spdlog.h>

#include <sstream>
#include <thread>

namespace iscsi_dev {

namespace {

const char* const ISCSIADM = "iscsiadm";
const char* const TGTADM = "tgtadm";
const char* const TGTD = "tgtd";

std::string trim(const std::string& line) {
    size_t begin = line.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = line.find_last_not_of(" \t\r");
    return line.substr(begin, end - begin + 1);
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

TgtIscsiControl::TgtIscsiControl(std::shared_ptr<CommandExecutor> target_executor,
                                 std::chrono::milliseconds retry_interval)
    : target_executor_(target_executor ? std::move(target_executor)
                                       : std::make_shared<LocalExecutor>())
    , retry_interval_(retry_interval) {
}

std::unique_ptr<CommandExecutor> TgtIscsiControl::open_namespace(const std::string& ns_dir) {
    return std::make_unique<NamespaceExecutor>(ns_dir);
}

void TgtIscsiControl::check_initiator(CommandExecutor& ne) {
    try {
        ne.execute(ISCSIADM, {"--version"});
    } catch (const CommandError& e) {
        throw PreconditionError("Cannot find iscsiadm: " + std::string(e.what()));
    }
}

std::string TgtIscsiControl::tgtadm(const std::vector<std::string>& args) {
    std::vector<std::string> full = {"--lld", "iscsi"};
    full.insert(full.end(), args.begin(), args.end());
    return target_executor_->execute(TGTADM, full);
}

bool TgtIscsiControl::daemon_running() {
    try {
        tgtadm({"--mode", "system", "--op", "show"});
        return true;
    } catch (const CommandError&) {
        return false;
    }
}

void TgtIscsiControl::start_daemon(bool force) {
    if (daemon_running()) {
        if (!force) {
            return;
        }
        spdlog::info("Stopping running {} before restart", TGTD);
        try {
            tgtadm({"--mode", "system", "--op", "delete"});
        } catch (const CommandError& e) {
            throw PreconditionError("Failed to stop " + std::string(TGTD) + ": " + e.what());
        }
    }

    // tgtd сам уходит в фон
    spdlog::info("Starting {}", TGTD);
    try {
        target_executor_->execute(TGTD, {});
    } catch (const CommandError& e) {
        throw PreconditionError("Failed to start " + std::string(TGTD) + ": " + e.what());
    }

    for (int i = 0; i < DAEMON_WAIT_RETRIES; ++i) {
        if (daemon_running()) {
            return;
        }
        std::this_thread::sleep_for(retry_interval_);
    }
    throw PreconditionError(std::string(TGTD) + " did not become ready");
}

void TgtIscsiControl::create_target(int tid, const std::string& name) {
    tgtadm({"--op", "new", "--mode", "target",
            "--tid", std::to_string(tid), "-T", name});
}

void TgtIscsiControl::delete_target(int tid) {
    tgtadm({"--op", "delete", "--mode", "target", "--tid", std::to_string(tid)});
}

void TgtIscsiControl::add_lun(int tid, int lun, const std::string& backing_store,
                              const std::string& bs_type, const std::string& bs_opts) {
    std::vector<std::string> args = {
        "--op", "new", "--mode", "logicalunit",
        "--tid", std::to_string(tid),
        "--lun", std::to_string(lun),
        "--backing-store", backing_store,
    };
    if (!bs_type.empty()) {
        args.push_back("--bstype");
        args.push_back(bs_type);
    }
    if (!bs_opts.empty()) {
        args.push_back("--bsopts");
        args.push_back(bs_opts);
    }
    tgtadm(args);
}

void TgtIscsiControl::delete_lun(int tid, int lun) {
    tgtadm({"--op", "delete", "--mode", "logicalunit",
            "--tid", std::to_string(tid), "--lun", std::to_string(lun)});
}

void TgtIscsiControl::bind_initiator(int tid, const std::string& initiator) {
    tgtadm({"--op", "bind", "--mode", "target",
            "--tid", std::to_string(tid), "-I", initiator});
}

void TgtIscsiControl::unbind_initiator(int tid, const std::string& initiator) {
    tgtadm({"--op", "unbind", "--mode", "target",
            "--tid", std::to_string(tid), "-I", initiator});
}

void TgtIscsiControl::discover_target(const std::string& ip, const std::string& target,
                                      CommandExecutor& ne) {
    std::string output = ne.execute(ISCSIADM, {"-m", "discovery", "-t", "sendtargets", "-p", ip});

    // Формат строки: 10.0.0.5:3260,1 iqn.2014-07.com.rancher:name
    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        std::istringstream fields(line);
        std::string portal, name;
        fields >> portal >> name;
        if (name == target) {
            return;
        }
    }
    throw IscsiError("Cannot discover target " + target + " at " + ip);
}

void TgtIscsiControl::delete_discovered_target(const std::string& ip, const std::string& target,
                                               CommandExecutor& ne) {
    ne.execute(ISCSIADM, {"-m", "node", "-o", "delete", "-T", target, "-p", ip});
}

void TgtIscsiControl::login_target(const std::string& ip, const std::string& target,
                                   CommandExecutor& ne) {
    ne.execute(ISCSIADM, {"-m", "node", "-T", target, "-p", ip, "--login"});
}

void TgtIscsiControl::logout_target(const std::string& ip, const std::string& target,
                                    CommandExecutor& ne) {
    ne.execute(ISCSIADM, {"-m", "node", "-T", target, "-p", ip, "--logout"});
}

std::string TgtIscsiControl::get_device(const std::string& ip, const std::string& target,
                                        int lun, CommandExecutor& ne) {
    for (int i = 0; i < DEVICE_WAIT_RETRIES; ++i) {
        std::string output = ne.execute(ISCSIADM, {"-m", "session", "-P", "3"});
        std::string device = parse_session_device(output, ip, target, lun);
        if (!device.empty()) {
            return device;
        }
        spdlog::debug("Waiting for device of {} lun {}", target, lun);
        std::this_thread::sleep_for(retry_interval_);
    }
    throw IscsiError("Cannot find device for " + target + " lun " +
                     std::to_string(lun) + " at " + ip);
}

std::string parse_session_device(const std::string& output, const std::string& ip,
                                 const std::string& target, int lun) {
    // Вывод "iscsiadm -m session -P 3":
    //   Target: <iqn> (non-flash)
    //       Current Portal: <ip>:3260,1
    //       ...
    //       scsi3 Channel 00 Id 0 Lun: 1
    //           Attached scsi disk sdb    State: running
    const std::string target_prefix = "Target: ";
    const std::string portal_prefix = "Current Portal: ";
    const std::string lun_marker = "Lun: ";
    const std::string disk_prefix = "Attached scsi disk ";

    bool target_found = false;
    bool portal_found = false;
    bool lun_found = false;

    std::istringstream iss(output);
    std::string raw;
    while (std::getline(iss, raw)) {
        std::string line = trim(raw);

        if (starts_with(line, target_prefix)) {
            std::istringstream fields(line.substr(target_prefix.size()));
            std::string name;
            fields >> name;
            target_found = (name == target);
            portal_found = false;
            lun_found = false;
            continue;
        }
        if (!target_found) {
            continue;
        }

        if (starts_with(line, portal_prefix)) {
            portal_found = starts_with(line.substr(portal_prefix.size()), ip + ":");
            continue;
        }
        if (!portal_found) {
            continue;
        }

        size_t pos = line.find(lun_marker);
        if (starts_with(line, "scsi") && pos != std::string::npos) {
            std::istringstream fields(line.substr(pos + lun_marker.size()));
            int value = -1;
            fields >> value;
            lun_found = !fields.fail() && value == lun;
            continue;
        }

        if (lun_found && starts_with(line, disk_prefix)) {
            std::istringstream fields(line.substr(disk_prefix.size()));
            std::string disk;
            fields >> disk;
            if (!disk.empty()) {
                return "/dev/" + disk;
            }
        }
    }

    return "";
}

} // namespace iscsi_dev
