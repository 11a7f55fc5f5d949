#include "command_executor.hpp"
#include "utils.hpp"

namespace iscsi_dev {

std::string LocalExecutor::execute(const std::string& program,
                                   const std::vector<std::string>& args) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(program);
    argv.insert(argv.end(), args.begin(), args.end());

    return execute_command_output(argv);
}

NamespaceExecutor::NamespaceExecutor(const std::string& ns_dir) : ns_dir_(ns_dir) {
    if (ns_dir_.empty()) {
        throw PreconditionError("Namespace directory is not set");
    }
    if (ns_dir_.back() != '/') {
        ns_dir_ += '/';
    }

    if (!directory_exists(ns_dir_)) {
        throw PreconditionError("Namespace directory " + ns_dir_ + " does not exist");
    }
}

std::vector<std::string> NamespaceExecutor::build_command(
        const std::string& program, const std::vector<std::string>& args) const {
    // nsenter --mount=<ns>/mnt --net=<ns>/net <program> <args...>
    std::vector<std::string> argv = {
        "nsenter",
        "--mount=" + ns_dir_ + "mnt",
        "--net=" + ns_dir_ + "net",
        program,
    };
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
}

std::string NamespaceExecutor::execute(const std::string& program,
                                       const std::vector<std::string>& args) {
    return execute_command_output(build_command(program, args));
}

} // namespace iscsi_dev
