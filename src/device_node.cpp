#include "device_node.hpp"
#include "utils.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <exception>
#include <future>
#include <memory>
#include <thread>
#include <unistd.h>
#include <sys/stat.h>

namespace iscsi_dev {

std::pair<unsigned, unsigned> split_device_number(uint64_t rdev) {
    return {static_cast<unsigned>(rdev / 256), static_cast<unsigned>(rdev % 256)};
}

uint64_t encode_device_number(unsigned major, unsigned minor) {
    return (static_cast<uint64_t>(major) << 8) |
           (minor & 0xff) |
           (static_cast<uint64_t>(minor & 0xfff00) << 12);
}

void make_block_node(const std::string& path, unsigned major, unsigned minor) {
    mode_t mode = S_IFBLK | 0600;

    spdlog::info("Creating device {} {}:{}", path, major, minor);
    if (mknod(path.c_str(), mode, static_cast<dev_t>(encode_device_number(major, minor))) != 0) {
        throw_os_error("Failed to create device " + path);
    }
}

void duplicate_device(const std::string& src, const std::string& dest) {
    struct stat st;
    if (stat(src.c_str(), &st) != 0) {
        throw_os_error("Failed to stat " + src);
    }

    auto [major, minor] = split_device_number(st.st_rdev);
    make_block_node(dest, major, minor);
}

void unlink_path(const std::string& path) {
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
        throw_os_error("Failed to remove " + path);
    }
}

void remove_device(const std::string& path, std::chrono::milliseconds timeout,
                   const RemoveFunc& remover) {
    if (!path_exists(path)) {
        return;
    }

    // Поток не отменяется по таймауту и может пережить вызов,
    // поэтому всё нужное ему передаётся по значению
    auto done = std::make_shared<std::promise<void>>();
    std::future<void> result = done->get_future();

    std::thread([path, remover, done]() {
        try {
            remover(path);
            done->set_value();
        } catch (const std::exception& e) {
            spdlog::error("Unable to remove: {}: {}", path, e.what());
            done->set_exception(std::current_exception());
        }
    }).detach();

    if (result.wait_for(timeout) == std::future_status::timeout) {
        spdlog::warn("Removal of {} did not finish in {} ms", path, timeout.count());
        throw TimeoutError("Timeout trying to delete " + path, path);
    }

    try {
        result.get();
    } catch (const OsError& e) {
        throw OsError("Failed to remove device " + path, e.code());
    }
}

} // namespace iscsi_dev
