#include "scsi_device.hpp"
#include "iscsi_control.hpp"
#include "utils.hpp"

#include <spdlog/spdlog.h>

namespace iscsi_dev {

ScsiDevice::ScsiDevice(const std::string& name, const std::string& backing_file,
                       const std::string& bs_type, const std::string& bs_opts,
                       std::shared_ptr<IscsiControl> iscsi,
                       const AddressResolver& resolver)
    : iscsi_(iscsi ? std::move(iscsi) : std::make_shared<TgtIscsiControl>())
    , target_(TARGET_PREFIX + name)
    , target_id_(TARGET_ID)
    , lun_id_(LUN_ID)
    , backing_file_(backing_file)
    , bs_type_(bs_type)
    , bs_opts_(bs_opts)
    , namespace_dir_(HOST_NAMESPACE) {

    std::vector<std::string> ips = resolver ? resolver() : get_local_ips();
    if (ips.empty()) {
        throw ResolutionError("No local IP address available for portal of " + target_);
    }
    portal_ = ips.front();
}

ScsiDevice::~ScsiDevice() = default;

void ScsiDevice::startup() {
    // 1. Команды initiator выполняются в namespace хоста
    auto ne = iscsi_->open_namespace(namespace_dir_);

    iscsi_->check_initiator(*ne);

    // 2. Target
    spdlog::debug("Creating target {} (tid {})", target_, target_id_);
    iscsi_->start_daemon(false);
    iscsi_->create_target(target_id_, target_);
    iscsi_->add_lun(target_id_, lun_id_, backing_file_, bs_type_, bs_opts_);
    iscsi_->bind_initiator(target_id_, ALL_INITIATORS);

    // 3. Initiator
    spdlog::debug("Logging in to {} at {}", target_, portal_);
    iscsi_->discover_target(portal_, target_, *ne);
    iscsi_->login_target(portal_, target_, *ne);
    device_ = iscsi_->get_device(portal_, target_, lun_id_, *ne);

    spdlog::info("Target {} attached as {}", target_, device_);
}

void ScsiDevice::shutdown() {
    if (device_.empty()) {
        throw AlreadyDownError("SCSI device " + target_ + " is already down");
    }

    auto ne = iscsi_->open_namespace(namespace_dir_);

    iscsi_->check_initiator(*ne);

    // 1. Initiator
    spdlog::debug("Logging out of {} at {}", target_, portal_);
    iscsi_->logout_target(portal_, target_, *ne);
    std::string detached = device_;
    device_.clear();
    iscsi_->delete_discovered_target(portal_, target_, *ne);

    // 2. Target
    spdlog::debug("Deleting target {} (tid {})", target_, target_id_);
    iscsi_->unbind_initiator(target_id_, ALL_INITIATORS);
    iscsi_->delete_lun(target_id_, lun_id_);
    iscsi_->delete_target(target_id_);

    spdlog::info("Target {} detached from {}", target_, detached);
}

void ScsiDevice::reattach() {
    auto ne = iscsi_->open_namespace(namespace_dir_);

    iscsi_->check_initiator(*ne);
    device_ = iscsi_->get_device(portal_, target_, lun_id_, *ne);

    spdlog::info("Target {} found attached as {}", target_, device_);
}

} // namespace iscsi_dev
