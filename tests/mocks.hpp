#ifndef ISCSI_DEV_TESTS_MOCKS_HPP
#define ISCSI_DEV_TESTS_MOCKS_HPP

#include "command_executor.hpp"
#include "iscsi_control.hpp"

#include <gmock/gmock.h>

namespace iscsi_dev {

class MockCommandExecutor : public CommandExecutor {
public:
    MOCK_METHOD(std::string, execute, (const std::string&, const std::vector<std::string>&), (override));
};

class MockIscsiControl : public IscsiControl {
public:
    MOCK_METHOD(std::unique_ptr<CommandExecutor>, open_namespace, (const std::string&), (override));
    MOCK_METHOD(void, check_initiator, (CommandExecutor&), (override));
    MOCK_METHOD(void, start_daemon, (bool), (override));
    MOCK_METHOD(void, create_target, (int, const std::string&), (override));
    MOCK_METHOD(void, delete_target, (int), (override));
    MOCK_METHOD(void, add_lun, (int, int, const std::string&, const std::string&, const std::string&), (override));
    MOCK_METHOD(void, delete_lun, (int, int), (override));
    MOCK_METHOD(void, bind_initiator, (int, const std::string&), (override));
    MOCK_METHOD(void, unbind_initiator, (int, const std::string&), (override));
    MOCK_METHOD(void, discover_target, (const std::string&, const std::string&, CommandExecutor&), (override));
    MOCK_METHOD(void, delete_discovered_target, (const std::string&, const std::string&, CommandExecutor&), (override));
    MOCK_METHOD(void, login_target, (const std::string&, const std::string&, CommandExecutor&), (override));
    MOCK_METHOD(void, logout_target, (const std::string&, const std::string&, CommandExecutor&), (override));
    MOCK_METHOD(std::string, get_device, (const std::string&, const std::string&, int, CommandExecutor&), (override));
};

} // namespace iscsi_dev

#endif // ISCSI_DEV_TESTS_MOCKS_HPP
