#ifndef ISCSI_DEV_ISCSI_CONTROL_HPP
#define ISCSI_DEV_ISCSI_CONTROL_HPP

#include "command_executor.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace iscsi_dev {

/**
 * @brief Управление iSCSI target (tgtd) и initiator (open-iscsi)
 *
 * Операции initiator выполняются через переданный исполнитель,
 * обычно привязанный к namespace хоста. Все ошибки пробрасываются
 * вызывающему без преобразования.
 */
class IscsiControl {
public:
    virtual ~IscsiControl() = default;

    /**
     * @brief Создаёт исполнитель, работающий в namespace другого процесса
     * @param ns_dir Каталог с файлами namespace
     * @throws PreconditionError если namespace недоступен
     */
    virtual std::unique_ptr<CommandExecutor> open_namespace(const std::string& ns_dir) = 0;

    /**
     * @brief Проверяет наличие iscsiadm
     * @throws PreconditionError если initiator недоступен
     */
    virtual void check_initiator(CommandExecutor& ne) = 0;

    /**
     * @brief Запускает tgtd
     * @param force Перезапустить, даже если демон уже работает
     * @throws PreconditionError если демон не удалось запустить
     */
    virtual void start_daemon(bool force) = 0;

    virtual void create_target(int tid, const std::string& name) = 0;
    virtual void delete_target(int tid) = 0;

    /**
     * @brief Добавляет LUN к target
     * @param backing_store Файл или блочное устройство с данными
     * @param bs_type Тип backing store (пустая строка - по умолчанию tgtd)
     * @param bs_opts Опции backing store, передаются как есть
     */
    virtual void add_lun(int tid, int lun, const std::string& backing_store,
                         const std::string& bs_type, const std::string& bs_opts) = 0;
    virtual void delete_lun(int tid, int lun) = 0;

    virtual void bind_initiator(int tid, const std::string& initiator) = 0;
    virtual void unbind_initiator(int tid, const std::string& initiator) = 0;

    virtual void discover_target(const std::string& ip, const std::string& target,
                                 CommandExecutor& ne) = 0;
    virtual void delete_discovered_target(const std::string& ip, const std::string& target,
                                          CommandExecutor& ne) = 0;

    virtual void login_target(const std::string& ip, const std::string& target,
                              CommandExecutor& ne) = 0;
    virtual void logout_target(const std::string& ip, const std::string& target,
                               CommandExecutor& ne) = 0;

    /**
     * @brief Возвращает локальное блочное устройство подключённого LUN
     * @return Путь вида /dev/sdX
     * @throws IscsiError если устройство так и не появилось
     */
    virtual std::string get_device(const std::string& ip, const std::string& target,
                                   int lun, CommandExecutor& ne) = 0;
};

/**
 * @brief Реализация через утилиты tgtadm и iscsiadm
 */
class TgtIscsiControl : public IscsiControl {
public:
    /// Сколько раз опрашивать сессию в ожидании диска
    static constexpr int DEVICE_WAIT_RETRIES = 5;

    /// Сколько раз опрашивать tgtd после запуска
    static constexpr int DAEMON_WAIT_RETRIES = 10;

    /// Пауза между попытками
    static constexpr std::chrono::milliseconds RETRY_INTERVAL{1000};

    /**
     * @brief Конструктор
     * @param target_executor Исполнитель для tgtd/tgtadm (по умолчанию LocalExecutor)
     * @param retry_interval Пауза между попытками опроса
     */
    explicit TgtIscsiControl(std::shared_ptr<CommandExecutor> target_executor = nullptr,
                             std::chrono::milliseconds retry_interval = RETRY_INTERVAL);

    std::unique_ptr<CommandExecutor> open_namespace(const std::string& ns_dir) override;
    void check_initiator(CommandExecutor& ne) override;
    void start_daemon(bool force) override;

    void create_target(int tid, const std::string& name) override;
    void delete_target(int tid) override;
    void add_lun(int tid, int lun, const std::string& backing_store,
                 const std::string& bs_type, const std::string& bs_opts) override;
    void delete_lun(int tid, int lun) override;
    void bind_initiator(int tid, const std::string& initiator) override;
    void unbind_initiator(int tid, const std::string& initiator) override;

    void discover_target(const std::string& ip, const std::string& target,
                         CommandExecutor& ne) override;
    void delete_discovered_target(const std::string& ip, const std::string& target,
                                  CommandExecutor& ne) override;
    void login_target(const std::string& ip, const std::string& target,
                      CommandExecutor& ne) override;
    void logout_target(const std::string& ip, const std::string& target,
                       CommandExecutor& ne) override;
    std::string get_device(const std::string& ip, const std::string& target,
                           int lun, CommandExecutor& ne) override;

private:
    /**
     * @brief Проверяет, отвечает ли tgtd
     */
    bool daemon_running();

    /**
     * @brief Выполняет tgtadm --lld iscsi с заданными аргументами
     */
    std::string tgtadm(const std::vector<std::string>& args);

    std::shared_ptr<CommandExecutor> target_executor_;
    std::chrono::milliseconds retry_interval_;
};

/**
 * @brief Ищет диск LUN в выводе "iscsiadm -m session -P 3"
 * @param output Вывод iscsiadm
 * @param ip Адрес портала
 * @param target Имя target
 * @param lun Номер LUN
 * @return Путь /dev/<disk> или пустая строка, если диск ещё не подключён
 */
std::string parse_session_device(const std::string& output, const std::string& ip,
                                 const std::string& target, int lun);

} // namespace iscsi_dev

#endif // ISCSI_DEV_ISCSI_CONTROL_HPP
