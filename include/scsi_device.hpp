#ifndef ISCSI_DEV_SCSI_DEVICE_HPP
#define ISCSI_DEV_SCSI_DEVICE_HPP

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace iscsi_dev {

// Forward declarations
class IscsiControl;

/**
 * @brief Источник локальных IP-адресов хоста
 */
using AddressResolver = std::function<std::vector<std::string>()>;

/**
 * @brief Блочное устройство, экспортированное через iSCSI
 *
 * Создаёт target и LUN поверх backing store, подключает к нему
 * initiator хоста и хранит путь к получившемуся блочному устройству.
 * Команды initiator выполняются в namespace хоста.
 *
 * Вызовы startup()/shutdown() на одном экземпляре должны
 * сериализоваться вызывающим.
 */
class ScsiDevice {
public:
    /// Префикс имени target (naming authority)
    static constexpr const char* TARGET_PREFIX = "iqn.2014-07.com.rancher:";

    /// Один target и один LUN на устройство
    static constexpr int TARGET_ID = 1;
    static constexpr int LUN_ID = 1;

    /// Каталог namespace процесса init хоста
    static constexpr const char* HOST_NAMESPACE = "/host/proc/1/ns/";

    /// Разрешаем доступ к target всем initiator
    static constexpr const char* ALL_INITIATORS = "ALL";

    /**
     * @brief Конструктор
     * @param name Имя устройства (становится частью имени target)
     * @param backing_file Файл или устройство с данными LUN
     * @param bs_type Тип backing store
     * @param bs_opts Опции backing store
     * @param iscsi Управление iSCSI (по умолчанию TgtIscsiControl)
     * @param resolver Источник локальных адресов (по умолчанию get_local_ips)
     * @throws ResolutionError если у хоста нет ни одного локального адреса
     */
    ScsiDevice(const std::string& name, const std::string& backing_file,
               const std::string& bs_type, const std::string& bs_opts,
               std::shared_ptr<IscsiControl> iscsi = nullptr,
               const AddressResolver& resolver = AddressResolver());

    ~ScsiDevice();

    /**
     * @brief Создаёт target и LUN, выполняет discovery и login
     *
     * При ошибке на любом шаге уже выполненные шаги не откатываются,
     * device() остаётся пустым.
     *
     * @throws PreconditionError если нет iscsiadm или не запускается tgtd
     */
    void startup();

    /**
     * @brief Выполняет logout и удаляет target
     *
     * device() очищается сразу после logout, даже если
     * последующая очистка target завершится ошибкой.
     *
     * @throws AlreadyDownError если устройство не подключено
     */
    void shutdown();

    /**
     * @brief Находит устройство уже подключённой сессии
     *
     * Нужен, чтобы остановить устройство, запущенное другим процессом.
     *
     * @throws IscsiError если сессия или диск не найдены
     */
    void reattach();

    const std::string& target() const { return target_; }
    int target_id() const { return target_id_; }
    int lun_id() const { return lun_id_; }
    const std::string& backing_file() const { return backing_file_; }
    const std::string& bs_type() const { return bs_type_; }
    const std::string& bs_opts() const { return bs_opts_; }
    const std::string& portal() const { return portal_; }

    /// Локальное блочное устройство; пустая строка - не подключено
    const std::string& device() const { return device_; }

    const std::string& namespace_dir() const { return namespace_dir_; }
    void set_namespace_dir(const std::string& ns_dir) { namespace_dir_ = ns_dir; }

private:
    std::shared_ptr<IscsiControl> iscsi_;

    std::string target_;
    int target_id_;
    int lun_id_;
    std::string backing_file_;
    std::string bs_type_;
    std::string bs_opts_;
    std::string portal_;
    std::string device_;
    std::string namespace_dir_;
};

} // namespace iscsi_dev

#endif // ISCSI_DEV_SCSI_DEVICE_HPP
