#ifndef ISCSI_DEV_COMMAND_EXECUTOR_HPP
#define ISCSI_DEV_COMMAND_EXECUTOR_HPP

#include <string>
#include <vector>

namespace iscsi_dev {

/**
 * @brief Исполнитель административных команд
 *
 * Позволяет запускать iscsiadm/tgtadm в нужном контексте
 * (своём или в namespace другого процесса) и подменять
 * исполнение в тестах.
 */
class CommandExecutor {
public:
    virtual ~CommandExecutor() = default;

    /**
     * @brief Выполняет команду
     * @param program Имя программы (ищется в PATH)
     * @param args Аргументы
     * @return Вывод команды без завершающего перевода строки
     * @throws CommandError при ошибке запуска или ненулевом коде возврата
     */
    virtual std::string execute(const std::string& program,
                                const std::vector<std::string>& args) = 0;
};

/**
 * @brief Выполняет команды в контексте текущего процесса
 */
class LocalExecutor : public CommandExecutor {
public:
    std::string execute(const std::string& program,
                        const std::vector<std::string>& args) override;
};

/**
 * @brief Выполняет команды в mount/net namespace другого процесса через nsenter
 */
class NamespaceExecutor : public CommandExecutor {
public:
    /**
     * @brief Конструктор
     * @param ns_dir Каталог с файлами namespace (например, /host/proc/1/ns/)
     * @throws PreconditionError если каталог не существует
     */
    explicit NamespaceExecutor(const std::string& ns_dir);

    std::string execute(const std::string& program,
                        const std::vector<std::string>& args) override;

    /// Каталог namespace, всегда с завершающим '/'
    const std::string& ns_dir() const { return ns_dir_; }

    /**
     * @brief Формирует полную командную строку nsenter
     */
    std::vector<std::string> build_command(const std::string& program,
                                           const std::vector<std::string>& args) const;

private:
    std::string ns_dir_;
};

} // namespace iscsi_dev

#endif // ISCSI_DEV_COMMAND_EXECUTOR_HPP
