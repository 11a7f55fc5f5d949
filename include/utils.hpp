#ifndef ISCSI_DEV_UTILS_HPP
#define ISCSI_DEV_UTILS_HPP

#include <string>
#include <vector>
#include <stdexcept>

namespace iscsi_dev {

/**
 * @brief Базовое исключение для ошибок iscsi-dev
 */
class IscsiError : public std::runtime_error {
public:
    explicit IscsiError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Не выполнено предварительное условие (нет iscsiadm, не запускается tgtd)
 */
class PreconditionError : public IscsiError {
public:
    explicit PreconditionError(const std::string& msg) : IscsiError(msg) {}
};

/**
 * @brief Не удалось определить локальный адрес для портала
 */
class ResolutionError : public IscsiError {
public:
    explicit ResolutionError(const std::string& msg) : IscsiError(msg) {}
};

/**
 * @brief Устройство уже остановлено
 */
class AlreadyDownError : public IscsiError {
public:
    explicit AlreadyDownError(const std::string& msg) : IscsiError(msg) {}
};

/**
 * @brief Ошибка системного вызова
 */
class OsError : public IscsiError {
public:
    OsError(const std::string& msg, int code);

    /// Значение errno
    int code() const { return code_; }

private:
    int code_;
};

/**
 * @brief Системный вызов завершился с ENOENT
 */
class NotFoundError : public OsError {
public:
    NotFoundError(const std::string& msg, int code) : OsError(msg, code) {}
};

/**
 * @brief Операция не уложилась в отведённое время
 */
class TimeoutError : public IscsiError {
public:
    TimeoutError(const std::string& msg, const std::string& path)
        : IscsiError(msg), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/**
 * @brief Внешняя команда не запустилась или вернула ненулевой код
 */
class CommandError : public IscsiError {
public:
    CommandError(const std::string& msg, const std::string& command,
                 int exit_code, const std::string& output)
        : IscsiError(msg), command_(command), exit_code_(exit_code), output_(output) {}

    const std::string& command() const { return command_; }
    int exit_code() const { return exit_code_; }
    const std::string& output() const { return output_; }

private:
    std::string command_;
    int exit_code_;
    std::string output_;
};

/**
 * @brief Бросает OsError (или NotFoundError для ENOENT) по текущему errno
 * @param what Описание операции для сообщения
 */
[[noreturn]] void throw_os_error(const std::string& what);

/**
 * @brief Результат выполнения внешней команды
 */
struct CommandResult {
    int exit_code;       ///< Код возврата (-1 если процесс завершён сигналом)
    std::string output;  ///< Объединённый stdout и stderr
};

/**
 * @brief Проверяет, запущено ли приложение с правами root
 * @return true если root
 */
bool is_root();

/**
 * @brief Проверяет существование пути (файл, устройство, каталог)
 * @param path Путь
 * @return true если путь существует
 */
bool path_exists(const std::string& path);

/**
 * @brief Проверяет существование директории
 * @param path Путь к директории
 * @return true если директория существует
 */
bool directory_exists(const std::string& path);

/**
 * @brief Склеивает argv в строку для логов и сообщений об ошибках
 */
std::string join_command(const std::vector<std::string>& argv);

/**
 * @brief Выполняет внешнюю команду без участия shell
 * @param argv Программа и её аргументы
 * @return Код возврата и вывод команды
 * @throws CommandError если процесс не удалось запустить
 */
CommandResult execute_command(const std::vector<std::string>& argv);

/**
 * @brief Выполняет команду и возвращает её вывод
 * @param argv Программа и её аргументы
 * @return Вывод команды без завершающего перевода строки
 * @throws CommandError при ненулевом коде возврата
 */
std::string execute_command_output(const std::vector<std::string>& argv);

/**
 * @brief Возвращает IPv4-адреса активных интерфейсов хоста (кроме loopback)
 * @return Адреса в порядке перечисления интерфейсов
 * @throws OsError при ошибке getifaddrs
 */
std::vector<std::string> get_local_ips();

} // namespace iscsi_dev

#endif // ISCSI_DEV_UTILS_HPP
