#ifndef ISCSI_DEV_DEVICE_NODE_HPP
#define ISCSI_DEV_DEVICE_NODE_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>

namespace iscsi_dev {

/// Сколько ждать удаления файла устройства
constexpr std::chrono::milliseconds REMOVE_TIMEOUT{30000};

/**
 * @brief Функция удаления пути
 * @throws OsError при ошибке удаления
 */
using RemoveFunc = std::function<void(const std::string&)>;

/**
 * @brief Разбивает номер устройства на major/minor
 *
 * Упрощённая схема: major = rdev / 256, minor = rdev % 256.
 * Расширенные номера minor (больше 255) не поддерживаются.
 *
 * @param rdev Номер устройства из stat
 * @return Пара (major, minor)
 */
std::pair<unsigned, unsigned> split_device_number(uint64_t rdev);

/**
 * @brief Кодирует major/minor в номер устройства для mknod
 */
uint64_t encode_device_number(unsigned major, unsigned minor);

/**
 * @brief Создаёт блочный файл устройства с правами 0600
 * @param path Путь к создаваемому файлу
 * @param major Старший номер
 * @param minor Младший номер
 * @throws OsError при ошибке mknod (например, файл уже существует)
 */
void make_block_node(const std::string& path, unsigned major, unsigned minor);

/**
 * @brief Создаёт копию блочного устройства с теми же major/minor
 * @param src Существующее устройство
 * @param dest Путь для нового файла устройства
 * @throws NotFoundError если src не существует
 * @throws OsError при ошибке stat или mknod
 */
void duplicate_device(const std::string& src, const std::string& dest);

/**
 * @brief Удаляет путь; отсутствие пути не считается ошибкой
 * @throws OsError при ошибке удаления
 */
void unlink_path(const std::string& path);

/**
 * @brief Удаляет файл устройства с ограничением по времени
 *
 * Удаление выполняется в фоновом потоке. Если оно не завершилось
 * за timeout, бросается TimeoutError, а поток продолжает работу.
 *
 * @param path Путь к файлу устройства
 * @param timeout Время ожидания
 * @param remover Функция удаления
 * @throws TimeoutError если удаление не уложилось в timeout
 * @throws OsError при ошибке удаления
 */
void remove_device(const std::string& path,
                   std::chrono::milliseconds timeout = REMOVE_TIMEOUT,
                   const RemoveFunc& remover = unlink_path);

} // namespace iscsi_dev

#endif // ISCSI_DEV_DEVICE_NODE_HPP
