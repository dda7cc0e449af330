#ifndef IMGROOT_MOUNT_MANAGER_HPP
#define IMGROOT_MOUNT_MANAGER_HPP

#include "retry_policy.hpp"

#include <string>
#include <vector>

namespace imgroot {

/**
 * @brief Запись из таблицы монтирования
 */
struct MountEntry {
    std::string source;  ///< Устройство или источник
    std::string target;  ///< Точка монтирования
    std::string fstype;  ///< Тип файловой системы
};

/**
 * @brief Менеджер монтирования
 *
 * Вызывает mount/umount. Методы, обращающиеся к системе, виртуальные:
 * тесты подменяют их и проверяют порядок операций.
 */
class MountManager {
public:
    /**
     * @brief Конструктор
     * @param mounts_file Таблица монтирования (/proc/mounts)
     */
    explicit MountManager(std::string mounts_file = "/proc/mounts");

    virtual ~MountManager() = default;

    /**
     * @brief Монтирует файловую систему
     * @param device Путь к устройству
     * @param mount_point Точка монтирования
     * @param read_only Монтировать только для чтения
     * @throws MountError при ошибке
     */
    virtual void mount(const std::string& device, const std::string& mount_point, bool read_only);

    /**
     * @brief Выполняет bind-mount файла или директории
     * @param source Путь на хосте
     * @param mount_point Точка монтирования
     * @throws MountError при ошибке
     */
    virtual void bind(const std::string& source, const std::string& mount_point);

    /**
     * @brief Перемонтирует bind-mount только для чтения
     * @throws MountError при ошибке; bind остаётся смонтированным
     */
    virtual void remount_read_only(const std::string& mount_point);

    /**
     * @brief Одна попытка размонтирования
     * @param mount_point Точка монтирования
     * @return true при успехе
     */
    virtual bool try_unmount(const std::string& mount_point);

    /**
     * @brief Размонтирует с повторами
     * @param mount_point Точка монтирования
     * @param policy Число попыток и пауза между ними
     * @throws MountError если все попытки неудачны
     */
    void unmount(const std::string& mount_point, const RetryPolicy& policy);

    /**
     * @brief Проверяет, смонтирована ли точка
     * @param mount_point Путь к точке монтирования
     * @return true если смонтирована
     */
    bool is_mounted(const std::string& mount_point);

    /**
     * @brief Проверяет, есть ли точки монтирования в поддереве
     * @param path Корень поддерева
     * @return true если path или что-то под ним смонтировано
     */
    virtual bool has_mounts_under(const std::string& path);

    /**
     * @brief Читает таблицу монтирования
     */
    std::vector<MountEntry> list_mounts();

private:
    std::string mounts_file_;
};

} // namespace imgroot

#endif // IMGROOT_MOUNT_MANAGER_HPP
