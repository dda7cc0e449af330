#ifndef IMGROOT_IMAGE_MOUNTER_HPP
#define IMGROOT_IMAGE_MOUNTER_HPP

#include "partition_table.hpp"
#include "resource_stack.hpp"
#include "retry_policy.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace imgroot {

// Forward declarations
class LoopManager;
class MountManager;

/**
 * @brief Один bind-mount с хоста в образ
 */
struct MountSpec {
    std::string host_path;   ///< Файл или директория на хосте
    std::string image_path;  ///< Абсолютный путь внутри образа
    bool read_only = false;  ///< Монтировать только для чтения

    /**
     * @brief Проверяет спецификацию
     * @throws ValidationError если image_path не абсолютный или host_path
     *         не существует (или не файл и не директория)
     */
    void validate() const;
};

/**
 * @brief Разбирает строку вида HOST:IMAGE[:ro|:rw]
 * @throws ValidationError при неверном формате
 */
MountSpec parse_mount_spec(const std::string& text);

/**
 * @brief Параметры сессии монтирования образа
 */
struct MountRequest {
    std::string image;                ///< Путь к файлу образа
    std::string root_dir;             ///< Точка монтирования; пусто - временная директория
    std::vector<MountSpec> mounts;    ///< Bind-mount'ы в порядке применения
    bool read_only = false;           ///< loop, root и boot только для чтения
    RetryPolicy retry;                ///< Повторы umount
};

/// Тело сессии: получает корень смонтированного образа
using SessionBody = std::function<int(const std::string& root_dir)>;

/**
 * @brief Монтирует образ: root, boot и bind-mount'ы
 *
 * Координирует чтение таблицы разделов, loop-устройства и
 * монтирование. Все ресурсы проходят через ResourceStack и
 * освобождаются в обратном порядке на любом пути выхода.
 */
class ImageMounter {
public:
    /// Число попыток umount по умолчанию
    static constexpr unsigned DEFAULT_UNMOUNT_ATTEMPTS = RetryPolicy::DEFAULT_ATTEMPTS;

    /// Пауза между попытками umount по умолчанию (мс)
    static constexpr long DEFAULT_UNMOUNT_BACKOFF_MS = RetryPolicy::DEFAULT_BACKOFF_MS;

    /**
     * @brief Конструктор с системными реализациями
     */
    ImageMounter();

    /**
     * @brief Конструктор с подменяемыми реализациями (для тестов)
     */
    ImageMounter(std::unique_ptr<PartitionTableReader> reader,
                 std::unique_ptr<LoopManager> loop,
                 std::unique_ptr<MountManager> mounts);

    /**
     * @brief Деструктор
     */
    ~ImageMounter();

    // Запрещаем копирование
    ImageMounter(const ImageMounter&) = delete;
    ImageMounter& operator=(const ImageMounter&) = delete;

    /**
     * @brief Монтирует образ, выполняет тело и всё размонтирует
     * @param request Параметры сессии
     * @param body Тело сессии
     * @return Результат тела и первая ошибка освобождения (предупреждение)
     * @throws ValidationError до захвата каких-либо ресурсов
     * @throws LayoutError, AttachError, MountError, ScaffoldError при захвате;
     *         к этому моменту всё захваченное уже освобождено
     */
    ScopeResult mount_image(const MountRequest& request, const SessionBody& body);

    /**
     * @brief Читает таблицу разделов образа
     */
    PartitionTable read_partitions(const std::string& image_path);

    LoopManager& loop() { return *loop_; }
    MountManager& mounts() { return *mounts_; }

private:
    /**
     * @brief Готовит корневую директорию сессии
     * @return Абсолютный путь к корню
     */
    std::string prepare_root(ResourceStack& stack, const std::string& root_dir);

    /**
     * @brief Монтирует устройство и регистрирует размонтирование
     */
    void mount_scoped(ResourceStack& stack, const std::string& device,
                      const std::string& mount_point, bool read_only, const RetryPolicy& retry);

    /**
     * @brief Выполняет bind-mount и регистрирует размонтирование
     */
    void bind_scoped(ResourceStack& stack, const MountSpec& spec,
                     const std::string& root_dir, const RetryPolicy& retry);

    std::unique_ptr<PartitionTableReader> reader_;
    std::unique_ptr<LoopManager> loop_;
    std::unique_ptr<MountManager> mounts_;
};

} // namespace imgroot

#endif // IMGROOT_IMAGE_MOUNTER_HPP
