#ifndef IMGROOT_LOOP_MANAGER_HPP
#define IMGROOT_LOOP_MANAGER_HPP

#include "retry_policy.hpp"

#include <list>
#include <map>
#include <string>
#include <vector>

namespace imgroot {

class ResourceStack;

/// Номер раздела -> путь к устройству (/dev/loopNpK)
using DeviceMap = std::map<int, std::string>;

/**
 * @brief Менеджер для работы с loop-устройствами
 *
 * Использует утилиту losetup для подключения/отключения
 * файлов-образов как блочных устройств. Разделы образа
 * находятся через sysfs после сканирования таблицы ядром.
 */
class LoopManager {
public:
    /**
     * @brief Конструктор
     * @param sysfs_block Каталог sysfs с блочными устройствами
     * @param dev_dir Каталог с узлами устройств
     */
    explicit LoopManager(std::string sysfs_block = "/sys/block",
                         std::string dev_dir = "/dev");

    virtual ~LoopManager() = default;

    /**
     * @brief Подключает файл как loop-устройство со сканированием разделов
     * @param image_path Путь к файлу образа
     * @param read_only Подключить только для чтения
     * @return Путь к созданному loop-устройству (например, /dev/loop0)
     * @throws AttachError при ошибке подключения
     */
    virtual std::string attach(const std::string& image_path, bool read_only);

    /**
     * @brief Отключает loop-устройство
     * @param loop_device Путь к loop-устройству
     * @throws AttachError при ошибке отключения
     */
    virtual void detach(const std::string& loop_device);

    /**
     * @brief Находит устройства разделов, созданные ядром
     * @param loop_device Путь к loop-устройству
     * @return Номер раздела -> путь к узлу устройства
     *
     * Ждёт появления узлов в dev_dir в пределах политики ожидания.
     */
    virtual DeviceMap partition_devices(const std::string& loop_device);

    /**
     * @brief Подключает образ в рамках стека ресурсов
     * @param stack Стек, в который регистрируется отключение
     * @param image_path Путь к файлу образа
     * @param read_only Только для чтения
     * @param expected_partitions Ожидаемое число разделов
     * @return Отображение номер -> устройство, живёт до размотки стека
     * @throws AttachError если разделов нет или их число неожиданное;
     *         отключение к этому моменту уже зарегистрировано в стеке
     */
    const DeviceMap& attach_scoped(ResourceStack& stack, const std::string& image_path,
                                   bool read_only, size_t expected_partitions);

    /**
     * @brief Находит loop-устройство для файла
     * @param image_path Путь к файлу образа
     * @return Путь к loop-устройству или пустая строка если не найдено
     */
    std::string find_loop_for_file(const std::string& image_path);

    /**
     * @brief Получает список всех подключённых loop-устройств
     * @return Вектор пар (loop-устройство, файл)
     */
    std::vector<std::pair<std::string, std::string>> list_attached();

    /**
     * @brief Политика ожидания узлов разделов
     */
    void set_wait_policy(const RetryPolicy& policy) { wait_policy_ = policy; }

private:
    std::string sysfs_block_;
    std::string dev_dir_;
    RetryPolicy wait_policy_;
    std::list<DeviceMap> sessions_;
};

/**
 * @brief Разбирает вывод `losetup -l -n -O NAME,BACK-FILE`
 * @param text Вывод losetup
 * @return Вектор пар (loop-устройство, файл)
 */
std::vector<std::pair<std::string, std::string>> parse_losetup_list(const std::string& text);

/**
 * @brief Находит путь устройства в выводе `losetup --show`
 * @param output Вывод losetup вместе с предупреждениями
 * @return Последняя строка вида /dev/loopN; пусто если её нет
 */
std::string parse_attached_device(const std::string& output);

/**
 * @brief Относится ли устройство к loop-устройству (оно само или его раздел loopNpK)
 */
bool is_loop_partition_of(const std::string& device, const std::string& loop_device);

} // namespace imgroot

#endif // IMGROOT_LOOP_MANAGER_HPP
