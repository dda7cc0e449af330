#ifndef IMGROOT_PARTITION_TABLE_HPP
#define IMGROOT_PARTITION_TABLE_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace imgroot {

/**
 * @brief Описание одного раздела образа
 *
 * Строится заново при каждом чтении таблицы; после изменения образа
 * (expand/append/delete) старые значения недействительны.
 */
struct Partition {
    int number = 0;              ///< Номер слота в таблице (с 1)
    std::string type;            ///< Код типа как в таблице ("c", "83", GUID)
    std::string type_name;       ///< Человекочитаемое имя типа
    uint64_t start_sectors = 0;  ///< Начало в секторах
    uint64_t size_sectors = 0;   ///< Размер в секторах
    uint64_t sector_size = 512;  ///< Размер сектора в байтах
    bool bootable = false;       ///< Флаг bootable (только dos)

    uint64_t start() const { return start_sectors * sector_size; }
    uint64_t size() const { return size_sectors * sector_size; }
    uint64_t end() const { return start() + size(); }
};

/**
 * @brief Таблица разделов образа
 *
 * Разделы упорядочены по возрастанию start. По соглашению раздел 1 -
 * boot, раздел 2 - корневая файловая система.
 */
class PartitionTable {
public:
    /// Номер загрузочного раздела
    static constexpr int BOOT_PARTITION = 1;

    /// Номер корневого раздела
    static constexpr int ROOT_PARTITION = 2;

    std::string label;            ///< "dos" или "gpt"
    std::string label_id;         ///< Идентификатор таблицы
    uint64_t sector_size = 512;   ///< Размер сектора
    std::vector<Partition> partitions;

    size_t size() const { return partitions.size(); }
    bool empty() const { return partitions.empty(); }

    /**
     * @brief Ищет раздел по номеру
     * @return Указатель на раздел или nullptr
     */
    const Partition* find(int number) const;

    /**
     * @brief Первый раздел по смещению
     * @throws NotFoundError если таблица пуста
     */
    const Partition& first() const;

    /**
     * @brief Последний раздел по смещению
     * @throws NotFoundError если таблица пуста
     */
    const Partition& last() const;

    /**
     * @brief Проверяет, что в таблице есть boot и root
     * @throws LayoutError если разделов меньше двух или нет 1/2
     */
    void require_boot_and_root() const;
};

/**
 * @brief Таблица "код типа -> имя"
 *
 * Загружается один раз на экземпляр читателя, дальше не меняется.
 */
using PartitionTypeNames = std::map<std::string, std::string>;

/**
 * @brief Разбирает вывод `sfdisk --dump`
 * @param text Вывод sfdisk
 * @return Таблица без имён типов, отсортированная по start
 * @throws LayoutError при некорректной строке раздела
 */
PartitionTable parse_sfdisk_dump(const std::string& text);

/**
 * @brief Разбирает вывод `sfdisk --label <label> -T`
 * @param text Вывод sfdisk
 * @return Соответствие кода типа (в нижнем регистре) имени
 */
PartitionTypeNames parse_type_list(const std::string& text);

/**
 * @brief Возвращает имя типа раздела
 * @param names Таблица типов
 * @param code Код типа (регистр не важен)
 * @return Имя или "unknown"
 */
std::string partition_type_name(const PartitionTypeNames& names, const std::string& code);

/**
 * @brief Читает таблицу разделов образа через sfdisk
 *
 * Методы виртуальные, чтобы в тестах подставлять готовую таблицу.
 */
class PartitionTableReader {
public:
    PartitionTableReader() = default;
    virtual ~PartitionTableReader() = default;

    /**
     * @brief Читает таблицу разделов
     * @param image_path Путь к файлу образа
     * @return Таблица с заполненными type_name
     * @throws LayoutError если sfdisk не смог прочитать таблицу
     */
    virtual PartitionTable read(const std::string& image_path);

protected:
    /**
     * @brief Загружает список типов для метки (dos/gpt)
     */
    virtual PartitionTypeNames load_type_names(const std::string& label);

private:
    const PartitionTypeNames& type_names(const std::string& label);

    std::map<std::string, PartitionTypeNames> type_cache_;
};

} // namespace imgroot

#endif // IMGROOT_PARTITION_TABLE_HPP
