#ifndef IMGROOT_MOUNT_SCAFFOLD_HPP
#define IMGROOT_MOUNT_SCAFFOLD_HPP

#include <functional>
#include <string>
#include <vector>

namespace imgroot {

class ResourceStack;

/**
 * @brief Что было создано для точки монтирования
 */
enum class ScaffoldKind {
    None,     ///< Путь уже существовал, ничего не создано
    Leaf,     ///< Создан один недостающий элемент (пустой файл или директория)
    Subtree   ///< Создана цепочка директорий, удаляется от верхнего созданного предка
};

/**
 * @brief Запись о созданной заготовке точки монтирования
 */
struct ScaffoldRecord {
    ScaffoldKind kind = ScaffoldKind::None;
    std::string created;   ///< Leaf: сам элемент; Subtree: верхний созданный предок
    bool is_file = false;  ///< Leaf создан как пустой файл
};

/**
 * @brief Разбиение пути на существующий префикс и недостающие элементы
 */
struct PathSplit {
    std::string existing;               ///< Самый длинный существующий префикс
    std::vector<std::string> missing;   ///< Недостающие элементы по порядку
};

/// Предикат существования пути
using ExistsPredicate = std::function<bool(const std::string&)>;

/// Предикат "в поддереве ещё есть точки монтирования"
using BusyPredicate = std::function<bool(const std::string&)>;

/**
 * @brief Находит самый длинный существующий префикс пути
 * @param path Абсолютный путь
 * @param exists Проверка существования (в тестах - фиктивная)
 * @return Префикс и недостающие элементы; без побочных эффектов
 * @throws ValidationError если путь не абсолютный
 */
PathSplit split_existing(const std::string& path, const ExistsPredicate& exists);

/**
 * @brief Создаёт недостающую часть пути для точки монтирования
 * @param target Абсолютный путь точки монтирования
 * @param want_file Последний элемент - пустой файл (иначе директория)
 * @return Запись о созданном
 * @throws ScaffoldError при ошибке; созданное к этому моменту удаляется
 */
ScaffoldRecord prepare_mount_point(const std::string& target, bool want_file);

/**
 * @brief Удаляет ровно то, что создал prepare_mount_point
 * @param record Запись о созданном
 * @throws ScaffoldError при ошибке удаления
 */
void remove_scaffold(const ScaffoldRecord& record);

/**
 * @brief Создаёт заготовку и регистрирует её удаление в стеке
 * @param stack Стек ресурсов
 * @param target Абсолютный путь точки монтирования
 * @param want_file Последний элемент - пустой файл
 * @param is_busy Если вернёт true для удаляемого пути, удаление
 *        отклоняется с ScaffoldError (там ещё что-то смонтировано)
 * @return Запись о созданном
 */
ScaffoldRecord prepare_scoped(ResourceStack& stack, const std::string& target, bool want_file,
                              const BusyPredicate& is_busy = BusyPredicate());

} // namespace imgroot

#endif // IMGROOT_MOUNT_SCAFFOLD_HPP
