#ifndef IMGROOT_RESOURCE_STACK_HPP
#define IMGROOT_RESOURCE_STACK_HPP

#include <exception>
#include <functional>
#include <string>
#include <vector>

namespace imgroot {

/**
 * @brief Упорядоченный стек захваченных ресурсов
 *
 * Каждый успешно захваченный ресурс (loop-устройство, mount, заготовка
 * пути) регистрирует действие освобождения. unwind() вызывает их в
 * обратном порядке, ровно один раз каждое. Ошибка одного освобождения
 * не останавливает остальные; сохраняется первая.
 */
class ResourceStack {
public:
    using Release = std::function<void()>;

    ResourceStack() = default;

    /**
     * @brief Деструктор - освобождает то, что не было освобождено через unwind()
     *
     * Ошибки только логируются.
     */
    ~ResourceStack();

    // Запрещаем копирование
    ResourceStack(const ResourceStack&) = delete;
    ResourceStack& operator=(const ResourceStack&) = delete;

    /**
     * @brief Регистрирует захваченный ресурс
     * @param name Описание ресурса для логов
     * @param release Действие освобождения
     */
    void push(const std::string& name, Release release);

    /**
     * @brief Освобождает все ресурсы в обратном порядке
     * @return Первая ошибка освобождения или nullptr
     */
    std::exception_ptr unwind();

    /**
     * @brief Количество ещё не освобождённых ресурсов
     */
    size_t size() const { return handles_.size(); }

    bool empty() const { return handles_.empty(); }

private:
    struct Handle {
        std::string name;
        Release release;
    };

    std::vector<Handle> handles_;
};

/**
 * @brief Итог выполнения тела сессии
 */
struct ScopeResult {
    int exit_code = 0;                  ///< Результат тела
    std::exception_ptr teardown_error;  ///< Первая ошибка освобождения (если была)
};

/**
 * @brief Захватывает ресурсы, выполняет тело и освобождает всё в обратном порядке
 * @param acquire Захват ресурсов; каждый ресурс регистрируется в переданном стеке
 * @param body Тело сессии, возвращает код результата
 * @return Код тела и первая ошибка освобождения
 *
 * Если acquire или body бросает исключение, стек разматывается, ошибки
 * освобождения логируются, а исходное исключение пробрасывается дальше.
 */
ScopeResult run_scoped(const std::function<void(ResourceStack&)>& acquire,
                       const std::function<int()>& body);

/**
 * @brief Текст исключения из exception_ptr (для логов и предупреждений)
 */
std::string describe_error(const std::exception_ptr& error);

} // namespace imgroot

#endif // IMGROOT_RESOURCE_STACK_HPP
