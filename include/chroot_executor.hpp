#ifndef IMGROOT_CHROOT_EXECUTOR_HPP
#define IMGROOT_CHROOT_EXECUTOR_HPP

#include "resource_stack.hpp"

#include <string>
#include <vector>

namespace imgroot {

/**
 * @brief Строит командную строку для запуска внутри chroot
 * @param command Команда и аргументы (может быть пустой)
 * @param user Пользователь внутри образа (может быть пустым)
 * @param shell Интерактивная оболочка по умолчанию
 * @return argv для execvp
 *
 * С пользователем команда оборачивается в `su --login`, без команды
 * запускается интерактивная оболочка.
 */
std::vector<std::string> build_command(const std::vector<std::string>& command,
                                       const std::string& user,
                                       const std::string& shell);

/**
 * @brief Временно отключает etc/ld.so.preload в корне образа
 * @param stack Стек, в который регистрируется восстановление
 * @param root_dir Корень смонтированного образа
 * @return true если файл был переименован
 * @throws ScaffoldError если переименовать не удалось
 *
 * Библиотеки из ld.so.preload собраны под архитектуру образа и
 * роняют каждый процесс, запущенный через эмулятор.
 */
bool disable_preload(ResourceStack& stack, const std::string& root_dir);

/**
 * @brief Запускает команды в chroot смонтированного образа
 */
class ChrootExecutor {
public:
    /// Файл со списком предзагружаемых библиотек
    static constexpr const char* PRELOAD_FILE = "/etc/ld.so.preload";

    /// Суффикс, с которым файл откладывается на время запуска
    static constexpr const char* PRELOAD_DISABLED_SUFFIX = ".imgroot-disabled";

    ChrootExecutor() = default;
    virtual ~ChrootExecutor() = default;

    /**
     * @brief Выполняет команду с корнем root_dir
     * @param root_dir Корень смонтированного образа
     * @param command Команда и аргументы; пусто - интерактивная оболочка
     * @param user Пользователь для login-оболочки; пусто - без su
     * @return Код возврата команды и ошибка восстановления ld.so.preload
     * @throws ExecError если процесс не удалось запустить
     */
    ScopeResult run(const std::string& root_dir, const std::vector<std::string>& command,
                    const std::string& user = "");

protected:
    /**
     * @brief fork + chroot + execvp, ожидание завершения
     * @return Код возврата; 128+N если процесс убит сигналом N
     * @throws ExecError если chroot или exec не удались
     */
    virtual int execute(const std::string& root_dir, const std::vector<std::string>& argv);
};

} // namespace imgroot

#endif // IMGROOT_CHROOT_EXECUTOR_HPP
