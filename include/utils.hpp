#ifndef IMGROOT_UTILS_HPP
#define IMGROOT_UTILS_HPP

#include <string>
#include <cstdint>
#include <istream>
#include <signal.h>
#include <vector>
#include <stdexcept>

namespace imgroot {

/**
 * @brief Базовое исключение imgroot
 */
class ImgrootError : public std::runtime_error {
public:
    explicit ImgrootError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Таблица разделов отсутствует или в ней слишком мало записей
 */
class LayoutError : public ImgrootError {
public:
    explicit LayoutError(const std::string& msg) : ImgrootError(msg) {}
};

/**
 * @brief Запрошенный раздел не найден (например, таблица пуста)
 */
class NotFoundError : public LayoutError {
public:
    explicit NotFoundError(const std::string& msg) : LayoutError(msg) {}
};

/**
 * @brief Ошибка подключения/отключения loop-устройства
 *        или неожиданная топология разделов
 */
class AttachError : public ImgrootError {
public:
    explicit AttachError(const std::string& msg) : ImgrootError(msg) {}
};

/**
 * @brief Ошибка mount / umount / bind-mount
 */
class MountError : public ImgrootError {
public:
    explicit MountError(const std::string& msg) : ImgrootError(msg) {}
};

/**
 * @brief Не удалось создать или удалить заготовку точки монтирования
 */
class ScaffoldError : public ImgrootError {
public:
    explicit ScaffoldError(const std::string& msg) : ImgrootError(msg) {}
};

/**
 * @brief Некорректные входные данные (путь не абсолютный, файл не существует)
 */
class ValidationError : public ImgrootError {
public:
    explicit ValidationError(const std::string& msg) : ImgrootError(msg) {}
};

/**
 * @brief Не удалось запустить дочерний процесс
 *
 * Ненулевой код возврата команды ошибкой не считается.
 */
class ExecError : public ImgrootError {
public:
    explicit ExecError(const std::string& msg) : ImgrootError(msg) {}
};

/**
 * @brief Результат выполнения внешней команды
 */
struct CommandResult {
    int exit_code;       ///< Код возврата (-1 если процесс завершён сигналом)
    std::string output;  ///< Объединённый stdout и stderr
};

/**
 * @brief Настраивает уровень логирования spdlog
 * @param verbose Включить debug-сообщения
 *
 * Переменная окружения IMGROOT_LOG_LEVEL (trace, debug, info, warn, error)
 * имеет приоритет над флагом.
 */
void init_logging(bool verbose);

/**
 * @brief Форматирует размер в человекочитаемый вид
 * @param bytes Размер в байтах
 * @return Строка вида "256M" или "1G"
 */
std::string format_size(uint64_t bytes);

/**
 * @brief Экранирует строку для передачи в /bin/sh
 * @param arg Аргумент
 * @return Строка в одинарных кавычках
 */
std::string shell_quote(const std::string& arg);

/**
 * @brief Собирает командную строку из аргументов, экранируя каждый
 */
std::string join_command(const std::vector<std::string>& args);

/**
 * @brief Убирает пробельные символы по краям
 */
std::string trim(const std::string& s);

/**
 * @brief Проверяет, запущено ли приложение с правами root
 * @return true если root
 */
bool is_root();

/**
 * @brief Проверяет существование пути (без разыменования симлинков)
 */
bool path_exists(const std::string& path);

/**
 * @brief Проверяет существование обычного файла
 * @param path Путь к файлу
 * @return true если файл существует
 */
bool file_exists(const std::string& path);

/**
 * @brief Проверяет существование директории
 * @param path Путь к директории
 * @return true если директория существует
 */
bool directory_exists(const std::string& path);

/**
 * @brief Возвращает канонический абсолютный путь
 * @throws ValidationError если путь не существует
 */
std::string absolute_path(const std::string& path);

/**
 * @brief Выполняет внешнюю команду через /bin/sh
 * @param cmd Команда для выполнения
 * @return Код возврата и вывод команды
 * @throws ImgrootError если не удалось создать процесс
 */
CommandResult execute_command(const std::string& cmd);

/**
 * @brief Выполняет команду и возвращает stdout
 * @param cmd Команда для выполнения
 * @return Вывод команды без завершающего перевода строки
 * @throws ImgrootError при ненулевом коде возврата
 */
std::string execute_command_output(const std::string& cmd);

/**
 * @brief Проверяет наличие исполняемого файла в PATH
 */
bool command_available(const std::string& name);

/**
 * @brief Игнорирует SIGINT и SIGTERM до выхода из области видимости
 *
 * Пока смонтирован образ, прерывание не должно оборвать размонтирование.
 */
class InterruptGuard {
public:
    InterruptGuard();
    ~InterruptGuard();

    // Запрещаем копирование
    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;

private:
    struct sigaction old_int_;
    struct sigaction old_term_;
};

/**
 * @brief Ждёт строку из потока; SIGINT и SIGTERM завершают ожидание
 * @param in Поток ввода
 * @return true если прочитана строка, false при EOF или сигнале
 */
bool wait_for_enter(std::istream& in);

} // namespace imgroot

#endif // IMGROOT_UTILS_HPP
