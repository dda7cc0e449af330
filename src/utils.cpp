#include "utils.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <array>
#include <climits>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <fcntl.h>

namespace imgroot {

namespace {

volatile std::sig_atomic_t interrupt_signal = 0;

void on_interrupt(int sig) {
    interrupt_signal = sig;
}

} // namespace

void init_logging(bool verbose) {
    // Логи идут в stderr, stdout остаётся за командой внутри chroot
    auto logger = spdlog::get("imgroot");
    if (!logger) {
        logger = spdlog::stderr_color_mt("imgroot");
    }
    logger->set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_default_logger(logger);

    spdlog::level::level_enum level = verbose ? spdlog::level::debug : spdlog::level::info;

    // from_str возвращает off и для неизвестного имени
    const char* env_level = std::getenv("IMGROOT_LOG_LEVEL");
    bool unknown_level = false;
    if (env_level && *env_level) {
        spdlog::level::level_enum parsed = spdlog::level::from_str(env_level);
        if (parsed != spdlog::level::off || std::strcmp(env_level, "off") == 0) {
            level = parsed;
        } else {
            unknown_level = true;
            level = spdlog::level::info;
        }
    }
    spdlog::set_level(level);

    if (unknown_level) {
        spdlog::warn("Unknown IMGROOT_LOG_LEVEL '{}', using info", env_level);
    }
}

std::string format_size(uint64_t bytes) {
    std::ostringstream oss;
    if (bytes >= 1024ULL * 1024ULL * 1024ULL && bytes % (1024ULL * 1024ULL * 1024ULL) == 0) {
        oss << (bytes / (1024ULL * 1024ULL * 1024ULL)) << "G";
    } else if (bytes >= 1024ULL * 1024ULL && bytes % (1024ULL * 1024ULL) == 0) {
        oss << (bytes / (1024ULL * 1024ULL)) << "M";
    } else if (bytes >= 1024ULL && bytes % 1024ULL == 0) {
        oss << (bytes / 1024ULL) << "K";
    } else {
        oss << bytes;
    }
    return oss.str();
}

std::string shell_quote(const std::string& arg) {
    std::string result = "'";
    for (char c : arg) {
        if (c == '\'') {
            result += "'\\''";
        } else {
            result += c;
        }
    }
    result += "'";
    return result;
}

std::string join_command(const std::vector<std::string>& args) {
    std::string result;
    for (const auto& arg : args) {
        if (!result.empty()) {
            result += ' ';
        }
        result += shell_quote(arg);
    }
    return result;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

bool is_root() {
    return geteuid() == 0;
}

bool path_exists(const std::string& path) {
    struct stat st;
    return lstat(path.c_str(), &st) == 0;
}

bool file_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

bool directory_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

std::string absolute_path(const std::string& path) {
    char resolved[PATH_MAX];
    if (realpath(path.c_str(), resolved) == nullptr) {
        throw ValidationError("Path does not exist: " + path);
    }
    return std::string(resolved);
}

CommandResult execute_command(const std::string& cmd) {
    int pipe_fd[2] = {-1, -1};
    if (pipe(pipe_fd) < 0) {
        throw ImgrootError("Failed to create pipe");
    }

    pid_t pid = fork();
    if (pid < 0) {
        ::close(pipe_fd[0]);
        ::close(pipe_fd[1]);
        throw ImgrootError("Failed to fork");
    }

    if (pid == 0) {
        // Дочерний процесс: stdout и stderr в pipe, stdin из /dev/null
        ::close(pipe_fd[0]);
        dup2(pipe_fd[1], STDOUT_FILENO);
        dup2(pipe_fd[1], STDERR_FILENO);
        ::close(pipe_fd[1]);

        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }

        execl("/bin/sh", "sh", "-c", cmd.c_str(), nullptr);
        _exit(127);
    }

    ::close(pipe_fd[1]);

    CommandResult result{-1, ""};
    std::array<char, 256> buffer;
    for (;;) {
        ssize_t n = ::read(pipe_fd[0], buffer.data(), buffer.size());
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            break;
        }
        result.output.append(buffer.data(), static_cast<size_t>(n));
    }
    ::close(pipe_fd[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw ImgrootError("waitpid failed for: " + cmd);
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    }

    while (!result.output.empty() && (result.output.back() == '\n' || result.output.back() == '\r')) {
        result.output.pop_back();
    }

    spdlog::debug("exec: {} -> {}", cmd, result.exit_code);
    return result;
}

std::string execute_command_output(const std::string& cmd) {
    std::array<char, 128> buffer;
    std::string result;

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        throw ImgrootError("Failed to execute command: " + cmd);
    }

    while (fgets(buffer.data(), buffer.size(), pipe) != nullptr) {
        result += buffer.data();
    }

    int status = pclose(pipe);
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        throw ImgrootError("Command failed: " + cmd);
    }

    // Убираем завершающий перевод строки
    while (!result.empty() && (result.back() == '\n' || result.back() == '\r')) {
        result.pop_back();
    }

    return result;
}

bool command_available(const std::string& name) {
    return execute_command("command -v " + shell_quote(name)).exit_code == 0;
}

InterruptGuard::InterruptGuard() {
    struct sigaction ignore {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    sigaction(SIGINT, &ignore, &old_int_);
    sigaction(SIGTERM, &ignore, &old_term_);
}

InterruptGuard::~InterruptGuard() {
    sigaction(SIGINT, &old_int_, nullptr);
    sigaction(SIGTERM, &old_term_, nullptr);
}

bool wait_for_enter(std::istream& in) {
    // Без SA_RESTART: сигнал прерывает read() и getline возвращает ошибку
    struct sigaction action {};
    struct sigaction old_int {};
    struct sigaction old_term {};
    action.sa_handler = on_interrupt;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;

    interrupt_signal = 0;
    sigaction(SIGINT, &action, &old_int);
    sigaction(SIGTERM, &action, &old_term);

    std::string line;
    bool got_line = static_cast<bool>(std::getline(in, line));

    sigaction(SIGINT, &old_int, nullptr);
    sigaction(SIGTERM, &old_term, nullptr);

    if (interrupt_signal != 0) {
        spdlog::info("Interrupted by signal {}", static_cast<int>(interrupt_signal));
        in.clear();
        return false;
    }
    return got_line;
}

} // namespace imgroot
