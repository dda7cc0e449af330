#include "chroot_executor.hpp"
#include "utils.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <sys/wait.h>

namespace imgroot {

namespace {

// Что сообщает дочерний процесс через pipe, если exec не состоялся
struct ChildFailure {
    int stage;  // 0 - chroot, 1 - chdir, 2 - exec
    int error;
};

[[noreturn]] void child_fail(int fd, int stage) {
    ChildFailure failure{stage, errno};
    ssize_t ignored = ::write(fd, &failure, sizeof(failure));
    (void)ignored;
    _exit(127);
}

} // namespace

std::vector<std::string> build_command(const std::vector<std::string>& command,
                                       const std::string& user,
                                       const std::string& shell) {
    if (!user.empty()) {
        std::vector<std::string> argv = {"su", "--login", user};
        if (!command.empty()) {
            argv.push_back("--command");
            argv.push_back(join_command(command));
        }
        return argv;
    }

    if (command.empty()) {
        return {shell.empty() ? "/bin/sh" : shell, "-i"};
    }
    return command;
}

bool disable_preload(ResourceStack& stack, const std::string& root_dir) {
    std::string preload = root_dir + ChrootExecutor::PRELOAD_FILE;
    std::string aside = preload + ChrootExecutor::PRELOAD_DISABLED_SUFFIX;

    if (!path_exists(preload)) {
        if (path_exists(aside)) {
            spdlog::warn("{} exists without {}; left from an interrupted run?", aside, preload);
        }
        return false;
    }

    if (path_exists(aside)) {
        throw ScaffoldError("Cannot disable " + preload + ": " + aside + " already exists");
    }

    if (::rename(preload.c_str(), aside.c_str()) != 0) {
        if (errno == EROFS) {
            spdlog::warn("Root is read-only, {} stays active", preload);
            return false;
        }
        throw ScaffoldError("Failed to move " + preload + " aside: " + std::strerror(errno));
    }
    spdlog::debug("moved {} to {}", preload, aside);

    stack.push("ld.so.preload " + preload, [preload, aside]() {
        if (::rename(aside.c_str(), preload.c_str()) != 0) {
            throw ScaffoldError("Failed to restore " + preload + ": " + std::strerror(errno));
        }
        spdlog::debug("restored {}", preload);
    });
    return true;
}

ScopeResult ChrootExecutor::run(const std::string& root_dir, const std::vector<std::string>& command,
                                const std::string& user) {
    const char* shell = std::getenv("SHELL");
    std::vector<std::string> argv = build_command(command, user, shell ? shell : "");

    ScopeResult result = run_scoped(
        [&](ResourceStack& stack) { disable_preload(stack, root_dir); },
        [&]() { return execute(root_dir, argv); });

    if (result.teardown_error) {
        spdlog::warn("{}", describe_error(result.teardown_error));
    }
    return result;
}

int ChrootExecutor::execute(const std::string& root_dir, const std::vector<std::string>& argv) {
    if (argv.empty()) {
        throw ExecError("Empty command");
    }

    std::vector<char*> c_argv;
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    int err_pipe[2] = {-1, -1};
    if (pipe2(err_pipe, O_CLOEXEC) < 0) {
        throw ExecError("Failed to create pipe: " + std::string(std::strerror(errno)));
    }

    // Пока ждём дочерний процесс, Ctrl-C достаётся ему, а мы доходим до размонтирования
    struct sigaction ignore {};
    struct sigaction old_int {};
    struct sigaction old_quit {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    sigaction(SIGINT, &ignore, &old_int);
    sigaction(SIGQUIT, &ignore, &old_quit);

    auto restore_signals = [&]() {
        sigaction(SIGINT, &old_int, nullptr);
        sigaction(SIGQUIT, &old_quit, nullptr);
    };

    spdlog::debug("chroot {}: {}", root_dir, join_command(argv));

    pid_t pid = fork();
    if (pid < 0) {
        int fork_errno = errno;
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        restore_signals();
        throw ExecError("Failed to fork: " + std::string(std::strerror(fork_errno)));
    }

    if (pid == 0) {
        // Дочерний процесс
        ::close(err_pipe[0]);
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGQUIT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);

        if (::chroot(root_dir.c_str()) != 0) {
            child_fail(err_pipe[1], 0);
        }
        if (::chdir("/") != 0) {
            child_fail(err_pipe[1], 1);
        }
        execvp(c_argv[0], c_argv.data());
        child_fail(err_pipe[1], 2);
    }

    ::close(err_pipe[1]);

    ChildFailure failure{};
    ssize_t n;
    do {
        n = ::read(err_pipe[0], &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    ::close(err_pipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            restore_signals();
            throw ExecError("waitpid failed: " + std::string(std::strerror(errno)));
        }
    }
    restore_signals();

    if (n == static_cast<ssize_t>(sizeof(failure))) {
        std::string what;
        switch (failure.stage) {
        case 0:
            what = "chroot into " + root_dir;
            break;
        case 1:
            what = "chdir to / in " + root_dir;
            break;
        default:
            what = "execute " + argv[0];
            break;
        }
        throw ExecError("Failed to " + what + ": " + std::strerror(failure.error));
    }

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace imgroot
