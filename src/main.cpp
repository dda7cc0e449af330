#include "chroot_executor.hpp"
#include "image_mounter.hpp"
#include "loop_manager.hpp"
#include "mount_manager.hpp"
#include "utils.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <iomanip>
#include <cstring>

using namespace imgroot;

namespace {

/**
 * @brief Общие параметры команд run и mount
 */
struct SessionOptions {
    MountRequest request;
    std::string user;
    bool verbose = false;
    std::vector<std::string> positional;
};

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options] [arguments]\n"
              << "\n"
              << "Commands:\n"
              << "  run <image> [command...]   Mount the image and run a command inside it\n"
              << "                             (interactive shell if no command is given)\n"
              << "  mount <image> <dir>        Mount the image at <dir> until Enter is pressed\n"
              << "  partitions <image>         Show the partition table\n"
              << "  status <image>             Show loop devices and mounts of the image\n"
              << "\n"
              << "Options for run and mount:\n"
              << "  --root DIR                 Mount point (default: temporary directory)\n"
              << "  --bind HOST:IMAGE[:ro]     Bind mount a host path into the image (repeatable)\n"
              << "  --read-only                Attach and mount the image read-only\n"
              << "  --user NAME                Run as NAME through a login shell (run only)\n"
              << "  --umount-attempts N        Unmount attempts (default: "
              << ImageMounter::DEFAULT_UNMOUNT_ATTEMPTS << ")\n"
              << "  --umount-backoff MS        Pause between unmount attempts (default: "
              << ImageMounter::DEFAULT_UNMOUNT_BACKOFF_MS << ")\n"
              << "  -v, --verbose              Debug logging\n"
              << "\n"
              << "Examples:\n"
              << "  " << program_name << " run raspios.img /bin/true\n"
              << "  " << program_name << " run --bind /tmp/foo:/mnt/data raspios.img ls /mnt/data\n"
              << "  " << program_name << " run --user pi raspios.img\n"
              << "  " << program_name << " mount --read-only raspios.img /mnt/image\n"
              << "  " << program_name << " partitions raspios.img\n";
}

unsigned long parse_count(const std::string& option, const std::string& value) {
    try {
        size_t pos = 0;
        unsigned long n = std::stoul(value, &pos);
        if (pos == value.size() && value[0] != '-') {
            return n;
        }
    } catch (const std::logic_error&) {
        throw ValidationError("Invalid value for " + option + ": " + value);
    }
    throw ValidationError("Invalid value for " + option + ": " + value);
}

/**
 * @brief Разбирает опции команды
 * @param options_until_positional После стольких позиционных аргументов
 *        остаток argv не разбирается (для run это команда внутри образа)
 */
SessionOptions parse_session_options(int argc, char* argv[], size_t options_until_positional) {
    SessionOptions opts;
    opts.request.retry.attempts = ImageMounter::DEFAULT_UNMOUNT_ATTEMPTS;
    opts.request.retry.backoff = std::chrono::milliseconds(ImageMounter::DEFAULT_UNMOUNT_BACKOFF_MS);

    int i = 2;
    for (; i < argc; ++i) {
        std::string arg = argv[i];

        if (opts.positional.size() >= options_until_positional) {
            break;
        }
        if (arg == "--") {
            ++i;
            break;
        }

        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw ValidationError("Missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "--root") {
            opts.request.root_dir = value();
        } else if (arg == "--bind") {
            opts.request.mounts.push_back(parse_mount_spec(value()));
        } else if (arg == "--read-only") {
            opts.request.read_only = true;
        } else if (arg == "--user") {
            opts.user = value();
        } else if (arg == "--umount-attempts") {
            opts.request.retry.attempts = static_cast<unsigned>(parse_count(arg, value()));
            if (opts.request.retry.attempts == 0) {
                throw ValidationError("--umount-attempts must be at least 1");
            }
        } else if (arg == "--umount-backoff") {
            opts.request.retry.backoff = std::chrono::milliseconds(parse_count(arg, value()));
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw ValidationError("Unknown option '" + arg + "'");
        } else {
            opts.positional.push_back(arg);
        }
    }

    for (; i < argc; ++i) {
        opts.positional.push_back(argv[i]);
    }
    return opts;
}

void report_teardown(const ScopeResult& result) {
    if (result.teardown_error) {
        std::cerr << "Warning: cleanup incomplete: " << describe_error(result.teardown_error) << "\n";
    }
}

int cmd_run(int argc, char* argv[]) {
    SessionOptions opts;
    try {
        opts = parse_session_options(argc, argv, 1);
    } catch (const ValidationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
    init_logging(opts.verbose);

    if (opts.positional.empty()) {
        std::cerr << "Error: Missing image file\n";
        std::cerr << "Usage: " << argv[0] << " run [options] <image> [command...]\n";
        return 2;
    }

    opts.request.image = opts.positional[0];
    std::vector<std::string> command(opts.positional.begin() + 1, opts.positional.end());

    if (!is_root()) {
        std::cerr << "Error: This operation requires root privileges\n";
        return 1;
    }

    try {
        ImageMounter mounter;
        ChrootExecutor executor;
        InterruptGuard guard;

        ScopeResult result = mounter.mount_image(opts.request, [&](const std::string& root_dir) {
            ScopeResult inner = executor.run(root_dir, command, opts.user);
            report_teardown(inner);
            return inner.exit_code;
        });

        // Ошибка размонтирования не меняет код возврата команды
        report_teardown(result);
        return result.exit_code;

    } catch (const ImgrootError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

int cmd_mount(int argc, char* argv[]) {
    SessionOptions opts;
    try {
        opts = parse_session_options(argc, argv, 2);
    } catch (const ValidationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
    init_logging(opts.verbose);

    if (opts.positional.size() != 2) {
        std::cerr << "Error: Expected image file and mount directory\n";
        std::cerr << "Usage: " << argv[0] << " mount [options] <image> <dir>\n";
        return 2;
    }
    if (!opts.user.empty()) {
        std::cerr << "Error: --user is only supported by run\n";
        return 2;
    }

    opts.request.image = opts.positional[0];
    opts.request.root_dir = opts.positional[1];

    if (!is_root()) {
        std::cerr << "Error: This operation requires root privileges\n";
        return 1;
    }

    try {
        ImageMounter mounter;
        InterruptGuard guard;

        ScopeResult result = mounter.mount_image(opts.request, [&](const std::string& root_dir) {
            std::cout << "Image '" << opts.request.image << "' mounted at " << root_dir << "\n";
            std::cout << "Press Enter to unmount...";
            std::cout.flush();

            // Ctrl-C, как и EOF, ведёт к обычному размонтированию
            if (!wait_for_enter(std::cin)) {
                std::cout << "\n";
            }
            return 0;
        });

        report_teardown(result);
        std::cout << "Image '" << opts.request.image << "' unmounted.\n";
        return result.exit_code;

    } catch (const ImgrootError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

int cmd_partitions(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Error: Missing image file\n";
        std::cerr << "Usage: " << argv[0] << " partitions <image>\n";
        return 2;
    }
    init_logging(false);

    std::string image = argv[2];

    try {
        ImageMounter mounter;
        PartitionTable table = mounter.read_partitions(image);

        if (table.empty()) {
            std::cout << "No partitions in " << image << "\n";
            return 0;
        }

        std::cout << "Label: " << (table.label.empty() ? "unknown" : table.label);
        if (!table.label_id.empty()) {
            std::cout << " (" << table.label_id << ")";
        }
        std::cout << ", sector size " << table.sector_size << "\n\n";

        std::cout << std::left
                  << std::setw(4) << "#"
                  << std::setw(14) << "Start"
                  << std::setw(14) << "End"
                  << std::setw(8) << "Size"
                  << "Type\n";

        for (const auto& p : table.partitions) {
            std::cout << std::setw(4) << p.number
                      << std::setw(14) << p.start()
                      << std::setw(14) << p.end()
                      << std::setw(8) << format_size(p.size())
                      << (p.type_name.empty() ? p.type : p.type_name)
                      << (p.bootable ? " *" : "") << "\n";
        }
        return 0;

    } catch (const ImgrootError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

int cmd_status(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Error: Missing image file\n";
        std::cerr << "Usage: " << argv[0] << " status <image>\n";
        return 2;
    }
    init_logging(false);

    try {
        std::string image = absolute_path(argv[2]);
        ImageMounter mounter;

        bool found = false;
        for (const auto& [loop_dev, backing_file] : mounter.loop().list_attached()) {
            if (backing_file != image) continue;
            found = true;

            std::cout << image << "\n";
            std::cout << "  Loop device: " << loop_dev << "\n";

            for (const auto& entry : mounter.mounts().list_mounts()) {
                if (is_loop_partition_of(entry.source, loop_dev)) {
                    std::cout << "  Mounted:     " << entry.source << " on " << entry.target
                              << " (" << entry.fstype << ")\n";
                }
            }
        }

        if (!found) {
            std::cout << "Image '" << argv[2] << "' is not attached.\n";
        }
        return 0;

    } catch (const ImgrootError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 2;
    }

    std::string command = argv[1];

    if (command == "run") {
        return cmd_run(argc, argv);
    } else if (command == "mount") {
        return cmd_mount(argc, argv);
    } else if (command == "partitions") {
        return cmd_partitions(argc, argv);
    } else if (command == "status") {
        return cmd_status(argc, argv);
    } else if (command == "-h" || command == "--help" || command == "help") {
        print_usage(argv[0]);
        return 0;
    } else {
        std::cerr << "Error: Unknown command '" << command << "'\n\n";
        print_usage(argv[0]);
        return 2;
    }
}
