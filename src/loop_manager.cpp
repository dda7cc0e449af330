#include "loop_manager.hpp"
#include "resource_stack.hpp"
#include "utils.hpp"

#include <spdlog/spdlog.h>

#include <sstream>
#include <fstream>
#include <filesystem>
#include <algorithm>
#include <climits>
#include <cstdlib>
#include <utility>

namespace imgroot {

namespace fs = std::filesystem;

LoopManager::LoopManager(std::string sysfs_block, std::string dev_dir)
    : sysfs_block_(std::move(sysfs_block))
    , dev_dir_(std::move(dev_dir)) {
}

std::string LoopManager::attach(const std::string& image_path, bool read_only) {
    // Параллельные сессии с одним образом не поддерживаются, только предупреждаем
    std::string existing = find_loop_for_file(image_path);
    if (!existing.empty()) {
        spdlog::warn("{} is already attached as {}", image_path, existing);
    }

    // losetup --find --show --partscan [--read-only] <image_path>
    std::string cmd = "losetup --find --show --partscan ";
    if (read_only) {
        cmd += "--read-only ";
    }
    cmd += shell_quote(image_path);

    CommandResult res = execute_command(cmd);
    if (res.exit_code != 0) {
        throw AttachError("Failed to attach " + image_path + " as loop device: " + res.output);
    }

    // stderr смешан с stdout: предупреждения losetup идут отдельными строками
    std::string loop_device = parse_attached_device(res.output);
    if (loop_device.empty()) {
        throw AttachError("Invalid loop device returned: " + res.output);
    }

    std::istringstream lines(res.output);
    std::string line;
    while (std::getline(lines, line)) {
        line = trim(line);
        if (!line.empty() && line != loop_device) {
            spdlog::warn("{}", line);
        }
    }

    spdlog::debug("attached {} as {}{}", image_path, loop_device, read_only ? " (ro)" : "");
    return loop_device;
}

void LoopManager::detach(const std::string& loop_device) {
    // losetup -d /dev/loopX
    CommandResult res = execute_command("losetup -d " + shell_quote(loop_device));
    if (res.exit_code != 0) {
        throw AttachError("Failed to detach loop device " + loop_device + ": " + res.output);
    }
    spdlog::debug("detached {}", loop_device);
}

DeviceMap LoopManager::partition_devices(const std::string& loop_device) {
    std::string name = fs::path(loop_device).filename().string();
    fs::path block_dir = fs::path(sysfs_block_) / name;

    DeviceMap devices;
    for (unsigned attempt = 1; ; ++attempt) {
        devices.clear();

        std::error_code ec;
        for (fs::directory_iterator it(block_dir, ec), end; !ec && it != end; it.increment(ec)) {
            std::string entry = it->path().filename().string();
            if (entry.compare(0, name.size(), name) != 0) continue;

            // Раздел ядро описывает файлом <loopNpK>/partition с номером
            std::ifstream number_file(it->path() / "partition");
            int number = 0;
            if (!(number_file >> number) || number <= 0) continue;

            devices[number] = (fs::path(dev_dir_) / entry).string();
        }

        bool nodes_ready = !devices.empty() &&
            std::all_of(devices.begin(), devices.end(),
                        [](const DeviceMap::value_type& d) { return path_exists(d.second); });

        if (nodes_ready || attempt >= wait_policy_.attempts) {
            break;
        }

        spdlog::debug("waiting for partition devices of {} (attempt {}/{})",
                      loop_device, attempt, wait_policy_.attempts);
        wait_policy_.wait();
    }

    // Возвращаем только узлы, которые действительно появились
    for (auto it = devices.begin(); it != devices.end();) {
        if (!path_exists(it->second)) {
            spdlog::warn("Partition device {} did not appear", it->second);
            it = devices.erase(it);
        } else {
            ++it;
        }
    }
    return devices;
}

const DeviceMap& LoopManager::attach_scoped(ResourceStack& stack, const std::string& image_path,
                                            bool read_only, size_t expected_partitions) {
    std::string loop_device = attach(image_path, read_only);

    // Отключение регистрируем сразу: ошибка ниже не должна оставить устройство
    sessions_.emplace_back();
    auto session = std::prev(sessions_.end());
    stack.push("loop device " + loop_device, [this, session, loop_device]() {
        sessions_.erase(session);
        detach(loop_device);
    });

    *session = partition_devices(loop_device);

    if (session->empty()) {
        throw AttachError("No partition devices appeared for " + loop_device);
    }
    if (session->size() != expected_partitions) {
        throw AttachError("Expected " + std::to_string(expected_partitions) +
                          " partition devices for " + loop_device + ", found " +
                          std::to_string(session->size()));
    }

    for (const auto& [number, device] : *session) {
        spdlog::debug("  partition {} -> {}", number, device);
    }
    return *session;
}

std::string LoopManager::find_loop_for_file(const std::string& image_path) {
    // Получаем абсолютный путь к файлу для сравнения
    char resolved_path[PATH_MAX];
    if (realpath(image_path.c_str(), resolved_path) == nullptr) {
        return ""; // Файл не существует
    }
    std::string abs_path(resolved_path);

    // losetup -j <image_path> выводит ассоциированные loop-устройства
    CommandResult res = execute_command("losetup -j " + shell_quote(abs_path));
    if (res.exit_code != 0 || res.output.empty()) {
        return "";
    }

    // Формат вывода: /dev/loop0: [64769]:123456 (/path/to/file)
    // Извлекаем имя устройства до двоеточия
    std::string first_line = res.output.substr(0, res.output.find('\n'));
    size_t colon_pos = first_line.find(':');
    if (colon_pos != std::string::npos) {
        return first_line.substr(0, colon_pos);
    }

    return "";
}

std::vector<std::pair<std::string, std::string>> LoopManager::list_attached() {
    // losetup -l выводит список всех loop-устройств
    CommandResult res = execute_command("losetup -l -n -O NAME,BACK-FILE");
    if (res.exit_code != 0) {
        spdlog::warn("Cannot list loop devices: {}", res.output);
        return {};
    }
    return parse_losetup_list(res.output);
}

std::vector<std::pair<std::string, std::string>> parse_losetup_list(const std::string& text) {
    std::vector<std::pair<std::string, std::string>> result;

    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        line = trim(line);
        if (line.empty()) continue;

        // Разбираем строку: "/dev/loop0  /path/to/file"
        std::istringstream iss(line);
        std::string device, file;
        iss >> device;

        // Остаток строки - путь к файлу (может содержать пробелы)
        std::getline(iss >> std::ws, file);

        if (!device.empty() && !file.empty()) {
            result.emplace_back(device, file);
        }
    }

    return result;
}

std::string parse_attached_device(const std::string& output) {
    std::istringstream lines(output);
    std::string line;
    std::string device;
    while (std::getline(lines, line)) {
        line = trim(line);
        if (line.compare(0, 9, "/dev/loop") == 0 && line.size() > 9 &&
            line.find_first_of(" \t:") == std::string::npos) {
            device = line;
        }
    }
    return device;
}

bool is_loop_partition_of(const std::string& device, const std::string& loop_device) {
    if (device == loop_device) {
        return true;
    }
    std::string prefix = loop_device + "p";
    if (device.size() <= prefix.size() || device.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    return std::all_of(device.begin() + prefix.size(), device.end(),
                       [](char c) { return c >= '0' && c <= '9'; });
}

} // namespace imgroot
