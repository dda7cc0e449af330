#include "mount_manager.hpp"
#include "utils.hpp"

#include <spdlog/spdlog.h>

#include <climits>
#include <cstdlib>
#include <utility>
#include <mntent.h>

namespace imgroot {

namespace {

std::string resolve(const std::string& path) {
    char resolved[PATH_MAX];
    if (realpath(path.c_str(), resolved) == nullptr) {
        return "";
    }
    return std::string(resolved);
}

} // namespace

MountManager::MountManager(std::string mounts_file)
    : mounts_file_(std::move(mounts_file)) {
}

void MountManager::mount(const std::string& device, const std::string& mount_point, bool read_only) {
    std::string cmd = "mount ";
    if (read_only) {
        cmd += "-o ro ";
    }
    cmd += shell_quote(device) + " " + shell_quote(mount_point);

    CommandResult res = execute_command(cmd);
    if (res.exit_code != 0) {
        throw MountError("Failed to mount " + device + " to " + mount_point + ": " + res.output);
    }
    spdlog::debug("mounted {} at {}{}", device, mount_point, read_only ? " (ro)" : "");
}

void MountManager::bind(const std::string& source, const std::string& mount_point) {
    CommandResult res = execute_command("mount --bind " + shell_quote(source) + " " + shell_quote(mount_point));
    if (res.exit_code != 0) {
        throw MountError("Failed to bind " + source + " to " + mount_point + ": " + res.output);
    }
    spdlog::debug("bound {} at {}", source, mount_point);
}

void MountManager::remount_read_only(const std::string& mount_point) {
    // Флаг ro для bind применяется только через remount
    CommandResult res = execute_command("mount -o remount,bind,ro " + shell_quote(mount_point));
    if (res.exit_code != 0) {
        throw MountError("Failed to make bind mount " + mount_point + " read-only: " + res.output);
    }
    spdlog::debug("remounted {} read-only", mount_point);
}

bool MountManager::try_unmount(const std::string& mount_point) {
    CommandResult res = execute_command("umount " + shell_quote(mount_point));
    if (res.exit_code != 0) {
        spdlog::debug("umount {} failed: {}", mount_point, res.output);
        return false;
    }
    return true;
}

void MountManager::unmount(const std::string& mount_point, const RetryPolicy& policy) {
    unsigned attempts = policy.attempts > 0 ? policy.attempts : 1;

    for (unsigned attempt = 1; attempt <= attempts; ++attempt) {
        if (try_unmount(mount_point)) {
            if (attempt > 1) {
                spdlog::debug("unmounted {} after {} attempts", mount_point, attempt);
            }
            return;
        }
        if (attempt < attempts) {
            spdlog::debug("{} is busy, retrying ({}/{})", mount_point, attempt, attempts);
            policy.wait();
        }
    }

    throw MountError("Failed to unmount " + mount_point + " after " +
                     std::to_string(attempts) + " attempts");
}

bool MountManager::is_mounted(const std::string& mount_point) {
    // Получаем абсолютный путь
    std::string abs_path = resolve(mount_point);
    if (abs_path.empty()) {
        return false;
    }

    for (const auto& entry : list_mounts()) {
        if (entry.target == abs_path) {
            return true;
        }
    }
    return false;
}

bool MountManager::has_mounts_under(const std::string& path) {
    std::string abs_path = resolve(path);
    if (abs_path.empty()) {
        return false;
    }

    std::string prefix = abs_path == "/" ? abs_path : abs_path + "/";
    for (const auto& entry : list_mounts()) {
        if (entry.target == abs_path || entry.target.compare(0, prefix.size(), prefix) == 0) {
            return true;
        }
    }
    return false;
}

std::vector<MountEntry> MountManager::list_mounts() {
    std::vector<MountEntry> result;

    // Читаем /proc/mounts
    FILE* mtab = setmntent(mounts_file_.c_str(), "r");
    if (!mtab) {
        return result;
    }

    struct mntent* entry;
    while ((entry = getmntent(mtab)) != nullptr) {
        result.push_back(MountEntry{entry->mnt_fsname, entry->mnt_dir, entry->mnt_type});
    }

    endmntent(mtab);
    return result;
}

} // namespace imgroot
