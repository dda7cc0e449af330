#include "mount_scaffold.hpp"
#include "resource_stack.hpp"
#include "utils.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

namespace imgroot {

namespace fs = std::filesystem;

namespace {

void create_placeholder(const std::string& path, bool as_file) {
    if (as_file) {
        int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
        if (fd < 0) {
            throw ScaffoldError("Failed to create file " + path + ": " + std::strerror(errno));
        }
        ::close(fd);
    } else if (::mkdir(path.c_str(), 0755) != 0) {
        throw ScaffoldError("Failed to create directory " + path + ": " + std::strerror(errno));
    }
}

} // namespace

PathSplit split_existing(const std::string& path, const ExistsPredicate& exists) {
    fs::path p = fs::path(path).lexically_normal();
    if (!p.is_absolute()) {
        throw ValidationError("Path must be absolute: " + path);
    }

    // "/a/b/" -> "/a/b"
    if (p.has_parent_path() && p.filename().empty()) {
        p = p.parent_path();
    }

    PathSplit split;
    while (p != p.root_path() && !exists(p.string())) {
        split.missing.insert(split.missing.begin(), p.filename().string());
        p = p.parent_path();
    }
    split.existing = p.string();
    return split;
}

ScaffoldRecord prepare_mount_point(const std::string& target, bool want_file) {
    PathSplit split = split_existing(target, path_exists);

    ScaffoldRecord record;
    if (split.missing.empty()) {
        return record;
    }

    fs::path current(split.existing);
    std::string top;

    try {
        for (size_t i = 0; i < split.missing.size(); ++i) {
            current /= split.missing[i];
            bool leaf = (i + 1 == split.missing.size());
            create_placeholder(current.string(), leaf && want_file);
            if (top.empty()) {
                top = current.string();
            }
        }
    } catch (const ScaffoldError&) {
        // Откатываем уже созданное: там ещё ничего не смонтировано
        if (!top.empty()) {
            std::error_code ec;
            fs::remove_all(top, ec);
            if (ec) {
                spdlog::error("Failed to roll back {}: {}", top, ec.message());
            }
        }
        throw;
    }

    if (split.missing.size() == 1) {
        record.kind = ScaffoldKind::Leaf;
        record.created = current.string();
        record.is_file = want_file;
    } else {
        record.kind = ScaffoldKind::Subtree;
        record.created = top;
    }

    spdlog::debug("created mount point {} (removal root {})", current.string(), record.created);
    return record;
}

void remove_scaffold(const ScaffoldRecord& record) {
    switch (record.kind) {
    case ScaffoldKind::None:
        return;

    case ScaffoldKind::Leaf: {
        int ret = record.is_file ? ::unlink(record.created.c_str())
                                 : ::rmdir(record.created.c_str());
        if (ret != 0 && errno != ENOENT) {
            throw ScaffoldError("Failed to remove " + record.created + ": " + std::strerror(errno));
        }
        break;
    }

    case ScaffoldKind::Subtree: {
        std::error_code ec;
        fs::remove_all(record.created, ec);
        if (ec) {
            throw ScaffoldError("Failed to remove " + record.created + ": " + ec.message());
        }
        break;
    }
    }

    spdlog::debug("removed mount point scaffold {}", record.created);
}

ScaffoldRecord prepare_scoped(ResourceStack& stack, const std::string& target, bool want_file,
                              const BusyPredicate& is_busy) {
    ScaffoldRecord record = prepare_mount_point(target, want_file);
    if (record.kind == ScaffoldKind::None) {
        return record;
    }

    stack.push("scaffold " + record.created, [record, is_busy]() {
        // Удаление под живой точкой монтирования затронуло бы файлы хоста
        if (is_busy && is_busy(record.created)) {
            throw ScaffoldError("Refusing to remove " + record.created +
                                ": a filesystem is still mounted below it");
        }
        remove_scaffold(record);
    });
    return record;
}

} // namespace imgroot
