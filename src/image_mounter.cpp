#include "image_mounter.hpp"
#include "loop_manager.hpp"
#include "mount_manager.hpp"
#include "mount_scaffold.hpp"
#include "utils.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <unistd.h>

namespace imgroot {

namespace fs = std::filesystem;

namespace {

// Путь внутри образа, приведённый к виду "/a/b"
std::string normalize_image_path(const std::string& image_path) {
    std::string normal = fs::path(image_path).lexically_normal().string();
    while (normal.size() > 1 && normal.back() == '/') {
        normal.pop_back();
    }
    return normal;
}

} // namespace

void MountSpec::validate() const {
    if (image_path.empty() || image_path[0] != '/') {
        throw ValidationError("Image path must be absolute: " + image_path);
    }
    if (normalize_image_path(image_path) == "/") {
        throw ValidationError("Cannot bind mount over the image root");
    }
    if (!file_exists(host_path) && !directory_exists(host_path)) {
        throw ValidationError("Host path does not exist or is not a file or directory: " + host_path);
    }
}

MountSpec parse_mount_spec(const std::string& text) {
    MountSpec spec;
    std::string rest = text;

    // Необязательный суффикс режима
    size_t last = rest.rfind(':');
    if (last != std::string::npos) {
        std::string mode = rest.substr(last + 1);
        if (mode == "ro" || mode == "rw") {
            spec.read_only = (mode == "ro");
            rest = rest.substr(0, last);
        }
    }

    size_t sep = rest.find(':');
    if (sep == std::string::npos || sep == 0 || sep + 1 == rest.size()) {
        throw ValidationError("Invalid mount spec '" + text + "', expected HOST:IMAGE[:ro|:rw]");
    }

    spec.host_path = rest.substr(0, sep);
    spec.image_path = rest.substr(sep + 1);
    return spec;
}

ImageMounter::ImageMounter()
    : reader_(std::make_unique<PartitionTableReader>())
    , loop_(std::make_unique<LoopManager>())
    , mounts_(std::make_unique<MountManager>()) {
}

ImageMounter::ImageMounter(std::unique_ptr<PartitionTableReader> reader,
                           std::unique_ptr<LoopManager> loop,
                           std::unique_ptr<MountManager> mounts)
    : reader_(std::move(reader))
    , loop_(std::move(loop))
    , mounts_(std::move(mounts)) {
}

ImageMounter::~ImageMounter() = default;

PartitionTable ImageMounter::read_partitions(const std::string& image_path) {
    if (!file_exists(image_path)) {
        throw ValidationError("Image file not found: " + image_path);
    }
    return reader_->read(image_path);
}

ScopeResult ImageMounter::mount_image(const MountRequest& request, const SessionBody& body) {
    // Проверки до захвата ресурсов
    if (!file_exists(request.image)) {
        throw ValidationError("Image file not found: " + request.image);
    }
    for (const auto& spec : request.mounts) {
        spec.validate();
    }

    std::string image = absolute_path(request.image);
    PartitionTable table = reader_->read(image);
    table.require_boot_and_root();

    std::string root_dir;

    auto acquire = [&](ResourceStack& stack) {
        // 1. Корневая директория (временная или заданная)
        root_dir = prepare_root(stack, request.root_dir);

        // 2. Подключаем образ как loop-устройство
        const DeviceMap& devices = loop_->attach_scoped(stack, image, request.read_only, table.size());

        auto root_dev = devices.find(PartitionTable::ROOT_PARTITION);
        auto boot_dev = devices.find(PartitionTable::BOOT_PARTITION);
        if (root_dev == devices.end() || boot_dev == devices.end()) {
            throw AttachError("Loop device for " + image + " has no boot or root partition node");
        }

        // 3. Корневая файловая система
        mount_scoped(stack, root_dev->second, root_dir, request.read_only, request.retry);

        // 4. Загрузочный раздел в /boot
        std::string boot_dir = root_dir + "/boot";
        prepare_scoped(stack, boot_dir, false,
                       [this](const std::string& p) { return mounts_->has_mounts_under(p); });
        mount_scoped(stack, boot_dev->second, boot_dir, request.read_only, request.retry);

        // 5. Bind-mount'ы в порядке списка, поверх root и boot
        for (const auto& spec : request.mounts) {
            bind_scoped(stack, spec, root_dir, request.retry);
        }

        spdlog::info("Mounted {} at {}", image, root_dir);
    };

    ScopeResult result = run_scoped(acquire, [&]() { return body(root_dir); });

    if (result.teardown_error) {
        spdlog::warn("Teardown of {} was incomplete: {}", image, describe_error(result.teardown_error));
    } else {
        spdlog::debug("Unmounted {}", image);
    }
    return result;
}

std::string ImageMounter::prepare_root(ResourceStack& stack, const std::string& root_dir) {
    if (root_dir.empty()) {
        const char* tmp = std::getenv("TMPDIR");
        std::string tmpl = std::string(tmp && *tmp ? tmp : "/tmp") + "/imgroot.XXXXXX";
        if (mkdtemp(tmpl.data()) == nullptr) {
            throw ScaffoldError("Failed to create temporary directory: " + std::string(std::strerror(errno)));
        }

        std::string created = tmpl;
        stack.push("temporary root " + created, [this, created]() {
            if (mounts_->has_mounts_under(created)) {
                throw ScaffoldError("Refusing to remove " + created + ": still mounted");
            }
            if (::rmdir(created.c_str()) != 0) {
                throw ScaffoldError("Failed to remove " + created + ": " + std::strerror(errno));
            }
        });
        return created;
    }

    std::string root = normalize_image_path(fs::absolute(root_dir).string());
    if (root == "/") {
        throw ValidationError("Refusing to mount an image over /");
    }

    prepare_scoped(stack, root, false,
                   [this](const std::string& p) { return mounts_->has_mounts_under(p); });
    return root;
}

void ImageMounter::mount_scoped(ResourceStack& stack, const std::string& device,
                                const std::string& mount_point, bool read_only,
                                const RetryPolicy& retry) {
    mounts_->mount(device, mount_point, read_only);
    stack.push("mount " + mount_point, [this, mount_point, retry]() {
        mounts_->unmount(mount_point, retry);
    });
}

void ImageMounter::bind_scoped(ResourceStack& stack, const MountSpec& spec,
                               const std::string& root_dir, const RetryPolicy& retry) {
    std::string target = root_dir + normalize_image_path(spec.image_path);

    prepare_scoped(stack, target, file_exists(spec.host_path),
                   [this](const std::string& p) { return mounts_->has_mounts_under(p); });

    mounts_->bind(spec.host_path, target);
    stack.push("bind " + target, [this, target, retry]() {
        mounts_->unmount(target, retry);
    });

    // Снимается тем же umount, что уже в стеке
    if (spec.read_only) {
        mounts_->remount_read_only(target);
    }
}

} // namespace imgroot
