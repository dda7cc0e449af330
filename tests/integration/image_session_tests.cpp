/**
 * Integration test: real loop devices, mounts and chroot
 *
 * Needs root and sfdisk, mkfs.vfat, mkfs.ext4, losetup. Skipped otherwise.
 */

#include "chroot_executor.hpp"
#include "image_mounter.hpp"
#include "loop_manager.hpp"
#include "mount_manager.hpp"
#include "resource_stack.hpp"
#include "test_helpers.hpp"

#include <doctest/doctest.h>

#include <filesystem>

using namespace imgroot;

namespace fs = std::filesystem;

namespace {

bool environment_ready() {
    if (!is_root()) {
        MESSAGE("not running as root, skipping");
        return false;
    }
    for (const char* tool : {"sfdisk", "mkfs.vfat", "mkfs.ext4", "losetup", "truncate", "mount"}) {
        if (!command_available(tool)) {
            MESSAGE(tool << " not available, skipping");
            return false;
        }
    }
    return true;
}

// 64M, dos: 16M FAT в разделе 1, ext4 с пустым /boot в разделе 2
bool build_image(const std::string& image, const std::string& staging) {
    REQUIRE(execute_command("truncate -s 64M " + shell_quote(image)).exit_code == 0);
    CommandResult res = execute_command(
        "printf 'label: dos\\nstart=2048, size=32768, type=c\\nstart=34816, type=83\\n' | sfdisk --no-reread " +
        shell_quote(image));
    REQUIRE_MESSAGE(res.exit_code == 0, res.output);

    LoopManager loop;
    MountManager mounts;
    ResourceStack stack;
    try {
        const DeviceMap& devices = loop.attach_scoped(stack, image, false, 2);

        res = execute_command("mkfs.vfat " + shell_quote(devices.at(1)));
        CHECK_MESSAGE(res.exit_code == 0, res.output);
        res = execute_command("mkfs.ext4 -q -F " + shell_quote(devices.at(2)));
        REQUIRE_MESSAGE(res.exit_code == 0, res.output);

        // /boot должен существовать для сеанса только для чтения
        mounts.mount(devices.at(2), staging, false);
        stack.push("staging", [&mounts, staging]() { mounts.unmount(staging, RetryPolicy{}); });
        fs::create_directories(staging + "/boot");
    } catch (const AttachError& e) {
        // Контейнер без /dev/loop-control
        MESSAGE("loop devices unavailable: " << e.what());
        CHECK(!stack.unwind());
        return false;
    }
    CHECK(!stack.unwind());
    return true;
}

std::vector<MountSpec> host_toolchain_binds() {
    std::vector<MountSpec> binds;
    for (const char* dir : {"/bin", "/lib", "/lib64", "/usr"}) {
        if (directory_exists(dir)) {
            binds.push_back(MountSpec{dir, dir, true});
        }
    }
    return binds;
}

} // namespace

TEST_CASE("image session with real loop devices") {
    if (!environment_ready()) {
        return;
    }

    TempTestDir tmp;
    REQUIRE(!tmp.path.empty());
    std::string image = tmp.sub("disk.img");
    std::string root = tmp.sub("root");
    fs::create_directories(root);

    std::string staging = tmp.sub("staging");
    fs::create_directories(staging);
    if (!build_image(image, staging)) {
        return;
    }

    ImageMounter mounter;
    LoopManager probe;
    MountManager mounts;

    MountRequest request;
    request.image = image;
    request.root_dir = root;
    request.mounts = host_toolchain_binds();
    request.retry.backoff = std::chrono::milliseconds(200);

    SUBCASE("partition table of the built image") {
        PartitionTable table = mounter.read_partitions(image);
        REQUIRE(table.size() == 2);
        CHECK(table.partitions[0].start() == 2048ULL * 512);
        CHECK(table.partitions[1].end() == 64ULL * 1024 * 1024);
    }

    SUBCASE("commands run in chroot with ld.so.preload disabled") {
        ScopeResult session = mounter.mount_image(request, [&](const std::string& root_dir) {
            CHECK(mounts.is_mounted(root_dir));
            CHECK(mounts.is_mounted(root_dir + "/boot"));
            CHECK(directory_exists(root_dir + "/lost+found"));

            bool boot_is_vfat = false;
            for (const auto& entry : mounts.list_mounts()) {
                if (entry.target == root_dir + "/boot") {
                    boot_is_vfat = (entry.fstype == "vfat");
                }
            }
            CHECK(boot_is_vfat);

            fs::create_directories(root_dir + "/etc");
            write_file(root_dir + "/etc/ld.so.preload", "/usr/lib/libnot-there.so\n");

            ChrootExecutor executor;
            ScopeResult ok = executor.run(root_dir, {"/bin/true"});
            CHECK(ok.exit_code == 0);
            CHECK(!ok.teardown_error);

            ScopeResult code = executor.run(root_dir, {"/bin/sh", "-c", "exit 3"});
            CHECK(code.exit_code == 3);

            ScopeResult hidden = executor.run(root_dir, {"/bin/sh", "-c", "test ! -e /etc/ld.so.preload"});
            CHECK(hidden.exit_code == 0);

            CHECK(read_file(root_dir + "/etc/ld.so.preload") == "/usr/lib/libnot-there.so\n");
            return 0;
        });

        CHECK(session.exit_code == 0);
        CHECK(!session.teardown_error);
        CHECK(probe.find_loop_for_file(image).empty());
        CHECK(!mounts.has_mounts_under(root));
        CHECK(fs::is_empty(root));

        // Во втором сеансе заготовок bind-mount'ов нет, ld.so.preload на месте
        request.mounts.clear();
        request.read_only = true;
        ScopeResult again = mounter.mount_image(request, [&](const std::string& root_dir) {
            CHECK(!path_exists(root_dir + "/usr"));
            CHECK(!path_exists(root_dir + "/bin"));
            CHECK(read_file(root_dir + "/etc/ld.so.preload") == "/usr/lib/libnot-there.so\n");
            CHECK(!path_exists(root_dir + "/etc/ld.so.preload.imgroot-disabled"));

            // Только чтение
            CHECK(execute_command("touch " + shell_quote(root_dir + "/etc/new-file")).exit_code != 0);
            return 0;
        });
        CHECK(!again.teardown_error);
    }

    SUBCASE("failure inside the session still releases everything") {
        CHECK_THROWS_AS(mounter.mount_image(request, [](const std::string&) -> int {
            throw ExecError("simulated launch failure");
        }), ExecError);

        CHECK(probe.find_loop_for_file(image).empty());
        CHECK(!mounts.has_mounts_under(root));
    }

    SUBCASE("bind mount of a missing host path fails before attaching") {
        request.mounts.push_back(MountSpec{tmp.sub("missing"), "/opt/data", false});
        CHECK_THROWS_AS(mounter.mount_image(request, [](const std::string&) { return 0; }), ValidationError);
        CHECK(probe.find_loop_for_file(image).empty());
    }
}
