/**
 * Unit tests for LoopManager partition discovery and scoped attachment
 */

#include "loop_manager.hpp"
#include "resource_stack.hpp"
#include "test_helpers.hpp"

#include <doctest/doctest.h>

#include <filesystem>

using namespace imgroot;

namespace fs = std::filesystem;

namespace {

// Фиктивный sysfs: <tmp>/sys/loop7/loop7pN/partition и <tmp>/dev/loop7pN
class FakeSysfs {
public:
    explicit FakeSysfs(const TempTestDir& tmp, std::string loop = "loop7")
        : sys(tmp.sub("sys")), dev(tmp.sub("dev")), loop_(std::move(loop)) {
        fs::create_directories(sys + "/" + loop_ + "/queue");
        fs::create_directories(dev);
        write_file(sys + "/" + loop_ + "/size", "131072\n");
    }

    void add_partition(int number, bool with_node = true) {
        std::string name = loop_ + "p" + std::to_string(number);
        fs::create_directories(sys + "/" + loop_ + "/" + name);
        write_file(sys + "/" + loop_ + "/" + name + "/partition", std::to_string(number) + "\n");
        if (with_node) {
            write_file(dev + "/" + name, "");
        }
    }

    std::string sys;
    std::string dev;

private:
    std::string loop_;
};

// losetup в PATH, пишущий аргументы в журнал и печатающий предупреждение
const char* LOSETUP_WITH_WARNING =
    "#!/bin/sh\n"
    "echo \"$*\" >> \"$(dirname \"$0\")/calls.log\"\n"
    "case \"$1\" in\n"
    "  -j|-d) exit 0 ;;\n"
    "  --find)\n"
    "    echo \"losetup: odd.img: Warning: file does not fit into a 512-byte sector; "
    "the end of the file will be ignored.\" >&2\n"
    "    echo /dev/loop9\n"
    "    exit 0 ;;\n"
    "esac\n"
    "exit 1\n";

// Реальное обнаружение разделов, подмена только losetup
class ScriptedLoopManager : public LoopManager {
public:
    ScriptedLoopManager(const std::string& sys, const std::string& dev, EventLog& events)
        : LoopManager(sys, dev), events_(events) {}

    std::string attach(const std::string& image_path, bool read_only) override {
        events_.push_back("attach " + image_path + (read_only ? " ro" : ""));
        return "/dev/loop7";
    }

    void detach(const std::string& loop_device) override {
        events_.push_back("detach " + loop_device);
    }

private:
    EventLog& events_;
};

RetryPolicy fast_policy(int& sleeps) {
    RetryPolicy policy;
    policy.attempts = 3;
    policy.backoff = std::chrono::milliseconds(10);
    policy.sleep = [&sleeps](std::chrono::milliseconds) { ++sleeps; };
    return policy;
}

} // namespace

TEST_CASE("parse_losetup_list") {
    auto entries = parse_losetup_list(
        "/dev/loop0 /var/lib/snapd/snaps/core_1.snap\n"
        "/dev/loop1   /home/user/images/my image.img  \n"
        "\n"
        "/dev/loop2\n");

    REQUIRE(entries.size() == 2);
    CHECK(entries[0].first == "/dev/loop0");
    CHECK(entries[0].second == "/var/lib/snapd/snaps/core_1.snap");
    CHECK(entries[1].first == "/dev/loop1");
    CHECK(entries[1].second == "/home/user/images/my image.img");
}

TEST_CASE("parse_attached_device") {
    CHECK(parse_attached_device("/dev/loop3\n") == "/dev/loop3");
    CHECK(parse_attached_device(
        "losetup: odd.img: Warning: file does not fit into a 512-byte sector; "
        "the end of the file will be ignored.\n/dev/loop12") == "/dev/loop12");
    CHECK(parse_attached_device("losetup: cannot find an unused loop device") == "");
    CHECK(parse_attached_device("") == "");
}

TEST_CASE("is_loop_partition_of") {
    CHECK(is_loop_partition_of("/dev/loop1", "/dev/loop1"));
    CHECK(is_loop_partition_of("/dev/loop1p2", "/dev/loop1"));
    CHECK(is_loop_partition_of("/dev/loop1p12", "/dev/loop1"));
    CHECK(!is_loop_partition_of("/dev/loop10", "/dev/loop1"));
    CHECK(!is_loop_partition_of("/dev/loop10p1", "/dev/loop1"));
    CHECK(!is_loop_partition_of("/dev/loop1p", "/dev/loop1"));
    CHECK(!is_loop_partition_of("/dev/sda1", "/dev/loop1"));
}

TEST_CASE("LoopManager::attach tolerates losetup warnings") {
    TempTestDir tmp;
    REQUIRE(!tmp.path.empty());
    std::string bin = tmp.sub("bin");
    fs::create_directories(bin);
    write_file(bin + "/losetup", LOSETUP_WITH_WARNING);
    fs::permissions(bin + "/losetup", fs::perms::owner_all | fs::perms::group_read |
                                          fs::perms::group_exec | fs::perms::others_read |
                                          fs::perms::others_exec);
    ScopedPathPrepend path(bin);

    std::string image = tmp.sub("odd.img");
    write_file(image, std::string(1000, '\0'));

    FakeSysfs sysfs(tmp, "loop9");
    sysfs.add_partition(1);
    sysfs.add_partition(2);
    int sleeps = 0;
    LoopManager loop(sysfs.sys, sysfs.dev);
    loop.set_wait_policy(fast_policy(sleeps));

    ResourceStack stack;
    const DeviceMap& devices = loop.attach_scoped(stack, image, false, 2);
    CHECK(devices.size() == 2);
    CHECK(stack.size() == 1);

    CHECK(!stack.unwind());
    std::string calls = read_file(bin + "/calls.log");
    CHECK(calls.find("--find --show --partscan " + image) != std::string::npos);
    CHECK(calls.find("-d /dev/loop9") != std::string::npos);
}

TEST_CASE("LoopManager::partition_devices") {
    TempTestDir tmp;
    REQUIRE(!tmp.path.empty());
    FakeSysfs sysfs(tmp);
    int sleeps = 0;

    LoopManager loop(sysfs.sys, sysfs.dev);
    loop.set_wait_policy(fast_policy(sleeps));

    SUBCASE("maps partition numbers to device nodes") {
        sysfs.add_partition(1);
        sysfs.add_partition(2);

        DeviceMap devices = loop.partition_devices("/dev/loop7");

        REQUIRE(devices.size() == 2);
        CHECK(devices[1] == sysfs.dev + "/loop7p1");
        CHECK(devices[2] == sysfs.dev + "/loop7p2");
        CHECK(sleeps == 0);
    }

    SUBCASE("waits for missing nodes and drops those that never appear") {
        sysfs.add_partition(1);
        sysfs.add_partition(2, false);

        DeviceMap devices = loop.partition_devices("/dev/loop7");

        CHECK(devices.size() == 1);
        CHECK(devices.count(1) == 1);
        CHECK(sleeps == 2);
    }

    SUBCASE("no partitions") {
        DeviceMap devices = loop.partition_devices("/dev/loop7");
        CHECK(devices.empty());
        CHECK(sleeps == 2);
    }
}

TEST_CASE("LoopManager::attach_scoped") {
    TempTestDir tmp;
    REQUIRE(!tmp.path.empty());
    FakeSysfs sysfs(tmp);
    EventLog events;
    int sleeps = 0;

    ScriptedLoopManager loop(sysfs.sys, sysfs.dev, events);
    loop.set_wait_policy(fast_policy(sleeps));

    SUBCASE("yields the mapping and detaches on unwind") {
        sysfs.add_partition(1);
        sysfs.add_partition(2);

        ResourceStack stack;
        const DeviceMap& devices = loop.attach_scoped(stack, "/img/disk.img", true, 2);
        CHECK(devices.size() == 2);
        CHECK(devices.at(2) == sysfs.dev + "/loop7p2");
        CHECK(stack.size() == 1);

        CHECK(!stack.unwind());
        CHECK(events == EventLog{"attach /img/disk.img ro", "detach /dev/loop7"});
    }

    SUBCASE("unexpected partition count fails but the device is still detached") {
        sysfs.add_partition(1);
        sysfs.add_partition(2);
        sysfs.add_partition(3);

        ResourceStack stack;
        CHECK_THROWS_AS(loop.attach_scoped(stack, "/img/disk.img", false, 2), AttachError);
        REQUIRE(stack.size() == 1);

        CHECK(!stack.unwind());
        CHECK(events == EventLog{"attach /img/disk.img", "detach /dev/loop7"});
    }

    SUBCASE("zero partition devices") {
        ResourceStack stack;
        CHECK_THROWS_AS(loop.attach_scoped(stack, "/img/disk.img", false, 2), AttachError);
        CHECK(!stack.unwind());
        CHECK(events.back() == "detach /dev/loop7");
    }
}
