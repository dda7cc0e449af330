/**
 * Unit tests for ResourceStack and run_scoped
 */

#include "resource_stack.hpp"
#include "utils.hpp"

#include <doctest/doctest.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace imgroot;

TEST_CASE("ResourceStack releases in reverse order") {
    std::vector<std::string> released;
    {
        ResourceStack stack;
        stack.push("a", [&]() { released.push_back("a"); });
        stack.push("b", [&]() { released.push_back("b"); });
        stack.push("c", [&]() { released.push_back("c"); });
        CHECK(stack.size() == 3);

        CHECK(!stack.unwind());
        CHECK(stack.empty());

        // Второй unwind ничего не делает
        CHECK(!stack.unwind());
    }
    CHECK(released == std::vector<std::string>{"c", "b", "a"});
}

TEST_CASE("ResourceStack destructor releases what is left") {
    std::vector<std::string> released;
    {
        ResourceStack stack;
        stack.push("a", [&]() { released.push_back("a"); });
        stack.push("b", [&]() { released.push_back("b"); });
    }
    CHECK(released == std::vector<std::string>{"b", "a"});
}

TEST_CASE("ResourceStack drains every handle and keeps the first error") {
    std::vector<std::string> released;
    ResourceStack stack;
    stack.push("a", [&]() { released.push_back("a"); throw MountError("a failed"); });
    stack.push("b", [&]() { released.push_back("b"); });
    stack.push("c", [&]() { released.push_back("c"); throw AttachError("c failed"); });

    std::exception_ptr error = stack.unwind();

    CHECK(released == std::vector<std::string>{"c", "b", "a"});
    REQUIRE(error);
    CHECK(describe_error(error) == "c failed");
    CHECK_THROWS_AS(std::rethrow_exception(error), AttachError);
}

TEST_CASE("run_scoped") {
    std::vector<std::string> events;

    auto acquire_three = [&](ResourceStack& stack) {
        for (const char* name : {"loop", "root", "boot"}) {
            events.push_back(std::string("acquire ") + name);
            stack.push(name, [&events, name]() { events.push_back(std::string("release ") + name); });
        }
    };

    SUBCASE("successful body") {
        ScopeResult result = run_scoped(acquire_three, [&]() {
            events.push_back("body");
            return 7;
        });

        CHECK(result.exit_code == 7);
        CHECK(!result.teardown_error);
        CHECK(events == std::vector<std::string>{
            "acquire loop", "acquire root", "acquire boot", "body",
            "release boot", "release root", "release loop"});
    }

    SUBCASE("acquisition failure unwinds earlier steps only") {
        auto acquire = [&](ResourceStack& stack) {
            events.push_back("acquire loop");
            stack.push("loop", [&]() { events.push_back("release loop"); });
            events.push_back("acquire root");
            stack.push("root", [&]() { events.push_back("release root"); });
            events.push_back("acquire boot");
            throw MountError("boot failed");
        };
        bool body_called = false;

        CHECK_THROWS_AS(run_scoped(acquire, [&]() { body_called = true; return 0; }), MountError);
        CHECK(!body_called);
        CHECK(events == std::vector<std::string>{
            "acquire loop", "acquire root", "acquire boot", "release root", "release loop"});
    }

    SUBCASE("body exception propagates after teardown") {
        CHECK_THROWS_WITH_AS(run_scoped(acquire_three, []() -> int {
            throw std::runtime_error("body failed");
        }), "body failed", std::runtime_error);

        CHECK(events.back() == "release loop");
        CHECK(events.size() == 6);
    }

    SUBCASE("body error stays primary when teardown also fails") {
        auto acquire = [&](ResourceStack& stack) {
            stack.push("root", [&]() { events.push_back("release root"); throw MountError("busy"); });
            stack.push("bind", [&]() { events.push_back("release bind"); });
        };

        CHECK_THROWS_AS(run_scoped(acquire, []() -> int { throw ExecError("no such file"); }), ExecError);
        CHECK(events == std::vector<std::string>{"release bind", "release root"});
    }

    SUBCASE("teardown error after success is reported, exit code kept") {
        auto acquire = [&](ResourceStack& stack) {
            stack.push("loop", [&]() { events.push_back("release loop"); });
            stack.push("root", [&]() { events.push_back("release root"); throw MountError("root busy"); });
            stack.push("bind", [&]() { events.push_back("release bind"); throw MountError("bind busy"); });
        };

        ScopeResult result = run_scoped(acquire, []() { return 0; });

        CHECK(result.exit_code == 0);
        REQUIRE(result.teardown_error);
        CHECK(describe_error(result.teardown_error) == "bind busy");
        CHECK(events == std::vector<std::string>{"release bind", "release root", "release loop"});
    }

    SUBCASE("non-zero exit code is data, not an error") {
        ScopeResult result = run_scoped(acquire_three, []() { return 42; });
        CHECK(result.exit_code == 42);
        CHECK(!result.teardown_error);
    }
}
