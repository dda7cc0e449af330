#include "resource_stack.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

namespace imgroot {

ResourceStack::~ResourceStack() {
    if (handles_.empty()) {
        return;
    }
    std::exception_ptr error = unwind();
    if (error) {
        spdlog::error("Resource release failed during cleanup: {}", describe_error(error));
    }
}

void ResourceStack::push(const std::string& name, Release release) {
    spdlog::debug("acquired: {}", name);
    handles_.push_back(Handle{name, std::move(release)});
}

std::exception_ptr ResourceStack::unwind() {
    std::exception_ptr first_error;

    while (!handles_.empty()) {
        // Снимаем с вершины до вызова, чтобы освобождение не повторилось
        Handle handle = std::move(handles_.back());
        handles_.pop_back();

        try {
            handle.release();
            spdlog::debug("released: {}", handle.name);
        } catch (...) {
            std::exception_ptr error = std::current_exception();
            spdlog::warn("Failed to release {}: {}", handle.name, describe_error(error));
            if (!first_error) first_error = error;
        }
    }

    return first_error;
}

ScopeResult run_scoped(const std::function<void(ResourceStack&)>& acquire,
                       const std::function<int()>& body) {
    ResourceStack stack;
    ScopeResult result;

    try {
        acquire(stack);
        result.exit_code = body();
    } catch (...) {
        std::exception_ptr teardown_error = stack.unwind();
        if (teardown_error) {
            spdlog::error("Cleanup after failure was incomplete: {}", describe_error(teardown_error));
        }
        throw;
    }

    result.teardown_error = stack.unwind();
    return result;
}

std::string describe_error(const std::exception_ptr& error) {
    if (!error) {
        return "";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

} // namespace imgroot
