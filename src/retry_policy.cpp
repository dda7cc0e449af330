#include "retry_policy.hpp"

#include <thread>

namespace imgroot {

void RetryPolicy::wait() const {
    if (backoff.count() <= 0) {
        return;
    }
    if (sleep) {
        sleep(backoff);
    } else {
        std::this_thread::sleep_for(backoff);
    }
}

} // namespace imgroot
