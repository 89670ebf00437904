#pragma once

#include <atomic>
#include <chrono>
#include <exception>
#include <stop_token>
#include <thread>

namespace mediasync {

/// Run `fn(stop_token)` on a worker thread and wait for it.
///
/// `should_stop` is polled every `poll` while the worker runs; once it returns
/// true the worker's stop token is requested. An exception thrown by `fn`
/// (OperationCancelled included) is rethrown on the calling thread after the
/// worker has been joined.
template <typename Fn, typename ShouldStop>
void run_cancellable(Fn&& fn, ShouldStop&& should_stop,
                     std::chrono::milliseconds poll = std::chrono::milliseconds(100)) {
    std::atomic<bool> done{false};
    std::exception_ptr error;
    {
        std::jthread worker([&](std::stop_token stop) {
            try {
                fn(stop);
            } catch (...) {
                error = std::current_exception();
            }
            done = true;
        });
        while (!done) {
            if (should_stop()) {
                worker.request_stop();
            }
            std::this_thread::sleep_for(poll);
        }
    }
    if (error) {
        std::rethrow_exception(error);
    }
}

}  // namespace mediasync
