#pragma once

#include <boost/asio/io_context.hpp>
#include <chrono>
#include <functional>
#include <future>
#include <thread>

namespace peerlink {
namespace test {

// Run every ready handler of an externally driven io_context until none is
// left (handlers may post further handlers)
inline size_t Drain(boost::asio::io_context& io) {
    size_t total = 0;
    for (;;) {
        io.restart();
        const size_t n = io.poll();
        total += n;
        if (n == 0) break;
    }
    return total;
}

// Run handlers and timers for a wall-clock period
inline void RunFor(boost::asio::io_context& io, std::chrono::milliseconds duration) {
    io.restart();
    io.run_for(duration);
    Drain(io);
}

// Poll a predicate (for controllers running their own thread)
inline bool WaitFor(const std::function<bool()>& predicate,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return predicate();
}

template <typename T>
bool IsReady(const std::future<T>& future) {
    return future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

} // namespace test
} // namespace peerlink
