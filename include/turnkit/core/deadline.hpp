#pragma once

#include "cancellation.hpp"
#include "result.hpp"
#include "thread_pool.hpp"
#include "types.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <string>

namespace turnkit::core {

// Granularity at which the caller token is polled while waiting
inline constexpr Duration kDeadlinePollInterval{10};

// Race `fn` on the pool against a deadline and the caller's token.
//
// `fn` receives a token linked to the caller's; it fires when either side
// gives up so cooperative work can stop early. Outcomes are kept apart:
// the caller firing first yields Cancelled, the deadline firing first yields
// `timeout_code`. Anything `fn` throws becomes `failure_code`.
//
// `fn` may outlive this call when abandoned, so it must own what it captures.
template<typename T, typename F>
Result<T, Error> run_with_deadline(ThreadPool& pool,
                                   F fn,
                                   Duration timeout,
                                   const CancellationToken& caller,
                                   ErrorCode timeout_code,
                                   ErrorCode failure_code,
                                   const std::string& context) {
    if (caller.is_cancelled()) {
        return Result<T, Error>::err(ErrorCode::Cancelled, "Cancelled before start", context);
    }

    auto linked = std::make_shared<CancellationSource>(CancellationSource::linked_to(caller));
    auto token = linked->token();

    std::future<Result<T, Error>> future;
    try {
        future = pool.submit([fn = std::move(fn), token]() mutable {
            return fn(token);
        });
    } catch (const std::exception& e) {
        return Result<T, Error>::err(failure_code, e.what(), context);
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            linked->cancel();
            return Result<T, Error>::err(
                timeout_code,
                "Deadline exceeded after " + std::to_string(timeout.count()) + "ms",
                context
            );
        }

        auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now, kDeadlinePollInterval);
        if (future.wait_for(slice) == std::future_status::ready) {
            break;
        }

        if (caller.is_cancelled()) {
            linked->cancel();
            return Result<T, Error>::err(ErrorCode::Cancelled, "Cancelled by caller", context);
        }
    }

    try {
        return future.get();
    } catch (const std::exception& e) {
        return Result<T, Error>::err(failure_code, e.what(), context);
    }
}

}  // namespace turnkit::core
