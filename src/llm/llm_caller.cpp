#include "turnkit/llm/llm_caller.hpp"
#include "turnkit/core/deadline.hpp"

#include <spdlog/spdlog.h>

namespace turnkit::llm {

namespace {

// Anything a client reports other than the deadline/cancel kinds is a transport failure
template<typename T>
Result<T, Error> normalize(Result<T, Error> result) {
    if (result.is_ok()) return result;

    auto& err = result.error();
    switch (err.code) {
        case ErrorCode::Cancelled:
        case ErrorCode::LLMTimeout:
        case ErrorCode::LLMConnectionFailed:
            break;
        default:
            err.message = "LLM call failed: " + err.message;
            err.code = ErrorCode::LLMConnectionFailed;
            break;
    }
    return result;
}

}  // namespace

LLMCaller::LLMCaller(std::shared_ptr<LLMClient> client, ThreadPool& pool, Duration timeout)
    : client_(std::move(client))
    , function_client_(std::dynamic_pointer_cast<FunctionCallingLLMClient>(client_))
    , pool_(pool)
    , timeout_(timeout)
{
}

Result<LLMResponse, Error> LLMCaller::complete(const std::vector<Message>& messages,
                                               const CancellationToken& cancellation) {
    auto start = std::chrono::steady_clock::now();

    auto result = run_with_deadline<LLMResponse>(
        pool_,
        [client = client_, messages](CancellationToken token) {
            return client->complete(messages, token);
        },
        timeout_,
        cancellation,
        ErrorCode::LLMTimeout,
        ErrorCode::LLMConnectionFailed,
        client_->name()
    );

    if (result.is_ok()) {
        result.value().latency = std::chrono::duration_cast<Duration>(
            std::chrono::steady_clock::now() - start);
        spdlog::debug("LLM '{}' completed in {}ms", client_->name(), result.value().latency.count());
    }
    return normalize(std::move(result));
}

Result<FunctionCallResult, Error> LLMCaller::complete_with_functions(const std::vector<Message>& messages,
                                                                     const Json& function_specs,
                                                                     const CancellationToken& cancellation) {
    if (!function_client_) {
        return Result<FunctionCallResult, Error>::err(
            ErrorCode::InvalidState, "Client does not support function calling", client_->name());
    }

    auto result = run_with_deadline<FunctionCallResult>(
        pool_,
        [client = function_client_, messages, function_specs](CancellationToken token) {
            return client->complete_with_functions(messages, function_specs, token);
        },
        timeout_,
        cancellation,
        ErrorCode::LLMTimeout,
        ErrorCode::LLMConnectionFailed,
        client_->name()
    );
    return normalize(std::move(result));
}

}  // namespace turnkit::llm
