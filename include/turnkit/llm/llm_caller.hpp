#pragma once

#include "turnkit/core/cancellation.hpp"
#include "turnkit/core/result.hpp"
#include "turnkit/core/thread_pool.hpp"
#include "llm_client.hpp"

#include <memory>

namespace turnkit::llm {

using namespace turnkit::core;

// Wraps a client so every call races the model deadline on the shared pool.
// Errors: Cancelled (caller), LLMTimeout (deadline), LLMConnectionFailed
// (transport or a throwing client).
class LLMCaller {
public:
    LLMCaller(std::shared_ptr<LLMClient> client, ThreadPool& pool, Duration timeout);

    Result<LLMResponse, Error> complete(const std::vector<Message>& messages,
                                        const CancellationToken& cancellation);

    // Requires supports_functions()
    Result<FunctionCallResult, Error> complete_with_functions(const std::vector<Message>& messages,
                                                              const Json& function_specs,
                                                              const CancellationToken& cancellation);

    bool supports_functions() const { return function_client_ != nullptr; }

    Duration timeout() const { return timeout_; }
    const LLMClient& client() const { return *client_; }

private:
    std::shared_ptr<LLMClient> client_;
    std::shared_ptr<FunctionCallingLLMClient> function_client_;
    ThreadPool& pool_;
    Duration timeout_;
};

}  // namespace turnkit::llm
