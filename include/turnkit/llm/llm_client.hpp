#pragma once

#include "turnkit/core/cancellation.hpp"
#include "turnkit/core/result.hpp"
#include "turnkit/core/types.hpp"

#include <string>
#include <vector>

namespace turnkit::llm {

using namespace turnkit::core;

// Plain completion boundary. Implementations should honour the token and
// report transport problems as LLMConnectionFailed.
class LLMClient {
public:
    virtual ~LLMClient() = default;

    virtual std::string name() const = 0;

    virtual Result<LLMResponse, Error> complete(const std::vector<Message>& messages,
                                                const CancellationToken& cancellation) = 0;
};

// Client with native structured calling
class FunctionCallingLLMClient : public LLMClient {
public:
    virtual Result<FunctionCallResult, Error> complete_with_functions(
        const std::vector<Message>& messages,
        const Json& function_specs,
        const CancellationToken& cancellation) = 0;
};

}  // namespace turnkit::llm
