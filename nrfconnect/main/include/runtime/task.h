#pragma once

#include "runtime/cancel_token.h"

#include <lib/core/CHIPError.h>

#include <utility>

namespace runtime
{

/**
 * A long-running unit of work that can be raced against others.
 *
 * Run() must return CHIP_ERROR_CANCELLED soon after the token is raised.
 */
class Task
{
public:
    virtual ~Task() = default;

    virtual const char * Name() const             = 0;
    virtual CHIP_ERROR Run(CancelToken & token) = 0;
};

template <typename Function>
class LambdaTask : public Task
{
public:
    LambdaTask(const char * name, Function function) : mName(name), mFunction(std::move(function)) {}

    const char * Name() const override { return mName; }
    CHIP_ERROR Run(CancelToken & token) override { return mFunction(token); }

private:
    const char * mName;
    Function mFunction;
};

template <typename Function>
LambdaTask<Function> MakeTask(const char * name, Function function)
{
    return LambdaTask<Function>(name, std::move(function));
}

} // namespace runtime
