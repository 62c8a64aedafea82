#pragma once

#include <basalt/evm/config.hpp>

#include <cstdint>
#include <string_view>

BASALT_EVM_NAMESPACE_BEGIN

// Run status of an interpreter. Every state other than Running is terminal.
enum class Status : uint8_t
{
    Running = 0,
    Success,
    Failure,
    Revert,
};

constexpr std::string_view status_name(Status const status) noexcept
{
    switch (status) {
    case Status::Running:
        return "running";
    case Status::Success:
        return "success";
    case Status::Failure:
        return "failure";
    case Status::Revert:
        return "revert";
    }
    return "unknown";
}

BASALT_EVM_NAMESPACE_END
