#pragma once

#include <basalt/core/result.hpp>
#include <basalt/evm/config.hpp>

#include <boost/outcome/config.hpp>
// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

BASALT_EVM_NAMESPACE_BEGIN

enum class Error
{
    Success = 0,
    StackUnderflow,
    StackOverflow,
    BadJumpDest,
    UndefinedInstruction,
    MemoryLimitExceeded,
    UnknownAccount,
    OutOfGas,
    StepLimitExceeded,
};

BASALT_EVM_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<basalt::evm::Error>
    : quick_status_code_from_enum_defaults<basalt::evm::Error>
{
    static constexpr auto const domain_name = "EVM Error";
    static constexpr auto const domain_uuid =
        "6b1c1a9e-2f37-4d52-9a8e-0c5e7d3f4a21";
    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
