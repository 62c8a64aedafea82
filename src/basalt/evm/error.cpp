#include <basalt/evm/error.hpp>

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

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<basalt::evm::Error>::mapping> const &
quick_status_code_from_enum<basalt::evm::Error>::value_mappings()
{
    using basalt::evm::Error;

    static std::initializer_list<mapping> const v = {
        {Error::Success, "success", {errc::success}},
        {Error::StackUnderflow, "stack underflow", {}},
        {Error::StackOverflow, "stack overflow", {}},
        {Error::BadJumpDest, "bad jump destination", {}},
        {Error::UndefinedInstruction, "undefined instruction", {}},
        {Error::MemoryLimitExceeded, "memory limit exceeded", {}},
        {Error::UnknownAccount, "unknown account", {}},
        {Error::OutOfGas, "out of gas", {}},
        {Error::StepLimitExceeded, "step limit exceeded", {}}};

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
