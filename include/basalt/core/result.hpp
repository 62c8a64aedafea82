#pragma once

#include <basalt/config.hpp>

#include <boost/outcome/config.hpp>
#include <boost/outcome/experimental/status_result.hpp>
#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

BASALT_NAMESPACE_BEGIN

template <class T>
using Result = BOOST_OUTCOME_V2_NAMESPACE::experimental::status_result<T>;

using BOOST_OUTCOME_V2_NAMESPACE::success;

BASALT_NAMESPACE_END
