#pragma once

#include <speechws/defines.hpp>

#if __cpp_lib_expected >= 202202L
    #include <expected>
#else
    #error "speechws requires C++23 std::expected"
#endif

SPEECHWS_NS_BEGIN

template <typename T, typename E>
using Result = std::expected<T, E>;

template <typename E>
using Err = std::unexpected<E>;

template <typename E>
using BadResultAccess = std::bad_expected_access<E>;

SPEECHWS_NS_END
