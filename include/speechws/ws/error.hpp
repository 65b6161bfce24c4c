/**
 * @file error.hpp
 * @brief The websocket and token error codes
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */
#pragma once

#include <speechws/io/error.hpp>

SPEECHWS_NS_BEGIN

enum class WsError : int {
    Ok = 0,
    BadHandshake,    //< The upgrade response is not a 101
    NotOpen,         //< Send before the upgrade completed
    Closed,          //< The connection is closed or closing
    BadUrl,          //< The url can't be parsed or is not wss
    InvalidSkewDate, //< The server date can't be parsed
};

class SPEECHWS_API WsCategory final : public std::error_category {
public:
    constexpr WsCategory() noexcept {}

    auto name() const noexcept -> const char * override;
    auto message(int value) const -> std::string override;

    static auto instance() noexcept -> const WsCategory &;
};

SPEECHWS_DECLARE_ERROR(WsError, WsCategory);

SPEECHWS_NS_END
