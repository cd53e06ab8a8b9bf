// Copyright (c) 2025 The Pinto Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PINTO_UTIL_STRPRINTF_H
#define PINTO_UTIL_STRPRINTF_H

#include <boost/format.hpp>

#include <string>

namespace util {
namespace detail {

inline void FeedFormat(boost::format&) {}

template <typename T, typename... Args>
void FeedFormat(boost::format& fmt, const T& arg, const Args&... args)
{
    fmt % arg;
    FeedFormat(fmt, args...);
}

} // namespace detail
} // namespace util

/**
 * Type-safe printf-style formatting.
 *
 * Conversion specifiers only select the presentation (width, precision,
 * base); the argument type always comes from the C++ type. Length modifiers
 * are not needed and should be left out.
 *
 * Throws boost::io::format_error on malformed format strings or argument
 * count mismatches.
 */
template <typename... Args>
std::string strprintf(const std::string& fmt, const Args&... args)
{
    boost::format f(fmt);
    util::detail::FeedFormat(f, args...);
    return f.str();
}

#endif // PINTO_UTIL_STRPRINTF_H
