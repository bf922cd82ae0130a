// Copyright (c) 2019 The Bitcoin Core developers
// Copyright (c) 2026 The Agora Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.

#ifndef AGORA_UTIL_STRING_H
#define AGORA_UTIL_STRING_H

#include <boost/format.hpp>

#include <stdint.h>
#include <string>
#include <vector>

namespace util_detail
{
inline void FormatArgs(boost::format&) {}

template <typename T, typename... Args>
void FormatArgs(boost::format& fmt, const T& value, const Args&... args)
{
    fmt % value;
    FormatArgs(fmt, args...);
}
} // namespace util_detail

/**
 * Format a printf-style string. Conversion specifiers only select the
 * placement of the arguments: the values are streamed with their own type.
 */
template <typename... Args>
std::string strprintf(const std::string& strFormat, const Args&... args)
{
    boost::format fmt(strFormat);
    fmt.exceptions(boost::io::all_error_bits ^ (boost::io::too_many_args_bit | boost::io::too_few_args_bit));
    util_detail::FormatArgs(fmt, args...);
    return fmt.str();
}

inline std::string strprintf(const std::string& str)
{
    return str;
}

inline std::string TrimString(const std::string& str, const std::string& pattern = " \f\n\r\t\v")
{
    std::string::size_type front = str.find_first_not_of(pattern);
    if (front == std::string::npos) {
        return std::string();
    }
    std::string::size_type end = str.find_last_not_of(pattern);
    return str.substr(front, end - front + 1);
}

/**
 * Join a list of items
 *
 * @param list       The list to join
 * @param separator  The separator
 * @param unary_op   Apply this operator to each item in the list
 */
template <typename T, typename UnaryOp>
std::string Join(const std::vector<T>& list, const std::string& separator, UnaryOp unary_op)
{
    std::string ret;
    for (size_t i = 0; i < list.size(); ++i) {
        if (i > 0) ret += separator;
        ret += unary_op(list.at(i));
    }
    return ret;
}

inline std::string Join(const std::vector<std::string>& list, const std::string& separator)
{
    return Join(list, separator, [](const std::string& i) { return i; });
}

/** Parse a decimal int64 without leading or trailing garbage. */
bool ParseInt64(const std::string& str, int64_t* out);

/** Parse a decimal uint64. A sign, even "+", is rejected. */
bool ParseUInt64(const std::string& str, uint64_t* out);

#endif // AGORA_UTIL_STRING_H
