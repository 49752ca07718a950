// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#ifndef UTILS_STRING_H
#define UTILS_STRING_H

#include <cctype>
#include <ostream>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace stretch
{

// c++11 no longer supplies a strcasecmp, so define our own version.
static inline int stringcasecompare(const char* a, const char* b)
{
    while (*a && *b)
    {
        if (tolower(*a) != tolower(*b))
            return tolower(*a) - tolower(*b);
        a++;
        b++;
    }
    return *a - *b;
}

/*!
 * Writing of a double to a stream.
 *
 * writes with \p precision digits after the decimal dot, but removes trailing zeros.
 * A value that rounds to zero is always written as "0", never as "-0".
 *
 * \param precision The number of (non-zero) digits after the decimal dot
 * \param coord double to output
 * \param ss The output stream to write the string to
 */
static inline void writeDoubleToStream(const unsigned int precision, const double coord, std::ostream& ss)
{
    std::string buffer = fmt::format("{:.{}f}", coord, precision);
    if (precision > 0)
    {
        size_t non_nul_pos = buffer.find_last_not_of('0');
        if (buffer[non_nul_pos] == '.')
        {
            buffer.resize(non_nul_pos);
        }
        else
        {
            buffer.resize(non_nul_pos + 1);
        }
    }
    if (buffer == "-0")
    {
        buffer = "0";
    }
    ss << buffer;
}

/*!
 * Struct to make it possible to inline calls to writeDoubleToStream with writing other stuff to the output stream
 */
struct PrecisionedDouble
{
    unsigned int precision; //!< Number of digits after the decimal mark with which to convert to string
    double value; //!< The double value

    friend inline std::ostream& operator<<(std::ostream& out, const PrecisionedDouble precision_and_input)
    {
        writeDoubleToStream(precision_and_input.precision, precision_and_input.value, out);
        return out;
    }
};

/*!
 * \brief Remove leading and trailing whitespace.
 */
[[nodiscard]] inline std::string_view trim(std::string_view text)
{
    constexpr std::string_view whitespace = " \t\r\n";
    const size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string_view::npos)
    {
        return {};
    }
    const size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

} // namespace stretch

#endif // UTILS_STRING_H
