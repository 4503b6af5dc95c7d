#pragma once

#include <cstdarg>
#include "../api.hpp"
#include "../string.hpp"
#include "../vector.hpp"

namespace capgate
{
    /**
     * @brief Formats a string using a format string and arguments.
     * @param format The format string.
     * @param args The arguments to format the string.
     * @return The formatted string.
     */
    __attribute__((format(printf, 1, 2))) CAPGATE_API string format(const char *format, ...) noexcept;

    CAPGATE_API string format_va_list(const char *format, va_list args) noexcept;

    /// @brief Splits the source by the delimiter, trimming whitespace and skipping empty items
    CAPGATE_API vector<string> split(string_view src, char delimiter);

    CAPGATE_API string_view trim(string_view src) noexcept;

    /// @brief ASCII case-insensitive comparison
    CAPGATE_API bool iequals(string_view lhs, string_view rhs) noexcept;

    template <typename It, typename Fn>
    string join(It first, It last, string_view separator, Fn &&to_text)
    {
        string out;
        for (It it = first; it != last; ++it)
        {
            if (it != first) out.append(separator);
            out.append(to_text(*it));
        }
        return out;
    }

    /// @brief Renders a list the way diagnostics print it: "[A, B, C]"
    template <typename Range, typename Fn>
    string bracket_list(const Range &range, Fn &&to_text)
    {
        string out = "[";
        out += join(range.begin(), range.end(), ", ", std::forward<Fn>(to_text));
        out += "]";
        return out;
    }
} // namespace capgate
