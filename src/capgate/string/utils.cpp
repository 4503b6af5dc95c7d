#include <capgate/string/utils.hpp>
#include <cctype>
#include <cstdio>

namespace capgate
{
    string format(const char *format, ...) noexcept
    {
        va_list args;
        va_start(args, format);
        string result = format_va_list(format, args);
        va_end(args);
        return result;
    }

    string format_va_list(const char *format, va_list args) noexcept
    {
        va_list copy;
        va_copy(copy, args);
        int size = vsnprintf(nullptr, 0, format, copy);
        va_end(copy);
        if (size <= 0) return string();

        string buffer;
        try
        {
            buffer.resize(static_cast<size_t>(size));
        }
        catch (const std::bad_alloc &)
        {
            return string();
        }
        vsnprintf(buffer.data(), static_cast<size_t>(size) + 1, format, args);
        return buffer;
    }

    string_view trim(string_view src) noexcept
    {
        size_t begin = 0;
        size_t end = src.size();
        while (begin < end && std::isspace(static_cast<unsigned char>(src[begin]))) ++begin;
        while (end > begin && std::isspace(static_cast<unsigned char>(src[end - 1]))) --end;
        return src.substr(begin, end - begin);
    }

    vector<string> split(string_view src, char delimiter)
    {
        vector<string> out;
        size_t pos = 0;
        while (pos <= src.size())
        {
            size_t next = src.find(delimiter, pos);
            if (next == string_view::npos) next = src.size();
            string_view item = trim(src.substr(pos, next - pos));
            if (!item.empty()) out.emplace_back(item.data(), item.size());
            pos = next + 1;
        }
        return out;
    }

    bool iequals(string_view lhs, string_view rhs) noexcept
    {
        if (lhs.size() != rhs.size()) return false;
        for (size_t i = 0; i < lhs.size(); ++i)
            if (std::tolower(static_cast<unsigned char>(lhs[i])) != std::tolower(static_cast<unsigned char>(rhs[i])))
                return false;
        return true;
    }
} // namespace capgate
