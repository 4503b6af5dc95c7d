#pragma once

#include <functional>
#include <string>
#include <string_view>
#include "memory/alloc.hpp"

namespace capgate
{
    using string = std::basic_string<char, std::char_traits<char>, mem_allocator<char>>;
    using string_view = std::string_view;

    struct string_hash
    {
        size_t operator()(const string &value) const noexcept
        {
            return std::hash<string_view>{}(string_view(value.data(), value.size()));
        }
    };
} // namespace capgate
