#pragma once

#include <vector>
#include "memory/alloc.hpp"

namespace capgate
{
    template <typename T>
    using vector = std::vector<T, mem_allocator<T>>;
} // namespace capgate
