#pragma once

#include "exception.hpp"

namespace capgate
{
    /// @brief Appends one line per captured frame: index, address, symbol and module when resolvable
    CAPGATE_API void write_stack_trace(string &out, const except_info &except_info);

#ifndef _MSC_VER
    CAPGATE_API string demangle(const char *mangled_name);
#endif
} // namespace capgate
