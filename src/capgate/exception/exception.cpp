#include <capgate/exception/exception.hpp>
#include <capgate/string/utils.hpp>

namespace capgate
{
    exception::exception() noexcept { capture_stack_trace(except_info); }

    unsupported_host_error::unsupported_host_error(vector<string> missing) : exception(), _missing(std::move(missing))
    {
        _message = "Current host does not support the following CPU features that are required by the image: ";
        _message += bracket_list(_missing, [](const string &name) -> const string & { return name; });
    }
} // namespace capgate
