#include <capgate/exception/utils.hpp>
#include <capgate/string/utils.hpp>
#include <cstdint>
#include <cstdlib>
#include <cxxabi.h>
#include <dlfcn.h>
#include <execinfo.h>

namespace capgate
{
    void capture_stack_trace(except_info &info) noexcept
    {
        release_stack_trace(info);
        constexpr int max_frames = 64;
        void *buffer[max_frames];
        int nptrs = backtrace(buffer, max_frames);
        if (nptrs <= 0) return;

        auto *addresses = static_cast<except_addr *>(scalable_malloc(sizeof(except_addr) * nptrs));
        if (!addresses) return;
        for (int i = 0; i < nptrs; ++i) addresses[i] = buffer[i];
        info.addresses = addresses;
        info.addresses_count = static_cast<size_t>(nptrs);
    }

    void release_stack_trace(except_info &info) noexcept
    {
        scalable_free(info.addresses);
        info.addresses = nullptr;
        info.addresses_count = 0;
    }

    string demangle(const char *mangled_name)
    {
        int status = 0;
        char *demangled = abi::__cxa_demangle(mangled_name, nullptr, nullptr, &status);
        if (status != 0 || !demangled) return mangled_name;
        string result = demangled;
        free(demangled);
        return result;
    }

    void write_stack_trace(string &out, const except_info &info)
    {
        out += "Stack trace:\n";
        for (size_t i = 0; i < info.addresses_count; ++i)
        {
            auto ip = reinterpret_cast<uintptr_t>(info.addresses[i]);
            out += format("\t#%zu 0x%llx", i, static_cast<unsigned long long>(ip));
            Dl_info dl{};
            if (dladdr(info.addresses[i], &dl) != 0)
            {
                out += " in ";
                out += dl.dli_sname ? demangle(dl.dli_sname) : string("<unknown>");
                if (dl.dli_fname)
                {
                    out += " at ";
                    out += dl.dli_fname;
                }
            }
            else
                out += " at <unknown>";
            out += '\n';
        }
    }
} // namespace capgate
