#include <capgate/arch/host.hpp>
#include <capgate/op_result.hpp>
#include <capgate/startup.hpp>

namespace capgate
{
    template class feature_access<arch::x86>;
    template class feature_access<arch::aarch64>;
    template class startup_gate<arch::x86>;
    template class startup_gate<arch::aarch64>;

    const char *gate_state_name(gate_state state) noexcept
    {
        switch (state)
        {
            case gate_state::unverified:
                return "unverified";
            case gate_state::verifying:
                return "verifying";
            case gate_state::verified:
                return "verified";
            case gate_state::fatal:
                return "fatal";
            default:
                return "unknown";
        }
    }

    const char *op_state_name(u16 state) noexcept
    {
        switch (state)
        {
            case CAPGATE_OP_SUCCESS:
                return "success";
            case CAPGATE_OP_UNSUPPORTED_HOST:
                return "unsupported host";
            case CAPGATE_OP_INVALID_STATE:
                return "invalid state";
            case CAPGATE_OP_INVALID_ARGUMENT:
                return "invalid argument";
            case CAPGATE_OP_INTERNAL_ERROR:
                return "internal error";
            default:
                return "unknown";
        }
    }
} // namespace capgate
