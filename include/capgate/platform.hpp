#pragma once

namespace capgate
{
    /**
     * True when the register save/restore code for deoptimization is generated at build time for
     * the register width of the build-time CPU features. Runtime widening is disabled in that case.
     */
#ifdef CAPGATE_CALLEE_SAVED_REGISTERS
    inline constexpr bool callee_saved_registers_supported = true;
#else
    inline constexpr bool callee_saved_registers_supported = false;
#endif
} // namespace capgate
