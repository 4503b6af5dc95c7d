#pragma once
#include "scalars.hpp"

#define CAPGATE_OP_UNKNOWN          0xFFFF
#define CAPGATE_OP_DOMAIN           0x0CA9
#define CAPGATE_OP_SUCCESS          0
#define CAPGATE_OP_UNSUPPORTED_HOST 2
#define CAPGATE_OP_INVALID_STATE    3
#define CAPGATE_OP_INVALID_ARGUMENT 4
#define CAPGATE_OP_INTERNAL_ERROR   5

#define CAPGATE_TRY(expr)             \
    {                                 \
        auto _r = (expr);             \
        if (!_r.success()) return _r; \
    }

namespace capgate
{
    struct op_result
    {
        u16 state;
        u16 domain_id;
        u32 code = 0;

        bool success() const { return state == CAPGATE_OP_SUCCESS; }

        operator u64() const { return ((u64)state << 48) | ((u64)domain_id << 32) | code; }

        static op_result from_u64(u64 result) { return {(u16)(result >> 48), (u16)(result >> 32), (u32)result}; }
    };

    op_result inline make_op_error(u16 state, u32 code = 0) { return {state, CAPGATE_OP_DOMAIN, code}; }
    op_result inline make_op_success() { return {CAPGATE_OP_SUCCESS, CAPGATE_OP_DOMAIN}; }

    CAPGATE_API const char *op_state_name(u16 state) noexcept;
} // namespace capgate
