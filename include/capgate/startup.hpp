#pragma once

#include "feature_access.hpp"
#include "op_result.hpp"

namespace capgate
{
    enum class gate_state : u8
    {
        unverified,
        verifying,
        verified,
        fatal
    };

    CAPGATE_API const char *gate_state_name(gate_state state) noexcept;

    /**
     * @brief Process startup check: the image runs only after the host passed verification.
     *
     * unverified -> verifying -> verified | fatal. Widening is permitted only once verified and may be
     * repeated; with a stable host every repetition leaves the target unchanged.
     */
    template <typename Arch>
    class startup_gate
    {
    public:
        using target_type = target_description<Arch>;

        explicit startup_gate(const feature_access<Arch> &access) : _access(access) {}

        gate_state state() const noexcept { return _state; }

        /**
         * @brief Verifies the host against the required features of the image.
         * @return CAPGATE_OP_UNSUPPORTED_HOST with the count of missing features as code, after a single
         * fatal log entry; CAPGATE_OP_INVALID_STATE when called twice.
         * @throws internal_error when the vocabulary and the resolver disagree. The gate becomes fatal on
         * this and on any other exception leaving the host check.
         */
        op_result verify(const target_type &image)
        {
            if (_state != gate_state::unverified) return make_op_error(CAPGATE_OP_INVALID_STATE);
            _state = gate_state::verifying;
            try
            {
                _access.verify_host_supports(image);
            }
            catch (const unsupported_host_error &e)
            {
                _state = gate_state::fatal;
                _missing = e.missing();
                logFatal("%s", e.what());
                return make_op_error(CAPGATE_OP_UNSUPPORTED_HOST, static_cast<u32>(_missing.size()));
            }
            catch (const std::exception &)
            {
                _state = gate_state::fatal;
                throw;
            }
            _state = gate_state::verified;
            logInfo("Host supports all %zu CPU features required by the image", image.required_features().size());
            return make_op_success();
        }

        /// @throws runtime_error unless the gate is verified
        void widen(target_type &runtime, bool callee_saved_registers_fixed) const
        {
            if (_state != gate_state::verified)
                throw runtime_error(format("Cannot enable %s CPU features while the startup gate is %s", Arch::name,
                                           gate_state_name(_state)));
            _access.enable_features(runtime, callee_saved_registers_fixed);
        }

        void widen(target_type &runtime) const { widen(runtime, callee_saved_registers_supported); }

        /// Names reported by the failed verification
        const vector<string> &missing() const noexcept { return _missing; }

    private:
        const feature_access<Arch> &_access;
        gate_state _state = gate_state::unverified;
        vector<string> _missing;
    };
} // namespace capgate
