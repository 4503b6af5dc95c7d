#include <capgate/log.hpp>
#include <capgate/startup.hpp>
#include <cassert>
#include <cstring>
#include <new>
#include "fake_host.hpp"

using namespace capgate;
using x86 = arch::x86;
using F = x86::feature;
using x86_set = feature_set<x86>;

namespace
{
    class capture_logger final : public log::logger_base
    {
    public:
        explicit capture_logger(const string &name) : logger_base(name) {}

        std::ostream &stream() override { return std::cerr; }

        void write(const string &message) override { messages.push_back(message); }

        vector<string> messages;
    };
} // namespace

void test_gate_verified()
{
    fake::x86_host::set({F::cx8, F::sse, F::sse2, F::avx});
    feature_access<x86> access(&fake::x86_host::probe);
    startup_gate<x86> gate(access);
    assert(gate.state() == gate_state::unverified);

    target_description<x86> image(x86_set{F::cx8, F::sse});
    op_result result = gate.verify(image);
    assert(result.success());
    assert(gate.state() == gate_state::verified);
    assert(gate.missing().empty());

    // A second verification is a state error
    result = gate.verify(image);
    assert(!result.success());
    assert(result.state == CAPGATE_OP_INVALID_STATE);
    assert(gate.state() == gate_state::verified);

    target_description<x86> runtime(x86_set{F::cx8});
    gate.widen(runtime, false);
    gate.widen(runtime, false);
    assert((runtime.features() == x86_set{F::cx8, F::sse, F::sse2, F::avx}));
}

void test_gate_fatal()
{
    log::log_service service;
    service.verbosity = log::level::warn;
    auto *capture = service.add_logger<capture_logger>("capture");
    capture->set_pattern("[%(level_name)] %(message)");
    service.default_logger = capture;

    fake::x86_host::set({F::cx8, F::sse});
    feature_access<x86> access(&fake::x86_host::probe);
    startup_gate<x86> gate(access);
    target_description<x86> image(x86_set{F::cx8, F::sse, F::avx, F::avx2});

    op_result result = gate.verify(image);
    assert(!result.success());
    assert(result.state == CAPGATE_OP_UNSUPPORTED_HOST);
    assert(result.domain_id == CAPGATE_OP_DOMAIN);
    assert(result.code == 2);
    assert(gate.state() == gate_state::fatal);
    assert(gate.missing().size() == 2);
    assert(gate.missing()[0] == "AVX" && gate.missing()[1] == "AVX2");

    // Exactly one fatal entry, written before verify returned
    assert(capture->messages.size() == 1);
    const string &line = capture->messages[0];
    assert(line.find("[FATAL]") == 0);
    assert(line.find("[AVX, AVX2]") != string::npos);

    bool threw = false;
    target_description<x86> runtime(x86_set{F::cx8});
    try
    {
        gate.widen(runtime, false);
    }
    catch (const runtime_error &e)
    {
        threw = true;
        assert(std::strstr(e.what(), "fatal") != nullptr);
    }
    assert(threw);
    assert((runtime.features() == x86_set{F::cx8}));
}

void test_gate_widen_requires_verification()
{
    fake::x86_host::set({F::cx8, F::sse});
    feature_access<x86> access(&fake::x86_host::probe);
    startup_gate<x86> gate(access);
    target_description<x86> runtime(x86_set{F::cx8});

    bool threw = false;
    try
    {
        gate.widen(runtime);
    }
    catch (const runtime_error &e)
    {
        threw = true;
        assert(std::strstr(e.what(), "unverified") != nullptr);
    }
    assert(threw);
    assert(std::strcmp(gate_state_name(gate_state::verifying), "verifying") == 0);
}

void test_gate_fatal_on_failed_enumeration()
{
    fake::x86_host::reset();
    feature_access<x86> access(&fake::x86_host::failing_read);
    startup_gate<x86> gate(access);
    target_description<x86> image(x86_set{F::cx8});

    bool threw = false;
    try
    {
        gate.verify(image);
    }
    catch (const std::bad_alloc &)
    {
        threw = true;
    }
    assert(threw);
    assert(fake::x86_host::probe_calls == 1);
    assert(gate.state() == gate_state::fatal);

    op_result result = gate.verify(image);
    assert(result.state == CAPGATE_OP_INVALID_STATE);
}

void test_op_result()
{
    op_result ok = make_op_success();
    assert(ok.success());

    op_result err = make_op_error(CAPGATE_OP_UNSUPPORTED_HOST, 3);
    op_result back = op_result::from_u64(err);
    assert(back.state == CAPGATE_OP_UNSUPPORTED_HOST);
    assert(back.domain_id == CAPGATE_OP_DOMAIN);
    assert(back.code == 3);
    assert(std::strcmp(op_state_name(back.state), "unsupported host") == 0);
}
