#include <capgate/exception/exception.hpp>
#include <capgate/exception/utils.hpp>
#include <cassert>
#include <cstring>

using namespace capgate;

void test_runtime_error()
{
    runtime_error err("Runtime error occurred");
    assert(string(err.what()) == "Runtime error occurred");
    assert(err.except_info.addresses_count > 0);
}

void test_unsupported_host_error()
{
    vector<string> missing;
    missing.emplace_back("AVX");
    missing.emplace_back("AVX2");
    unsupported_host_error err(missing);
    assert(err.missing() == missing);
    assert(string(err.what()) ==
           "Current host does not support the following CPU features that are required by the image: [AVX, AVX2]");

    internal_error internal("Missing feature check: X");
    assert(std::strcmp(internal.what(), "Missing feature check: X") == 0);
}

void test_stacktrace()
{
    runtime_error err("Runtime error occurred");
    assert(err.except_info.addresses_count > 0);

    // Recapturing replaces the frames instead of leaking them
    capture_stack_trace(err.except_info);
    assert(err.except_info.addresses_count > 0);
    assert(err.except_info.addresses != nullptr);

    string trace;
    write_stack_trace(trace, err.except_info);
    assert(trace.find("Stack trace:") == 0);
    assert(trace.find("#0 0x") != string::npos);

    // Moving transfers the captured frames
    runtime_error moved(std::move(err));
    assert(moved.except_info.addresses_count > 0);
    assert(err.except_info.addresses == nullptr);

    assert(demangle("_ZN7capgate13runtime_errorD0Ev").find("capgate::runtime_error") != string::npos);
}
