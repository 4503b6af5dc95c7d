#pragma once

#include <exception>
#include "../api.hpp"
#include "../string.hpp"
#include "../vector.hpp"

namespace capgate
{
    using except_addr = void *;

    struct except_info
    {
        except_addr *addresses = nullptr;
        size_t addresses_count = 0;
    };

    CAPGATE_API void capture_stack_trace(except_info &except_info) noexcept;

    CAPGATE_API void release_stack_trace(except_info &except_info) noexcept;

    class CAPGATE_API exception : public std::exception
    {
    public:
        struct except_info except_info;

        /// Captures the stack trace of the throw site
        exception() noexcept;

        exception(exception &&other) noexcept : except_info(other.except_info) { other.except_info = {}; }
        exception(const exception &) = delete;
        exception &operator=(const exception &) = delete;

        virtual ~exception() noexcept { release_stack_trace(except_info); }

        virtual const char *what() const noexcept = 0;
    };

    class CAPGATE_API runtime_error final : public exception
    {
    public:
        explicit runtime_error(string message) : exception(), _message(std::move(message)) {}
        explicit runtime_error(const char *message) : exception(), _message(message) {}

        const char *what() const noexcept override { return _message.c_str(); }

    private:
        string _message;
    };

    /// Raised when the library itself is inconsistently built: a vocabulary entry without a resolver case.
    class CAPGATE_API internal_error final : public exception
    {
    public:
        explicit internal_error(string message) : exception(), _message(std::move(message)) {}

        const char *what() const noexcept override { return _message.c_str(); }

    private:
        string _message;
    };

    /// Raised when the host lacks capabilities the image was compiled for.
    class CAPGATE_API unsupported_host_error final : public exception
    {
    public:
        explicit unsupported_host_error(vector<string> missing);

        const char *what() const noexcept override { return _message.c_str(); }

        /// Missing capability names in the order of the required set
        const vector<string> &missing() const noexcept { return _missing; }

    private:
        vector<string> _missing;
        string _message;
    };
} // namespace capgate
