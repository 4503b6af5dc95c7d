#ifndef CAPGATE_LOG_H
#define CAPGATE_LOG_H

#include <atomic>
#include <fstream>
#include <iostream>
#include <memory>
#include <oneapi/tbb/concurrent_queue.h>
#include <unordered_map>
#include <utility>
#include "api.hpp"
#include "memory/alloc.hpp"
#include "string.hpp"
#include "vector.hpp"

namespace capgate
{
    namespace log
    {
        enum class level
        {
            fatal,
            error,
            warn,
            info,
            debug,
            trace
        };

        CAPGATE_API const char *level_name(level level) noexcept;

        /// @return false when the text names no level
        CAPGATE_API bool parse_level(string_view text, level &out) noexcept;

        class token_handler_base
        {
        public:
            virtual ~token_handler_base() = default;
            virtual void handle(level level, const char *message, string &out) const = 0;
        };

        using token_handler_list = vector<std::shared_ptr<token_handler_base>>;

        class text_handler final : public token_handler_base
        {
        public:
            explicit text_handler(string_view text) : _text(text) {}

            void handle(level, const char *, string &out) const override { out += _text; }

        private:
            const string _text;
        };

        class time_handler final : public token_handler_base
        {
        public:
            void handle(level level, const char *message, string &out) const override;
        };

        class thread_id_handler final : public token_handler_base
        {
        public:
            void handle(level level, const char *message, string &out) const override;
        };

        class level_name_handler final : public token_handler_base
        {
        public:
            void handle(level level, const char *, string &out) const override { out += level_name(level); }
        };

        class message_handler final : public token_handler_base
        {
        public:
            void handle(level, const char *message, string &out) const override { out += message; }
        };

        namespace colors
        {
            constexpr string_view red = "\x1b[31m";
            constexpr string_view green = "\x1b[32m";
            constexpr string_view yellow = "\x1b[33m";
            constexpr string_view blue = "\x1b[34m";
            constexpr string_view magenta = "\x1b[35m";
            constexpr string_view cyan = "\x1b[36m";
            constexpr string_view reset = "\x1b[0m";
        }; // namespace colors

        class color_handler final : public token_handler_base
        {
        public:
            void handle(level level, const char *message, string &out) const override;
        };

        class decolor_handler final : public token_handler_base
        {
        public:
            void handle(level, const char *, string &out) const override { out += colors::reset; }
        };

        class CAPGATE_API logger_base
        {
        public:
            explicit logger_base(const string &name) : _name(name) {}

            virtual ~logger_base() = default;

            /**
             * @brief Replaces the output pattern.
             *
             * Tokens are written as %(name): ascii_time, level_name, thread, message, color_auto, color_off.
             * Unknown tokens are dropped, everything else is copied verbatim.
             */
            void set_pattern(const string &pattern);

            const string &name() const { return _name; }

            virtual std::ostream &stream() = 0;

            virtual void write(const string &message) = 0;

            void parse_tokens(level level, const char *message, string &out) const
            {
                for (auto &token : _tokens) token->handle(level, message, out);
            }

        private:
            string _name;
            token_handler_list _tokens;
        };

        class CAPGATE_API file_logger final : public logger_base
        {
        public:
            file_logger(const string &name, const string &path, std::ios_base::openmode flags)
                : logger_base(name)
            {
                _fs.open(path.c_str(), flags);
            }

            ~file_logger()
            {
                if (_fs.is_open()) _fs.close();
            }

            std::ostream &stream() override { return _fs; }

            void write(const string &message) override
            {
                if (_fs.is_open()) _fs << message.c_str() << std::flush;
            }

        private:
            std::ofstream _fs;
        };

        class console_logger final : public logger_base
        {
        public:
            explicit console_logger(const string &name) : logger_base(name) {}

            std::ostream &stream() override { return std::cerr; }

            void write(const string &message) override { std::cerr << message.c_str(); }
        };

        /**
         * @class The Log Service
         * @brief Manages loggers for the application.
         *
         * Provides functionality to add, get, and remove loggers. Messages are queued and written by
         * dispatch(); fatal messages are written before log() returns.
         */
        class CAPGATE_API log_service final
        {
        public:
            static log_service *instance;
            logger_base *default_logger;
            // Messages above this level are dropped
            level verbosity;

            log_service() : default_logger(nullptr), verbosity(level::error) { instance = this; }
            ~log_service();

            log_service(const log_service &) = delete;
            log_service &operator=(const log_service &) = delete;

            /**
             * @brief Adds a logger with the specified name.
             * @param name The name of the logger.
             * @param args Arguments forwarded to the logger constructor after the name.
             * @return A pointer to the added logger, owned by the service.
             */
            template <typename T, typename... Args>
            T *add_logger(const string &name, Args &&...args)
            {
                remove_logger(name);
                auto *logger = capgate::alloc<T>(name, std::forward<Args>(args)...);
                _loggers[name] = logger;
                return logger;
            }

            /**
             * @brief Gets the logger with the specified name.
             * @return A pointer to the logger, or nullptr if the logger was not found.
             */
            logger_base *get_logger(const string &name) const
            {
                auto it = _loggers.find(name);
                return it == _loggers.end() ? nullptr : it->second;
            }

            /// @brief Removes the logger with the specified name. Pending messages for it are written first.
            void remove_logger(const string &name);

            __attribute__((format(printf, 4, 5))) void log(logger_base *logger, enum level level,
                                                           const char *message, ...);

            /// @brief Writes every queued message.
            void dispatch();

            /// @param force drop pending messages instead of writing them
            void await(bool force = false);

            size_t pending() const { return static_cast<size_t>(_count.load(std::memory_order_relaxed)); }

        private:
            std::unordered_map<string, logger_base *, string_hash> _loggers;
            oneapi::tbb::concurrent_queue<std::pair<logger_base *, string>> _queue;
            std::atomic<int> _count{0};
        };

        inline logger_base *get_logger(const string &name) { return log_service::instance->get_logger(name); }

        inline logger_base *get_default_logger() { return log_service::instance->default_logger; }
    } // namespace log
} // namespace capgate

#ifdef CAPGATE_LOG_ENABLE
    #define CAPGATE_LOG(lvl, ...)                                                                              \
        do {                                                                                                   \
            auto *_svc = capgate::log::log_service::instance;                                                  \
            if (_svc && _svc->default_logger) _svc->log(_svc->default_logger, capgate::log::level::lvl, __VA_ARGS__); \
        } while (0)
    #define logInfo(...)  CAPGATE_LOG(info, __VA_ARGS__)
    #define logDebug(...) CAPGATE_LOG(debug, __VA_ARGS__)
    #define logTrace(...) CAPGATE_LOG(trace, __VA_ARGS__)
    #define logWarn(...)  CAPGATE_LOG(warn, __VA_ARGS__)
    #define logError(...) CAPGATE_LOG(error, __VA_ARGS__)
    #define logFatal(...) CAPGATE_LOG(fatal, __VA_ARGS__)
#else
    #define logInfo(...)
    #define logDebug(...)
    #define logTrace(...)
    #define logWarn(...)
    #define logError(...)
    #define logFatal(...)
#endif

#endif
