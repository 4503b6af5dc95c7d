#include <capgate/log.hpp>
#include <capgate/string/utils.hpp>
#include <chrono>
#include <cstdarg>
#include <ctime>
#include <regex>
#include <thread>

namespace capgate
{
    namespace log
    {
        const char *level_name(level level) noexcept
        {
            switch (level)
            {
                case level::info:
                    return "INFO";
                case level::debug:
                    return "DEBUG";
                case level::trace:
                    return "TRACE";
                case level::warn:
                    return "WARN";
                case level::error:
                    return "ERROR";
                case level::fatal:
                    return "FATAL";
                default:
                    return "UNKNOWN";
            }
        }

        bool parse_level(string_view text, level &out) noexcept
        {
            static const std::pair<string_view, enum level> names[] = {
                {"fatal", level::fatal}, {"error", level::error}, {"warn", level::warn},
                {"info", level::info},   {"debug", level::debug}, {"trace", level::trace}};
            text = trim(text);
            for (const auto &entry : names)
                if (iequals(entry.first, text))
                {
                    out = entry.second;
                    return true;
                }
            return false;
        }

        void time_handler::handle(level, const char *, string &out) const
        {
            using namespace std::chrono;
            auto now = system_clock::now();
            auto now_ns = now.time_since_epoch();
            long long ns = duration_cast<nanoseconds>(now_ns).count() % 1000000000;

            time_t time_t_now = system_clock::to_time_t(now);
            std::tm tm_now;

#ifdef _WIN32
            localtime_s(&tm_now, &time_t_now);
#else
            localtime_r(&time_t_now, &tm_now);
#endif

            out += format("%04d-%02d-%02d %02d:%02d:%02d.%09lld", tm_now.tm_year + 1900, tm_now.tm_mon + 1,
                          tm_now.tm_mday, tm_now.tm_hour, tm_now.tm_min, tm_now.tm_sec, ns);
        }

        void thread_id_handler::handle(level, const char *, string &out) const
        {
            out += format("%zu", std::hash<std::thread::id>{}(std::this_thread::get_id()));
        }

        void color_handler::handle(level level, const char *, string &out) const
        {
            switch (level)
            {
                case level::fatal:
                    out += colors::magenta;
                    break;
                case level::error:
                    out += colors::red;
                    break;
                case level::warn:
                    out += colors::yellow;
                    break;
                case level::info:
                    out += colors::green;
                    break;
                case level::debug:
                    out += colors::blue;
                    break;
                case level::trace:
                    out += colors::cyan;
                    break;
                default:
                    out += colors::reset;
                    break;
            }
        }

        static std::shared_ptr<token_handler_base> make_token_handler(const std::string &token)
        {
            if (token == "ascii_time") return std::make_shared<time_handler>();
            if (token == "level_name") return std::make_shared<level_name_handler>();
            if (token == "thread") return std::make_shared<thread_id_handler>();
            if (token == "message") return std::make_shared<message_handler>();
            if (token == "color_auto") return std::make_shared<color_handler>();
            if (token == "color_off") return std::make_shared<decolor_handler>();
            return nullptr;
        }

        void logger_base::set_pattern(const string &pattern)
        {
            _tokens.clear();
            std::regex token_regex("%\\((.*?)\\)");
            const char *begin = pattern.data();
            const char *end = pattern.data() + pattern.size();
            std::cregex_iterator it(begin, end, token_regex);
            std::cregex_iterator regex_end;

            size_t last_pos = 0;
            for (; it != regex_end; ++it)
            {
                size_t pos = static_cast<size_t>(it->position());
                if (pos != last_pos)
                    _tokens.push_back(std::make_shared<text_handler>(string_view(pattern).substr(last_pos, pos - last_pos)));

                if (auto handler = make_token_handler(it->str(1))) _tokens.push_back(std::move(handler));

                last_pos = pos + static_cast<size_t>(it->length());
            }
            if (last_pos != pattern.size())
                _tokens.push_back(std::make_shared<text_handler>(string_view(pattern).substr(last_pos)));
        }

        void log_service::log(logger_base *logger, enum level level, const char *message, ...)
        {
            if (!logger || level > verbosity) return;
            va_list args;
            va_start(args, message);
            string formatted = format_va_list(message, args);
            va_end(args);
            // Pattern text is copied verbatim, never read as a format string
            string text;
            logger->parse_tokens(level, formatted.c_str(), text);
            if (level == level::fatal)
            {
                dispatch();
                logger->write(text);
                return;
            }
            _count.fetch_add(1, std::memory_order_relaxed);
            _queue.emplace(logger, std::move(text));
        }

        void log_service::dispatch()
        {
            std::pair<logger_base *, string> pair;
            while (_queue.try_pop(pair))
            {
                pair.first->write(pair.second);
                _count.fetch_sub(1, std::memory_order_relaxed);
            }
        }

        void log_service::await(bool force)
        {
            if (force)
            {
                _queue.clear();
                _count.store(0, std::memory_order_relaxed);
                return;
            }
            dispatch();
        }

        void log_service::remove_logger(const string &name)
        {
            auto it = _loggers.find(name);
            if (it == _loggers.end()) return;
            dispatch();
            if (default_logger == it->second) default_logger = nullptr;
            capgate::release(it->second);
            _loggers.erase(it);
        }

        log_service::~log_service()
        {
            dispatch();
            for (auto &logger : _loggers) capgate::release(logger.second);
            _loggers.clear();
            default_logger = nullptr;
            if (instance == this) instance = nullptr;
        }

        log_service *log_service::instance = nullptr;
    } // namespace log
} // namespace capgate
