#include <capgate/config.hpp>
#include <capgate/exception/exception.hpp>
#include <capgate/string/utils.hpp>
#include <cstdlib>

namespace capgate
{
    static void erase_all(string &text, string_view token)
    {
        for (size_t pos = text.find(token); pos != string::npos; pos = text.find(token, pos))
            text.erase(pos, token.size());
    }

    void load_config(config &cfg, env_lookup lookup)
    {
        if (!lookup) lookup = [](const char *name) -> const char * { return std::getenv(name); };

        if (const char *value = lookup("CAPGATE_LOG_LEVEL"))
        {
            if (!log::parse_level(value, cfg.log_level))
                throw runtime_error(format("CAPGATE_LOG_LEVEL: unknown log level '%s'", value));
        }
        if (const char *value = lookup("CAPGATE_LOG_FILE")) cfg.log_file = value;
        if (const char *value = lookup("CAPGATE_LOG_PATTERN")) cfg.log_pattern = value;
        if (lookup("CAPGATE_NO_COLOR")) cfg.color = false;
    }

    log::logger_base *apply_config(const config &cfg, log::log_service &service)
    {
        service.verbosity = cfg.log_level;

        string pattern = cfg.log_pattern;
        if (!cfg.color)
        {
            erase_all(pattern, "%(color_auto)");
            erase_all(pattern, "%(color_off)");
        }
        auto *console = service.add_logger<log::console_logger>("console");
        console->set_pattern(pattern);
        service.default_logger = console;

        if (!cfg.log_file.empty())
        {
            auto *file = service.add_logger<log::file_logger>("file", cfg.log_file, std::ios::out | std::ios::app);
            string file_pattern = cfg.log_pattern;
            erase_all(file_pattern, "%(color_auto)");
            erase_all(file_pattern, "%(color_off)");
            file->set_pattern("%(ascii_time) " + file_pattern);
            service.default_logger = file;
        }
        return service.default_logger;
    }
} // namespace capgate
