#pragma once

#include "log.hpp"

namespace capgate
{
    struct config
    {
        log::level log_level = log::level::warn;
        string log_file;
        string log_pattern = "%(color_auto)[%(level_name)] %(message)%(color_off)\n";
        bool color = true;
    };

    using env_lookup = const char *(*)(const char *name);

    /**
     * @brief Reads CAPGATE_LOG_LEVEL, CAPGATE_LOG_FILE, CAPGATE_LOG_PATTERN and CAPGATE_NO_COLOR.
     *
     * Unset variables keep the current values of cfg.
     * @throws runtime_error when CAPGATE_LOG_LEVEL names no level
     */
    CAPGATE_API void load_config(config &cfg, env_lookup lookup = nullptr);

    /**
     * @brief Configures the service: level, a "console" logger and, when log_file is set, a "file"
     * logger which then becomes the default.
     * @return The default logger
     */
    CAPGATE_API log::logger_base *apply_config(const config &cfg, log::log_service &service);
} // namespace capgate
