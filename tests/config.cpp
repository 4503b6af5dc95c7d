#include <capgate/config.hpp>
#include <capgate/exception/exception.hpp>
#include <cassert>
#include <cstring>

namespace
{
    const char *env_debug(const char *name)
    {
        if (std::strcmp(name, "CAPGATE_LOG_LEVEL") == 0) return "debug";
        if (std::strcmp(name, "CAPGATE_LOG_PATTERN") == 0) return "%(color_auto)%(message)%(color_off)\n";
        if (std::strcmp(name, "CAPGATE_NO_COLOR") == 0) return "1";
        return nullptr;
    }

    const char *env_bad_level(const char *name)
    {
        if (std::strcmp(name, "CAPGATE_LOG_LEVEL") == 0) return "loud";
        return nullptr;
    }

    const char *env_empty(const char *) { return nullptr; }
} // namespace

void test_config()
{
    using namespace capgate;

    config defaults;
    load_config(defaults, &env_empty);
    assert(defaults.log_level == log::level::warn);
    assert(defaults.log_file.empty());
    assert(defaults.color);

    config cfg;
    load_config(cfg, &env_debug);
    assert(cfg.log_level == log::level::debug);
    assert(!cfg.color);
    assert(cfg.log_pattern == "%(color_auto)%(message)%(color_off)\n");

    config bad;
    bool threw = false;
    try
    {
        load_config(bad, &env_bad_level);
    }
    catch (const runtime_error &e)
    {
        threw = true;
        assert(std::strstr(e.what(), "loud") != nullptr);
    }
    assert(threw);
    assert(bad.log_level == log::level::warn);

    log::log_service service;
    log::logger_base *logger = apply_config(cfg, service);
    assert(logger == service.get_logger("console"));
    assert(service.default_logger == logger);
    assert(service.verbosity == log::level::debug);
    assert(service.get_logger("file") == nullptr);
}
