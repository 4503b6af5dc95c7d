#include <capgate/log.hpp>
#include <cassert>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace
{
    class memory_logger final : public capgate::log::logger_base
    {
    public:
        explicit memory_logger(const capgate::string &name) : logger_base(name) {}

        std::ostream &stream() override { return std::cerr; }

        void write(const capgate::string &message) override { lines.push_back(message); }

        capgate::vector<capgate::string> lines;
    };
} // namespace

void test_log()
{
    using namespace capgate;
    using namespace capgate::log;

    log_service service;
    assert(log_service::instance == &service);
    service.verbosity = level::trace;

    auto *console = service.add_logger<console_logger>("console");
    service.default_logger = console;
    console->set_pattern("%(color_auto)[%(level_name)]%(ascii_time)%(thread)%(message)%(color_off)\n");
    assert(console->name() == "console");

    service.log(console, level::debug, "Test debug log: %d", 123);
    service.log(console, level::trace, "Test trace log: %d", 123);
    service.log(console, level::error, "Test error log: %d", 123);
    service.log(console, level::warn, "Test warn log: %d", 123);
    service.log(console, level::info, "Test info log: %d", 123);
    assert(service.pending() == 5);
    service.log(console, level::fatal, "Test fatal log: %d", 123);
    assert(service.pending() == 0);

    logger_base *fetched = service.get_logger("console");
    assert(fetched == console);
    service.await(true);
    service.remove_logger("console");
    assert(service.get_logger("console") == nullptr);
    assert(service.default_logger == nullptr);

    const char *output_dir = getenv("TEST_OUTPUT_DIR");
    string filepath = string(output_dir ? output_dir : ".") + "/test_log.txt";
    auto *filelog = service.add_logger<file_logger>("file", filepath, std::ios::out | std::ios::trunc);
    assert(filelog->stream().good());
    filelog->set_pattern("%(level_name): %(message)\n");

    service.default_logger = filelog;
    assert(service.default_logger == service.get_logger("file"));
    service.verbosity = level::info;
    service.log(filelog, level::info, "File log: %d", 456);
    service.log(filelog, level::debug, "Filtered: %d", 789);
    assert(service.pending() == 1);
    service.dispatch();
    service.remove_logger("file");

    {
        std::ifstream in(filepath.c_str());
        std::stringstream content;
        content << in.rdbuf();
        std::string text = content.str();
        assert(text.find("INFO: File log: 456") != std::string::npos);
        assert(text.find("Filtered") == std::string::npos);
    }
}

void test_log_levels()
{
    using namespace capgate::log;

    level parsed = level::error;
    assert(parse_level("debug", parsed) && parsed == level::debug);
    assert(parse_level(" TRACE ", parsed) && parsed == level::trace);
    assert(!parse_level("verbose", parsed) && parsed == level::trace);
    assert(std::string(level_name(level::warn)) == "WARN");

    // Macros are harmless without a service
    assert(log_service::instance == nullptr);
    logInfo("dropped %d", 1);
    logFatal("dropped %d", 2);
}

void test_log_literal_percent()
{
    using namespace capgate::log;

    log_service service;
    service.verbosity = level::info;
    auto *memory = service.add_logger<memory_logger>("memory");
    memory->set_pattern("load 100%d %(message)\n");

    service.log(memory, level::fatal, "Missing: %s", "[AVX, AVX2]");
    assert(memory->lines.size() == 1);
    assert(memory->lines[0] == "load 100%d Missing: [AVX, AVX2]\n");

    // Arguments carrying '%' are not formatted twice
    service.log(memory, level::info, "%s", "50%s done");
    service.dispatch();
    assert(memory->lines.size() == 2);
    assert(memory->lines[1] == "load 100%d 50%s done\n");
}
