#include <capgate/arch/host.hpp>
#include <capgate/config.hpp>
#include <capgate/exception/utils.hpp>
#include <capgate/level.hpp>
#include <capgate/startup.hpp>
#include <cstdio>
#include <cstdlib>
#include <cstring>

using namespace capgate;
using host_arch = arch::host;

namespace
{
    void print_usage()
    {
        fprintf(stderr,
                "usage: capgate <command> [options]\n"
                "\n"
                "commands:\n"
                "  list                                 print the CPU features of this host\n"
                "  vocab                                print every feature name known for %s\n"
                "  verify [--level LEVEL] [FEATURE...]  check that the host supports the features\n"
                "  enable [--level LEVEL] [FEATURE...]  print the runtime feature set after widening\n"
                "\n"
                "LEVEL is x86-64-v1 .. x86-64-v4. FEATURE lists may be comma separated.\n",
                host_arch::name);
    }

    template <typename Arch>
    bool add_level(feature_set<Arch> &features, x86_64_level level)
    {
        if constexpr (std::is_same_v<Arch, arch::x86>)
        {
            features |= level_features(level);
            return true;
        }
        else
            return false;
    }

    template <typename Arch>
    void log_highest_level(const feature_set<Arch> &host)
    {
        if constexpr (std::is_same_v<Arch, arch::x86>)
        {
            if (auto level = highest_level(host)) logInfo("Highest supported level: %s", x86_64_level_name(*level));
        }
    }

    struct required_args
    {
        feature_set<host_arch> features;
        bool ok = true;
    };

    required_args parse_required(int argc, char **argv, int first)
    {
        required_args result;
        for (int i = first; i < argc; ++i)
        {
            if (strcmp(argv[i], "--level") == 0)
            {
                if (i + 1 >= argc)
                {
                    logError("--level requires a value");
                    result.ok = false;
                    return result;
                }
                auto level = parse_x86_64_level(argv[++i]);
                if (!level)
                {
                    logError("Unknown microarchitecture level '%s'", argv[i]);
                    result.ok = false;
                    return result;
                }
                if (!add_level<host_arch>(result.features, *level))
                {
                    logError("Microarchitecture levels apply to x86 only");
                    result.ok = false;
                    return result;
                }
                continue;
            }
            result.features |= parse_feature_list<host_arch>(argv[i]);
        }
        return result;
    }

    op_result cmd_list(const feature_access<host_arch> &access)
    {
        auto host = access.enumerate_host_features();
        for (const auto &name : feature_names<host_arch>(host)) printf("%s\n", name.c_str());
        log_highest_level<host_arch>(host);
        return make_op_success();
    }

    op_result cmd_vocab()
    {
        for (const char *name : host_arch::feature_names) printf("%s\n", name);
        return make_op_success();
    }

    op_result cmd_verify(const feature_access<host_arch> &access, int argc, char **argv)
    {
        auto args = parse_required(argc, argv, 2);
        if (!args.ok) return make_op_error(CAPGATE_OP_INVALID_ARGUMENT);
        target_description<host_arch> image(args.features);
        startup_gate<host_arch> gate(access);
        CAPGATE_TRY(gate.verify(image));
        printf("OK %s\n", to_string<host_arch>(image.required_features()).c_str());
        return make_op_success();
    }

    op_result cmd_enable(const feature_access<host_arch> &access, int argc, char **argv)
    {
        auto args = parse_required(argc, argv, 2);
        if (!args.ok) return make_op_error(CAPGATE_OP_INVALID_ARGUMENT);
        target_description<host_arch> runtime(args.features);
        startup_gate<host_arch> gate(access);
        CAPGATE_TRY(gate.verify(runtime));
        gate.widen(runtime);
        if (!callee_saved_registers_supported)
            logInfo("Runtime CPU features widened to the host");
        else
            logInfo("Callee-saved registers are fixed at build time; runtime CPU features left unchanged");
        printf("%s\n", to_string<host_arch>(runtime.features()).c_str());
        return make_op_success();
    }

    op_result run(int argc, char **argv)
    {
        const char *command = argv[1];
        if (strcmp(command, "vocab") == 0) return cmd_vocab();

        feature_access<host_arch> access;
        if (strcmp(command, "list") == 0) return cmd_list(access);
        if (strcmp(command, "verify") == 0) return cmd_verify(access, argc, argv);
        if (strcmp(command, "enable") == 0) return cmd_enable(access, argc, argv);

        print_usage();
        return make_op_error(CAPGATE_OP_INVALID_ARGUMENT);
    }
} // namespace

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        print_usage();
        return 2;
    }

    log::log_service service;
    config cfg;
    try
    {
        load_config(cfg);
    }
    catch (const capgate::exception &e)
    {
        fprintf(stderr, "capgate: %s\n", e.what());
        return 2;
    }
    apply_config(cfg, service);

    op_result result = make_op_error(CAPGATE_OP_UNKNOWN);
    try
    {
        result = run(argc, argv);
    }
    catch (const internal_error &e)
    {
        logFatal("%s", e.what());
        if (service.verbosity >= log::level::debug)
        {
            string trace;
            write_stack_trace(trace, e.except_info);
            logDebug("%s", trace.c_str());
        }
        result = make_op_error(CAPGATE_OP_INTERNAL_ERROR);
    }
    catch (const capgate::exception &e)
    {
        logError("%s", e.what());
        result = make_op_error(CAPGATE_OP_INVALID_ARGUMENT);
    }
    service.dispatch();

    if (result.success()) return EXIT_SUCCESS;
    if (result.state == CAPGATE_OP_INVALID_ARGUMENT) return 2;
    return EXIT_FAILURE;
}
