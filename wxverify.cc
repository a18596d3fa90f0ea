#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>
#include <unistd.h>

#ifdef WXV_PROFILE
# include <gperftools/profiler.h>
#endif

#include "config.h"
#include "exception.h"
#include "scenario.h"
#include "verify.h"

const char *prog;

#define error(...) \
do { \
fprintf(stderr, "%s: error: ", prog); \
fprintf(stderr, __VA_ARGS__); \
fprintf(stderr, "\n"); \
std::exit(EXIT_FAILURE); \
} while (false)

namespace {

constexpr int exit_oracle_unavailable = 2;

void usage(FILE *f = stderr) {
    const char *s = R"=(usage: %s [option...]
Checks the paging theories; with no options every scenario's default goals are run.
Options:
 -h               show help
 -s <scenario>    run scenario (basic_paging|aliasing|single_level_wx|nested_wxvisor or 1-4)
 -g <goal>        check goal instead of the scenario's defaults
 -w <bits>        address width (default 32)
 -p <bits>        page shift (default 12)
 -n <stages>      translation stages of the nested scenario (default 2)
 -a <va>          pin the checked virtual address (default 0x12345000 if it fits)
 -A <va>          pin the next alias address
 -t <ms>          solver timeout; expiry reports unknown
 -j <threads>     run checks on this many threads
 -d               dump each query as SMT-LIB2 to stderr
 -v               verbose
)=";
    fprintf(f, s, prog);
#ifdef WXV_PROFILE
    fprintf(f, " -P <file>        write a CPU profile\n");
#endif
}

uint64_t parse_uint64(const char *s) {
    char *end;
    const uint64_t res = std::strtoull(s, &end, 0);
    if (*s == '\0' || *end != '\0') {
        error("bad integer %s", s);
    }
    return res;
}

unsigned parse_unsigned(const char *s) {
    const uint64_t res = parse_uint64(s);
    if (res > UINT32_MAX) {
        error("%s out of range", s);
    }
    return res;
}

}

int main(int argc, char *argv[]) {
    prog = argv[0];

    std::vector<std::string> scenario_args;
    std::vector<std::string> goal_args;

    int optc;
    while ((optc = getopt(argc, argv, "hs:g:w:p:n:a:A:t:j:dvP:")) >= 0) {
        switch (optc) {
            case 'h':
                usage(stdout);
                return EXIT_SUCCESS;

            case 's':
                scenario_args.push_back(optarg);
                break;

            case 'g':
                goal_args.push_back(optarg);
                break;

            case 'w':
                conf::addr_bits = parse_unsigned(optarg);
                break;

            case 'p':
                conf::page_bits = parse_unsigned(optarg);
                break;

            case 'n':
                conf::nested_stages = parse_unsigned(optarg);
                break;

            case 'a':
                conf::va = parse_uint64(optarg);
                break;

            case 'A':
                conf::aliases.push_back(parse_uint64(optarg));
                break;

            case 't':
                conf::timeout_ms = parse_unsigned(optarg);
                break;

            case 'j':
                conf::jobs = parse_unsigned(optarg);
                break;

            case 'd':
                conf::dump = true;
                break;

            case 'v':
                conf::verbose = true;
                break;

            case 'P':
                conf::profile = optarg;
                break;

            default:
                usage();
                return EXIT_FAILURE;
        }
    }

    if (argc != optind) {
        usage();
        return EXIT_FAILURE;
    }

    if (conf::profile) {
#ifdef WXV_PROFILE
        ProfilerStart(conf::profile->c_str());
        std::atexit(ProfilerStop);
#else
        error("-P: built without profiling support");
#endif
    }

    try {
        std::vector<wxv::Scenario> scenarios;
        for (const std::string& arg : scenario_args) {
            scenarios.push_back(wxv::parse_scenario(arg));
        }
        if (scenarios.empty()) {
            scenarios = wxv::all_scenarios();
        }

        std::vector<wxv::Goal> goals;
        for (const std::string& arg : goal_args) {
            goals.push_back(wxv::parse_goal(arg));
        }

        std::vector<wxv::Check> checks;
        for (const wxv::Scenario scenario : scenarios) {
            if (goals.empty()) {
                const auto defaults = wxv::default_checks(scenario);
                checks.insert(checks.end(), defaults.begin(), defaults.end());
            } else {
                for (const wxv::Goal goal : goals) {
                    checks.push_back(wxv::Check {scenario, goal, wxv::expected_verdict(scenario, goal)});
                }
            }
        }

        for (const wxv::Outcome& outcome : wxv::run_checks(checks, conf::jobs)) {
            wxv::print_outcome(std::cout, outcome);
        }
    } catch (const wxv::configuration_error& e) {
        std::cerr << prog << ": " << e << "\n";
        return EXIT_FAILURE;
    } catch (const wxv::oracle_unavailable& e) {
        std::cerr << prog << ": " << e << "\n";
        return exit_oracle_unavailable;
    }

    return EXIT_SUCCESS;
}
