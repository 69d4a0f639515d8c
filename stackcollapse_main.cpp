#include "./include/parallel_stackcollapse.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>

#include <getopt.h>

using namespace stackcollapse;

namespace {

enum LongOption {
    OPT_ADDRS = 256,
    OPT_ALL,
    OPT_JIT,
    OPT_KERNEL,
    OPT_PID,
    OPT_TID,
    OPT_EVENT_FILTER,
    OPT_SKIP_AFTER,
};

void print_usage(const char* prog, std::ostream& os) {
    os << "Usage: " << prog << " [OPTIONS] [PATH]\n"
       << "\n"
       << "Converts perf script output into folded stacks, one line per distinct stack.\n"
       << "\n"
       << "Options:\n"
       << "      --addrs               Include raw addresses where symbols can't be found\n"
       << "      --all                 All annotations (--kernel --jit)\n"
       << "      --jit                 Annotate jit functions with a _[j]\n"
       << "      --kernel              Annotate kernel functions with a _[k]\n"
       << "      --pid                 Include PID with process names [1]\n"
       << "      --tid                 Include TID and PID with process names [1]\n"
       << "      --event-filter STR    Event filter [default: first encountered event]\n"
       << "                            Tracepoints match by full name, eg sched:sched_switch\n"
       << "      --skip-after STR      Omit all the parent stack frames of the matched function\n"
       << "                            Matched against the final label, including any _[k]/_[j]\n"
       << "  -n, --nthreads UINT       Number of threads to use [default: " << default_nthreads() << "]\n"
       << "  -q, --quiet               Silence all log output\n"
       << "  -v, --verbose             Verbose logging mode (-v, -vv, -vvv)\n"
       << "  -h, --help                Print this help\n"
       << "\n"
       << "PATH is the perf script output file, or STDIN if not specified or \"-\".\n"
       << "\n"
       << "[1] perf script must emit both PID and TIDs for these to work; eg, Linux < 4.1:\n"
       << "        perf script -f comm,pid,tid,cpu,time,event,ip,sym,dso,trace\n"
       << "    for Linux >= 4.1:\n"
       << "        perf script -F comm,pid,tid,cpu,time,event,ip,sym,dso,trace\n"
       << "    If you save this output add --header on Linux >= 3.14 to include perf info.\n";
}

size_t parse_nthreads(const char* arg) {
    auto n = parse_number<size_t>(arg ? std::string_view(arg) : std::string_view());
    if (! n) {
        throw std::invalid_argument(std::string("invalid value for --nthreads: ") + (arg ? arg : ""));
    }
    return *n;
}

} // namespace

int main(int argc, char* argv[]) {
    std::ios::sync_with_stdio(false);

    static const option long_options[] = {
        {       "addrs",       no_argument, nullptr,        OPT_ADDRS},
        {         "all",       no_argument, nullptr,          OPT_ALL},
        {         "jit",       no_argument, nullptr,          OPT_JIT},
        {      "kernel",       no_argument, nullptr,       OPT_KERNEL},
        {         "pid",       no_argument, nullptr,          OPT_PID},
        {         "tid",       no_argument, nullptr,          OPT_TID},
        {"event-filter", required_argument, nullptr, OPT_EVENT_FILTER},
        {  "skip-after", required_argument, nullptr,   OPT_SKIP_AFTER},
        {    "nthreads", required_argument, nullptr,              'n'},
        {       "quiet",       no_argument, nullptr,              'q'},
        {     "verbose",       no_argument, nullptr,              'v'},
        {        "help",       no_argument, nullptr,              'h'},
        {       nullptr,                 0, nullptr,                0},
    };

    CollapseOptions options;
    options.nthreads = default_nthreads();
    bool quiet = false;
    int verbose = 0;

    try {
        int c;
        while ((c = getopt_long(argc, argv, "n:qvh", long_options, nullptr)) != -1) {
            switch (c) {
                case OPT_ADDRS:
                    options.include_addrs = true;
                    break;
                case OPT_ALL:
                    options.annotate_kernel = true;
                    options.annotate_jit = true;
                    break;
                case OPT_JIT:
                    options.annotate_jit = true;
                    break;
                case OPT_KERNEL:
                    options.annotate_kernel = true;
                    break;
                case OPT_PID:
                    options.include_pid = true;
                    break;
                case OPT_TID:
                    options.include_tid = true;
                    break;
                case OPT_EVENT_FILTER:
                    options.event_filter = optarg;
                    break;
                case OPT_SKIP_AFTER:
                    options.skip_after = optarg;
                    break;
                case 'n':
                    options.nthreads = parse_nthreads(optarg);
                    break;
                case 'q':
                    quiet = true;
                    break;
                case 'v':
                    verbose++;
                    break;
                case 'h':
                    print_usage(argv[0], std::cout);
                    return 0;
                default:
                    print_usage(argv[0], std::cerr);
                    return 1;
            }
        }

        if (argc - optind > 1) {
            throw std::invalid_argument("too many arguments");
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage(argv[0], std::cerr);
        return 1;
    }

    if (quiet) {
        Logger::set_level(LogLevel::Off);
    } else if (verbose == 1) {
        Logger::set_level(LogLevel::Info);
    } else if (verbose == 2) {
        Logger::set_level(LogLevel::Debug);
    } else if (verbose >= 3) {
        Logger::set_level(LogLevel::Trace);
    }

    std::string infile = optind < argc ? argv[optind] : "";

    try {
        PerfCollapser collapser(options);
        log_trace("using ", collapser.get_collapser_name(), " with ", options.nthreads, " threads");

        auto start = std::chrono::steady_clock::now();
        CollapseStats stats = collapser.collapse_file(infile, std::cout);
        auto end = std::chrono::steady_clock::now();

        log_info("reading, processing and writing time: ",
                 std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count(), "ms");
        log_info(stats);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
