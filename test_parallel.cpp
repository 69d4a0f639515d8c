#include <catch2/catch.hpp>

#include "./include/parallel_stackcollapse.hpp"
#include <cstdio>
#include <fstream>
#include <map>
#include <sstream>

using namespace stackcollapse;

namespace {

std::string collapse_to_string(std::string_view input, CollapseOptions options = {},
                               CollapseStats* stats = nullptr) {
    PerfCollapser collapser(std::move(options));
    std::ostringstream out;
    CollapseStats result = collapser.collapse(input, out);
    if (stats) *stats = result;
    return out.str();
}

std::map<std::string, size_t> as_map(const SampleCounter& counter) {
    return std::map<std::string, size_t>(counter.begin(), counter.end());
}

// 生成一个有重复堆栈, 多个进程, 偶尔有坏行的 trace
std::string synthetic_trace(int records) {
    static const char* const funcs[] = {"main", "run", "parse", "fold", "write", "malloc", "memcpy", "foo"};
    std::string trace = "# ========\n# captured on    : Thu Jan  1 00:00:00 2020\n# ========\n#\n";

    for (int i = 0; i < records; ++i) {
        const char* comm = (i % 3 == 0) ? "worker" : "Web Content";
        const char* event = (i % 5 == 4) ? "instructions" : "cycles";

        trace += comm;
        trace += " " + std::to_string(100 + i % 4) + "/" + std::to_string(200 + i % 6);
        trace += " [00" + std::to_string(i % 4) + "] " + std::to_string(1000 + i) + ".000123:";
        trace += "     250000 " + std::string(event) + ":u:\n";

        int depth = 1 + (i * 7) % 6;
        for (int d = depth; d >= 0; --d) {
            const char* func = funcs[(i + d * 3) % 8];
            char line[128];
            std::snprintf(line, sizeof(line), "\t    %x %s+0x%x (/usr/bin/app)\n", 0x400000 + d * 16, func, d);
            trace += line;
        }
        if (i % 17 == 0) {
            trace += "\t    ffffffff81000000 native_safe_halt ([kernel.kallsyms])\n";
        }
        if (i % 23 == 0) {
            trace += "\t    ???? weird\n";
        }
        trace += "\n";
    }
    return trace;
}

size_t total_count(const SampleCounter& counter) {
    size_t sum = 0;
    for (const auto& entry : counter) {
        sum += entry.second;
    }
    return sum;
}

} // namespace

TEST_CASE("Identical records fold into one line", "[collapse]") {
    std::string_view trace = "app 100 [000] 1.000000: cycles:\n"
                             "\t4005d4 main (/app)\n"
                             "\n"
                             "app 100 [000] 1.000100: cycles:\n"
                             "\t4005d4 main (/app)\n"
                             "\n";

    CHECK(collapse_to_string(trace) == "app;main 2\n");
}

TEST_CASE("Stacks are written root to leaf", "[collapse]") {
    std::string_view trace = "app 100 1.0: cycles:\n"
                             "\t4005f0 leaf (/app)\n"
                             "\t4005d4 main (/app)\n"
                             "\t4004a0 __libc_start_main (/lib/libc.so.6)\n";

    CHECK(collapse_to_string(trace) == "app;__libc_start_main;main;leaf 1\n");
}

TEST_CASE("skip-after trims the callers of the marker", "[collapse]") {
    std::string_view trace = "app 100 1.0: cycles:\n"
                             "\t3 leaf (/app)\n"
                             "\t2 foo (/app)\n"
                             "\t1 root (/app)\n"
                             "\n"
                             "app 100 2.0: cycles:\n"
                             "\t3 leaf (/app)\n"
                             "\t1 root (/app)\n";

    CollapseOptions options;
    options.skip_after = "foo";
    CHECK(collapse_to_string(trace, options) == "app;foo;leaf 1\napp;root;leaf 1\n");
}

TEST_CASE("skip-after matches the annotated label", "[collapse]") {
    std::string_view trace = "app 100 1.0: cycles:\n"
                             "\t3 leaf ([kernel.kallsyms])\n"
                             "\t2 foo ([kernel.kallsyms])\n"
                             "\t1 root (/app)\n";

    CollapseOptions options;
    options.annotate_kernel = true;
    options.skip_after = "foo";
    CHECK(collapse_to_string(trace, options) == "app;root;foo_[k];leaf_[k] 1\n");

    options.skip_after = "foo_[k]";
    CHECK(collapse_to_string(trace, options) == "app;foo_[k];leaf_[k] 1\n");
}

TEST_CASE("Trace ending in a header without newline", "[collapse]") {
    std::string_view trace = "app 1 1.0: cycles:\n\t1 main (/a)\n\napp 1 2.0: cycles:";

    CollapseStats stats;
    CHECK(collapse_to_string(trace, {}, &stats) == "app 1\napp;main 1\n");
    CHECK(stats.records == 2);

    CollapseOptions options;
    options.nthreads = 4;
    CHECK(collapse_to_string(trace, options) == "app 1\napp;main 1\n");
}

TEST_CASE("Trimming is a no-op when the marker never appears", "[collapse]") {
    std::string trace = synthetic_trace(300);

    CollapseOptions options;
    options.skip_after = "does_not_exist";
    CHECK(collapse_to_string(trace, options) == collapse_to_string(trace));
}

TEST_CASE("Unset event filter counts only the first event type", "[collapse]") {
    std::string_view trace = "app 100 1.0: 1 cycles:\n\t1 a (/app)\n\n"
                             "app 100 2.0: 1 instructions:\n\t1 b (/app)\n\n"
                             "app 100 3.0: 1 cycles:\n\t1 a (/app)\n\n"
                             "app 100 4.0: 1 instructions:\n\t1 b (/app)\n\n";

    for (size_t nthreads : {1, 2, 4}) {
        CollapseOptions options;
        options.nthreads = nthreads;
        CollapseStats stats;
        CHECK(collapse_to_string(trace, options, &stats) == "app;a 2\n");
        CHECK(stats.filtered == 2);
    }
}

TEST_CASE("Explicit event filter", "[collapse]") {
    std::string_view trace = "app 100 1.0: 1 cycles:\n\t1 a (/app)\n\n"
                             "app 100 2.0: 1 instructions:\n\t1 b (/app)\n\n";

    CollapseOptions options;
    options.event_filter = "instructions";
    CHECK(collapse_to_string(trace, options) == "app;b 1\n");

    options.event_filter = "branch-misses";
    CHECK(collapse_to_string(trace, options).empty());
}

TEST_CASE("Unresolvable frames are kept as the unknown sentinel", "[collapse]") {
    std::string_view trace = "app 100 1.0: cycles:\n"
                             "\t7f1e2215d058 [unknown] ([unknown])\n"
                             "\t4005d4 main (/app)\n";

    CHECK(collapse_to_string(trace) == "app;main;[unknown] 1\n");

    CollapseOptions options;
    options.include_addrs = true;
    CHECK(collapse_to_string(trace, options) == "app;main;[unknown+7f1e2215d058] 1\n");
}

TEST_CASE("Process labels with pid and tid", "[collapse]") {
    std::string_view trace = "app 100/101 1.0: cycles:\n\t1 main (/app)\n\n"
                             "app 100/102 2.0: cycles:\n\t1 main (/app)\n\n";

    CollapseOptions options;
    options.include_pid = true;
    CHECK(collapse_to_string(trace, options) == "app-100;main 2\n");

    options.include_tid = true;
    CHECK(collapse_to_string(trace, options) == "app-100/101;main 1\napp-100/102;main 1\n");
}

TEST_CASE("Kernel and jit annotations end to end", "[collapse]") {
    std::string_view trace = "java 7/7 1.0: cycles:\n"
                             "\tffffffff8103ce3b native_safe_halt ([kernel.kallsyms])\n"
                             "\t7f722d142778 Ljava/io/PrintStream;::print (/tmp/perf-19982.map)\n"
                             "\t4005d4 main (/usr/bin/java)\n";

    CollapseOptions options;
    options.annotate_kernel = true;
    options.annotate_jit = true;
    CHECK(collapse_to_string(trace, options) == "java;main;java/io/PrintStream:::print_[j];native_safe_halt_[k] 1\n");
}

TEST_CASE("Records without frames fold to the process label", "[collapse]") {
    std::string_view trace = "app 100 1.0: cycles:\n"
                             "\n"
                             "app 100 2.0: cycles:\n"
                             "app 100 3.0: cycles:\n"
                             "\t1 main (/app)\n";

    CHECK(collapse_to_string(trace) == "app 2\napp;main 1\n");
}

TEST_CASE("Empty input produces empty output", "[collapse]") {
    CollapseStats stats;
    CHECK(collapse_to_string("", {}, &stats).empty());
    CHECK(stats.records == 0);
    CHECK(stats.unique_stacks == 0);

    CHECK(collapse_to_string("# only\n# metadata\n\n").empty());
}

TEST_CASE("Malformed content never aborts the run", "[collapse]") {
    Logger::set_level(LogLevel::Off);

    std::string_view trace = "\n\n"
                             "this is not a header\n"
                             "\t1 main (/app)\n"
                             "\n"
                             "app 100 1.0: cycles:\n"
                             "\tnot-a-frame\n"
                             "\t1 main (/app)\n";

    CollapseStats stats;
    CHECK(collapse_to_string(trace, {}, &stats) == "app;main 1\n");
    CHECK(stats.bad_headers == 1);
    CHECK(stats.bad_frames == 1);
    CHECK(stats.folded == 1);

    Logger::set_level(LogLevel::Warn);
}

TEST_CASE("Results do not depend on the worker count", "[collapse][parallel]") {
    Logger::set_level(LogLevel::Off);
    std::string trace = synthetic_trace(2000);

    CollapseStats single_stats;
    std::string single = collapse_to_string(trace, {}, &single_stats);
    REQUIRE(! single.empty());

    for (size_t nthreads : {2, 3, 4, 8, 16}) {
        CollapseOptions options;
        options.nthreads = nthreads;
        CollapseStats stats;
        CHECK(collapse_to_string(trace, options, &stats) == single);
        CHECK(stats.folded == single_stats.folded);
        CHECK(stats.filtered == single_stats.filtered);
        CHECK(stats.bad_frames == single_stats.bad_frames);
        CHECK(stats.unique_stacks == single_stats.unique_stacks);
    }

    Logger::set_level(LogLevel::Warn);
}

TEST_CASE("Folding is idempotent and counts every folded record", "[collapse][parallel]") {
    Logger::set_level(LogLevel::Off);
    std::string trace = synthetic_trace(1000);

    CollapseOptions options;
    options.nthreads = 4;
    PerfCollapser collapser(options);

    CollapseStats first_stats;
    CollapseStats second_stats;
    SampleCounter first = collapser.fold(trace, &first_stats);
    SampleCounter second = collapser.fold(trace, &second_stats);

    CHECK(as_map(first) == as_map(second));
    CHECK(total_count(first) == first_stats.folded);
    CHECK(first_stats.records == 1000);
    CHECK(first_stats.folded + first_stats.filtered + first_stats.bad_headers == first_stats.records);
    CHECK(first_stats.filtered == 200);

    Logger::set_level(LogLevel::Warn);
}

TEST_CASE("Zero workers is a configuration error", "[config]") {
    CollapseOptions options;
    options.nthreads = 0;
    CHECK_THROWS_AS(PerfCollapser(options), ConfigException);
}

TEST_CASE("is_applicable recognizes perf script output", "[collapse]") {
    PerfCollapser collapser;
    CHECK(collapser.get_collapser_name() == "PerfCollapser");

    CHECK(collapser.is_applicable("# header\napp 100 1.0: cycles:\n\t4005d4 main (/app)\n\n"));
    CHECK(collapser.is_applicable("app 100 1.0: cycles:\n\t4005d4 main (/app)\n"));
    CHECK(! collapser.is_applicable("main;foo;bar 12\nmain;foo 3\n"));
    CHECK(! collapser.is_applicable("app 100 1.0: cycles:\n\tnot a frame\n"));
    CHECK(! collapser.is_applicable(""));
}

TEST_CASE("collapse_file reads a trace from disk", "[collapse][io]") {
    std::string path = "stackcollapse_test_input.perf";
    {
        std::ofstream ofs(path);
        REQUIRE(ofs.is_open());
        ofs << "app 100 1.0: cycles:\n\t4005d4 main (/app)\n\napp 100 2.0: cycles:\n\t4005d4 main (/app)\n";
    }

    PerfCollapser collapser;
    std::ostringstream out;
    CollapseStats stats = collapser.collapse_file(path, out);
    std::remove(path.c_str());

    CHECK(out.str() == "app;main 2\n");
    CHECK(stats.folded == 2);
}

TEST_CASE("collapse_file on an empty file", "[collapse][io]") {
    std::string path = "stackcollapse_test_empty.perf";
    { std::ofstream ofs(path); }

    PerfCollapser collapser;
    std::ostringstream out;
    CHECK_NOTHROW(collapser.collapse_file(path, out));
    std::remove(path.c_str());
    CHECK(out.str().empty());
}

TEST_CASE("collapse_file on a missing file", "[collapse][io]") {
    PerfCollapser collapser;
    std::ostringstream out;
    CHECK_THROWS_AS(collapser.collapse_file("/nonexistent/stackcollapse/input.perf", out), FileNotFoundException);
}
