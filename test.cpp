#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "./include/stackcollapse.hpp"
#include <sstream>
#include <type_traits>

using namespace stackcollapse;

namespace {

std::vector<RecordBlock> all_blocks(std::string_view data) {
    std::vector<RecordBlock> blocks;
    BlockScanner scanner(data);
    while (auto block = scanner.next_block()) {
        blocks.push_back(*block);
    }
    return blocks;
}

RawFrame make_frame(std::optional<std::string_view> symbol, std::optional<std::string_view> module,
                    uint64_t address = 0x4005d4) {
    RawFrame frame;
    frame.address = address;
    frame.symbol = symbol;
    frame.module = module;
    return frame;
}

// 截获日志, 析构时恢复
struct LogCapture {
    std::ostringstream out;
    LogLevel saved;

    explicit LogCapture(LogLevel level = LogLevel::Warn) : saved(Logger::level()) {
        Logger::set_level(level);
        Logger::set_sink(&out);
    }

    ~LogCapture() {
        Logger::set_sink(nullptr);
        Logger::set_level(saved);
    }
};

} // namespace

TEST_CASE("BlockScanner splits records on blank lines", "[splitter]") {
    std::string_view data = "app 100 1.0: cycles:\n"
                            "\t4005d4 main (/app)\n"
                            "\t4004a0 _start (/app)\n"
                            "\n"
                            "app 100 2.0: cycles:\n"
                            "\t4005d4 main (/app)\n";

    auto blocks = all_blocks(data);
    REQUIRE(blocks.size() == 2);
    CHECK(blocks[0].header == "app 100 1.0: cycles:");
    CHECK(blocks[0].body == "\t4005d4 main (/app)\n\t4004a0 _start (/app)\n");
    CHECK(blocks[1].header == "app 100 2.0: cycles:");
    CHECK(blocks[1].body == "\t4005d4 main (/app)\n");
}

TEST_CASE("BlockScanner skips metadata lines", "[splitter]") {
    std::string_view data = "# ========\n"
                            "# captured on    : Thu Jan  1 00:00:00 2020\n"
                            "# ========\n"
                            "#\n"
                            "app 100 1.0: cycles:\n"
                            "\t4005d4 main (/app)\n"
                            "\n";

    auto blocks = all_blocks(data);
    REQUIRE(blocks.size() == 1);
    CHECK(blocks[0].header == "app 100 1.0: cycles:");
}

TEST_CASE("BlockScanner handles records without frames or separators", "[splitter]") {
    std::string_view data = "app 100 1.0: cycles:\r\n"
                            "app 100 2.0: cycles:\r\n"
                            "\t4005d4 main (/app)\r\n"
                            "app 100 3.0: cycles:";

    auto blocks = all_blocks(data);
    REQUIRE(blocks.size() == 3);
    CHECK(blocks[0].header == "app 100 1.0: cycles:");
    CHECK(blocks[0].body.empty());
    CHECK(trim(blocks[1].body) == "4005d4 main (/app)");
    CHECK(blocks[2].header == "app 100 3.0: cycles:");
    CHECK(blocks[2].body.empty());
}

TEST_CASE("BlockScanner handles a final header without newline", "[splitter]") {
    auto blocks = all_blocks("app 1 1.0: cycles:\n\t1 main (/a)\n\napp 1 2.0: cycles:");
    REQUIRE(blocks.size() == 2);
    CHECK(blocks[1].header == "app 1 2.0: cycles:");
    CHECK(blocks[1].body.empty());

    LineScanner scanner("last");
    CHECK(scanner.next_line() == "last");
    CHECK(scanner.pos == 4);
    CHECK(scanner.eof());
}

TEST_CASE("BlockScanner ignores stack lines before the first header", "[splitter]") {
    std::string_view data = "\t4005d4 main (/app)\n"
                            "\n"
                            "app 100 1.0: cycles:\n"
                            "\t4005d4 main (/app)\n";

    auto blocks = all_blocks(data);
    REQUIRE(blocks.size() == 1);
    CHECK(blocks[0].header == "app 100 1.0: cycles:");
}

TEST_CASE("partition_blocks never splits a record", "[splitter]") {
    std::string data;
    for (int i = 0; i < 200; ++i) {
        data += "app " + std::to_string(1000 + i) + " 1.0: cycles:\n";
        for (int j = 0; j <= i % 7; ++j) {
            data += "\t40" + std::to_string(j) + " func" + std::to_string(j) + " (/app)\n";
        }
        data += "\n";
    }

    for (size_t parts : {1, 2, 3, 8, 64, 1000}) {
        auto ranges = partition_blocks(data, parts);
        REQUIRE(! ranges.empty());
        CHECK(ranges.size() <= parts);

        std::string joined;
        size_t blocks = 0;
        for (auto range : ranges) {
            REQUIRE(! range.empty());
            CHECK(range.front() == 'a');
            joined += range;
            blocks += all_blocks(range).size();
        }
        CHECK(joined == data);
        CHECK(blocks == 200);
    }
}

TEST_CASE("partition_blocks on empty input", "[splitter]") {
    CHECK(partition_blocks("", 4).empty());
}

TEST_CASE("parse_header extracts the header fields", "[parser]") {
    SECTION("pid/tid, cpu, timestamp and event") {
        auto header = PerfRecordParser::parse_header("java 25607/25608 [002] 4794564.109216:     250000 cycles:u:");
        REQUIRE(header);
        CHECK(header->comm == "java");
        CHECK(header->pid == 25607u);
        CHECK(header->tid == 25608u);
        CHECK(header->cpu == 2u);
        CHECK(header->timestamp_us == 4794564109216ull);
        CHECK(header->event == "cycles");
    }

    SECTION("a lone number is the thread id") {
        auto header = PerfRecordParser::parse_header("swapper     0 [000] 1.500000: cpu-clock:");
        REQUIRE(header);
        CHECK(header->comm == "swapper");
        CHECK(! header->pid);
        CHECK(header->tid == 0u);
        CHECK(header->event == "cpu-clock");
    }

    SECTION("process names may contain spaces and colons") {
        auto header = PerfRecordParser::parse_header("Web Content 1234/1240 10.000001: 1 cycles:");
        REQUIRE(header);
        CHECK(header->comm == "Web Content");
        CHECK(header->pid == 1234u);
        CHECK(header->tid == 1240u);

        header = PerfRecordParser::parse_header("kworker/u8:2 88 [001] 2.0: sched:sched_switch:");
        REQUIRE(header);
        CHECK(header->comm == "kworker/u8:2");
        CHECK(header->tid == 88u);
        CHECK(header->event == "sched:sched_switch");
    }

    SECTION("headers without timestamp or event") {
        auto header = PerfRecordParser::parse_header("app 100 instructions:");
        REQUIRE(header);
        CHECK(! header->timestamp_us);
        CHECK(header->event == "instructions");

        header = PerfRecordParser::parse_header("app 100 ");
        REQUIRE(header);
        CHECK(header->event.empty());
    }

    SECTION("malformed headers") {
        CHECK(! PerfRecordParser::parse_header("no pid here"));
        CHECK(! PerfRecordParser::parse_header("app 100"));
        CHECK(! PerfRecordParser::parse_header("app 99999999999 1.0: cycles:"));
        CHECK(! PerfRecordParser::parse_header("app 1/ 1.0: cycles:"));
    }
}

TEST_CASE("strip_event_modifiers keeps tracepoint names", "[parser]") {
    CHECK(PerfRecordParser::strip_event_modifiers("cycles:") == "cycles");
    CHECK(PerfRecordParser::strip_event_modifiers("cycles:ppp:") == "cycles");
    CHECK(PerfRecordParser::strip_event_modifiers("cpu_atom/cycles/Pu:") == "cpu_atom/cycles/Pu");
    CHECK(PerfRecordParser::strip_event_modifiers("sched:sched_switch:") == "sched:sched_switch");
}

TEST_CASE("parse_frame extracts address, symbol and module", "[parser]") {
    auto frame = PerfRecordParser::parse_frame("\t    7f0b8bf5766d malloc+0x5d (/usr/lib/libc.so.6)");
    REQUIRE(frame);
    CHECK(frame->address == 0x7f0b8bf5766dull);
    CHECK(frame->symbol == std::string_view("malloc+0x5d"));
    CHECK(frame->module == std::string_view("/usr/lib/libc.so.6"));

    frame = PerfRecordParser::parse_frame("  7f1e2215d058  (/lib/x86_64-linux-gnu/libc-2.15.so)");
    REQUIRE(frame);
    CHECK(! frame->symbol);
    CHECK(frame->module == std::string_view("/lib/x86_64-linux-gnu/libc-2.15.so"));

    frame = PerfRecordParser::parse_frame("\t0 [unknown] ([unknown])");
    REQUIRE(frame);
    CHECK(frame->address == 0u);
    CHECK(! frame->symbol);
    CHECK(frame->module == std::string_view("[unknown]"));

    frame = PerfRecordParser::parse_frame("\t4005d4 std::vector<int>::push_back(int const&) (/app)");
    REQUIRE(frame);
    CHECK(frame->symbol == std::string_view("std::vector<int>::push_back(int const&)"));
    CHECK(frame->module == std::string_view("/app"));

    frame = PerfRecordParser::parse_frame("\t4005d4 foo(int)");
    REQUIRE(frame);
    CHECK(frame->symbol == std::string_view("foo(int)"));
    CHECK(! frame->module);

    frame = PerfRecordParser::parse_frame("\t4005d4");
    REQUIRE(frame);
    CHECK(! frame->symbol);
    CHECK(! frame->module);

    CHECK(! PerfRecordParser::parse_frame("\tnot-an-address main (/app)"));
    CHECK(! PerfRecordParser::parse_frame("   "));
}

TEST_CASE("parse_frames drops malformed lines only", "[parser]") {
    LogCapture capture;
    CollapseStats stats;
    std::vector<RawFrame> frames;

    PerfRecordParser::parse_frames("\t4005d4 main (/app)\n\tzzzz garbage\n# comment\n\t4004a0 _start (/app)\n", frames,
                                   stats);

    REQUIRE(frames.size() == 2);
    CHECK(frames[0].symbol == std::string_view("main"));
    CHECK(frames[1].symbol == std::string_view("_start"));
    CHECK(stats.bad_frames == 1);
    CHECK(capture.out.str().find("weird stack line: zzzz garbage") != std::string::npos);
}

TEST_CASE("EventFilter resolves on first observation", "[filter]") {
    EventFilter filter;
    CHECK(! filter.is_set());
    CHECK(filter.accept(""));
    CHECK(! filter.is_set());
    CHECK(filter.accept("cycles"));
    CHECK(filter.event() == std::optional<std::string>("cycles"));
    CHECK(! filter.accept("instructions"));
    CHECK(filter.accept("cycles"));

    EventFilter fixed("instructions");
    CHECK(fixed.is_set());
    CHECK(! fixed.accept("cycles"));
    CHECK(fixed.accept("instructions"));
}

TEST_CASE("FrameNormalizer labels", "[normalizer]") {
    CollapseOptions options;
    FrameNormalizer normalizer(options);

    SECTION("symbol offsets and argument lists are removed") {
        CHECK(normalizer.normalize(make_frame("malloc+0x5d", "/usr/lib/libc.so.6")) == "malloc");
        CHECK(normalizer.normalize(make_frame("foo(int, char)", "/app")) == "foo");
        CHECK(normalizer.normalize(make_frame("a;b", "/app")) == "a:b");
        CHECK(normalizer.normalize(make_frame("(anonymous namespace)::run(int)", "/app")) ==
              "(anonymous namespace)::run(int)");
        CHECK(normalizer.normalize(make_frame("net/http.(*Client).Do", "/app")) == "net/http.(*Client).Do");
    }

    SECTION("unknown symbols fall back to the module or the sentinel") {
        CHECK(normalizer.normalize(make_frame(std::nullopt, "[unknown]")) == "[unknown]");
        CHECK(normalizer.normalize(make_frame(std::nullopt, std::nullopt)) == "[unknown]");
        CHECK(normalizer.normalize(make_frame(std::nullopt, "/usr/lib/libc.so.6")) == "[libc.so.6]");
        CHECK(normalizer.normalize(make_frame(std::nullopt, "[kernel.kallsyms]")) == "[kernel.kallsyms]");
    }

    SECTION("raw addresses") {
        options.include_addrs = true;
        CHECK(normalizer.normalize(make_frame(std::nullopt, "[unknown]", 0x7f1e2215d058)) ==
              "[unknown+7f1e2215d058]");
        CHECK(normalizer.normalize(make_frame(std::nullopt, "/usr/lib/libc.so.6", 0xabc)) == "[libc.so.6+abc]");
        CHECK(normalizer.normalize(make_frame("main", "/app")) == "main");
    }

    SECTION("kernel and jit annotations") {
        CHECK(normalizer.normalize(make_frame("native_safe_halt", "[kernel.kallsyms]")) == "native_safe_halt");

        options.annotate_kernel = true;
        options.annotate_jit = true;
        CHECK(normalizer.normalize(make_frame("native_safe_halt", "[kernel.kallsyms]")) == "native_safe_halt_[k]");
        CHECK(normalizer.normalize(make_frame("tcp_sendmsg", "/lib/modules/4.3.0-rc1-virtual/build/vmlinux")) ==
              "tcp_sendmsg_[k]");
        CHECK(normalizer.normalize(make_frame("Interpreter", "/tmp/perf-19982.map")) == "Interpreter_[j]");
        CHECK(normalizer.normalize(make_frame("main", "/app")) == "main");
        CHECK(normalizer.normalize(make_frame(std::nullopt, "[kernel.kallsyms]")) == "[kernel.kallsyms]_[k]");
        CHECK(normalizer.normalize(make_frame(std::nullopt, "[unknown]")) == "[unknown]");
    }

    SECTION("classifiers can be replaced") {
        options.annotate_kernel = true;
        options.annotate_jit = true;
        options.is_kernel_module = [](std::string_view module) { return module == "/boot/zImage"; };
        options.is_jit_module = [](std::string_view module) { return ends_with(module, ".jit"); };

        CHECK(normalizer.normalize(make_frame("schedule", "/boot/zImage")) == "schedule_[k]");
        CHECK(normalizer.normalize(make_frame("native_safe_halt", "[kernel.kallsyms]")) == "native_safe_halt");
        CHECK(normalizer.normalize(make_frame("lambda", "/var/code.jit")) == "lambda_[j]");
    }

    SECTION("inlined frames") {
        std::vector<std::string> labels;
        normalizer.normalize(make_frame("Lfoo/Bar;::a->Lfoo/Baz;::b->c", "/tmp/perf-1.map"), "java", labels);
        REQUIRE(labels.size() == 3);
        CHECK(labels[0] == "c_[i]");
        CHECK(labels[1] == "foo/Baz:::b_[i]");
        CHECK(labels[2] == "foo/Bar:::a");
    }

    SECTION("java tidying only applies to java processes") {
        CHECK(normalizer.normalize(make_frame("Ljava/lang/Thread;::run", "/tmp/perf-1.map"), "java") ==
              "java/lang/Thread:::run");
        CHECK(normalizer.normalize(make_frame("Ljava/lang/Thread;::run", "/tmp/perf-1.map"), "app") ==
              "Ljava/lang/Thread:::run");
    }
}

TEST_CASE("StackTrimmer keeps the marker and its callees", "[trimmer]") {
    std::vector<std::string> stack{"root", "foo", "leaf"};

    StackTrimmer trimmer(std::string("foo"));
    trimmer.trim(stack);
    CHECK(stack == std::vector<std::string>{"foo", "leaf"});

    std::vector<std::string> untouched{"root", "bar", "leaf"};
    trimmer.trim(untouched);
    CHECK(untouched == std::vector<std::string>{"root", "bar", "leaf"});

    // 从 root 开始的第一个匹配
    std::vector<std::string> recursive{"root", "foo", "mid", "foo", "leaf"};
    CHECK(trimmer.first_kept(recursive) == 1);

    std::vector<std::string> no_marker{"root", "foo"};
    StackTrimmer().trim(no_marker);
    CHECK(no_marker.size() == 2);
}

TEST_CASE("Folding parts hold the options by reference", "[config]") {
    // 临时 options 会悬空, 只能传左值
    STATIC_REQUIRE(std::is_constructible<PerfStackFolder, const CollapseOptions&>::value);
    STATIC_REQUIRE(! std::is_constructible<PerfStackFolder, CollapseOptions>::value);
    STATIC_REQUIRE(! std::is_constructible<FrameNormalizer, CollapseOptions>::value);
    STATIC_REQUIRE(! std::is_constructible<StackAggregator, CollapseOptions>::value);
}

TEST_CASE("StackAggregator builds folded keys", "[aggregator]") {
    CollapseOptions options;
    RecordHeader header;
    header.comm = "Web Content";
    header.pid = 10;
    header.tid = 11;

    std::vector<std::string> frames{"main", "run"};

    SECTION("process name only") {
        StackAggregator aggregator(options);
        CHECK(aggregator.folded_key(header, frames) == "Web_Content;main;run");
        CHECK(aggregator.folded_key(header, {}) == "Web_Content");
    }

    SECTION("pid and tid") {
        options.include_pid = true;
        StackAggregator with_pid(options);
        CHECK(with_pid.process_label(header) == "Web_Content-10");

        options.include_tid = true;
        StackAggregator with_tid(options);
        CHECK(with_tid.process_label(header) == "Web_Content-10/11");

        header.pid.reset();
        CHECK(with_tid.process_label(header) == "Web_Content-?/11");
    }

    SECTION("counting") {
        StackAggregator aggregator(options);
        aggregator.add(header, frames);
        aggregator.add(header, frames);
        aggregator.add(header, {"main"});

        const auto& counter = aggregator.counter();
        REQUIRE(counter.size() == 2);
        CHECK(counter.at("Web_Content;main;run") == 2);
        CHECK(counter.at("Web_Content;main") == 1);

        SampleCounter taken = aggregator.take_counter();
        CHECK(taken.size() == 2);
        CHECK(aggregator.counter().empty());
    }
}

TEST_CASE("merge_counters sums identical keys", "[aggregator]") {
    SampleCounter a{{"app;main", 2}, {"app;main;foo", 1}};
    SampleCounter b{{"app;main", 3}, {"app;bar", 4}};

    merge_counters(a, std::move(b));
    CHECK(a.size() == 3);
    CHECK(a.at("app;main") == 5);
    CHECK(a.at("app;main;foo") == 1);
    CHECK(a.at("app;bar") == 4);
}

TEST_CASE("FoldedWriter writes sorted lines", "[writer]") {
    SampleCounter counter{{"b;y", 1}, {"a;x", 3}, {"a", 2}};
    std::ostringstream out;
    FoldedWriter::write(counter, out);
    CHECK(out.str() == "a 2\na;x 3\nb;y 1\n");
}

TEST_CASE("FoldedWriter reports write failures", "[writer]") {
    SampleCounter counter{{"app;main", 1}};
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    CHECK_THROWS_AS(FoldedWriter::write(counter, out), IoException);
}

TEST_CASE("PerfStackFolder discards malformed headers and keeps going", "[folder]") {
    LogCapture capture;
    CollapseOptions options;
    PerfStackFolder folder(options);

    folder.fold("garbage line without pid\n"
                "\t4005d4 main (/app)\n"
                "\n"
                "app 100 1.0: cycles:\n"
                "\t4005d4 main (/app)\n"
                "\tnope\n"
                "\t4004a0 _start (/app)\n");

    CHECK(folder.stats().records == 2);
    CHECK(folder.stats().bad_headers == 1);
    CHECK(folder.stats().bad_frames == 1);
    CHECK(folder.stats().folded == 1);

    SampleCounter counter = folder.take_counter();
    REQUIRE(counter.size() == 1);
    CHECK(counter.at("app;_start;main") == 1);
    CHECK(capture.out.str().find("[WARN] weird event line: garbage line without pid") != std::string::npos);
}

TEST_CASE("PerfStackFolder resolves the event filter from the first record", "[folder]") {
    CollapseOptions options;
    PerfStackFolder folder(options);

    folder.fold("app 100 1.0: 1 instructions:\n\t1 a (/app)\n\n"
                "app 100 2.0: 1 cycles:\n\t1 a (/app)\n\n"
                "app 100 3.0: 1 instructions:\n\t1 b (/app)\n");

    CHECK(folder.filter().event() == std::optional<std::string>("instructions"));
    CHECK(folder.stats().filtered == 1);

    SampleCounter counter = folder.take_counter();
    CHECK(counter.size() == 2);
    CHECK(counter.count("app;a") == 1);
    CHECK(counter.count("app;b") == 1);
}

TEST_CASE("CollapseOptions validation", "[config]") {
    CollapseOptions options;
    CHECK_NOTHROW(options.validate());

    options.nthreads = 0;
    CHECK_THROWS_AS(options.validate(), ConfigException);
    options.nthreads = 4;

    options.event_filter = "";
    CHECK_THROWS_AS(options.validate(), ConfigException);
    options.event_filter.reset();

    options.skip_after = "";
    CHECK_THROWS_AS(options.validate(), ConfigException);
    options.skip_after.reset();

    options.is_jit_module = nullptr;
    CHECK_THROWS_AS(options.validate(), ConfigException);
}

TEST_CASE("default_nthreads is positive", "[config]") {
    CHECK(default_nthreads() >= 1);
}
