#pragma once

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include <sys/mman.h>
#include <unistd.h>
#include <fcntl.h>

namespace stackcollapse {

class StackCollapseException : public std::runtime_error {
  public:
    explicit StackCollapseException(std::string_view message)
        : std::runtime_error(std::string("StackCollapse Error: ") + std::string(message)) {}
};

class MemoryException : public std::runtime_error {
  public:
    explicit MemoryException(std::string_view message)
        : std::runtime_error(std::string("Memory Error: ") + std::string(message)) {}
};

class FileNotFoundException : public std::runtime_error {
  public:
    explicit FileNotFoundException(std::string_view message)
        : std::runtime_error(std::string("File not found: ") + std::string(message)) {}
};

class OpenFileException : public std::runtime_error {
  public:
    explicit OpenFileException(std::string_view message)
        : std::runtime_error(std::string("Cannot open file: ") + std::string(message)) {}
};

class ConfigException : public StackCollapseException {
  public:
    explicit ConfigException(std::string_view message)
        : StackCollapseException(std::string("Config Error: ") + std::string(message)) {}
};

class IoException : public StackCollapseException {
  public:
    explicit IoException(std::string_view message)
        : StackCollapseException(std::string("I/O Error: ") + std::string(message)) {}
};

// 🔥 ===== 日志 =====
enum class LogLevel { Off = 0, Error, Warn, Info, Debug, Trace };

class Logger {
  private:
    static inline std::atomic<LogLevel> level_{LogLevel::Warn};
    static inline std::ostream* sink_ = &std::cerr;
    static inline std::mutex mutex_;

    static std::string_view level_name(LogLevel level) {
        switch (level) {
            case LogLevel::Error:
                return "ERROR";
            case LogLevel::Warn:
                return "WARN";
            case LogLevel::Info:
                return "INFO";
            case LogLevel::Debug:
                return "DEBUG";
            case LogLevel::Trace:
                return "TRACE";
            default:
                return "";
        }
    }

  public:
    static void set_level(LogLevel level) {
        level_.store(level);
    }

    static LogLevel level() {
        return level_.load();
    }

    // 测试里用来截获输出, nullptr 恢复到 stderr
    static void set_sink(std::ostream* sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = sink ? sink : &std::cerr;
    }

    static bool enabled(LogLevel level) {
        return level != LogLevel::Off && level <= level_.load();
    }

    template <typename... Args>
    static void log(LogLevel level, const Args&... args) {
        if (! enabled(level)) return;

        std::ostringstream oss;
        oss << '[' << level_name(level) << "] ";
        (oss << ... << args);
        oss << '\n';

        std::lock_guard<std::mutex> lock(mutex_);
        *sink_ << oss.str();
    }
};

template <typename... Args>
inline void log_error(const Args&... args) {
    Logger::log(LogLevel::Error, args...);
}

template <typename... Args>
inline void log_warn(const Args&... args) {
    Logger::log(LogLevel::Warn, args...);
}

template <typename... Args>
inline void log_info(const Args&... args) {
    Logger::log(LogLevel::Info, args...);
}

template <typename... Args>
inline void log_debug(const Args&... args) {
    Logger::log(LogLevel::Debug, args...);
}

template <typename... Args>
inline void log_trace(const Args&... args) {
    Logger::log(LogLevel::Trace, args...);
}

namespace {
inline std::string_view trim(std::string_view str) {
    const auto first = str.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

inline bool is_blank(std::string_view line) {
    return line.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

inline bool is_indented(std::string_view line) {
    return ! line.empty() && (line.front() == ' ' || line.front() == '\t');
}

inline bool is_metadata(std::string_view line) {
    return ! line.empty() && line.front() == '#';
}

inline bool starts_with(std::string_view str, std::string_view prefix) {
    return str.size() >= prefix.size() && str.substr(0, prefix.size()) == prefix;
}

inline bool ends_with(std::string_view str, std::string_view suffix) {
    return str.size() >= suffix.size() && str.substr(str.size() - suffix.size()) == suffix;
}

inline bool is_hex_digit(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

inline bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

template <typename T>
std::optional<T> parse_number(std::string_view str, int base = 10) {
    T value{};
    if (str.empty()) return std::nullopt;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value, base);
    if (ec != std::errc() || ptr != str.data() + str.size()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

struct LineScanner {
    std::string_view buffer;
    size_t pos = 0;

    explicit LineScanner(std::string_view data) : buffer(data) {}

    // 返回下一行 (不含 '\n'), 不做 trim
    std::string_view next_line() {
        if (pos >= buffer.size()) {
            return {};
        }

        size_t end = buffer.find('\n', pos);
        if (end == std::string_view::npos) end = buffer.size();

        std::string_view line = buffer.substr(pos, end - pos);
        // 最后一行没有 '\n' 时 pos 停在 buffer.size()
        pos = std::min(end + 1, buffer.size());

        if (! line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        return line;
    }

    bool eof() const {
        return pos >= buffer.size();
    }
};

struct MMapBuffer {
    void* addr = nullptr;
    size_t size = 0;

    explicit MMapBuffer(const std::string& filename) {
        int fd = open(filename.c_str(), O_RDONLY);
        if (fd == -1) {
            if (errno == ENOENT) throw FileNotFoundException(filename);
            throw OpenFileException(filename);
        }

        off_t end = lseek(fd, 0, SEEK_END);
        if (end < 0) {
            close(fd);
            throw IoException(std::string("cannot determine size of ") + filename);
        }
        size = static_cast<size_t>(end);

        // 空文件不能 mmap
        if (size > 0) {
            addr = mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0);
            if (addr == MAP_FAILED) {
                close(fd);
                throw MemoryException("mmap failed");
            }
            madvise(addr, size, MADV_SEQUENTIAL);
        }
        close(fd);
    }

    MMapBuffer(const MMapBuffer&) = delete;
    MMapBuffer& operator=(const MMapBuffer&) = delete;

    ~MMapBuffer() {
        if (addr) munmap(addr, size);
    }

    std::string_view view() const {
        if (! addr) return {};
        return {static_cast<const char*>(addr), size};
    }
};

/**
 * @brief 输入数据: 文件走 mmap, 标准输入读进内存
 */
class InputBuffer {
  private:
    std::unique_ptr<MMapBuffer> mapped_;
    std::string owned_;

  public:
    static InputBuffer from_file(const std::string& path) {
        InputBuffer buffer;
        buffer.mapped_ = std::make_unique<MMapBuffer>(path);
        return buffer;
    }

    static InputBuffer from_stream(std::istream& in) {
        InputBuffer buffer;
        buffer.owned_.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        if (in.bad()) {
            throw IoException("failed to read input stream");
        }
        return buffer;
    }

    std::string_view view() const {
        if (mapped_) return mapped_->view();
        return owned_;
    }
};

// 🔥 ===== 配置 =====
using ModuleClassifier = std::function<bool(std::string_view)>;

// i.e. "[kernel.kallsyms]", "[nf_conntrack_ipv4]", "/lib/modules/4.3.0/build/vmlinux"
inline bool default_kernel_module(std::string_view module) {
    return module != "[unknown]" && (starts_with(module, "[") || ends_with(module, "vmlinux"));
}

// perf map agent 生成的符号表, i.e. "/tmp/perf-19982.map"
inline bool default_jit_module(std::string_view module) {
    return starts_with(module, "/tmp/perf-") && ends_with(module, ".map");
}

inline size_t default_nthreads() {
    unsigned int n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : n;
}

struct CollapseOptions {
    // 标签选项
    bool include_addrs = false; // 没有符号时输出原始地址
    bool include_pid = false;   // 进程名后加 -pid
    bool include_tid = false;   // 进程名后加 -pid/tid

    // 注解
    bool annotate_kernel = false; // _[k]
    bool annotate_jit = false;    // _[j]

    // 过滤和裁剪
    std::optional<std::string> event_filter; // 未设置时取第一个出现的事件
    std::optional<std::string> skip_after;   // 丢弃匹配函数之上的所有父帧

    // 符号整理
    bool tidy_generic = true;
    bool tidy_java = true;

    size_t nthreads = 1;

    ModuleClassifier is_kernel_module = default_kernel_module;
    ModuleClassifier is_jit_module = default_jit_module;

    void validate() const {
        if (nthreads == 0) {
            throw ConfigException("Number of threads must be positive");
        }
        if (event_filter && event_filter->empty()) {
            throw ConfigException("Event filter cannot be empty");
        }
        if (skip_after && skip_after->empty()) {
            throw ConfigException("Skip-after function name cannot be empty");
        }
        if (! is_kernel_module || ! is_jit_module) {
            throw ConfigException("Module classifiers must be set");
        }
    }
};

struct CollapseStats {
    size_t records = 0;     // 读到的 block 数
    size_t folded = 0;      // 计入结果的 record 数
    size_t filtered = 0;    // 被事件过滤掉的 record 数
    size_t bad_headers = 0; // 丢弃的 block
    size_t bad_frames = 0;  // 丢弃的单个帧
    size_t unique_stacks = 0;

    CollapseStats& operator+=(const CollapseStats& other) {
        records += other.records;
        folded += other.folded;
        filtered += other.filtered;
        bad_headers += other.bad_headers;
        bad_frames += other.bad_frames;
        return *this;
    }
};

inline std::ostream& operator<<(std::ostream& os, const CollapseStats& stats) {
    os << "records: " << stats.records << ", folded: " << stats.folded << ", filtered: " << stats.filtered
       << ", bad headers: " << stats.bad_headers << ", bad frames: " << stats.bad_frames
       << ", unique stacks: " << stats.unique_stacks;
    return os;
}

// 🔥 ===== 数据模型 =====
struct RecordHeader {
    std::string_view comm;
    std::optional<uint32_t> pid;
    std::optional<uint32_t> tid;
    std::optional<uint32_t> cpu;
    std::optional<uint64_t> timestamp_us;
    std::string_view event; // 空表示 header 里没有事件名
};

struct RawFrame {
    std::optional<uint64_t> address;
    std::optional<std::string_view> symbol;
    std::optional<std::string_view> module;
};

struct RawRecord {
    RecordHeader header;
    std::vector<RawFrame> frames; // leaf -> root, 与 trace 中顺序一致
};

using SampleCounter = std::unordered_map<std::string, size_t>;

/**
 * @brief 事件过滤: 未设置时由第一次观察到的事件名确定, 之后不再改变
 */
class EventFilter {
  private:
    std::optional<std::string> event_;

  public:
    EventFilter() = default;

    explicit EventFilter(std::string event) : event_(std::move(event)) {}

    bool accept(std::string_view event) {
        if (event.empty()) return true;
        if (! event_) {
            event_.emplace(event);
            log_info("Filtering for events of type: ", event);
            return true;
        }
        return event == *event_;
    }

    bool is_set() const {
        return event_.has_value();
    }

    const std::optional<std::string>& event() const {
        return event_;
    }
};

// 🔥 ===== Block 切分 =====
struct RecordBlock {
    std::string_view header;
    std::string_view body; // header 之后的帧行, 可能为空
};

/**
 * @brief 把 perf script 文本切成一个个 sample block
 *
 * header 行不缩进, 帧行以空白开头; 空行或下一个 header 结束当前 block.
 * '#' 开头的元数据行 (perf script --header) 任何位置都跳过.
 */
class BlockScanner {
  private:
    LineScanner scanner_;

  public:
    explicit BlockScanner(std::string_view data) : scanner_(data) {}

    std::optional<RecordBlock> next_block() {
        while (! scanner_.eof()) {
            std::string_view line = scanner_.next_line();
            if (is_blank(line) || is_metadata(line)) continue;
            if (is_indented(line)) {
                log_debug("stack line outside of a record: ", trim(line));
                continue;
            }

            RecordBlock block;
            block.header = line;

            size_t body_start = scanner_.pos;
            size_t body_end = body_start;
            while (! scanner_.eof()) {
                size_t line_start = scanner_.pos;
                std::string_view next = scanner_.next_line();
                if (is_blank(next)) break;
                if (! is_indented(next) && ! is_metadata(next)) {
                    // 下一个 record 的 header, 退回去
                    scanner_.pos = line_start;
                    break;
                }
                body_end = scanner_.pos;
            }
            block.body = scanner_.buffer.substr(body_start, body_end - body_start);
            return block;
        }
        return std::nullopt;
    }

    bool eof() const {
        return scanner_.eof();
    }
};

// 从 pos 开始找第一个 header 行 (非空, 不缩进) 的起始位置, 找不到返回 data.size()
inline size_t next_block_start(std::string_view data, size_t pos) {
    if (pos == 0) return 0;
    if (pos >= data.size()) return data.size();

    size_t line_start = pos;
    if (data[pos - 1] != '\n') {
        size_t nl = data.find('\n', pos);
        if (nl == std::string_view::npos) return data.size();
        line_start = nl + 1;
    }

    while (line_start < data.size()) {
        char c = data[line_start];
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
            return line_start;
        }
        size_t nl = data.find('\n', line_start);
        if (nl == std::string_view::npos) return data.size();
        line_start = nl + 1;
    }
    return data.size();
}

/**
 * @brief 按字节数把输入切成至多 parts 段, 切点总在 block 边界上
 */
inline std::vector<std::string_view> partition_blocks(std::string_view data, size_t parts) {
    std::vector<std::string_view> ranges;
    if (data.empty()) return ranges;
    if (parts == 0) parts = 1;

    size_t start = 0;
    for (size_t i = 1; i < parts; ++i) {
        size_t target = data.size() / parts * i + data.size() % parts * i / parts;
        if (target <= start) continue;

        size_t cut = next_block_start(data, target);
        if (cut >= data.size()) break;
        if (cut <= start) continue;

        ranges.push_back(data.substr(start, cut - start));
        start = cut;
    }
    ranges.push_back(data.substr(start));

    return ranges;
}

// 🔥 ===== Record 解析 =====
class PerfRecordParser {
  public:
    /**
     * i.e. "java 25607/25608 [002] 4794564.109216:     250000 cycles:u:"
     *      "Web Content 1234 123.456: cpu-clock:"
     */
    static std::optional<RecordHeader> parse_header(std::string_view line) {
        RecordHeader header;

        // 进程名可以带空格, 第一个以空白结束的 "数字[/数字]" 单词是 pid/tid
        size_t word_start = 0;
        bool all_digits = false;
        bool last_was_space = false;
        size_t slash_at = std::string_view::npos;
        size_t pid_end = std::string_view::npos;

        for (size_t i = 0; i < line.size(); ++i) {
            char c = line[i];
            if (c == ' ' || c == '\t') {
                if (all_digits && ! last_was_space) {
                    pid_end = i;
                    break;
                }
                word_start = i + 1;
                all_digits = true;
                slash_at = std::string_view::npos;
            } else if (c == '/') {
                if (all_digits) {
                    if (slash_at != std::string_view::npos) all_digits = false;
                    slash_at = i;
                }
            } else if (! is_digit(c)) {
                all_digits = false;
            }
            last_was_space = c == ' ' || c == '\t';
        }

        if (pid_end == std::string_view::npos || word_start == 0) {
            return std::nullopt;
        }

        header.comm = trim(line.substr(0, word_start - 1));
        if (header.comm.empty()) {
            return std::nullopt;
        }

        if (slash_at != std::string_view::npos) {
            header.pid = parse_number<uint32_t>(line.substr(word_start, slash_at - word_start));
            header.tid = parse_number<uint32_t>(line.substr(slash_at + 1, pid_end - slash_at - 1));
            if (! header.pid || ! header.tid) return std::nullopt;
        } else {
            // 只有一个数字时是 tid (perf script 默认字段)
            header.tid = parse_number<uint32_t>(line.substr(word_start, pid_end - word_start));
            if (! header.tid) return std::nullopt;
        }

        parse_header_fields(line.substr(pid_end), header);
        return header;
    }

    /**
     * i.e. "7f0b8bf5766d malloc+0x5d (/usr/lib/libc.so.6)"
     *      "ffffffff8103ce3b native_safe_halt ([kernel.kallsyms])"
     *      "7f1e2215d058  (/lib/x86_64-linux-gnu/libc-2.15.so)"
     */
    static std::optional<RawFrame> parse_frame(std::string_view line) {
        line = trim(line);
        if (line.empty()) return std::nullopt;

        RawFrame frame;

        size_t pc_end = line.find_first_of(" \t");
        std::string_view pc = line.substr(0, pc_end);
        if (starts_with(pc, "0x") || starts_with(pc, "0X")) {
            pc.remove_prefix(2);
        }
        frame.address = parse_number<uint64_t>(pc, 16);
        if (! frame.address) {
            return std::nullopt;
        }
        if (pc_end == std::string_view::npos) {
            return frame;
        }

        std::string_view content = trim(line.substr(pc_end));
        std::string_view func_name = content;

        if (! content.empty() && content.back() == ')') {
            size_t paren_start = content.rfind('(');
            if (paren_start == 0 || (paren_start != std::string_view::npos && content[paren_start - 1] == ' ')) {
                frame.module = content.substr(paren_start + 1, content.size() - paren_start - 2);
                func_name = trim(content.substr(0, paren_start));
            }
        }

        if (! func_name.empty() && func_name != "[unknown]") {
            frame.symbol = func_name;
        }

        return frame;
    }

    // 解析 block body 里的所有帧, 坏行跳过
    static void parse_frames(std::string_view body, std::vector<RawFrame>& frames, CollapseStats& stats) {
        LineScanner scanner(body);
        while (! scanner.eof()) {
            std::string_view line = scanner.next_line();
            if (is_blank(line) || is_metadata(line)) continue;

            auto frame = parse_frame(line);
            if (! frame) {
                ++stats.bad_frames;
                log_warn("weird stack line: ", trim(line));
                continue;
            }
            frames.push_back(*frame);
        }
    }

    // perf 事件修饰符, i.e. "cycles:u", "cpu-clock:ppp"
    static std::string_view strip_event_modifiers(std::string_view event) {
        while (! event.empty() && event.back() == ':') {
            event.remove_suffix(1);
        }

        size_t colon = event.rfind(':');
        if (colon == std::string_view::npos || colon == 0) return event;

        std::string_view modifiers = event.substr(colon + 1);
        if (modifiers.empty() || modifiers.find_first_not_of("ukhIGHpPSDWe") != std::string_view::npos) {
            return event;
        }
        return event.substr(0, colon);
    }

  private:
    // "4794564.109216" -> 4794564109216, 小数部分按微秒截断
    static std::optional<uint64_t> parse_timestamp_us(std::string_view seconds) {
        size_t dot = seconds.find('.');
        auto whole = parse_number<uint64_t>(seconds.substr(0, dot));
        if (! whole) return std::nullopt;

        uint64_t micros = 0;
        if (dot != std::string_view::npos) {
            std::string_view fraction = seconds.substr(dot + 1, 6);
            if (! fraction.empty()) {
                auto value = parse_number<uint64_t>(fraction);
                if (! value) return std::nullopt;
                micros = *value;
                for (size_t i = fraction.size(); i < 6; ++i) {
                    micros *= 10;
                }
            }
        }
        return *whole * 1000000 + micros;
    }

    // pid/tid 之后: [cpu] 时间戳: 周期 事件:
    static void parse_header_fields(std::string_view rest, RecordHeader& header) {
        size_t pos = 0;
        while (pos < rest.size()) {
            size_t start = rest.find_first_not_of(" \t", pos);
            if (start == std::string_view::npos) break;
            size_t end = rest.find_first_of(" \t", start);
            if (end == std::string_view::npos) end = rest.size();
            pos = end;

            std::string_view word = rest.substr(start, end - start);

            if (! header.cpu && word.size() > 2 && word.front() == '[' && word.back() == ']') {
                header.cpu = parse_number<uint32_t>(word.substr(1, word.size() - 2));
                if (header.cpu) continue;
            }

            if (! header.timestamp_us && word.size() > 1 && word.back() == ':' && is_digit(word.front()) &&
                word.find_first_not_of("0123456789.", 0) == word.size() - 1) {
                header.timestamp_us = parse_timestamp_us(word.substr(0, word.size() - 1));
                if (header.timestamp_us) continue;
            }

            // 采样周期
            if (word.find_first_not_of("0123456789") == std::string_view::npos) continue;

            header.event = strip_event_modifiers(word);
            break;
        }
    }
};

// 🔥 ===== 帧规范化 =====
class FrameNormalizer {
  private:
    const CollapseOptions& options_;

  public:
    explicit FrameNormalizer(const CollapseOptions& options) : options_(options) {}
    // 只保存引用, 不接受临时对象
    explicit FrameNormalizer(CollapseOptions&&) = delete;

    /**
     * @brief 把一个 RawFrame 变成 label 追加到 labels (leaf -> root 顺序)
     *
     * 内联帧 "a->b->c" 会产生多个 label: root -> leaf 为 a, b_[i], c_[i]
     */
    void normalize(const RawFrame& frame, std::string_view comm, std::vector<std::string>& labels) const {
        if (! frame.symbol) {
            std::string label = fallback_label(frame);
            if (frame.module && *frame.module != "[unknown]") {
                annotate(label, *frame.module);
            }
            labels.emplace_back(std::move(label));
            return;
        }

        std::string_view symbol = strip_offset(*frame.symbol);

        std::vector<std::string_view> inlined;
        size_t start = 0;
        while (true) {
            size_t arrow = symbol.find("->", start);
            if (arrow == std::string_view::npos) {
                inlined.push_back(symbol.substr(start));
                break;
            }
            inlined.push_back(symbol.substr(start, arrow - start));
            start = arrow + 2;
        }

        for (size_t i = inlined.size(); i-- > 0;) {
            std::string label = tidy(inlined[i], comm);
            if (i > 0) {
                label += "_[i]";
            } else if (frame.module) {
                annotate(label, *frame.module);
            }
            labels.emplace_back(std::move(label));
        }
    }

    std::string normalize(const RawFrame& frame, std::string_view comm = {}) const {
        std::vector<std::string> labels;
        normalize(frame, comm, labels);
        std::string joined;
        for (auto it = labels.rbegin(); it != labels.rend(); ++it) {
            if (! joined.empty()) joined += ';';
            joined += *it;
        }
        return joined;
    }

  private:
    static std::string_view strip_offset(std::string_view func) {
        size_t offset = func.rfind("+0x");
        if (offset == std::string_view::npos || offset + 3 == func.size()) return func;

        std::string_view tail = func.substr(offset + 3);
        if (std::all_of(tail.begin(), tail.end(), is_hex_digit)) {
            return func.substr(0, offset);
        }
        return func;
    }

    static std::string hex(uint64_t value) {
        char buf[17];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value, 16);
        (void)ec;
        return std::string(buf, ptr);
    }

    std::string fallback_label(const RawFrame& frame) const {
        std::string_view name = "unknown";
        if (frame.module && *frame.module != "[unknown]") {
            name = *frame.module;
            size_t last_slash = name.find_last_of('/');
            if (last_slash != std::string_view::npos) {
                name = name.substr(last_slash + 1);
            }
            if (name.size() >= 2 && name.front() == '[' && name.back() == ']') {
                name = name.substr(1, name.size() - 2);
            }
        } else if (! options_.include_addrs) {
            return "[unknown]";
        }

        std::string label;
        label.reserve(name.size() + 20);
        label += '[';
        label += name;
        if (options_.include_addrs && frame.address) {
            label += '+';
            label += hex(*frame.address);
        }
        label += ']';
        return label;
    }

    std::string tidy(std::string_view func, std::string_view comm) const {
        std::string name(func);

        if (options_.tidy_generic) {
            std::replace(name.begin(), name.end(), ';', ':');

            // 去掉参数列表, 但保留 "(anonymous namespace)" 和 Go 的 "pkg.(*T).Method"
            size_t first_paren = name.find('(');
            if (first_paren != std::string::npos && first_paren > 0 &&
                name.compare(first_paren, 21, "(anonymous namespace)") != 0 && name[first_paren - 1] != '.') {
                name.erase(first_paren);
            }
        }

        // i.e. "Ljava/lang/Thread;::run" -> "java/lang/Thread:::run"
        if (options_.tidy_java && comm == "java" && name.size() > 1 && name.front() == 'L' &&
            name.find('/') != std::string::npos) {
            name.erase(0, 1);
        }

        return name;
    }

    void annotate(std::string& label, std::string_view module) const {
        if (options_.annotate_kernel && options_.is_kernel_module(module)) {
            label += "_[k]";
        } else if (options_.annotate_jit && options_.is_jit_module(module)) {
            label += "_[j]";
        }
    }
};

// 🔥 ===== 堆栈裁剪 =====
class StackTrimmer {
  private:
    std::optional<std::string> marker_;

  public:
    explicit StackTrimmer(std::optional<std::string> marker = std::nullopt) : marker_(std::move(marker)) {}

    // frames 为 root -> leaf, 返回第一个保留的下标
    size_t first_kept(const std::vector<std::string>& frames) const {
        if (! marker_) return 0;
        auto it = std::find(frames.begin(), frames.end(), *marker_);
        if (it == frames.end()) return 0;
        return static_cast<size_t>(it - frames.begin());
    }

    void trim(std::vector<std::string>& frames) const {
        size_t first = first_kept(frames);
        if (first > 0) {
            frames.erase(frames.begin(), frames.begin() + static_cast<std::ptrdiff_t>(first));
        }
    }
};

// 🔥 ===== 堆栈折叠 =====
class StackAggregator {
  private:
    const CollapseOptions& options_;
    SampleCounter counter_;
    std::string key_;

  public:
    explicit StackAggregator(const CollapseOptions& options) : options_(options) {
        counter_.reserve(8192);
    }
    explicit StackAggregator(CollapseOptions&&) = delete;

    std::string process_label(const RecordHeader& header) const {
        std::string label(header.comm);
        std::replace(label.begin(), label.end(), ' ', '_');

        if (options_.include_pid || options_.include_tid) {
            label += '-';
            label += header.pid ? std::to_string(*header.pid) : "?";
        }
        if (options_.include_tid) {
            label += '/';
            label += header.tid ? std::to_string(*header.tid) : "?";
        }
        return label;
    }

    // frames 为 root -> leaf
    std::string folded_key(const RecordHeader& header, const std::vector<std::string>& frames) const {
        std::string key;
        build_key(header, frames, key);
        return key;
    }

    void add(const RecordHeader& header, const std::vector<std::string>& frames) {
        build_key(header, frames, key_);

        auto iter = counter_.find(key_);
        if (iter == counter_.end()) {
            counter_.emplace_hint(iter, key_, 1);
        } else {
            ++iter->second;
        }
    }

    const SampleCounter& counter() const {
        return counter_;
    }

    SampleCounter take_counter() {
        SampleCounter result = std::move(counter_);
        counter_.clear();
        return result;
    }

  private:
    void build_key(const RecordHeader& header, const std::vector<std::string>& frames, std::string& key) const {
        key = process_label(header);
        for (const auto& frame : frames) {
            key += ';';
            key += frame;
        }
    }
};

// 合并计数, src 的结点直接搬进 dst
inline void merge_counters(SampleCounter& dst, SampleCounter&& src) {
    if (dst.empty()) {
        dst = std::move(src);
        return;
    }
    for (auto it = src.begin(); it != src.end();) {
        auto found = dst.find(it->first);
        if (found != dst.end()) {
            found->second += it->second;
            ++it;
        } else {
            auto next = std::next(it);
            dst.insert(src.extract(it));
            it = next;
        }
    }
    src.clear();
}

/**
 * @brief 单个区间上的完整流水线: 切分 -> 解析 -> 规范化 -> 裁剪 -> 折叠
 */
class PerfStackFolder {
  private:
    EventFilter filter_;
    FrameNormalizer normalizer_;
    StackTrimmer trimmer_;
    StackAggregator aggregator_;
    CollapseStats stats_;

    RawRecord record_;
    std::vector<std::string> labels_;

  public:
    explicit PerfStackFolder(const CollapseOptions& options, EventFilter filter = {})
        : filter_(std::move(filter)),
          normalizer_(options),
          trimmer_(options.skip_after),
          aggregator_(options) {
        record_.frames.reserve(64);
        labels_.reserve(64);
    }
    // options 要比 folder 活得久
    explicit PerfStackFolder(CollapseOptions&&, EventFilter = {}) = delete;

    void fold(std::string_view range) {
        BlockScanner scanner(range);
        while (auto block = scanner.next_block()) {
            fold_block(*block);
        }
    }

    void fold_block(const RecordBlock& block) {
        ++stats_.records;

        auto header = PerfRecordParser::parse_header(block.header);
        if (! header) {
            ++stats_.bad_headers;
            log_warn("weird event line: ", block.header);
            return;
        }

        if (! filter_.accept(header->event)) {
            ++stats_.filtered;
            return;
        }

        record_.header = *header;
        record_.frames.clear();
        PerfRecordParser::parse_frames(block.body, record_.frames, stats_);

        labels_.clear();
        for (const auto& frame : record_.frames) {
            normalizer_.normalize(frame, record_.header.comm, labels_);
        }
        std::reverse(labels_.begin(), labels_.end());
        trimmer_.trim(labels_);

        aggregator_.add(record_.header, labels_);
        ++stats_.folded;
    }

    const EventFilter& filter() const {
        return filter_;
    }

    const CollapseStats& stats() const {
        return stats_;
    }

    SampleCounter take_counter() {
        return aggregator_.take_counter();
    }
};

// 🔥 ===== 输出 =====
class FoldedWriter {
  public:
    // 按 key 排序输出, 保证同一输入的结果与线程数无关
    static void write(const SampleCounter& counter, std::ostream& os) {
        std::vector<const SampleCounter::value_type*> sorted;
        sorted.reserve(counter.size());
        for (const auto& entry : counter) {
            sorted.push_back(&entry);
        }
        std::sort(sorted.begin(), sorted.end(), [](const auto* a, const auto* b) { return a->first < b->first; });

        for (const auto* entry : sorted) {
            os << entry->first << ' ' << entry->second << '\n';
            if (! os) {
                throw IoException("failed to write folded output");
            }
        }
        os.flush();
        if (! os) {
            throw IoException("failed to write folded output");
        }
    }
};

// 🔥 ===== 折叠器基类 =====
class AbstractCollapser {
  public:
    virtual ~AbstractCollapser() = default;

    virtual CollapseStats collapse(std::string_view input, std::ostream& out) = 0;
    virtual bool is_applicable(std::string_view input) const = 0;
    virtual std::string_view get_collapser_name() const = 0;

    // path 为空或 "-" 时读标准输入
    CollapseStats collapse_file(const std::string& path, std::ostream& out) {
        InputBuffer input = (path.empty() || path == "-") ? InputBuffer::from_stream(std::cin)
                                                          : InputBuffer::from_file(path);
        return collapse(input.view(), out);
    }
};

} // namespace stackcollapse
