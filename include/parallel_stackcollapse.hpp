#pragma once

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include "stackcollapse.hpp"

// 在 stackcollapse.hpp 的流水线基础上做并行折叠

namespace stackcollapse {

/**
 * @brief 适配 perf script 输出的折叠器
 *
 * 输入按 block 边界切成 nthreads 段, 每段一个独立的 PerfStackFolder,
 * 全部结束后在当前线程里合并计数.
 */
class PerfCollapser : public AbstractCollapser {
  private:
    CollapseOptions options_;
    static constexpr int MAX_PREVIEW_LINE = 128;

  public:
    explicit PerfCollapser(CollapseOptions options = {}) : options_(std::move(options)) {
        options_.validate();
    }

    CollapseStats collapse(std::string_view input, std::ostream& out) override {
        CollapseStats stats;
        SampleCounter counter = fold(input, &stats);
        FoldedWriter::write(counter, out);
        return stats;
    }

    SampleCounter fold(std::string_view input, CollapseStats* stats = nullptr) {
        EventFilter filter = resolve_event_filter(input);
        std::vector<std::string_view> ranges = partition_blocks(input, options_.nthreads);

        std::vector<SampleCounter> partials(ranges.size());
        std::vector<CollapseStats> partial_stats(ranges.size());

        auto fold_range = [&](size_t i) {
            PerfStackFolder folder(options_, filter);
            folder.fold(ranges[i]);
            partials[i] = folder.take_counter();
            partial_stats[i] = folder.stats();
        };

        if (ranges.size() <= 1) {
            // 数据量太小或只要一个线程, 直接在当前线程做
            for (size_t i = 0; i < ranges.size(); ++i) {
                fold_range(i);
            }
        } else {
            log_debug("folding ", input.size(), " bytes in ", ranges.size(), " ranges");

            // arena 的生命周期只在这次调用内
            tbb::task_arena arena(static_cast<int>(std::min(options_.nthreads, ranges.size())));
            arena.execute([&] {
                tbb::parallel_for(tbb::blocked_range<size_t>(0, ranges.size(), 1),
                                  [&](const tbb::blocked_range<size_t>& range) {
                                      for (size_t i = range.begin(); i != range.end(); ++i) {
                                          fold_range(i);
                                      }
                                  });
            });
        }

        // 按区间顺序合并
        SampleCounter result;
        CollapseStats total;
        for (size_t i = 0; i < partials.size(); ++i) {
            log_debug("range ", i, ": ", ranges[i].size(), " bytes, ", partial_stats[i].folded, " samples, ",
                      partials[i].size(), " unique stacks");
            total += partial_stats[i];
            merge_counters(result, std::move(partials[i]));
        }
        total.unique_stacks = result.size();

        if (stats) *stats = total;
        return result;
    }

    bool is_applicable(std::string_view input) const override {
        LineScanner scanner(input);
        bool in_record = false;
        bool header_ok = false;
        int lines_checked = 0;

        while (! scanner.eof() && lines_checked < MAX_PREVIEW_LINE) {
            std::string_view line = scanner.next_line();
            lines_checked++;

            if (is_metadata(line)) continue;
            if (is_blank(line)) {
                if (in_record) return header_ok;
                continue;
            }

            if (! is_indented(line)) {
                if (in_record) return header_ok;
                in_record = true;
                header_ok = PerfRecordParser::parse_header(line).has_value();
                if (! header_ok) return false;
            } else if (in_record) {
                if (! PerfRecordParser::parse_frame(line)) return false;
            }
        }
        return in_record && header_ok;
    }

    std::string_view get_collapser_name() const override {
        return "PerfCollapser";
    }

    const CollapseOptions& get_options() const {
        return options_;
    }

  private:
    // 未指定事件时, 在切分之前统一取第一个带事件名的合法 header, 避免各段各自挑选
    EventFilter resolve_event_filter(std::string_view input) const {
        if (options_.event_filter) {
            return EventFilter(*options_.event_filter);
        }

        BlockScanner scanner(input);
        while (auto block = scanner.next_block()) {
            auto header = PerfRecordParser::parse_header(block->header);
            if (header && ! header->event.empty()) {
                log_info("Filtering for events of type: ", header->event);
                return EventFilter(std::string(header->event));
            }
        }
        return EventFilter();
    }
};

} // namespace stackcollapse
