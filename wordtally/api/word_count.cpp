/*******************************************************************************
 * wordtally/api/word_count.cpp
 *
 * Part of Project Wordtally
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <wordtally/api/word_count.hpp>

#include <wordtally/common/logger.hpp>
#include <wordtally/common/math.hpp>
#include <wordtally/common/stats_timer.hpp>
#include <wordtally/core/file_io.hpp>
#include <wordtally/core/line_reader.hpp>
#include <wordtally/core/reduce_pre_table.hpp>
#include <wordtally/core/word_count.hpp>

#include <tlx/thread_pool.hpp>

#include <exception>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace wordtally {
namespace api {

namespace {

static constexpr bool debug = false;

using Outbox = std::vector<std::vector<WordCountPair> >;

using WordCountPreTable = core::ReducePreTable<
          std::string, size_t, core::WordCountReduce,
          core::ReducePreVectorEmitter<WordCountPair> >;

//! Map phase of one worker: read its share of the input and fill its outbox,
//! one vector per reduce partition.
void MapWorker(const JobConfig& config, const core::SysFileList& files,
               size_t rank, Outbox& outbox, JobCounters& counters) {
    const size_t num_workers = config.num_workers;

    core::LineReader reader(
        files, common::CalculateLocalRange(
            files.total_size, num_workers, rank));

    if (config.use_combiner) {
        core::ReducePreVectorEmitter<WordCountPair> emitter(outbox);
        WordCountPreTable table(num_workers, core::WordCountReduce(),
                                emitter, config.combiner_limit);

        while (reader.HasNext()) {
            core::RecordStatus status = core::ProcessLine(
                reader.Next(), config.cutoff,
                [&](const WordCountPair& p) {
                    ++counters.map_output_words;
                    table.Insert(p);
                });
            counters.Count(status);
        }

        table.FlushAll();
        counters.combine_output_records += table.num_emitted();
        emitter.PrintStats();
    }
    else {
        core::ReduceByHash<std::string> index_function;

        while (reader.HasNext()) {
            core::RecordStatus status = core::ProcessLine(
                reader.Next(), config.cutoff,
                [&](WordCountPair&& p) {
                    ++counters.map_output_words;
                    size_t partition = index_function(p.first, num_workers);
                    outbox[partition].emplace_back(std::move(p));
                });
            counters.Count(status);
        }
    }

    sLOG << "MapWorker" << rank << "read" << reader.total_lines() << "lines"
         << reader.total_bytes() << "bytes";
}

//! Reduce phase of one worker: sum up the pairs of partition rank from all
//! outboxes.
void ReduceWorker(size_t rank, std::vector<Outbox>& outboxes,
                  std::vector<WordCountPair>& output, JobCounters& counters) {
    core::WordCountPostTable table;

    for (Outbox& outbox : outboxes) {
        std::vector<WordCountPair>& in = outbox[rank];
        for (const WordCountPair& p : in)
            table.Insert(p);
        counters.reduce_input_records += in.size();
        // release memory early
        std::vector<WordCountPair>().swap(in);
    }

    output.reserve(table.num_items());
    table.Flush([&output](const WordCountPair& p) { output.push_back(p); });
    counters.reduce_output_records += output.size();

    sLOG << "ReduceWorker" << rank << "reduced" << table.num_inserted()
         << "pairs into" << output.size() << "words";
}

//! Rethrow the first exception captured by a worker.
void RethrowFirst(const std::vector<std::exception_ptr>& errors) {
    for (const std::exception_ptr& e : errors) {
        if (e) std::rethrow_exception(e);
    }
}

} // namespace

WordCountResult RunWordCount(
    const JobConfig& config, const std::vector<std::string>& input_paths) {

    config.Validate();

    common::StatsTimerStart timer;

    const size_t num_workers = config.num_workers;
    core::SysFileList files = core::GlobFileSizePrefixSum(input_paths);

    LOG << "RunWordCount() " << config << " files=" << files.count()
        << " total_size=" << files.total_size;

    // outboxes[w][p]: pairs from worker w for reduce partition p
    std::vector<Outbox> outboxes(num_workers, Outbox(num_workers));
    std::vector<JobCounters> counters(num_workers);
    std::vector<std::vector<WordCountPair> > outputs(num_workers);
    std::vector<std::exception_ptr> errors(num_workers);

    tlx::ThreadPool pool(
        num_workers, [](size_t i) {
            common::NameThisThread("worker " + std::to_string(i));
        });

    common::StatsTimerStart map_timer;

    for (size_t w = 0; w < num_workers; ++w) {
        pool.enqueue(
            [&, w]() {
                try {
                    MapWorker(config, files, w, outboxes[w], counters[w]);
                }
                catch (...) {
                    errors[w] = std::current_exception();
                }
            });
    }
    pool.loop_until_empty();
    map_timer.Stop();
    RethrowFirst(errors);

    common::StatsTimerStart reduce_timer;

    for (size_t p = 0; p < num_workers; ++p) {
        pool.enqueue(
            [&, p]() {
                try {
                    ReduceWorker(p, outboxes, outputs[p], counters[p]);
                }
                catch (...) {
                    errors[p] = std::current_exception();
                }
            });
    }
    pool.loop_until_empty();
    reduce_timer.Stop();
    RethrowFirst(errors);

    WordCountResult result;
    size_t total_words = 0;
    for (size_t p = 0; p < num_workers; ++p) {
        total_words += outputs[p].size();
        result.counters += counters[p];
    }

    result.pairs.reserve(total_words);
    for (std::vector<WordCountPair>& out : outputs) {
        std::move(out.begin(), out.end(), std::back_inserter(result.pairs));
    }
    core::SortWordCounts(&result.pairs);

    LOG1 << "RESULT"
         << " benchmark=wordcount"
         << " time=" << timer.Milliseconds()
         << " map_time=" << map_timer.Milliseconds()
         << " reduce_time=" << reduce_timer.Milliseconds()
         << " files=" << files.count()
         << " bytes=" << files.total_size
         << " workers=" << num_workers
         << " combiner=" << config.use_combiner
         << " words=" << result.pairs.size()
         << " " << result.counters;

    return result;
}

WordCountResult RunWordCount(
    const JobConfig& config, const std::vector<std::string>& input_paths,
    const std::string& output_path) {
    WordCountResult result = RunWordCount(config, input_paths);
    WriteWordCounts(output_path, result.pairs);
    return result;
}

void WriteWordCounts(
    const std::string& output_path, const std::vector<WordCountPair>& pairs) {
    static constexpr size_t buffer_size = 1024 * 1024;

    core::SysFile file = core::SysFile::OpenForWrite(output_path);

    std::string buffer;
    buffer.reserve(buffer_size + 256);

    for (const WordCountPair& p : pairs) {
        buffer += p.first;
        buffer += '\t';
        buffer += std::to_string(p.second);
        buffer += '\n';

        if (buffer.size() >= buffer_size) {
            file.write_all(buffer.data(), buffer.size());
            buffer.clear();
        }
    }
    file.write_all(buffer.data(), buffer.size());
    file.close();

    sLOG << "WriteWordCounts() wrote" << pairs.size() << "words to"
         << output_path;
}

} // namespace api
} // namespace wordtally

/******************************************************************************/
