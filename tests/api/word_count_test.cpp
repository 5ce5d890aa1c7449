/*******************************************************************************
 * tests/api/word_count_test.cpp
 *
 * Part of Project Wordtally
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <wordtally/api/word_count.hpp>
#include <wordtally/common/system_exception.hpp>
#include <wordtally/core/temporary_directory.hpp>

#include <gtest/gtest.h>

#include <map>
#include <random>
#include <string>
#include <vector>

using namespace wordtally;

using Pairs = std::vector<api::WordCountPair>;

static const std::string example_input =
    "Hello World\tx\t01-01-2019\tfoo bar\n"
    "Ignored Title\t\t01-01-2019\treply text\n"
    "Late Post\tx\t01-01-2020\tfoo\n"
    "post_theme header date line\tx\t01-01-2019\tfoo\n";

static const Pairs example_correct = {
    { "bar", 1 }, { "foo", 1 }, { "hello", 1 }, { "reply", 1 },
    { "text", 1 }, { "world", 1 }
};

static api::JobConfig MakeConfig(size_t workers, bool combiner,
                                 size_t limit = api::kDefaultCombinerLimit) {
    api::JobConfig config;
    config.num_workers = workers;
    config.use_combiner = combiner;
    config.combiner_limit = limit;
    return config;
}

TEST(WordCount, ExampleAllWorkers) {
    core::TemporaryDirectory tmp;
    std::string input = tmp.WriteFile("input.tsv", example_input);

    for (size_t workers = 1; workers <= 8; ++workers) {
        for (bool combiner : { true, false }) {
            api::WordCountResult result = api::RunWordCount(
                MakeConfig(workers, combiner), { input });

            ASSERT_EQ(example_correct, result.pairs)
                << "workers " << workers << " combiner " << combiner;

            const api::JobCounters& c = result.counters;
            ASSERT_EQ(4u, c.input_lines);
            ASSERT_EQ(1u, c.header_lines);
            ASSERT_EQ(1u, c.excluded_records);
            ASSERT_EQ(2u, c.accepted_records);
            ASSERT_EQ(0u, c.malformed_records());
            ASSERT_EQ(6u, c.map_output_words);
            ASSERT_EQ(6u, c.reduce_output_records);
        }
    }
}

TEST(WordCount, WritesOutputFile) {
    core::TemporaryDirectory tmp;
    std::string input = tmp.WriteFile("input.tsv", example_input);

    api::RunWordCount(MakeConfig(3, true), { input }, tmp.path("out.txt"));

    ASSERT_EQ("bar\t1\nfoo\t1\nhello\t1\nreply\t1\ntext\t1\nworld\t1\n",
              tmp.ReadFile("out.txt"));
}

TEST(WordCount, MalformedAndEmpty) {
    core::TemporaryDirectory tmp;
    tmp.WriteFile("a.tsv",
                  "\n"
                  "too\tfew\tfields\n"
                  "t\tx\t99-99-2019\tbad date\n"
                  "t\tx\t17-10-2019\tlast day\r\n"
                  "t\tx\t18-10-2019\tcutoff day\n");
    tmp.WriteFile("b.tsv", "");

    api::WordCountResult result = api::RunWordCount(
        MakeConfig(2, true), { tmp.get() });

    ASSERT_EQ(Pairs({ { "day", 1 }, { "last", 1 } }), result.pairs);
    ASSERT_EQ(5u, result.counters.input_lines);
    ASSERT_EQ(2u, result.counters.too_few_fields);
    ASSERT_EQ(1u, result.counters.bad_dates);
    ASSERT_EQ(1u, result.counters.excluded_records);
    ASSERT_EQ(1u, result.counters.accepted_records);

    // no input bytes at all
    core::TemporaryDirectory empty;
    result = api::RunWordCount(MakeConfig(4, true), { empty.get() },
                               empty.path("out.txt"));
    ASSERT_EQ(Pairs(), result.pairs);
    ASSERT_EQ("", empty.ReadFile("out.txt"));
}

TEST(WordCount, MissingInputThrows) {
    core::TemporaryDirectory tmp;
    ASSERT_THROW(api::RunWordCount(MakeConfig(2, true),
                                   { tmp.path("missing.tsv") }),
                 common::SystemException);
    ASSERT_THROW(api::RunWordCount(MakeConfig(0, true),
                                   { tmp.get() }),
                 api::ConfigException);
}

//! Random posts over several files, checked against a sequential count.
TEST(WordCount, RandomInputIndependentOfPartitioning) {
    core::TemporaryDirectory tmp;

    std::default_random_engine rng(42);
    const std::vector<std::string> vocabulary = {
        "alpha", "Beta", "gamma", "DELTA", "c++", "x2", "über", "Straße",
        "привет", "don't", "end."
    };
    const std::vector<std::string> dates = {
        "01-01-2019", "17-10-2019", "18-10-2019", "19-10-2019", "31-02-2019",
        "05-05-2005", "bad-date!!"
    };
    std::uniform_int_distribution<size_t> word_dist(0, vocabulary.size() - 1);
    std::uniform_int_distribution<size_t> date_dist(0, dates.size() - 1);
    std::uniform_int_distribution<size_t> len_dist(0, 12);
    std::bernoulli_distribution reply_dist(0.5);

    auto sentence = [&]() {
                        std::string s;
                        size_t n = len_dist(rng);
                        for (size_t i = 0; i < n; ++i) {
                            if (i) s += ' ';
                            s += vocabulary[word_dist(rng)];
                        }
                        return s;
                    };

    std::map<std::string, size_t> expected;
    for (size_t f = 0; f < 3; ++f) {
        std::string content;
        for (size_t i = 0; i < 400; ++i) {
            std::string line = sentence() + "\t"
                               + (reply_dist(rng) ? "x" : "") + "\t"
                               + dates[date_dist(rng)] + "\t" + sentence();
            for (const api::WordCountPair& p : core::ProcessLine(line))
                expected[p.first] += p.second;
            content += line + "\n";
        }
        tmp.WriteFile("part-" + std::to_string(f), content);
    }
    const Pairs correct(expected.begin(), expected.end());
    ASSERT_FALSE(correct.empty());

    for (size_t workers : { 1, 2, 3, 5, 8 }) {
        for (size_t limit : { 1, 3, 1000 }) {
            api::WordCountResult result = api::RunWordCount(
                MakeConfig(workers, true, limit), { tmp.path("part-*") });
            ASSERT_EQ(correct, result.pairs)
                << "workers " << workers << " limit " << limit;
            ASSERT_EQ(result.counters.combine_output_records,
                      result.counters.reduce_input_records);
            ASSERT_GE(result.counters.map_output_words,
                      result.counters.combine_output_records);
        }
        api::WordCountResult result = api::RunWordCount(
            MakeConfig(workers, false), { tmp.get() });
        ASSERT_EQ(correct, result.pairs) << "workers " << workers;
        ASSERT_EQ(result.counters.map_output_words,
                  result.counters.reduce_input_records);
    }
}

/******************************************************************************/
