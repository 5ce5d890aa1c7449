/*******************************************************************************
 * examples/count_words/count_words_run.cpp
 *
 * Counts the words of posts dated before a cutoff day.
 *
 * Part of Project Wordtally
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <wordtally/api/config.hpp>
#include <wordtally/api/word_count.hpp>
#include <wordtally/common/logger.hpp>

#include <tlx/cmdline_parser.hpp>

#include <exception>
#include <iostream>
#include <string>
#include <vector>

using namespace wordtally; // NOLINT

int main(int argc, char* argv[]) {

    api::JobConfig config;
    try {
        config = api::JobConfig::FromEnvironment();
    }
    catch (const api::ConfigException& e) {
        LOG1 << "count_words_run: " << e.what();
        return 2;
    }

    tlx::CmdlineParser clp;
    clp.set_description(
        "Counts the words of tab-separated posts "
        "(title, reply flag, dd-MM-yyyy date, comment) dated before a "
        "cutoff day and writes \"word<TAB>count\" lines sorted by word.");

    std::vector<std::string> locations;
    clp.add_param_stringlist("locations", locations,
                             "<input> <output>: input file, directory or "
                             "glob pattern and output file");

    clp.add_size_t('w', "workers", config.num_workers,
                   "number of worker threads, default: WORDTALLY_WORKERS "
                   "or the number of cores");

    std::string cutoff;
    clp.add_string('c', "cutoff", cutoff,
                   "count posts dated before this day (dd-MM-yyyy), "
                   "default: 18-10-2019");

    bool no_combiner = false;
    clp.add_bool('C', "no-combiner", no_combiner,
                 "disable the per-worker combiner");

    clp.add_size_t('l', "limit", config.combiner_limit,
                   "distinct words per combiner partition before flushing");

    if (!clp.process(argc, argv, std::cerr)) {
        return 2;
    }

    if (locations.size() != 2) {
        std::cerr << "count_words_run: expected <input> <output>" << std::endl;
        clp.print_usage(std::cerr);
        return 2;
    }

    clp.print_result();

    config.use_combiner = !no_combiner;
    try {
        if (!cutoff.empty())
            config.SetCutoff(cutoff);
        config.Validate();
    }
    catch (const api::ConfigException& e) {
        LOG1 << "count_words_run: " << e.what();
        return 2;
    }

    common::NameThisThread("main");

    try {
        api::RunWordCount(config, { locations[0] }, locations[1]);
    }
    catch (const std::exception& e) {
        LOG1 << "count_words_run: " << e.what();
        return 1;
    }

    return 0;
}

/******************************************************************************/
