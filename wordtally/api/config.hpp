/*******************************************************************************
 * wordtally/api/config.hpp
 *
 * Job configuration of a word count run.
 *
 * Part of Project Wordtally
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef WORDTALLY_API_CONFIG_HEADER
#define WORDTALLY_API_CONFIG_HEADER

#include <wordtally/core/date.hpp>

#include <ostream>
#include <stdexcept>
#include <string>

namespace wordtally {
namespace api {

/*!
 * Thrown for invalid configuration values, from the environment or from
 * command line options.
 */
class ConfigException : public std::runtime_error
{
public:
    explicit ConfigException(const std::string& what)
        : std::runtime_error(what) { }
};

//! Default number of distinct words a combiner partition holds before flushing.
static constexpr size_t kDefaultCombinerLimit = 65536;

//! Environment variable overriding the number of workers.
static constexpr const char* kWorkersEnvironment = "WORDTALLY_WORKERS";

struct JobConfig {
    //! number of workers, which is also the number of reduce partitions.
    size_t num_workers = 1;

    //! records dated strictly before this day are counted.
    core::Date cutoff = core::kDefaultCutoff;

    //! pre-aggregate map output per worker before the shuffle.
    bool use_combiner = true;

    //! distinct words per combiner partition before it is flushed.
    size_t combiner_limit = kDefaultCombinerLimit;

    /*!
     * Returns the default configuration. The number of workers is taken from
     * WORDTALLY_WORKERS, or std::thread::hardware_concurrency() if unset.
     * Throws ConfigException if the environment variable is not a positive
     * number.
     */
    static JobConfig FromEnvironment();

    //! Parse a cutoff date given as dd-MM-yyyy, throws ConfigException.
    void SetCutoff(const std::string& text);

    //! Throws ConfigException if the configuration cannot be run.
    void Validate() const;

    friend std::ostream& operator << (std::ostream& os, const JobConfig& c);
};

} // namespace api
} // namespace wordtally

#endif // !WORDTALLY_API_CONFIG_HEADER

/******************************************************************************/
