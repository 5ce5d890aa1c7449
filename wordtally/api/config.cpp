/*******************************************************************************
 * wordtally/api/config.cpp
 *
 * Part of Project Wordtally
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <wordtally/api/config.hpp>

#include <wordtally/common/logger.hpp>

#include <cstdlib>
#include <string>
#include <thread>

namespace wordtally {
namespace api {

JobConfig JobConfig::FromEnvironment() {
    static constexpr bool debug = false;

    JobConfig config;

    const char* env_workers = getenv(kWorkersEnvironment);
    if (env_workers && *env_workers) {
        // parse envvar only if it exists.
        char* endptr;
        config.num_workers = std::strtoul(env_workers, &endptr, 10);

        if (!endptr || *endptr != 0 || config.num_workers == 0) {
            throw ConfigException(
                      std::string("environment variable ")
                      + kWorkersEnvironment + "=" + env_workers
                      + " is not a valid number of workers.");
        }
    }
    else {
        config.num_workers = std::thread::hardware_concurrency();
        if (config.num_workers == 0) config.num_workers = 1;
    }

    LOG << "JobConfig::FromEnvironment() " << config;
    return config;
}

void JobConfig::SetCutoff(const std::string& text) {
    if (!core::ParseDate(text, &cutoff)) {
        throw ConfigException(
                  "cutoff date \"" + text + "\" is not in dd-MM-yyyy format.");
    }
}

void JobConfig::Validate() const {
    if (num_workers == 0)
        throw ConfigException("number of workers must be positive.");
    if (use_combiner && combiner_limit == 0)
        throw ConfigException("combiner limit must be positive.");
}

std::ostream& operator << (std::ostream& os, const JobConfig& c) {
    return os << "[JobConfig"
              << " num_workers=" << c.num_workers
              << " cutoff=" << c.cutoff
              << " use_combiner=" << c.use_combiner
              << " combiner_limit=" << c.combiner_limit << "]";
}

} // namespace api
} // namespace wordtally

/******************************************************************************/
