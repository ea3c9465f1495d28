#ifndef __UMICLUST_UTILS_HPP__
#define __UMICLUST_UTILS_HPP__

#include <memory>
#include <string>

#include "spdlog/spdlog.h"

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include "UmiClustOpts.hpp"

namespace umiclust {
  namespace utils {

    namespace bfs = boost::filesystem;

    // 1 debug, 2 info, 3 warn, anything higher err
    spdlog::level::level_enum verbosityToLevel(uint32_t verbosity);

    /**
     * Colored stderr logger, with a second sink writing to logFile unless
     * logFile is empty.
     */
    std::shared_ptr<spdlog::logger> makeLogger(const std::string& name,
                                               const bfs::path& logFile,
                                               uint32_t verbosity);

    bool processUmiClustOpts(UmiClustOpts& aopt,
                             boost::program_options::variables_map& vm);

    void logRunStats(UmiClustOpts& aopt);
  }
}

#endif // __UMICLUST_UTILS_HPP__
