#ifndef __UMICLUST_TYPES_HPP__
#define __UMICLUST_TYPES_HPP__

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "UmiClustDefaults.hpp"

namespace umiclust {
namespace types {

  // one row of the joined annotation tables
  struct ReadTuple {
    std::string readId;
    std::string umi;
    std::string barcode;
    std::string gene;
    std::string transcript;

    // alignment coordinates, only needed for the region fallback
    std::string chrom;
    int64_t start{umiclust::defaults::noCoordinate};
    int64_t end{umiclust::defaults::noCoordinate};
  };

  // distinct raw UMI -> number of reads carrying it, within one group
  using UmiCountMap = std::unordered_map<std::string, uint32_t>;
  // first element is the representative
  using UmiCluster = std::vector<std::string>;
  // raw UMI -> representative UMI, within one group
  using CorrectionMap = std::unordered_map<std::string, std::string>;

  struct CorrectedRead {
    std::string umi;
    std::string gene;
    std::string transcript;
    std::string barcode;
  };

  using CorrectedReadMap = std::unordered_map<std::string, CorrectedRead>;

}
}

#endif//__UMICLUST_TYPES_HPP__
