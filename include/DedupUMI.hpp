#ifndef DEDUP_UMI_HPP
#define DEDUP_UMI_HPP

#include <string>
#include <vector>

#include "Graph.hpp"
#include "UmiClustOpts.hpp"
#include "UmiTypes.hpp"

using UGroupT = umiclust::types::UmiCountMap;

// Walk the components in order and give every vertex to the first one
// that reaches it; members of each cluster are listed by decreasing count.
std::vector<umiclust::graph::ComponentT>
groupDirectional(const umiclust::graph::Graph& g,
                 const std::vector<umiclust::graph::ComponentT>& components);

std::vector<umiclust::types::UmiCluster>
clusterUmis(const UGroupT& ugroup,
            uint32_t umiEditDistance,
            UmiClustStats& stats);

umiclust::types::CorrectionMap
createCorrectionMap(const std::vector<umiclust::types::UmiCluster>& clusters);

// corrected UMI for every entry of umis, same order
std::vector<std::string> correctUmis(const std::vector<std::string>& umis,
                                     uint32_t umiEditDistance,
                                     UmiClustStats& stats);

#endif // DEDUP_UMI_HPP
