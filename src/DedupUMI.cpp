#include "DedupUMI.hpp"

#include <algorithm>
#include <unordered_set>

// The directional method follows UMI-tools:
// Smith, Tom, Andreas Heger, and Ian Sudbery. "UMI-tools: modeling sequencing
// errors in Unique Molecular Identifiers to improve quantification accuracy."
// Genome research 27.3 (2017): 491-499.

std::vector<umiclust::graph::ComponentT>
groupDirectional(const umiclust::graph::Graph& g,
                 const std::vector<umiclust::graph::ComponentT>& components) {
  using namespace umiclust::graph;

  std::unordered_set<VertexT> observed;
  std::vector<ComponentT> groups;
  groups.reserve(components.size());

  for (auto& comp : components) {
    if ( comp.size() == 1 ) {
      groups.emplace_back(comp);
      observed.insert(comp.front());
      continue;
    }

    ComponentT sorted(comp);
    std::stable_sort(sorted.begin(), sorted.end(),
                     [&g](VertexT v1, VertexT v2) {
                       if (g.getCount(v1) != g.getCount(v2)) {
                         return g.getCount(v1) > g.getCount(v2);
                       }
                       return v1 < v2;
                     });

    // drop every vertex an earlier group already claimed
    ComponentT group;
    for (VertexT vertex : sorted) {
      if (observed.insert(vertex).second) {
        group.emplace_back(vertex);
      }
    }
    groups.emplace_back(std::move(group));
  }

  return groups;
}

std::vector<umiclust::types::UmiCluster>
clusterUmis(const UGroupT& ugroup,
            uint32_t umiEditDistance,
            UmiClustStats& stats) {
  using namespace umiclust::graph;

  Graph g;
  uint64_t numUniEdges{0}, numBiEdges{0};
  graphFromUmiCounts(ugroup, g, umiEditDistance, numUniEdges, numBiEdges);

  std::vector<ComponentT> groups = groupDirectional(g, g.connected_components());

  std::vector<umiclust::types::UmiCluster> clusters;
  clusters.reserve(groups.size());
  for (auto& group : groups) {
    umiclust::types::UmiCluster cluster;
    cluster.reserve(group.size());
    for (VertexT vertex : group) {
      cluster.emplace_back(g.getUmi(vertex));
    }
    clusters.emplace_back(std::move(cluster));
  }

  stats.totalUmis += g.num_vertices();
  stats.totalClusters += clusters.size();
  stats.totalUniEdges += numUniEdges;
  stats.totalBiEdges += numBiEdges;
  return clusters;
}

umiclust::types::CorrectionMap
createCorrectionMap(const std::vector<umiclust::types::UmiCluster>& clusters) {
  umiclust::types::CorrectionMap umiMap;
  for (auto& cluster : clusters) {
    for (auto& umi : cluster) {
      umiMap[umi] = cluster.front();
    }
  }
  return umiMap;
}

std::vector<std::string> correctUmis(const std::vector<std::string>& umis,
                                     uint32_t umiEditDistance,
                                     UmiClustStats& stats) {
  UGroupT ugroup;
  for (auto& umi : umis) {
    ugroup[umi] += 1;
  }

  umiclust::types::CorrectionMap umiMap =
    createCorrectionMap(clusterUmis(ugroup, umiEditDistance, stats));

  std::vector<std::string> corrected;
  corrected.reserve(umis.size());
  for (auto& umi : umis) {
    corrected.emplace_back(umiMap.at(umi));
  }
  return corrected;
}
