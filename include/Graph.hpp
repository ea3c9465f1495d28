#ifndef GRAPH_HPP
#define GRAPH_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "UmiTypes.hpp"

namespace umiclust {
  namespace graph {

    using VertexT = uint32_t;
    using ComponentT = std::vector<VertexT>;

    enum EdgeType {
      NoEdge,
      BiDirected,
      XToY,
      YToX,
    };

    /**
     * Directed UMI graph of one gene + cell group. Vertices are dense ids,
     * numbered by decreasing count (ties by increasing sequence), and
     * edges[v] holds the vertices v points to.
     */
    struct Graph {
      std::vector<std::string> vertexNames;
      std::vector<uint32_t> counts;
      std::vector<std::vector<VertexT>> edges;

      void add_edge(VertexT source, VertexT sink) {
        edges[source].push_back(sink);
      }

      size_t num_vertices() const {
        return vertexNames.size();
      }

      size_t num_edges() const {
        size_t i = 0;
        for(auto& it: edges) {
          i += it.size();
        }
        return i;
      }

      const std::string& getUmi(VertexT vertex) const {
        return vertexNames[vertex];
      }

      uint32_t getCount(VertexT vertex) const {
        return counts[vertex];
      }

      const std::vector<VertexT>& getNeighbors(VertexT vertex) const {
        return edges[vertex];
      }

      // vertex ids ordered by decreasing count, ties by increasing id
      std::vector<VertexT> byDecreasingCount() const;

      // breadth first search from every not yet found vertex, visited in
      // byDecreasingCount() order
      std::vector<ComponentT> connected_components() const;
    };

    // Levenshtein distance of x and y, or maxDist + 1 once it exceeds maxDist
    uint32_t editDistance(const std::string& x, const std::string& y,
                          uint32_t maxDist);

    EdgeType hasEdge(const std::pair<std::string, uint32_t>& x,
                     const std::pair<std::string, uint32_t>& y,
                     uint32_t umiEditDistance);

    void graphFromUmiCounts(const types::UmiCountMap& umiCounts,
                            Graph& g,
                            uint32_t umiEditDistance,
                            uint64_t& numUniEdges,
                            uint64_t& numBiEdges);
  }
}

#endif // GRAPH_HPP
