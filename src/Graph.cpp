#include "Graph.hpp"

#include <algorithm>
#include <deque>
#include <numeric>
#include <unordered_set>

#include "edlib.h"

namespace umiclust {
  namespace graph {

    std::vector<VertexT> Graph::byDecreasingCount() const {
      std::vector<VertexT> order(num_vertices());
      std::iota(order.begin(), order.end(), 0);
      std::stable_sort(order.begin(), order.end(),
                       [this](VertexT v1, VertexT v2) {
                         return counts[v1] > counts[v2];
                       });
      return order;
    }

    std::vector<ComponentT> Graph::connected_components() const {
      std::vector<ComponentT> components;
      std::vector<bool> found(num_vertices(), false);

      for (VertexT node : byDecreasingCount()) {
        if (found[node]) { continue; }

        // the search only follows out-edges and ignores `found`, so a
        // vertex claimed by an earlier component can be reached again
        ComponentT component;
        std::unordered_set<VertexT> visitedSet;
        std::deque<VertexT> bfsList;
        visitedSet.insert(node);
        bfsList.push_back(node);

        while ( bfsList.size() != 0 ){
          VertexT cv = bfsList.front();
          bfsList.pop_front();
          component.emplace_back(cv);

          for (VertexT nextVertex : getNeighbors(cv)) {
            if (visitedSet.insert(nextVertex).second) {
              bfsList.push_back(nextVertex);
            }
          }
        }//end-while

        for (VertexT v : component) { found[v] = true; }
        components.emplace_back(std::move(component));
      }

      return components;
    }

    uint32_t editDistance(const std::string& x, const std::string& y,
                          uint32_t maxDist) {
      size_t lenDiff = (x.size() > y.size()) ? x.size() - y.size()
                                             : y.size() - x.size();
      if (lenDiff > maxDist) { return maxDist + 1; }
      if (x.empty() or y.empty()) {
        return static_cast<uint32_t>(lenDiff);
      }

      EdlibAlignResult result =
        edlibAlign(x.c_str(), static_cast<int>(x.size()),
                   y.c_str(), static_cast<int>(y.size()),
                   edlibNewAlignConfig(static_cast<int>(maxDist), EDLIB_MODE_NW,
                                       EDLIB_TASK_DISTANCE, NULL, 0));
      int distance = result.editDistance;
      bool ok = (result.status == EDLIB_STATUS_OK);
      edlibFreeAlignResult(result);

      // edlib reports -1 when the distance is above the band
      if (not ok or distance < 0) { return maxDist + 1; }
      return static_cast<uint32_t>(distance);
    }

    EdgeType hasEdge(const std::pair<std::string, uint32_t>& x,
                     const std::pair<std::string, uint32_t>& y,
                     uint32_t umiEditDistance) {
      if (editDistance(x.first, y.first, umiEditDistance) > umiEditDistance) {
        return EdgeType::NoEdge;
      }

      // count(x) >= 2 * count(y) - 1, kept in unsigned arithmetic
      uint64_t xCount = x.second;
      uint64_t yCount = y.second;
      bool xToY = (xCount + 1 >= 2 * yCount);
      bool yToX = (yCount + 1 >= 2 * xCount);

      if (xToY and yToX) {
        return EdgeType::BiDirected;
      } else if (xToY) {
        return EdgeType::XToY;
      } else if (yToX) {
        return EdgeType::YToX;
      }
      return EdgeType::NoEdge;
    }

    void graphFromUmiCounts(const types::UmiCountMap& umiCounts,
                            Graph& g,
                            uint32_t umiEditDistance,
                            uint64_t& numUniEdges,
                            uint64_t& numBiEdges) {
      std::vector<std::pair<std::string, uint32_t>> umiSeqCounts(umiCounts.begin(),
                                                                 umiCounts.end());
      std::sort(umiSeqCounts.begin(), umiSeqCounts.end(),
                [](const std::pair<std::string, uint32_t>& a,
                   const std::pair<std::string, uint32_t>& b) {
                  if (a.second != b.second) { return a.second > b.second; }
                  return a.first < b.first;
                });

      size_t numUmis = umiSeqCounts.size();
      g.vertexNames.clear();
      g.counts.clear();
      g.vertexNames.reserve(numUmis);
      g.counts.reserve(numUmis);
      for (auto& it : umiSeqCounts) {
        g.vertexNames.emplace_back(it.first);
        g.counts.emplace_back(it.second);
      }
      g.edges.assign(numUmis, std::vector<VertexT>());

      for ( size_t uId=0; uId<numUmis; uId++ ){
        VertexT v1 = static_cast<VertexT>(uId);

        for ( size_t uId_second=uId+1; uId_second<numUmis; uId_second++ ){
          //check if two UMI can be connected
          EdgeType edge = hasEdge( umiSeqCounts[uId], umiSeqCounts[uId_second], umiEditDistance );
          if ( edge == EdgeType::NoEdge ) { continue; }

          VertexT v2 = static_cast<VertexT>(uId_second);

          switch ( edge ) {
          case EdgeType::BiDirected:
            numBiEdges += 1;
            g.add_edge(v1, v2);
            g.add_edge(v2, v1);
            break;
          case EdgeType::XToY:
            numUniEdges += 1;
            g.add_edge(v1, v2);
            break;
          case EdgeType::YToX:
            numUniEdges += 1;
            g.add_edge(v2, v1);
            break;
          case EdgeType::NoEdge:
            break;
          };
        }
      }//end-outer-for
    }
  }
}
