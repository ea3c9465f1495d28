#include "Graph.hpp"

SCENARIO("UMI edit distances are Levenshtein distances bounded by the threshold") {
  using umiclust::graph::editDistance;

  GIVEN("UMIs differing by substitutions and indels") {
    THEN("a single substitution costs one") {
      REQUIRE(editDistance("AAAAA", "AAAAT", 2) == 1);
    }
    THEN("a deletion costs one") {
      REQUIRE(editDistance("ACGTA", "AGTA", 2) == 1);
    }
    THEN("identical UMIs are at distance zero") {
      REQUIRE(editDistance("ACGTAC", "ACGTAC", 2) == 0);
    }
    THEN("distances above the threshold are reported as threshold + 1") {
      REQUIRE(editDistance("AAAAA", "TTTTT", 2) == 3);
      REQUIRE(editDistance("AAAAAAAA", "AA", 2) == 3);
    }
    THEN("an empty UMI is as far as the other one is long") {
      REQUIRE(editDistance("", "AC", 2) == 2);
    }
  }
}

SCENARIO("Edges follow the abundance rule count(u) >= 2 * count(v) - 1") {
  using umiclust::graph::EdgeType;
  using umiclust::graph::hasEdge;

  GIVEN("two UMIs one substitution apart") {
    WHEN("one is much more abundant") {
      THEN("the edge points from the abundant UMI") {
        REQUIRE(hasEdge({"AAAAA", 100}, {"AAAAT", 5}, 2) == EdgeType::XToY);
        REQUIRE(hasEdge({"AAAAT", 5}, {"AAAAA", 100}, 2) == EdgeType::YToX);
      }
    }
    WHEN("the counts are at the rule boundary") {
      THEN("count 5 reaches count 3 but not count 4") {
        REQUIRE(hasEdge({"AAAAA", 5}, {"AAAAT", 3}, 2) == EdgeType::XToY);
        REQUIRE(hasEdge({"AAAAA", 5}, {"AAAAT", 4}, 2) == EdgeType::NoEdge);
      }
    }
    WHEN("both are singletons") {
      THEN("the edge goes both ways") {
        REQUIRE(hasEdge({"AAAAA", 1}, {"AAAAT", 1}, 2) == EdgeType::BiDirected);
      }
    }
  }

  GIVEN("two UMIs further apart than the threshold") {
    THEN("there is no edge whatever the counts") {
      REQUIRE(hasEdge({"AAAAA", 100}, {"TTTTT", 1}, 2) == EdgeType::NoEdge);
    }
  }
}

SCENARIO("UMI graphs are built and traversed by decreasing count") {
  using namespace umiclust::graph;

  GIVEN("the counts {AAAAA:100, AAAAT:5, TTTTT:50}") {
    umiclust::types::UmiCountMap counts{{"AAAAA", 100}, {"AAAAT", 5}, {"TTTTT", 50}};
    Graph g;
    uint64_t numUniEdges{0}, numBiEdges{0};
    graphFromUmiCounts(counts, g, 2, numUniEdges, numBiEdges);

    THEN("vertices are numbered by decreasing count") {
      REQUIRE(g.num_vertices() == 3);
      REQUIRE(g.getUmi(0) == "AAAAA");
      REQUIRE(g.getUmi(1) == "TTTTT");
      REQUIRE(g.getUmi(2) == "AAAAT");
    }
    THEN("only AAAAA -> AAAAT is linked") {
      REQUIRE(g.num_edges() == 1);
      REQUIRE(numUniEdges == 1);
      REQUIRE(numBiEdges == 0);
      REQUIRE(g.getNeighbors(0) == std::vector<VertexT>{2});
      REQUIRE(g.getNeighbors(1).empty());
      REQUIRE(g.getNeighbors(2).empty());
    }
    WHEN("the components are extracted") {
      auto components = g.connected_components();
      THEN("the most abundant component comes first") {
        REQUIRE(components.size() == 2);
        REQUIRE(components[0] == ComponentT{0, 2});
        REQUIRE(components[1] == ComponentT{1});
      }
    }
  }

  GIVEN("a low count UMI reachable from two unlinked parents") {
    // AAAA and AACC are two edits apart, AAAC is one edit from both
    umiclust::types::UmiCountMap counts{{"AAAA", 10}, {"AACC", 8}, {"AAAC", 4}};
    Graph g;
    uint64_t numUniEdges{0}, numBiEdges{0};
    graphFromUmiCounts(counts, g, 1, numUniEdges, numBiEdges);

    THEN("the shared child shows up in both components") {
      auto components = g.connected_components();
      REQUIRE(components.size() == 2);
      REQUIRE(components[0] == ComponentT{0, 2});
      REQUIRE(components[1] == ComponentT{1, 2});
    }
  }

  GIVEN("UMIs with equal counts") {
    umiclust::types::UmiCountMap counts{{"GGGG", 3}, {"CCCC", 3}, {"AAAA", 3}};
    Graph g;
    uint64_t numUniEdges{0}, numBiEdges{0};
    graphFromUmiCounts(counts, g, 1, numUniEdges, numBiEdges);

    THEN("ties are numbered by increasing sequence") {
      REQUIRE(g.getUmi(0) == "AAAA");
      REQUIRE(g.getUmi(1) == "CCCC");
      REQUIRE(g.getUmi(2) == "GGGG");
      REQUIRE(g.byDecreasingCount() == std::vector<VertexT>{0, 1, 2});
    }
  }
}
