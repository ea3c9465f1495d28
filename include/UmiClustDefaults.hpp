#ifndef UMICLUST_DEFAULTS_HPP
#define UMICLUST_DEFAULTS_HPP

#include <cstdint>

namespace umiclust {
namespace defaults {
  // clustering
  constexpr const uint32_t umiEditDistance{2};
  constexpr const uint32_t maxUmiEditDistance{8};
  constexpr const uint32_t cellGeneMaxReads{20000};
  constexpr const uint32_t groupsPerBatch{50};
  constexpr const uint32_t numThreads{4};

  // region fallback for reads without a gene
  constexpr const uint32_t refInterval{1000};
  // start / end of a read whose tag table row has no usable coordinate
  constexpr const int64_t noCoordinate{-1};

  // sentinels of the annotation tables
  constexpr const char unassignedGene[] = "NA";
  constexpr const char noTranscript[] = "-";

  // output
  constexpr const char outputBam[] = "tagged.sorted.bam";
  constexpr const char outputReadTags[] = "read_tags.tsv";

  // alignment tags
  constexpr const char barcodeTag[] = "CB";
  constexpr const char correctedUmiTag[] = "UB";
  constexpr const char geneTag[] = "GN";
  constexpr const char transcriptTag[] = "TR";

  // logging
  constexpr const uint32_t verbosity{2};
}
}

#endif // UMICLUST_DEFAULTS_HPP
