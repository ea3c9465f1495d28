#ifndef __UMICLUST_GROUP_PARTITIONER_HPP__
#define __UMICLUST_GROUP_PARTITIONER_HPP__

#include <cstdint>
#include <string>
#include <vector>

#include "UmiClustOpts.hpp"
#include "UmiTypes.hpp"

namespace umiclust {
  namespace grouping {

    /**
     * Gene name for a read without a gene assignment, built from the bin of
     * width refInterval holding the alignment midpoint:
     * <chrom>_<floor(mid/I)*I>_<ceil(mid/I)*I>. A midpoint that falls on a
     * bin boundary gives identical start and end.
     */
    std::string createRegionName(const std::string& chrom,
                                 int64_t start, int64_t end,
                                 uint32_t refInterval);

    std::string groupKey(const std::string& gene, const std::string& barcode);

    struct ReadGroup {
      std::string key;
      // indices into GroupedReads::reads
      std::vector<uint32_t> readIdxs;
    };

    struct GroupedReads {
      // reads kept after the per group cap, input order, genes resolved
      std::vector<types::ReadTuple> reads;
      // groups in order of first appearance
      std::vector<ReadGroup> groups;
    };

    // [firstGroup, lastGroup) of GroupedReads::groups
    struct GroupBatch {
      size_t firstGroup;
      size_t lastGroup;
    };

    // throws TableFormatError for an unassigned read without chrom / start / end
    GroupedReads groupReads(std::vector<types::ReadTuple>&& reads,
                            UmiClustOpts& aopt);

    std::vector<GroupBatch> partitionGroups(size_t numGroups,
                                            uint32_t groupsPerBatch);
  }
}

#endif // __UMICLUST_GROUP_PARTITIONER_HPP__
