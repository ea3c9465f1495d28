#include "GroupPartitioner.hpp"

#include <algorithm>
#include <unordered_map>

#include "UmiClustExceptions.hpp"

namespace umiclust {
  namespace grouping {

    std::string createRegionName(const std::string& chrom,
                                 int64_t start, int64_t end,
                                 uint32_t refInterval) {
      int64_t midpoint = (start + end) / 2;
      int64_t interval = static_cast<int64_t>(refInterval);

      int64_t intervalStart = (midpoint / interval) * interval;
      int64_t intervalEnd = (midpoint % interval == 0) ? intervalStart
                                                        : intervalStart + interval;

      return chrom + "_" + std::to_string(intervalStart) + "_" +
             std::to_string(intervalEnd);
    }

    std::string groupKey(const std::string& gene, const std::string& barcode) {
      return gene + ":" + barcode;
    }

    GroupedReads groupReads(std::vector<types::ReadTuple>&& reads,
                            UmiClustOpts& aopt) {
      GroupedReads grouped;
      std::unordered_map<std::string, size_t> groupIndex;
      auto& stats = aopt.stats;

      stats.totalReads += reads.size();
      grouped.reads.reserve(reads.size());

      for (auto& read : reads) {
        if (read.gene == umiclust::defaults::unassignedGene) {
          if (read.chrom.empty() or
              read.start == umiclust::defaults::noCoordinate or
              read.end == umiclust::defaults::noCoordinate) {
            throw TableFormatError(aopt.tagsFile.string(), "chr/start/end",
                                   "read " + read.readId + " has no gene "
                                   "assignment and no usable alignment "
                                   "coordinates to name its region");
          }
          read.gene = createRegionName(read.chrom, read.start, read.end,
                                       aopt.refInterval);
          stats.regionNamedReads += 1;
        }

        std::string key = groupKey(read.gene, read.barcode);
        auto it = groupIndex.find(key);
        if (it == groupIndex.end()) {
          it = groupIndex.emplace(key, grouped.groups.size()).first;
          grouped.groups.emplace_back(ReadGroup{key, {}});
        }

        ReadGroup& group = grouped.groups[it->second];
        if (group.readIdxs.size() >= aopt.cellGeneMaxReads) {
          stats.cappedReads += 1;
          continue;
        }

        group.readIdxs.emplace_back(static_cast<uint32_t>(grouped.reads.size()));
        grouped.reads.emplace_back(std::move(read));
      }
      reads.clear();

      stats.usedReads += grouped.reads.size();
      stats.numGroups += grouped.groups.size();

      if (stats.cappedReads > 0 and aopt.jointLog) {
        aopt.jointLog->debug("{} reads over the limit of {} per gene + cell "
                             "were left out of clustering",
                             stats.cappedReads, aopt.cellGeneMaxReads);
      }
      return grouped;
    }

    std::vector<GroupBatch> partitionGroups(size_t numGroups,
                                            uint32_t groupsPerBatch) {
      std::vector<GroupBatch> batches;
      size_t step = std::max<size_t>(1, groupsPerBatch);
      for (size_t first = 0; first < numGroups; first += step) {
        batches.push_back(GroupBatch{first, std::min(numGroups, first + step)});
      }
      return batches;
    }
  }
}
