#include "BatchDispatcher.hpp"

#include <algorithm>

#include "tbb/blocked_range.h"
#include "tbb/global_control.h"
#include "tbb/parallel_for.h"

#include "DedupUMI.hpp"
#include "UmiClustExceptions.hpp"

namespace umiclust {
  namespace dispatch {

    BatchResult processBatch(const grouping::GroupedReads& grouped,
                             const grouping::GroupBatch& batch,
                             uint32_t umiEditDistance,
                             UmiClustStats& stats,
                             const std::atomic<bool>& interrupted) {
      BatchResult result;

      for (size_t gId = batch.firstGroup; gId < batch.lastGroup; ++gId) {
        if (interrupted.load()) { return result; }

        auto& group = grouped.groups[gId];
        if (group.readIdxs.empty()) { continue; }

        std::vector<std::string> umis;
        umis.reserve(group.readIdxs.size());
        for (uint32_t readIdx : group.readIdxs) {
          umis.emplace_back(grouped.reads[readIdx].umi);
        }

        std::vector<std::string> corrected = correctUmis(umis, umiEditDistance, stats);
        for (size_t i = 0; i < corrected.size(); ++i) {
          result.correctedUmis.emplace_back(group.readIdxs[i], std::move(corrected[i]));
        }
      }

      result.complete = true;
      return result;
    }

    BatchDispatcher::BatchDispatcher(UmiClustOpts& aopt,
                                     const std::atomic<bool>& interrupted)
      : aopt_(aopt), interrupted_(interrupted) {}

    std::vector<std::string> BatchDispatcher::run(const grouping::GroupedReads& grouped) {
      auto& log = aopt_.jointLog;
      std::vector<std::string> correctedUmis(grouped.reads.size());

      std::vector<grouping::GroupBatch> batches =
        grouping::partitionGroups(grouped.groups.size(), aopt_.groupsPerBatch);
      aopt_.stats.numBatches += batches.size();
      if (batches.empty()) {
        log->info("No gene + cell groups to cluster");
        return correctedUmis;
      }

      size_t numBatches = batches.size();
      log->info("Clustering UMIs of {} gene + cell groups in {} batches using {} threads",
                grouped.groups.size(), numBatches, aopt_.numThreads);

      // one slot per submitted batch; nothing is merged before every task returned
      std::vector<BatchResult> results(numBatches);
      std::atomic<uint64_t> numFinished{0};
      uint64_t reportEvery = std::max<uint64_t>(1, numBatches / 10);

      tbb::global_control c(tbb::global_control::max_allowed_parallelism,
                            std::max<uint32_t>(1, aopt_.numThreads));
      using BlockedIndexRange = tbb::blocked_range<size_t>;
      tbb::parallel_for(
          BlockedIndexRange(size_t(0), numBatches, size_t(1)),
          [&](const BlockedIndexRange& range) -> void {
            for (size_t bId = range.begin(); bId < range.end(); ++bId) {
              if (interrupted_.load()) {
                throw DispatchInterrupted(numFinished.load(), numBatches);
              }
              results[bId] = processBatch(grouped, batches[bId],
                                          aopt_.umiEditDistance,
                                          aopt_.stats, interrupted_);
              if (not results[bId].complete) {
                throw DispatchInterrupted(numFinished.load(), numBatches);
              }

              uint64_t finished = ++numFinished;
              if (finished % reportEvery == 0) {
                log->debug("{} / {} batches done", finished, numBatches);
              }
            }
          });

      if (interrupted_.load()) {
        throw DispatchInterrupted(numFinished.load(), numBatches);
      }

      for (auto& result : results) {
        for (auto& it : result.correctedUmis) {
          correctedUmis[it.first] = std::move(it.second);
        }
      }

      log->info("Done clustering {} UMIs into {} molecules",
                aopt_.stats.totalUmis.load(), aopt_.stats.totalClusters.load());
      return correctedUmis;
    }
  }
}
