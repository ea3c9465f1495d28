#ifndef __UMICLUST_BATCH_DISPATCHER_HPP__
#define __UMICLUST_BATCH_DISPATCHER_HPP__

#include <atomic>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "GroupPartitioner.hpp"
#include "UmiClustOpts.hpp"

namespace umiclust {
  namespace dispatch {

    struct BatchResult {
      // (index into GroupedReads::reads, corrected UMI)
      std::vector<std::pair<uint32_t, std::string>> correctedUmis;
      bool complete{false};
    };

    /**
     * Corrects the UMIs of every group of one batch, one group after the
     * other. Returns early with complete == false when interrupted is set.
     */
    BatchResult processBatch(const grouping::GroupedReads& grouped,
                             const grouping::GroupBatch& batch,
                             uint32_t umiEditDistance,
                             UmiClustStats& stats,
                             const std::atomic<bool>& interrupted);

    /**
     * Runs processBatch for every batch of groupsPerBatch groups as tasks
     * of a pool of numThreads workers. The result holds the corrected UMI
     * of every read of `grouped`, indexed like grouped.reads.
     *
     * Throws DispatchInterrupted, before anything is merged, if interrupted
     * is raised while batches are running.
     */
    class BatchDispatcher {
    public:
      BatchDispatcher(UmiClustOpts& aopt, const std::atomic<bool>& interrupted);

      std::vector<std::string> run(const grouping::GroupedReads& grouped);

    private:
      UmiClustOpts& aopt_;
      const std::atomic<bool>& interrupted_;
    };
  }
}

#endif // __UMICLUST_BATCH_DISPATCHER_HPP__
