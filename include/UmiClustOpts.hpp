#ifndef UMICLUST_OPTS_HPP
#define UMICLUST_OPTS_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "spdlog/spdlog.h"
#include <boost/filesystem.hpp>

#include "UmiClustDefaults.hpp"

/**
  * Counters filled in while a run progresses. The clustering counters are
  * bumped from worker tasks, hence atomic.
  */
struct UmiClustStats {
  uint64_t totalReads{0};
  uint64_t usedReads{0};
  uint64_t cappedReads{0};
  uint64_t regionNamedReads{0};
  uint64_t skippedAssignRows{0};

  uint64_t numGroups{0};
  uint64_t numBatches{0};

  std::atomic<uint64_t> totalUmis{0};
  std::atomic<uint64_t> totalClusters{0};
  std::atomic<uint64_t> totalUniEdges{0};
  std::atomic<uint64_t> totalBiEdges{0};

  // read ids seen more than once when building the correction map
  uint64_t duplicateReadIds{0};
  uint64_t taggedRecords{0};
  uint64_t skippedRecords{0};
};

/**
  * A structure to hold the options of a umiclust run so that
  * we don't have to pass them all around as separate arguments.
  */
struct UmiClustOpts {
  UmiClustOpts(): umiEditDistance(umiclust::defaults::umiEditDistance),
                  refInterval(umiclust::defaults::refInterval),
                  cellGeneMaxReads(umiclust::defaults::cellGeneMaxReads),
                  groupsPerBatch(umiclust::defaults::groupsPerBatch),
                  numThreads(umiclust::defaults::numThreads),
                  verbosity(umiclust::defaults::verbosity) {}

  // maximum allowable edit distance for linking two UMIs
  uint32_t umiEditDistance;
  // width (bp) of the genomic bins used as gene name for unassigned reads
  uint32_t refInterval;
  // maximum number of reads kept per gene + cell barcode
  uint32_t cellGeneMaxReads;
  // number of gene + cell groups handed to a worker at once
  uint32_t groupsPerBatch;
  // size of the worker pool
  uint32_t numThreads;
  // 1 debug, 2 info, 3 warnings, 4 errors
  uint32_t verbosity;

  // contig to process; the whole file when empty
  std::string chrom;

  // Related to the logger
  std::shared_ptr<spdlog::logger> jointLog{nullptr};

  // input alignments with CB tags
  boost::filesystem::path bamFile;
  // featureCounts style read / gene assignments
  boost::filesystem::path geneAssignsFile;
  // read / transcript assignments
  boost::filesystem::path transcriptAssignsFile;
  // read / CB / UR tag table
  boost::filesystem::path tagsFile;
  // tagged alignment output
  boost::filesystem::path outputBam;
  // read to tag table output
  boost::filesystem::path outputReadTags;
  // optional log file
  boost::filesystem::path logFile;

  //meta-info related counters
  UmiClustStats stats;
};

#endif // UMICLUST_OPTS_HPP
