#include "UmiClustUtils.hpp"

#include <vector>

#include "spdlog/fmt/fmt.h"
#include "spdlog/sinks/ansicolor_sink.h"
#include "spdlog/sinks/basic_file_sink.h"

#include "UmiClustDefaults.hpp"

namespace umiclust {
  namespace utils {

    namespace po = boost::program_options;

    spdlog::level::level_enum verbosityToLevel(uint32_t verbosity) {
      switch (verbosity) {
      case 1:
        return spdlog::level::debug;
      case 2:
        return spdlog::level::info;
      case 3:
        return spdlog::level::warn;
      default:
        return spdlog::level::err;
      }
    }

    std::shared_ptr<spdlog::logger> makeLogger(const std::string& name,
                                               const bfs::path& logFile,
                                               uint32_t verbosity) {
      auto consoleSink = std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>();
      consoleSink->set_color(spdlog::level::warn, consoleSink->magenta);
      std::vector<spdlog::sink_ptr> sinks{consoleSink};
      if (!logFile.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile.string(), true));
      }
      auto logger = std::make_shared<spdlog::logger>(name, std::begin(sinks), std::end(sinks));
      logger->set_level(verbosityToLevel(verbosity));
      return logger;
    }

    namespace {
      bool requireFile(po::variables_map& vm, const std::string& option,
                       const std::string& what, bfs::path& target) {
        target = vm[option].as<std::string>();
        if (!bfs::exists(target)) {
          fmt::print(stderr, "\n{} {} does not exist\n Exiting Now\n",
                     what, target.string());
          return false;
        }
        return true;
      }
    }

    bool processUmiClustOpts(UmiClustOpts& aopt, po::variables_map& vm) {
      if (!requireFile(vm, "bam", "Alignment file", aopt.bamFile) or
          !requireFile(vm, "gene_assigns", "Gene assignment file", aopt.geneAssignsFile) or
          !requireFile(vm, "bc_ur_tags", "Barcode and UMI tag file", aopt.tagsFile)) {
        return false;
      }
      if (vm.count("transcript_assigns") and
          !requireFile(vm, "transcript_assigns", "Transcript assignment file",
                       aopt.transcriptAssignsFile)) {
        return false;
      }

      aopt.outputBam = vm["output"].as<std::string>();
      aopt.outputReadTags = vm["output_read_tags"].as<std::string>();

      if (aopt.verbosity < 1 or aopt.verbosity > 4) {
        fmt::print(stderr, "\n--verbosity must be between 1 and 4, got {}\n",
                   aopt.verbosity);
        return false;
      }

      //create logger
      if (vm.count("log")) {
        aopt.logFile = vm["log"].as<std::string>();
      }
      aopt.jointLog = makeLogger("umiclustLog", aopt.logFile, aopt.verbosity);
      spdlog::register_logger(aopt.jointLog);

      if (aopt.umiEditDistance > umiclust::defaults::maxUmiEditDistance) {
        aopt.jointLog->error("Too high edit distance collapsing {}, expected <= {}",
                             aopt.umiEditDistance,
                             umiclust::defaults::maxUmiEditDistance);
        return false;
      }
      if (aopt.refInterval == 0) {
        aopt.jointLog->error("--ref_interval has to be at least 1");
        return false;
      }
      if (aopt.cellGeneMaxReads == 0) {
        aopt.jointLog->error("--cell_gene_max_reads has to be at least 1");
        return false;
      }
      if (aopt.groupsPerBatch == 0) {
        aopt.jointLog->error("--batch_size has to be at least 1");
        return false;
      }
      if (aopt.numThreads == 0) {
        aopt.jointLog->error("--threads has to be at least 1");
        return false;
      }

      if (aopt.chrom.empty()) {
        aopt.jointLog->info("No contig given, processing the whole alignment file");
      } else {
        aopt.jointLog->info("Processing alignments on contig {}", aopt.chrom);
      }
      if (aopt.transcriptAssignsFile.empty()) {
        aopt.jointLog->info("No transcript assignments given, every read gets "
                            "transcript '{}'", umiclust::defaults::noTranscript);
      }
      return true;
    }

    void logRunStats(UmiClustOpts& aopt) {
      auto& stats = aopt.stats;
      aopt.jointLog->info("Reads with annotations: {}", stats.totalReads);
      aopt.jointLog->info("Reads named by genomic region: {}", stats.regionNamedReads);
      aopt.jointLog->info("Reads dropped by the cap of {} per gene and cell: {}",
                          aopt.cellGeneMaxReads, stats.cappedReads);
      aopt.jointLog->info("Reads clustered: {} in {} groups and {} batches",
                          stats.usedReads, stats.numGroups, stats.numBatches);
      aopt.jointLog->info("Distinct UMIs: {}, molecules after correction: {}",
                          stats.totalUmis.load(), stats.totalClusters.load());
      aopt.jointLog->info("Total Uni Edges in UMI graphs: {}, Bi edges: {}",
                          stats.totalUniEdges.load(), stats.totalBiEdges.load());
      if (stats.duplicateReadIds > 0) {
        aopt.jointLog->info("Read ids listed more than once: {}", stats.duplicateReadIds);
      }
      aopt.jointLog->info("Records tagged: {}, left out: {}",
                          stats.taggedRecords, stats.skippedRecords);
    }
  }
}
