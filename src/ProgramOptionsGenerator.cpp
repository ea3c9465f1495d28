#include <string>

#include "ProgramOptionsGenerator.hpp"
#include "UmiClustDefaults.hpp"

namespace umiclust {

  po::options_description ProgramOptionsGenerator::getBasicOptions(UmiClustOpts& aopt) {
    po::options_description basic("\n"
                                  "basic options");
    basic.add_options()("version,v", "print version string")
      ("help,h", "produce help message")
      ("threads,t",
       po::value<uint32_t>(&(aopt.numThreads))->default_value(umiclust::defaults::numThreads),
       "The number of worker threads clustering groups concurrently.")
      ("verbosity",
       po::value<uint32_t>(&(aopt.verbosity))->default_value(umiclust::defaults::verbosity),
       "Logging level: 1 debug, 2 info, 3 warnings only, 4 errors only.")
      ("log", po::value<std::string>(),
       "Also write the log to this file.");
    return basic;
  }

  po::options_description ProgramOptionsGenerator::getInputOptions(UmiClustOpts& aopt) {
    po::options_description inputs("\n"
                                   "input options");
    inputs.add_options()
      ("chrom", po::value<std::string>(&(aopt.chrom))->default_value(""),
       "Only process alignments on this contig; requires an indexed alignment "
       "file. The whole file is processed when this is not given.")
      ("gene_assigns", po::value<std::string>()->required(),
       "Read to gene assignments: tab separated, no header, columns read id, "
       "status, mapping quality and gene (NA when unassigned).")
      ("transcript_assigns", po::value<std::string>(),
       "Read to transcript assignments: tab separated with a header holding "
       "at least the columns read id and ref_id. Reads without an entry get "
       "the transcript '-'.")
      ("bc_ur_tags", po::value<std::string>()->required(),
       "Read to cell barcode and raw UMI table: tab separated with a header "
       "holding at least the columns read id, CB and UR. The optional columns "
       "chr, start and end place reads without a gene in a genomic bin.");
    return inputs;
  }

  po::options_description ProgramOptionsGenerator::getClusteringOptions(UmiClustOpts& aopt) {
    po::options_description clustering("\n"
                                       "UMI clustering options");
    clustering.add_options()
      ("umi_edit_distance",
       po::value<uint32_t>(&(aopt.umiEditDistance))->default_value(umiclust::defaults::umiEditDistance),
       "Maximum Levenshtein distance between two UMIs of the same gene and "
       "cell that are linked in the UMI graph.")
      ("ref_interval,i",
       po::value<uint32_t>(&(aopt.refInterval))->default_value(umiclust::defaults::refInterval),
       "Size of the genomic window (bp) assigned as gene name when no gene "
       "assignment is found.")
      ("cell_gene_max_reads",
       po::value<uint32_t>(&(aopt.cellGeneMaxReads))->default_value(umiclust::defaults::cellGeneMaxReads),
       "Maximum number of reads kept for one gene and cell barcode; later "
       "reads of the group are dropped before clustering.")
      ("batch_size",
       po::value<uint32_t>(&(aopt.groupsPerBatch))->default_value(umiclust::defaults::groupsPerBatch),
       "Number of gene and cell groups handed to a worker as one task.");
    return clustering;
  }

  po::options_description ProgramOptionsGenerator::getOutputOptions(UmiClustOpts& /*aopt*/) {
    po::options_description outputs("\n"
                                    "output options");
    outputs.add_options()
      ("output",
       po::value<std::string>()->default_value(umiclust::defaults::outputBam),
       "Output alignment file with corrected UMI (UB), gene (GN) and "
       "transcript (TR) tags.")
      ("output_read_tags",
       po::value<std::string>()->default_value(umiclust::defaults::outputReadTags),
       "Output table of read id, gene, transcript, cell barcode and "
       "corrected UMI.");
    return outputs;
  }

  po::options_description ProgramOptionsGenerator::getHiddenOptions(UmiClustOpts& /*aopt*/) {
    po::options_description hidden("\n"
                                   "hidden options");
    hidden.add_options()
      ("bam", po::value<std::string>()->required(),
       "Input alignment file carrying cell barcode (CB) tags.");
    return hidden;
  }

}
