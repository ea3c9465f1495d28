#ifndef __UMICLUST_READ_TAGGER_HPP__
#define __UMICLUST_READ_TAGGER_HPP__

#include <string>
#include <vector>

#include <boost/filesystem.hpp>

#include "GroupPartitioner.hpp"
#include "UmiClustOpts.hpp"
#include "UmiTypes.hpp"

namespace umiclust {
  namespace tagging {

    struct ReadTagRow {
      std::string readId;
      std::string gene;
      std::string transcript;
      std::string barcode;
      std::string umi;
    };

    // read id -> corrected UMI, resolved gene, transcript and barcode, for
    // every read that got a corrected UMI. A read id listed more than once
    // keeps its last entry and is counted in stats.duplicateReadIds.
    types::CorrectedReadMap
    buildCorrectedReadMap(const grouping::GroupedReads& grouped,
                          const std::vector<std::string>& correctedUmis,
                          UmiClustOpts& aopt);

    /**
     * Streams the records of aopt.bamFile (only aopt.chrom when set, which
     * needs an index) and writes to aopt.outputBam every record whose read
     * has a corrected UMI and a gene, with the UB, GN and TR tags set. Other
     * records are left out. One row per written record is appended to
     * readTags, in output order.
     */
    void tagAlignments(UmiClustOpts& aopt,
                       const types::CorrectedReadMap& correctedReads,
                       std::vector<ReadTagRow>& readTags);

    void writeReadTags(const boost::filesystem::path& filePath,
                       const std::vector<ReadTagRow>& readTags);
  }
}

#endif // __UMICLUST_READ_TAGGER_HPP__
