#ifndef __UMICLUST_ANNOTATION_READER_HPP__
#define __UMICLUST_ANNOTATION_READER_HPP__

#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/filesystem.hpp>

#include "UmiClustOpts.hpp"
#include "UmiTypes.hpp"

namespace umiclust {
  namespace annotation {

    namespace bfs = boost::filesystem;

    struct GeneAssignment {
      std::string readId;
      std::string gene;
    };

    struct BarcodeUmiTags {
      std::string barcode;
      std::string umi;
      std::string chrom;
      int64_t start{umiclust::defaults::noCoordinate};
      int64_t end{umiclust::defaults::noCoordinate};
    };

    /**
     * featureCounts "-R CORE" output, no header:
     * read_id  status  mapq  gene
     * Only the read id and gene are kept. Rows with fewer than four fields
     * are skipped and counted in skippedRows.
     */
    std::vector<GeneAssignment> readGeneAssignments(const bfs::path& filePath,
                                                    uint64_t& skippedRows);

    /**
     * Headed table whose first column is the read id; the transcript is
     * taken from the `ref_id` column. An empty file gives an empty map.
     */
    std::unordered_map<std::string, std::string>
    readTranscriptAssignments(const bfs::path& filePath);

    /**
     * Headed table whose first column is the read id, with at least the
     * `CB` and `UR` columns. `chr`, `start` and `end` are read when present;
     * a start or end that is not a non-negative integer is kept as
     * defaults::noCoordinate.
     */
    std::unordered_map<std::string, BarcodeUmiTags>
    readBarcodeUmiTags(const bfs::path& filePath);

    /**
     * Reads the three tables of aopt and joins them on the read id, in the
     * order of the gene assignments. Reads missing from the tag table are
     * dropped; reads without a transcript get "-".
     */
    std::vector<types::ReadTuple> loadReadTuples(UmiClustOpts& aopt);
  }
}

#endif // __UMICLUST_ANNOTATION_READER_HPP__
