#include "ReadTagger.hpp"

#include <fstream>

#include "SamTypes.hpp"
#include "UmiClustDefaults.hpp"
#include "UmiClustExceptions.hpp"

namespace umiclust {
  namespace tagging {

    namespace su = umiclust::samutils;

    types::CorrectedReadMap
    buildCorrectedReadMap(const grouping::GroupedReads& grouped,
                          const std::vector<std::string>& correctedUmis,
                          UmiClustOpts& aopt) {
      types::CorrectedReadMap correctedReads;
      correctedReads.reserve(grouped.reads.size());

      for (size_t i = 0; i < grouped.reads.size(); ++i) {
        if (i >= correctedUmis.size() or correctedUmis[i].empty()) { continue; }
        const auto& read = grouped.reads[i];
        auto inserted = correctedReads.emplace(read.readId, types::CorrectedRead());
        if (not inserted.second) {
          aopt.stats.duplicateReadIds += 1;
          if (aopt.jointLog) {
            aopt.jointLog->debug("read {} is listed more than once; its UMI was "
                                 "counted once per listing", read.readId);
          }
        }
        auto& entry = inserted.first->second;
        entry.umi = correctedUmis[i];
        entry.gene = read.gene;
        entry.transcript = read.transcript;
        entry.barcode = read.barcode;
      }
      if (aopt.stats.duplicateReadIds > 0 and aopt.jointLog) {
        aopt.jointLog->debug("{} duplicate read ids in the gene assignments",
                             aopt.stats.duplicateReadIds);
      }
      return correctedReads;
    }

    void tagAlignments(UmiClustOpts& aopt,
                       const types::CorrectedReadMap& correctedReads,
                       std::vector<ReadTagRow>& readTags) {
      std::string inPath = aopt.bamFile.string();
      std::string outPath = aopt.outputBam.string();

      su::SamFilePtr inFile(sam_open(inPath.c_str(), "r"));
      if (!inFile) {
        throw AlignmentIOError(inPath, "could not be opened");
      }
      su::SamHeaderPtr header(sam_hdr_read(inFile.get()));
      if (!header) {
        throw AlignmentIOError(inPath, "could not read the header");
      }

      su::SamIndexPtr index;
      su::SamIteratorPtr iter;
      if (!aopt.chrom.empty()) {
        index.reset(sam_index_load(inFile.get(), inPath.c_str()));
        if (!index) {
          throw AlignmentIOError(inPath, "no index found, restricting to a "
                                 "contig needs an indexed file");
        }
        iter.reset(sam_itr_querys(index.get(), header.get(), aopt.chrom.c_str()));
        if (!iter) {
          throw AlignmentIOError(inPath, "contig " + aopt.chrom +
                                 " is not in the header");
        }
      }

      su::SamFilePtr outFile(sam_open(outPath.c_str(), "wb"));
      if (!outFile) {
        throw AlignmentIOError(outPath, "could not be opened for writing");
      }
      if (sam_hdr_write(outFile.get(), header.get()) < 0) {
        throw AlignmentIOError(outPath, "could not write the header");
      }

      su::SamRecordPtr rec(su::bam_init());
      int ret{0};
      while (true) {
        if (iter) {
          ret = sam_itr_next(inFile.get(), iter.get(), rec.get());
        } else {
          ret = sam_read1(inFile.get(), header.get(), rec.get());
        }
        if (ret < 0) { break; }

        std::string readId(su::bam_name(rec.get()));
        auto it = correctedReads.find(readId);
        if (it == correctedReads.end() or it->second.umi.empty() or
            it->second.gene.empty()) {
          aopt.stats.skippedRecords += 1;
          continue;
        }
        const auto& corrected = it->second;

        if (su::setStringTag(rec.get(), defaults::correctedUmiTag, corrected.umi) < 0 or
            su::setStringTag(rec.get(), defaults::geneTag, corrected.gene) < 0 or
            su::setStringTag(rec.get(), defaults::transcriptTag, corrected.transcript) < 0) {
          throw AlignmentIOError(outPath, "could not add tags to read " + readId);
        }
        if (sam_write1(outFile.get(), header.get(), rec.get()) < 0) {
          throw AlignmentIOError(outPath, "could not write read " + readId);
        }

        std::string barcode = su::getStringTag(rec.get(), defaults::barcodeTag);
        if (barcode.empty()) { barcode = corrected.barcode; }
        readTags.push_back(ReadTagRow{readId, corrected.gene,
                                      corrected.transcript, barcode,
                                      corrected.umi});
        aopt.stats.taggedRecords += 1;
      }

      // -1 is a clean end of file
      if (ret < -1) {
        throw AlignmentIOError(inPath, "truncated or corrupt record after " +
                               std::to_string(aopt.stats.taggedRecords +
                                              aopt.stats.skippedRecords) +
                               " records");
      }

      if (sam_close(outFile.release()) < 0) {
        throw AlignmentIOError(outPath, "could not be closed cleanly");
      }

      if (aopt.jointLog) {
        aopt.jointLog->info("Wrote {} tagged records to {}",
                            aopt.stats.taggedRecords, outPath);
        if (aopt.stats.skippedRecords > 0) {
          aopt.jointLog->info("{} records had no corrected UMI or gene and "
                              "were left out", aopt.stats.skippedRecords);
        }
      }
    }

    void writeReadTags(const boost::filesystem::path& filePath,
                       const std::vector<ReadTagRow>& readTags) {
      std::ofstream tagStream(filePath.string());
      if (!tagStream.is_open()) {
        throw FileAccessError(filePath.string(), "could not be opened for writing");
      }

      tagStream << "read_id\tgene\ttranscript\tbarcode\tumi\n";
      for (const auto& row : readTags) {
        tagStream << row.readId << '\t' << row.gene << '\t' << row.transcript
                  << '\t' << row.barcode << '\t' << row.umi << '\n';
      }
      tagStream.close();
      if (tagStream.fail()) {
        throw FileAccessError(filePath.string(), "write failed");
      }
    }
  }
}
