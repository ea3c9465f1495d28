#include "AnnotationReader.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "UmiClustDefaults.hpp"
#include "UmiClustExceptions.hpp"

namespace umiclust {
  namespace annotation {

    namespace {
      std::vector<std::string> splitFields(const std::string& line) {
        std::vector<std::string> fields;
        std::stringstream buffer(line);
        std::string token;
        while( getline( buffer, token, '\t') ) {
          fields.emplace_back(token);
        }
        if (not fields.empty() and not fields.back().empty() and
            fields.back().back() == '\r') {
          fields.back().pop_back();
        }
        return fields;
      }

      int32_t columnIndex(const std::vector<std::string>& header,
                          const std::string& column) {
        for (size_t i = 0; i < header.size(); ++i) {
          if (header[i] == column) { return static_cast<int32_t>(i); }
        }
        return -1;
      }

      int64_t parseCoordinate(const std::string& field) {
        if (field.empty()) { return umiclust::defaults::noCoordinate; }
        char* endPtr{nullptr};
        long long parsed = std::strtoll(field.c_str(), &endPtr, 10);
        if (*endPtr != '\0' or parsed < 0) {
          return umiclust::defaults::noCoordinate;
        }
        return static_cast<int64_t>(parsed);
      }

      void openOrThrow(std::ifstream& stream, const bfs::path& filePath) {
        if (!bfs::exists(filePath)) {
          throw FileAccessError(filePath.string(), "file does not exist");
        }
        stream.open(filePath.string());
        if (!stream.is_open()) {
          throw FileAccessError(filePath.string(), "file could not be opened");
        }
      }
    }

    std::vector<GeneAssignment> readGeneAssignments(const bfs::path& filePath,
                                                    uint64_t& skippedRows) {
      std::ifstream assignFile;
      openOrThrow(assignFile, filePath);

      std::vector<GeneAssignment> assigns;
      std::string line;
      while (std::getline(assignFile, line)) {
        if (line.empty()) { continue; }
        auto fields = splitFields(line);
        if (fields.size() < 4) {
          skippedRows += 1;
          continue;
        }
        assigns.push_back(GeneAssignment{fields[0], fields[3]});
      }
      return assigns;
    }

    std::unordered_map<std::string, std::string>
    readTranscriptAssignments(const bfs::path& filePath) {
      std::ifstream txpFile;
      openOrThrow(txpFile, filePath);

      std::unordered_map<std::string, std::string> txps;
      std::string line;
      if (!std::getline(txpFile, line)) {
        // a chromosome without any transcript assignment
        return txps;
      }

      auto header = splitFields(line);
      int32_t refIdx = columnIndex(header, "ref_id");
      if (refIdx < 0) {
        throw TableFormatError(filePath.string(), "ref_id");
      }

      while (std::getline(txpFile, line)) {
        auto fields = splitFields(line);
        if (fields.size() <= static_cast<size_t>(refIdx)) { continue; }
        txps[fields[0]] = fields[refIdx];
      }
      return txps;
    }

    std::unordered_map<std::string, BarcodeUmiTags>
    readBarcodeUmiTags(const bfs::path& filePath) {
      std::ifstream tagFile;
      openOrThrow(tagFile, filePath);

      std::unordered_map<std::string, BarcodeUmiTags> tags;
      std::string line;
      if (!std::getline(tagFile, line)) {
        return tags;
      }

      auto header = splitFields(line);
      int32_t cbIdx = columnIndex(header, "CB");
      int32_t urIdx = columnIndex(header, "UR");
      if (cbIdx < 0) { throw TableFormatError(filePath.string(), "CB"); }
      if (urIdx < 0) { throw TableFormatError(filePath.string(), "UR"); }
      int32_t chrIdx = columnIndex(header, "chr");
      int32_t startIdx = columnIndex(header, "start");
      int32_t endIdx = columnIndex(header, "end");

      size_t minFields = static_cast<size_t>(std::max(cbIdx, urIdx)) + 1;
      while (std::getline(tagFile, line)) {
        auto fields = splitFields(line);
        if (fields.size() < minFields) { continue; }

        BarcodeUmiTags row;
        row.barcode = fields[cbIdx];
        row.umi = fields[urIdx];
        if (chrIdx >= 0 and fields.size() > static_cast<size_t>(chrIdx)) {
          row.chrom = fields[chrIdx];
        }
        if (startIdx >= 0 and fields.size() > static_cast<size_t>(startIdx)) {
          row.start = parseCoordinate(fields[startIdx]);
        }
        if (endIdx >= 0 and fields.size() > static_cast<size_t>(endIdx)) {
          row.end = parseCoordinate(fields[endIdx]);
        }
        tags[fields[0]] = row;
      }
      return tags;
    }

    std::vector<types::ReadTuple> loadReadTuples(UmiClustOpts& aopt) {
      auto& log = aopt.jointLog;

      uint64_t skippedRows{0};
      std::vector<GeneAssignment> geneAssigns =
        readGeneAssignments(aopt.geneAssignsFile, skippedRows);
      aopt.stats.skippedAssignRows += skippedRows;
      if (skippedRows > 0) {
        log->warn("Skipped {} malformed rows of {}", skippedRows,
                  aopt.geneAssignsFile.string());
      }

      std::unordered_map<std::string, std::string> txpAssigns;
      if (!aopt.transcriptAssignsFile.empty()) {
        txpAssigns = readTranscriptAssignments(aopt.transcriptAssignsFile);
      }
      std::unordered_map<std::string, BarcodeUmiTags> tags =
        readBarcodeUmiTags(aopt.tagsFile);

      log->info("Read {} gene assignments, {} transcript assignments and "
                "{} barcode / UMI tags",
                geneAssigns.size(), txpAssigns.size(), tags.size());

      std::vector<types::ReadTuple> reads;
      reads.reserve(geneAssigns.size());
      uint64_t noTags{0};
      for (auto& assign : geneAssigns) {
        auto tagIt = tags.find(assign.readId);
        if (tagIt == tags.end()) {
          noTags += 1;
          continue;
        }

        types::ReadTuple read;
        read.readId = assign.readId;
        read.umi = tagIt->second.umi;
        read.barcode = tagIt->second.barcode;
        read.gene = assign.gene;
        auto txpIt = txpAssigns.find(assign.readId);
        read.transcript = (txpIt == txpAssigns.end()) ? umiclust::defaults::noTranscript
                                                      : txpIt->second;
        read.chrom = tagIt->second.chrom;
        read.start = tagIt->second.start;
        read.end = tagIt->second.end;
        reads.emplace_back(std::move(read));
      }

      if (noTags > 0) {
        log->debug("{} gene assigned reads have no barcode / UMI tags", noTags);
      }
      return reads;
    }
  }
}
