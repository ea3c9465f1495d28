#include "ReadTagger.hpp"
#include "SamTypes.hpp"
#include "UmiClustExceptions.hpp"

namespace {
  // copies a coordinate sorted SAM file into BAM and builds its .bai
  void writeIndexedBam(const boost::filesystem::path& samPath,
                       const boost::filesystem::path& bamPath) {
    namespace su = umiclust::samutils;
    su::SamFilePtr in(sam_open(samPath.string().c_str(), "r"));
    REQUIRE(in.get() != nullptr);
    su::SamHeaderPtr header(sam_hdr_read(in.get()));
    REQUIRE(header.get() != nullptr);
    su::SamFilePtr out(sam_open(bamPath.string().c_str(), "wb"));
    REQUIRE(out.get() != nullptr);
    REQUIRE(sam_hdr_write(out.get(), header.get()) == 0);

    su::SamRecordPtr rec(su::bam_init());
    while (sam_read1(in.get(), header.get(), rec.get()) >= 0) {
      REQUIRE(sam_write1(out.get(), header.get(), rec.get()) >= 0);
    }
    REQUIRE(sam_close(out.release()) == 0);
    REQUIRE(sam_index_build(bamPath.string().c_str(), 0) == 0);
  }

  std::vector<std::string> recordNames(const boost::filesystem::path& bamPath) {
    namespace su = umiclust::samutils;
    std::vector<std::string> names;
    su::SamFilePtr in(sam_open(bamPath.string().c_str(), "r"));
    REQUIRE(in.get() != nullptr);
    su::SamHeaderPtr header(sam_hdr_read(in.get()));
    REQUIRE(header.get() != nullptr);
    su::SamRecordPtr rec(su::bam_init());
    while (sam_read1(in.get(), header.get(), rec.get()) >= 0) {
      names.emplace_back(su::bam_name(rec.get()));
    }
    return names;
  }
}

SCENARIO("Alignments are tagged with corrected UMIs, genes and transcripts") {
  using namespace umiclust::tagging;
  namespace su = umiclust::samutils;

  GIVEN("a small alignment file and corrections for two of its reads") {
    auto dir = makeTempDir();
    writeTextFile(dir / "input.sam",
                  "@HD\tVN:1.6\tSO:coordinate\n"
                  "@SQ\tSN:chr1\tLN:10000\n"
                  "r1\t0\tchr1\t100\t60\t4M\t*\t0\t0\tACGT\tIIII\tCB:Z:BC1\n"
                  "r2\t0\tchr1\t200\t60\t4M\t*\t0\t0\tACGT\tIIII\tUB:Z:OLD\n"
                  "r3\t0\tchr1\t300\t60\t4M\t*\t0\t0\tACGT\tIIII\tCB:Z:BC3\n");

    umiclust::types::CorrectedReadMap corrected;
    corrected["r1"] = umiclust::types::CorrectedRead{"AAAA", "G1", "T1", "BCX"};
    corrected["r2"] = umiclust::types::CorrectedRead{"CCCC", "chr1_0_1000", "-", "BC2"};

    UmiClustOpts aopt;
    aopt.jointLog = makeTestLogger();
    aopt.bamFile = dir / "input.sam";
    aopt.outputBam = dir / "tagged.bam";
    aopt.outputReadTags = dir / "read_tags.tsv";

    std::vector<ReadTagRow> readTags;
    tagAlignments(aopt, corrected, readTags);

    THEN("only corrected reads are written, in input order") {
      REQUIRE(aopt.stats.taggedRecords == 2);
      REQUIRE(aopt.stats.skippedRecords == 1);
      REQUIRE(readTags.size() == 2);
      REQUIRE(readTags[0].readId == "r1");
      REQUIRE(readTags[1].readId == "r2");
    }
    THEN("the barcode comes from the record and falls back to the tag table") {
      REQUIRE(readTags[0].barcode == "BC1");
      REQUIRE(readTags[1].barcode == "BC2");
    }
    THEN("the output records carry UB, GN and TR") {
      su::SamFilePtr in(sam_open(aopt.outputBam.string().c_str(), "r"));
      REQUIRE(in.get() != nullptr);
      su::SamHeaderPtr header(sam_hdr_read(in.get()));
      REQUIRE(header.get() != nullptr);
      su::SamRecordPtr rec(su::bam_init());

      std::vector<std::string> names;
      std::unordered_map<std::string, std::vector<std::string>> recordTags;
      while (sam_read1(in.get(), header.get(), rec.get()) >= 0) {
        std::string name(su::bam_name(rec.get()));
        names.push_back(name);
        recordTags[name] = {su::getStringTag(rec.get(), "UB"),
                            su::getStringTag(rec.get(), "GN"),
                            su::getStringTag(rec.get(), "TR")};
      }

      REQUIRE(names == std::vector<std::string>{"r1", "r2"});
      REQUIRE(recordTags["r1"] == std::vector<std::string>{"AAAA", "G1", "T1"});
      REQUIRE(recordTags["r2"] == std::vector<std::string>{"CCCC", "chr1_0_1000", "-"});
    }
    THEN("the read tag table lists the written reads") {
      writeReadTags(aopt.outputReadTags, readTags);
      std::ifstream tagFile(aopt.outputReadTags.string());
      std::string line;
      REQUIRE(static_cast<bool>(std::getline(tagFile, line)));
      REQUIRE(line == "read_id\tgene\ttranscript\tbarcode\tumi");
      REQUIRE(static_cast<bool>(std::getline(tagFile, line)));
      REQUIRE(line == "r1\tG1\tT1\tBC1\tAAAA");
      REQUIRE(static_cast<bool>(std::getline(tagFile, line)));
      REQUIRE(line == "r2\tchr1_0_1000\t-\tBC2\tCCCC");
      REQUIRE_FALSE(static_cast<bool>(std::getline(tagFile, line)));
    }
    boost::filesystem::remove_all(dir);
  }

  GIVEN("a contig restriction on an unindexed file") {
    auto dir = makeTempDir();
    writeTextFile(dir / "input.sam",
                  "@HD\tVN:1.6\tSO:coordinate\n"
                  "@SQ\tSN:chr1\tLN:10000\n"
                  "r1\t0\tchr1\t100\t60\t4M\t*\t0\t0\tACGT\tIIII\n");
    UmiClustOpts aopt;
    aopt.jointLog = makeTestLogger();
    aopt.bamFile = dir / "input.sam";
    aopt.outputBam = dir / "tagged.bam";
    aopt.chrom = "chr1";

    THEN("tagging fails with an alignment error") {
      std::vector<ReadTagRow> readTags;
      REQUIRE_THROWS_AS(tagAlignments(aopt, umiclust::types::CorrectedReadMap(), readTags),
                        AlignmentIOError);
    }
    boost::filesystem::remove_all(dir);
  }

  GIVEN("an indexed alignment file with reads on two contigs") {
    auto dir = makeTempDir();
    writeTextFile(dir / "input.sam",
                  "@HD\tVN:1.6\tSO:coordinate\n"
                  "@SQ\tSN:chr1\tLN:10000\n"
                  "@SQ\tSN:chr2\tLN:10000\n"
                  "r1\t0\tchr1\t100\t60\t4M\t*\t0\t0\tACGT\tIIII\tCB:Z:BC1\n"
                  "r2\t0\tchr1\t200\t60\t4M\t*\t0\t0\tACGT\tIIII\tCB:Z:BC1\n"
                  "r3\t0\tchr2\t50\t60\t4M\t*\t0\t0\tACGT\tIIII\tCB:Z:BC2\n"
                  "r4\t0\tchr2\t80\t60\t4M\t*\t0\t0\tACGT\tIIII\tCB:Z:BC2\n");
    writeIndexedBam(dir / "input.sam", dir / "input.bam");

    umiclust::types::CorrectedReadMap corrected;
    corrected["r1"] = umiclust::types::CorrectedRead{"AAAA", "G1", "T1", "BC1"};
    corrected["r2"] = umiclust::types::CorrectedRead{"AAAA", "G1", "-", "BC1"};
    corrected["r3"] = umiclust::types::CorrectedRead{"CCCC", "G2", "T2", "BC2"};
    corrected["r4"] = umiclust::types::CorrectedRead{"GGGG", "G2", "-", "BC2"};

    UmiClustOpts aopt;
    aopt.jointLog = makeTestLogger();
    aopt.bamFile = dir / "input.bam";
    aopt.outputBam = dir / "tagged.bam";

    WHEN("tagging is restricted to chr1") {
      aopt.chrom = "chr1";
      std::vector<ReadTagRow> readTags;
      tagAlignments(aopt, corrected, readTags);

      THEN("only the chr1 records are written, in order") {
        REQUIRE(readTags.size() == 2);
        REQUIRE(readTags[0].readId == "r1");
        REQUIRE(readTags[1].readId == "r2");
        REQUIRE(aopt.stats.taggedRecords == 2);
        REQUIRE(aopt.stats.skippedRecords == 0);
        REQUIRE(recordNames(aopt.outputBam) == std::vector<std::string>{"r1", "r2"});
      }
    }

    WHEN("tagging is restricted to chr2") {
      aopt.chrom = "chr2";
      std::vector<ReadTagRow> readTags;
      tagAlignments(aopt, corrected, readTags);

      THEN("only the chr2 records are written") {
        REQUIRE(readTags.size() == 2);
        REQUIRE(readTags[0].readId == "r3");
        REQUIRE(readTags[0].umi == "CCCC");
        REQUIRE(readTags[1].readId == "r4");
        REQUIRE(recordNames(aopt.outputBam) == std::vector<std::string>{"r3", "r4"});
      }
    }

    WHEN("the contig is not in the header") {
      aopt.chrom = "chr9";
      std::vector<ReadTagRow> readTags;
      THEN("tagging fails with an alignment error") {
        REQUIRE_THROWS_AS(tagAlignments(aopt, corrected, readTags), AlignmentIOError);
      }
    }
    boost::filesystem::remove_all(dir);
  }

  GIVEN("grouped reads and their corrected UMIs") {
    umiclust::grouping::GroupedReads grouped;
    grouped.reads.push_back(makeRead("r1", "AAAT", "BC1", "G1"));
    grouped.reads.push_back(makeRead("r2", "AAAA", "BC1", "G1"));
    grouped.reads[0].transcript = "T1";
    std::vector<std::string> correctedUmis{"AAAA", "AAAA"};

    UmiClustOpts aopt;
    aopt.jointLog = makeTestLogger();

    THEN("the correction map is keyed by read id") {
      auto corrected = buildCorrectedReadMap(grouped, correctedUmis, aopt);
      REQUIRE(corrected.size() == 2);
      REQUIRE(corrected.at("r1").umi == "AAAA");
      REQUIRE(corrected.at("r1").gene == "G1");
      REQUIRE(corrected.at("r1").transcript == "T1");
      REQUIRE(corrected.at("r1").barcode == "BC1");
      REQUIRE(aopt.stats.duplicateReadIds == 0);
    }

    WHEN("a read id is listed twice") {
      grouped.reads.push_back(makeRead("r1", "AAAT", "BC1", "G1"));
      correctedUmis.push_back("AAAA");
      auto corrected = buildCorrectedReadMap(grouped, correctedUmis, aopt);

      THEN("it is kept once and counted as a duplicate") {
        REQUIRE(corrected.size() == 2);
        REQUIRE(aopt.stats.duplicateReadIds == 1);
        REQUIRE(corrected.at("r1").transcript == "-");
      }
    }
  }
}
