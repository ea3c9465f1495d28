/**
>HEADER
    Copyright (c) 2020-2024 The umiclust developers

    This file is part of umiclust.

    umiclust is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    umiclust is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with umiclust.  If not, see <http://www.gnu.org/licenses/>.
<HEADER
**/

#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <boost/program_options.hpp>

#include "spdlog/spdlog.h"
#include "spdlog/fmt/fmt.h"

#include "AnnotationReader.hpp"
#include "BatchDispatcher.hpp"
#include "GroupPartitioner.hpp"
#include "InterruptSignals.hpp"
#include "ProgramOptionsGenerator.hpp"
#include "ReadTagger.hpp"
#include "UmiClustConfig.hpp"
#include "UmiClustExceptions.hpp"
#include "UmiClustOpts.hpp"
#include "UmiClustUtils.hpp"

namespace po = boost::program_options;

int runUmiClust(UmiClustOpts& aopt) {
  auto reads = umiclust::annotation::loadReadTuples(aopt);
  auto grouped = umiclust::grouping::groupReads(std::move(reads), aopt);
  aopt.jointLog->info("Grouped {} reads into {} gene and cell groups",
                      aopt.stats.usedReads, aopt.stats.numGroups);

  std::vector<std::string> correctedUmis;
  {
    InterruptSignals signals;
    signals.setup();
    umiclust::dispatch::BatchDispatcher dispatcher(aopt, InterruptSignals::interrupted());
    try {
      correctedUmis = dispatcher.run(grouped);
    } catch (const DispatchInterrupted&) {
      signals.reset();
      throw;
    }
    signals.reset();
  }

  auto correctedReads = umiclust::tagging::buildCorrectedReadMap(grouped, correctedUmis, aopt);
  aopt.jointLog->info("{} reads carry a corrected UMI", correctedReads.size());

  std::vector<umiclust::tagging::ReadTagRow> readTags;
  umiclust::tagging::tagAlignments(aopt, correctedReads, readTags);
  umiclust::tagging::writeReadTags(aopt.outputReadTags, readTags);
  aopt.jointLog->info("Wrote {} rows to {}", readTags.size(),
                      aopt.outputReadTags.string());

  umiclust::utils::logRunStats(aopt);
  return 0;
}

int main(int argc, char* argv[]) {
  UmiClustOpts aopt;
  umiclust::ProgramOptionsGenerator pogen;

  auto basicOpt = pogen.getBasicOptions(aopt);
  auto inputOpt = pogen.getInputOptions(aopt);
  auto clusterOpt = pogen.getClusteringOptions(aopt);
  auto outputOpt = pogen.getOutputOptions(aopt);
  auto hiddenOpt = pogen.getHiddenOptions(aopt);

  po::options_description all("umiclust options");
  all.add(basicOpt).add(inputOpt).add(clusterOpt).add(outputOpt).add(hiddenOpt);

  po::options_description visible("umiclust options");
  visible.add(basicOpt).add(inputOpt).add(clusterOpt).add(outputOpt);

  po::positional_options_description pd;
  pd.add("bam", 1);

  po::variables_map vm;
  int rc{0};
  try {
    auto orderedOptions =
        po::command_line_parser(argc, argv).options(all).positional(pd).run();

    po::store(orderedOptions, vm);

    if (vm.count("help")) {
      auto hstring = R"(
umiclust
==========
Directional UMI error correction for tagged single-cell alignments.

Usage: umiclust [options] <bam>
)";

      std::cout << hstring << std::endl;
      std::cout << visible << std::endl;
      std::exit(0);
    }
    if (vm.count("version")) {
      std::cout << "umiclust " << umiclust::version << "\n";
      std::exit(0);
    }

    po::notify(vm);

    if (!umiclust::utils::processUmiClustOpts(aopt, vm)) {
      fmt::print(stderr, "Exiting now: invalid options.\n");
      std::exit(1);
    }

    rc = runUmiClust(aopt);
    aopt.jointLog->flush();
    spdlog::drop_all();

  } catch (po::error& e) {
    std::cerr << "Exception : [" << e.what() << "]. Exiting.\n";
    std::exit(1);
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "logger failed with : [" << ex.what() << "]. Exiting.\n";
    std::exit(1);
  } catch (const DispatchInterrupted& e) {
    if (aopt.jointLog) {
      aopt.jointLog->error("{}", e.what());
      aopt.jointLog->flush();
    } else {
      std::cerr << e.what() << "\n";
    }
    std::exit(1);
  } catch (std::exception& e) {
    if (aopt.jointLog) {
      aopt.jointLog->error("{}", e.what());
      aopt.jointLog->flush();
    }
    std::cerr << "Exception : [" << e.what() << "]\n";
    std::cerr << "For usage information, try " << argv[0]
              << " --help\nExiting.\n";
    std::exit(1);
  }

  return rc;
}
