#ifndef PROGRAM_OPTIONS_GENERATOR_HPP
#define PROGRAM_OPTIONS_GENERATOR_HPP

#include <boost/program_options.hpp>
#include "UmiClustOpts.hpp"

namespace umiclust {
namespace po = boost::program_options;
class ProgramOptionsGenerator{
public:
  po::options_description getBasicOptions(UmiClustOpts& aopt);
  po::options_description getInputOptions(UmiClustOpts& aopt);
  po::options_description getClusteringOptions(UmiClustOpts& aopt);
  po::options_description getOutputOptions(UmiClustOpts& aopt);
  po::options_description getHiddenOptions(UmiClustOpts& aopt);
};

}

#endif // PROGRAM_OPTIONS_GENERATOR_HPP
