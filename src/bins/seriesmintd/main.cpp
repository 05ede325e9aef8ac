/*
Copyright (c) [2023-2024] [Sparq Network]

This software is distributed under the MIT License.
See the LICENSE.txt file in the project root for more information.
*/

#include <filesystem>
#include <iostream>
#include <string>

#include "src/seriesmanager.h"

namespace po = boost::program_options;

int main(int argc, char* argv[]) {
  const po::options_description desc = SeriesMint::makeOptionsDescription();
  try {
    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
    po::notify(vm);

    if (vm.count("help")) {
      std::cout << desc << std::endl;
      return 0;
    }
    if (vm.count("verbose")) Utils::logToCout = true;

    const std::string rootPath = vm["root-path"].as<std::string>();
    std::filesystem::create_directories(rootPath);
    Logger::setLogFile(rootPath + "/debug.txt");

    const Options options = SeriesMint::applyOverrides(Options::fromFile(rootPath), SeriesMint::parseOverrides(vm));
    Logger::setLogLevel(options.getLogLevel());
    Logger::logToDebug(LogType::INFO, Log::seriesmintd, __func__,
      "Starting " + options.getWeb3ClientVersion() + " on chain " + std::to_string(options.getChainID())
    );

    SeriesMint::Manager manager(options);
    std::cout << "Deployed ERC721Series at: " << manager.deploy().hex(true) << std::endl;
    for (const auto& [tokenId, uri] : manager.mint(vm["mint"].as<uint64_t>())) {
      std::cout << "Minted token " << tokenId << ": " << uri << std::endl;
    }
    std::cout << manager.summary().dump(2) << std::endl;
  } catch (const std::exception& e) {
    Logger::logToDebug(LogType::ERROR, Log::seriesmintd, __func__, std::string("Fatal: ") + e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
