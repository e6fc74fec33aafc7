#ifndef __NOMAD_COMMAND_LINE__
#define __NOMAD_COMMAND_LINE__

#include <cxxopts.hpp>

#include "Headers.hpp"
#include "SetupConfig.hpp"

namespace nomad {
/**
 * @brief Adds help, version, config and logging flags shared by every tool.
 */
void addCommonOptions(cxxopts::Options* options);

/**
 * @brief Builds the config from the INI file and environment, then applies
 * the shared command-line flags.  Exits with 1 if an explicit --cfgfile
 * cannot be loaded.
 */
SetupConfig loadConfig(const cxxopts::ParseResult& result);

/**
 * @brief Points the default logger at a log file and applies verbosity.
 */
void configureLogging(el::Configurations* defaultConf,
                      const SetupConfig& config, const string& logPrefix);

/**
 * @brief Prints --help or --version and exits if either was requested.
 */
void handleInfoOptions(const cxxopts::ParseResult& result,
                       const cxxopts::Options& options, const string& name);

[[noreturn]] void handleParseException(const std::exception& e,
                                       const cxxopts::Options& options);
}  // namespace nomad

#endif  // __NOMAD_COMMAND_LINE__
