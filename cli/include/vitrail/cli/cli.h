// Vitrail CLI Commands
// Handles: vitrail castle, vitrail walk, vitrail init, vitrail --version

#pragma once

#include <vitrail/cli/project_config.h>
#include <ostream>
#include <string>

namespace vitrail::cli {

// Parse argv and run the selected subcommand. Returns the process exit code.
int handleCommand(int argc, char** argv);

// Generate a castle from the config and print its layout
int runCastle(const ProjectConfig& config, bool asJson, std::ostream& out);

// Generate, build collision and walk forward for a number of fixed ticks
int runWalk(const ProjectConfig& config, int ticks, float dt, std::ostream& out);

// Write the default project file
int writeDefaultConfig(const std::string& path);

} // namespace vitrail::cli
