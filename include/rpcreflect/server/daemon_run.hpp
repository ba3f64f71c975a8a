#pragma once

/// @file rpcreflect/server/daemon_run.hpp
/// @brief Entry point of the reflection server

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>

RPCREFLECT_NAMESPACE_BEGIN

namespace server {

/// Command line options shared by all reflection server binaries
boost::program_options::options_description BaseRunOptions();

/// Parses the command line and runs the server until it is shut down
int DaemonMain(int argc, const char* const argv[]);

/// Runs the server with an already parsed command line
int DaemonMain(const boost::program_options::variables_map& vm);

}  // namespace server

RPCREFLECT_NAMESPACE_END
