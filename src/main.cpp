#include <rpcreflect/server/daemon_run.hpp>

int main(int argc, char* argv[]) { return rpcreflect::server::DaemonMain(argc, argv); }
