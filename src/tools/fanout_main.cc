// teepipe_fanout: copy stdin to N lossy readers, each drained into its own file
// (<output_prefix>.N) or, without a prefix, into stdout.
#include <csignal>
#include <exception>
#include <iostream>
#include <string>

#include <unistd.h>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "common/configuration.h"
#include "tools/fanout.h"

using namespace Teepipe;

int main(int argc, char* argv[]) {
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();
	FLAGS_logtostderr = 1;
	// A closed output should fail that reader's WriteTo with EPIPE, not kill the process.
	std::signal(SIGPIPE, SIG_IGN);

	cxxopts::Options options("teepipe_fanout", "Copy stdin to several lossy readers");
	options.allow_unrecognised_options();
	options.add_options()
		("config", "YAML configuration file", cxxopts::value<std::string>())
		("lowwater", "Chunks to coalesce per read when a reader is idle", cxxopts::value<int>())
		("highwater", "Per-reader queue capacity in chunks", cxxopts::value<int>())
		("chunk_size", "Bytes read from stdin per write", cxxopts::value<size_t>())
		("num_readers", "Number of readers", cxxopts::value<int>())
		("timeout_ms", "Cancel each reader after this many ms (0: never)", cxxopts::value<int>())
		("o,output_prefix", "Write reader N to <prefix>.N; required with more than one reader (default: stdout)", cxxopts::value<std::string>())
		("l,log_level", "Verbose log level", cxxopts::value<int>()->default_value("0"))
		("h,help", "Print usage");

	Configuration& config = Configuration::getInstance();
	try {
		auto result = options.parse(argc, argv);
		if (result.count("help")) {
			std::cout << options.help() << std::endl;
			return 0;
		}
		FLAGS_v = result["log_level"].as<int>();
		if (result.count("output_prefix")) {
			config.config().fanout.output_prefix.set(result["output_prefix"].as<std::string>());
		}
	} catch (const std::exception& e) {
		// cxxopts rejects e.g. a negative --chunk_size before getopt sees it
		LOG(ERROR) << "Invalid command line: " << e.what();
		return 1;
	}

	config.overrideFromCommandLine(argc, argv);
	return RunFanout(config.config(), STDIN_FILENO);
}
