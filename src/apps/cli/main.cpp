#include "cli/commandLoop.hpp"
#include "cli/options.hpp"

#include "Logging.hpp"

#include <boost/program_options.hpp>

#include <format>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
	namespace po = boost::program_options;

	ttt::cli::Options options;
	try {
		options = ttt::cli::parseOptions(std::vector<std::string>(argv + 1, argv + argc));
	} catch (const po::error& e) {
		ttt::cli::Logger().Log(Logging::LogLevel::Error, std::format("[Main] Invalid command line: {}", e.what()));
		std::cerr << e.what() << "\n\n" << ttt::cli::Options{}.makeOptionsDescription() << std::endl;
		return 1;
	}

	if (options.help) {
		std::cout << options.makeOptionsDescription() << std::endl;
		return 0;
	}

	ttt::Game game(options.startingMark());
	ttt::cli::CommandLoop loop(game, std::cin, std::cout);
	loop.run();

	return 0;
}
