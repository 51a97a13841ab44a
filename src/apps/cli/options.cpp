#include "cli/options.hpp"

#include "core/notation.hpp"

namespace ttt::cli {

namespace po = boost::program_options;

po::options_description Options::makeOptionsDescription() {
	po::options_description desc("Tic-Tac-Toe options");

	// clang-format off
	desc.add_options()
		("help,h", po::bool_switch(&help), "print this help message")
		("start-player,s", po::value<std::string>(&startPlayer)->default_value("X"), "player to start the game, X or O");
	// clang-format on
	return desc;
}

Mark Options::startingMark() const {
	return markOrDefault(startPlayer);
}

Options parseOptions(const std::vector<std::string>& args) {
	Options options;
	const auto desc = options.makeOptionsDescription();

	po::variables_map vm;
	po::store(po::command_line_parser(args).options(desc).run(), vm);
	po::notify(vm);

	return options;
}

} // namespace ttt::cli
