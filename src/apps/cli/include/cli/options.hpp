#pragma once

#include "core/types.hpp"

#include <boost/program_options.hpp>

#include <string>
#include <vector>

namespace ttt::cli {

//! Command line settings of the terminal game.
struct Options {
	std::string startPlayer{"X"}; //!< Raw designator of the mark that moves first.
	bool help{false};             //!< Print usage and exit.

	//! Options bound to the members of this struct.
	boost::program_options::options_description makeOptionsDescription();

	//! Starting mark. Unknown designators fall back to X.
	Mark startingMark() const;
};

//! Parse the command line into options.
//! \note Throws boost::program_options::error on unknown options or missing values.
Options parseOptions(const std::vector<std::string>& args);

} // namespace ttt::cli
