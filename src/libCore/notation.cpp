#include "core/notation.hpp"

#include "Logging.hpp"

#include <cctype>
#include <charconv>
#include <format>
#include <limits>

namespace ttt {

static std::string_view trim(std::string_view s) {
	while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
		s.remove_prefix(1);
	}
	while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
		s.remove_suffix(1);
	}
	return s;
}

//! Strict unsigned parse of the full token. A single leading '+' is allowed.
//! \note Numbers too large for Id map to the largest Id so they stay off board instead of being malformed.
static std::optional<Id> parseIndex(std::string_view s) {
	s = trim(s);
	if (!s.empty() && s.front() == '+') {
		s.remove_prefix(1);
	}
	if (s.empty()) {
		return {};
	}

	Id value             = 0u;
	const auto* end      = s.data() + s.size();
	const auto [ptr, ec] = std::from_chars(s.data(), end, value);
	if (ptr != end) {
		return {};
	}
	if (ec == std::errc::result_out_of_range) {
		return std::numeric_limits<Id>::max();
	}
	if (ec != std::errc()) {
		return {};
	}
	return value;
}

std::optional<Mark> markFromString(std::string_view s) {
	s = trim(s);
	if (s.size() != 1u) {
		return {};
	}

	switch (std::toupper(static_cast<unsigned char>(s.front()))) {
	case 'X':
		return Mark::X;
	case 'O':
		return Mark::O;
	default:
		return {};
	}
}

Mark markOrDefault(std::string_view s) {
	if (const auto mark = markFromString(s)) {
		return *mark;
	}

	Logger().Log(Logging::LogLevel::Warning, std::format("[Notation] Unknown mark '{}'. Falling back to X.", s));
	return Mark::X;
}

std::string toString(const Mark mark) {
	return mark == Mark::O ? "O" : "X";
}

char toChar(const Board::Cell cell) {
	switch (cell) {
	case Board::Cell::X:
		return 'X';
	case Board::Cell::O:
		return 'O';
	case Board::Cell::Empty:
		break;
	}
	return ' ';
}

std::optional<Coord> parseCoord(std::string_view s) {
	// Expect "row,col"
	const auto commaPos = s.find(',');
	if (commaPos == std::string_view::npos) {
		return {};
	}

	const auto row = parseIndex(s.substr(0, commaPos));
	const auto col = parseIndex(s.substr(commaPos + 1));
	if (!row || !col) {
		return {};
	}
	return Coord{*row, *col};
}

std::string renderBoard(const Board& board) {
	std::string out;
	out.reserve(board.size() * 10u);

	for (Id row = 0u; row != board.size(); ++row) {
		for (Id col = 0u; col != board.size(); ++col) {
			if (col) {
				out += " | ";
			}
			out.push_back(toChar(board.get({row, col})));
		}
		out.push_back('\n');
	}
	return out;
}

} // namespace ttt
