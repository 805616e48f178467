#include "server/serverConfig.hpp"

#include <charconv>
#include <format>
#include <limits>

namespace ttt::server {

static constexpr std::string_view FLAG_PORT            = "--port";
static constexpr std::string_view FLAG_MAX_CONNECTIONS = "--max-connections";
static constexpr std::string_view FLAG_TICK_MS         = "--tick-ms";
static constexpr std::string_view FLAG_ENFORCE_SEATS   = "--enforce-seats";
static constexpr std::string_view FLAG_HELP            = "--help";

static std::optional<std::uint64_t> parseNumber(std::string_view value, std::uint64_t min, std::uint64_t max) {
	if (value.empty()) {
		return {};
	}
	std::uint64_t parsed = 0;
	const auto* end      = value.data() + value.size();
	const auto [ptr, ec] = std::from_chars(value.data(), end, parsed);
	if (ec != std::errc() || ptr != end || parsed < min || parsed > max) {
		return {};
	}
	return parsed;
}

std::vector<std::string_view> collectArguments(int argc, const char* const* argv) {
	if (argc <= 1 || argv == nullptr) {
		return {};
	}
	return std::vector<std::string_view>(argv + 1, argv + argc);
}

std::optional<ParsedArguments> parseArguments(const std::vector<std::string_view>& args) {
	ParsedArguments parsed{};

	for (std::size_t i = 0; i < args.size(); ++i) {
		const auto flag = args[i];

		if (flag == FLAG_HELP) {
			parsed.showHelp = true;
			continue;
		}
		if (flag == FLAG_ENFORCE_SEATS) {
			parsed.config.enforceSeats = true;
			continue;
		}

		// Remaining flags take a value.
		if (i + 1 == args.size()) {
			return {};
		}
		const auto value = args[++i];

		if (flag == FLAG_PORT) {
			// Port 0 lets the OS choose.
			const auto port = parseNumber(value, 0u, std::numeric_limits<std::uint16_t>::max());
			if (!port) {
				return {};
			}
			parsed.config.port = static_cast<std::uint16_t>(*port);
		} else if (flag == FLAG_MAX_CONNECTIONS) {
			const auto count = parseNumber(value, 1u, 100'000u);
			if (!count) {
				return {};
			}
			parsed.config.maxConnections = static_cast<std::size_t>(*count);
		} else if (flag == FLAG_TICK_MS) {
			const auto ms = parseNumber(value, 1u, 10'000u);
			if (!ms) {
				return {};
			}
			parsed.config.tickInterval = std::chrono::milliseconds{*ms};
		} else {
			return {};
		}
	}

	return parsed;
}

std::string usage(std::string_view program) {
	const ServerConfig defaults{};
	return std::format("Usage: {} [options]\n"
	                   "  {} <n>            Listening port (default {}).\n"
	                   "  {} <n> Maximum concurrent connections (default {}).\n"
	                   "  {} <n>         Server tick period in milliseconds (default {}).\n"
	                   "  {}         Only accept moves for the seat of the sending connection.\n"
	                   "  {}                Show this text.\n",
	                   program, FLAG_PORT, defaults.port, FLAG_MAX_CONNECTIONS, defaults.maxConnections, FLAG_TICK_MS, defaults.tickInterval.count(),
	                   FLAG_ENFORCE_SEATS, FLAG_HELP);
}

} // namespace ttt::server
