#include "StdioMessages.hh"
#include <iostream>

namespace gbcore {

void StdioMessages::log(CliComm::LogLevel level, std::string_view message) noexcept
{
	auto& out = (level == CliComm::LogLevel::INFO) ? std::cout : std::cerr;
	out << CliComm::toString(level) << ": " << message << '\n' << std::flush;
}

void StdioMessages::update(CliComm::UpdateType /*type*/, std::string_view /*name*/,
                           std::string_view /*value*/) noexcept
{
	// ignore
}

} // namespace gbcore
