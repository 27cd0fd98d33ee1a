#include "CliComm.hh"

namespace gbcore {

void CliComm::printInfo(std::string_view message)
{
	log(LogLevel::INFO, message);
}

void CliComm::printWarning(std::string_view message)
{
	log(LogLevel::WARNING, message);
}

void CliComm::printError(std::string_view message)
{
	log(LogLevel::LOGLEVEL_ERROR, message);
}

} // namespace gbcore
