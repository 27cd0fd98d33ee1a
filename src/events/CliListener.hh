#ifndef CLILISTENER_HH
#define CLILISTENER_HH

#include "CliComm.hh"

namespace gbcore {

/** Receiver of everything that is sent through a GlobalCliComm. Both
  * callbacks may be invoked from any thread that logs, but never
  * concurrently. */
class CliListener
{
public:
	CliListener(const CliListener&) = delete;
	CliListener(CliListener&&) = delete;
	CliListener& operator=(const CliListener&) = delete;
	CliListener& operator=(CliListener&&) = delete;

	virtual ~CliListener() = default;

	virtual void log(CliComm::LogLevel level, std::string_view message) noexcept = 0;

	virtual void update(CliComm::UpdateType type, std::string_view name,
	                    std::string_view value) noexcept = 0;

protected:
	CliListener() = default;
};

} // namespace gbcore

#endif
