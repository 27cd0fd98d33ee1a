#ifndef GLOBALCLICOMM_HH
#define GLOBALCLICOMM_HH

#include "CliComm.hh"

#include <memory>
#include <mutex>
#include <vector>

namespace gbcore {

class CliListener;

/** Distributes log messages and state updates to all registered
  * listeners. Without listeners messages are printed on std::cerr.
  */
class GlobalCliComm final : public CliComm
{
public:
	GlobalCliComm(const GlobalCliComm&) = delete;
	GlobalCliComm& operator=(const GlobalCliComm&) = delete;

	GlobalCliComm() = default;
	~GlobalCliComm();

	CliListener* addListener(std::unique_ptr<CliListener> listener);
	std::unique_ptr<CliListener> removeListener(CliListener& listener);

	// CliComm
	void log(LogLevel level, std::string_view message) override;
	void update(UpdateType type, std::string_view name,
	            std::string_view value) override;

private:
	std::vector<std::unique_ptr<CliListener>> listeners; // unordered
	std::mutex mutex; // lock access to listeners member
	bool delivering = false;
};

} // namespace gbcore

#endif
