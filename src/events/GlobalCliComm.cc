#include "GlobalCliComm.hh"
#include "CliListener.hh"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <utility>

namespace gbcore {

GlobalCliComm::~GlobalCliComm()
{
	assert(!delivering);
}

CliListener* GlobalCliComm::addListener(std::unique_ptr<CliListener> listener)
{
	std::scoped_lock lock(mutex);
	auto* p = listener.get();
	listeners.push_back(std::move(listener));
	return p;
}

std::unique_ptr<CliListener> GlobalCliComm::removeListener(CliListener& listener)
{
	std::scoped_lock lock(mutex);
	auto it = std::ranges::find(listeners, &listener,
		[](const auto& ptr) { return ptr.get(); });
	assert(it != listeners.end());
	auto result = std::move(*it);
	*it = std::move(listeners.back());
	listeners.pop_back();
	return result;
}

void GlobalCliComm::log(LogLevel level, std::string_view message)
{
	if (delivering) {
		// Don't allow recursive calls, this would hang while trying to
		// acquire the mutex below. This happens e.g. when a listener
		// itself logs something.
		std::cerr << "Recursive cliComm message: " << message << '\n';
		return;
	}
	delivering = true;

	{
		std::scoped_lock lock(mutex);
		if (!listeners.empty()) {
			for (const auto& l : listeners) {
				l->log(level, message);
			}
		} else {
			// don't let the message get lost
			std::cerr << message << '\n';
		}
	}
	delivering = false;
}

void GlobalCliComm::update(UpdateType type, std::string_view name, std::string_view value)
{
	if (delivering) return;
	delivering = true;
	{
		std::scoped_lock lock(mutex);
		for (const auto& l : listeners) {
			l->update(type, name, value);
		}
	}
	delivering = false;
}

} // namespace gbcore
