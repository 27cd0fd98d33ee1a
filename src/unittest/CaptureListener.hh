#ifndef CAPTURELISTENER_HH
#define CAPTURELISTENER_HH

#include "CliListener.hh"

#include <string>
#include <utility>
#include <vector>

namespace gbcore {

// Records everything sent through a GlobalCliComm, for inspection in tests.
class CaptureListener final : public CliListener
{
public:
	struct Message {
		CliComm::LogLevel level;
		std::string text;
	};
	struct Update {
		CliComm::UpdateType type;
		std::string name;
		std::string value;
	};

	void log(CliComm::LogLevel level, std::string_view message) noexcept override {
		messages.push_back({level, std::string(message)});
	}
	void update(CliComm::UpdateType type, std::string_view name,
	            std::string_view value) noexcept override {
		updates.push_back({type, std::string(name), std::string(value)});
	}

	[[nodiscard]] size_t count(CliComm::LogLevel level) const {
		size_t result = 0;
		for (const auto& m : messages) {
			if (m.level == level) ++result;
		}
		return result;
	}

	std::vector<Message> messages;
	std::vector<Update> updates;
};

} // namespace gbcore

#endif
