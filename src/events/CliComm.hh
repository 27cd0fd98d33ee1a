#ifndef CLICOMM_HH
#define CLICOMM_HH

#include "strCat.hh"

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

namespace gbcore {

class CliComm
{
public:
	enum class LogLevel : uint8_t {
		INFO,
		WARNING,
		LOGLEVEL_ERROR, // ERROR may give preprocessor name clashes
		NUM // must be last
	};
	enum class UpdateType : uint8_t {
		SETTING,
		STATUS,
		NUM // must be last
	};

	virtual void log(LogLevel level, std::string_view message) = 0;
	/** Report a change of state, e.g. a setting that got a new value or
	  * the CPU core that halted. */
	virtual void update(UpdateType type, std::string_view name,
	                    std::string_view value) = 0;

	// convenience methods (shortcuts for log())
	void printInfo   (std::string_view message);
	void printWarning(std::string_view message);
	void printError  (std::string_view message);

	// These overloads are (only) needed for efficiency, because otherwise
	// the templated overload below is a better match than the 'string_view'
	// overload above (and we don't want to construct a temp string).
	void printInfo(const char* message) {
		printInfo(std::string_view(message));
	}
	void printWarning(const char* message) {
		printWarning(std::string_view(message));
	}
	void printError(const char* message) {
		printError(std::string_view(message));
	}

	template<typename... Args>
	void printInfo(Args&& ...args) {
		auto tmp = strCat(std::forward<Args>(args)...);
		printInfo(std::string_view(tmp));
	}
	template<typename... Args>
	void printWarning(Args&& ...args) {
		auto tmp = strCat(std::forward<Args>(args)...);
		printWarning(std::string_view(tmp));
	}
	template<typename... Args>
	void printError(Args&& ...args) {
		auto tmp = strCat(std::forward<Args>(args)...);
		printError(std::string_view(tmp));
	}

	// string representations of the LogLevel and UpdateType enums
	[[nodiscard]] static std::string_view toString(LogLevel level) {
		static constexpr std::array<std::string_view, size_t(LogLevel::NUM)> levelStr = {
			"info", "warning", "error"
		};
		return levelStr[std::to_underlying(level)];
	}
	[[nodiscard]] static std::string_view toString(UpdateType type) {
		static constexpr std::array<std::string_view, size_t(UpdateType::NUM)> updateStr = {
			"setting", "status"
		};
		return updateStr[std::to_underlying(type)];
	}

protected:
	CliComm() = default;
	~CliComm() = default;
};

} // namespace gbcore

#endif
