#ifndef COREEXCEPTION_HH
#define COREEXCEPTION_HH

#include "strCat.hh"

#include <concepts>
#include <string>
#include <type_traits>
#include <utility>

namespace gbcore {

class CoreException
{
public:
	explicit CoreException() = default;

	explicit CoreException(std::string message_)
		: message(std::move(message_)) {}

	template<typename T, typename... Args>
		requires(!std::same_as<CoreException, std::remove_cvref_t<T>>) // don't block copy-constructor
	explicit CoreException(T&& t, Args&&... args)
		: message(strCat(std::forward<T>(t), std::forward<Args>(args)...))
	{
	}

	[[nodiscard]] const std::string& getMessage() const &  { return message; }
	[[nodiscard]]       std::string  getMessage()       && { return std::move(message); }

private:
	std::string message;
};

} // namespace gbcore

#endif
