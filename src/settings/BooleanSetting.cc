#include "BooleanSetting.hh"

namespace gbcore {

BooleanSetting::BooleanSetting(
		Interpreter& interpreter_, CliComm& cliComm_, std::string_view name,
		bool initialValue)
	: Setting(interpreter_, cliComm_, name,
	          TclObject(toString(initialValue)))
{
	auto& interp = getInterpreter();
	setChecker([&interp](TclObject& newValue) {
		// May throw.
		// Re-set the queried value to get a normalized value.
		newValue = toString(newValue.getBoolean(interp));
	});
	init();
}

std::string_view BooleanSetting::getTypeString() const
{
	return "boolean";
}

} // namespace gbcore
