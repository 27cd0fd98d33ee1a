#include "TclObject.hh"
#include "Interpreter.hh"
#include "CommandException.hh"

namespace gbcore {

std::string_view TclObject::getString() const
{
	int length;
	const char* buf = Tcl_GetStringFromObj(obj, &length);
	return {buf, size_t(length)};
}

bool TclObject::getBoolean(Interpreter& interp_) const
{
	auto* interp = interp_.interp;
	int result;
	if (Tcl_GetBooleanFromObj(interp, obj, &result) != TCL_OK) {
		throw CommandException(Tcl_GetStringResult(interp));
	}
	return result != 0;
}

} // namespace gbcore
