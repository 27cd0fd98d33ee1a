#ifndef INTERPRETER_HH
#define INTERPRETER_HH

#include "TclObject.hh"

#include <tcl.h>

#include <string_view>

namespace gbcore {

class Setting;

/** Owns a Tcl interpreter. Settings registered here are mirrored in a
  * global Tcl variable with the same name: reading the variable returns
  * the setting value, writing it goes through the setting's checker.
  */
class Interpreter
{
public:
	Interpreter();
	Interpreter(const Interpreter&) = delete;
	Interpreter(Interpreter&&) = delete;
	Interpreter& operator=(const Interpreter&) = delete;
	Interpreter& operator=(Interpreter&&) = delete;
	~Interpreter();

	/** Evaluate a Tcl script, throws CommandException on error. */
	TclObject execute(std::string_view command);

	void setVariable(const TclObject& name, const TclObject& value);
	void unsetVariable(const char* name);
	void registerSetting(Setting& variable);
	void unregisterSetting(Setting& variable);

private:
	static char* traceProc(ClientData clientData, Tcl_Interp* interp,
	                       const char* part1, const char* part2, int flags);

	Tcl_Interp* interp;

	friend class TclObject;
};

} // namespace gbcore

#endif
