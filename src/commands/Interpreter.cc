#include "Interpreter.hh"
#include "CommandException.hh"
#include "Setting.hh"

#include <algorithm>
#include <bit>
#include <cassert>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace gbcore {

// See comments in traceProc()
namespace {
	struct Trace {
		uintptr_t id;
		Setting* setting;
	};
}
static std::vector<Trace> traces; // sorted on id
static uintptr_t traceCount = 0;

Interpreter::Interpreter()
	: interp(Tcl_CreateInterp())
{
	Tcl_Preserve(interp);
}

Interpreter::~Interpreter()
{
	if (!Tcl_InterpDeleted(interp)) {
		Tcl_DeleteInterp(interp);
	}
	Tcl_Release(interp);

	// Tcl_Finalize() should only be called once for the whole application.
	// The unittests create and destroy multiple Interpreters.
	static bool scheduled = false;
	if (!scheduled) {
		scheduled = true;
		atexit(Tcl_Finalize);
	}
}

TclObject Interpreter::execute(std::string_view command)
{
	if (Tcl_EvalEx(interp, command.data(), int(command.size()), TCL_EVAL_GLOBAL) != TCL_OK) {
		throw CommandException(Tcl_GetStringResult(interp));
	}
	return TclObject(Tcl_GetObjResult(interp));
}

static void setVar(Tcl_Interp* interp, const TclObject& name, const TclObject& value)
{
	if (!Tcl_ObjSetVar2(interp, name.getTclObjectNonConst(), nullptr,
		            value.getTclObjectNonConst(),
		            TCL_GLOBAL_ONLY | TCL_LEAVE_ERR_MSG)) {
		// might contain error message of a trace proc
		std::cerr << Tcl_GetStringResult(interp) << '\n';
	}
}
static Tcl_Obj* getVar(Tcl_Interp* interp, const TclObject& name)
{
	return Tcl_ObjGetVar2(interp, name.getTclObjectNonConst(), nullptr,
	                      TCL_GLOBAL_ONLY);
}

void Interpreter::setVariable(const TclObject& name, const TclObject& value)
{
	if (!Tcl_ObjSetVar2(interp, name.getTclObjectNonConst(), nullptr,
		            value.getTclObjectNonConst(),
		            TCL_GLOBAL_ONLY | TCL_LEAVE_ERR_MSG)) {
		throw CommandException(Tcl_GetStringResult(interp));
	}
}

void Interpreter::unsetVariable(const char* name)
{
	Tcl_UnsetVar(interp, name, TCL_GLOBAL_ONLY);
}

void Interpreter::registerSetting(Setting& variable)
{
	const auto& name = variable.getNameObj();
	if (Tcl_Obj* tclVarValue = getVar(interp, name)) {
		// Tcl var already existed, use this value
		try {
			variable.setValueDirect(TclObject(tclVarValue));
		} catch (CommandException& e) {
			std::cerr << "Ignoring initial value of " << variable.getName()
			          << ": " << e.getMessage() << '\n';
		}
	}
	setVariable(name, variable.getValue());

	uintptr_t traceID = traceCount++;
	traces.push_back(Trace{traceID, &variable}); // still in sorted order
	Tcl_TraceVar(interp, variable.getName().data(), // 0-terminated
	             TCL_TRACE_READS | TCL_TRACE_WRITES | TCL_TRACE_UNSETS,
	             traceProc, std::bit_cast<ClientData>(traceID));
}

void Interpreter::unregisterSetting(Setting& variable)
{
	auto it = std::ranges::find(traces, &variable, &Trace::setting);
	assert(it != traces.end());
	uintptr_t traceID = it->id;
	traces.erase(it);

	const char* name = variable.getName().data(); // 0-terminated
	Tcl_UntraceVar(interp, name,
	               TCL_TRACE_READS | TCL_TRACE_WRITES | TCL_TRACE_UNSETS,
	               traceProc, std::bit_cast<ClientData>(traceID));
	unsetVariable(name);
}

static Setting* getTraceSetting(uintptr_t traceID)
{
	auto it = std::ranges::lower_bound(traces, traceID, {}, &Trace::id);
	return ((it != traces.end()) && (it->id == traceID)) ? it->setting : nullptr;
}

char* Interpreter::traceProc(ClientData clientData, Tcl_Interp* interp,
                             const char* part1, const char* /*part2*/, int flags)
{
	// Lookup the Setting object that belongs to this Tcl variable. The
	// clientData is an ID rather than a Setting pointer: Tcl may still
	// deliver an unset trace after the Setting was destroyed, the lookup
	// then fails and the callback is ignored.
	auto traceID = std::bit_cast<uintptr_t>(clientData);
	auto* variable = getTraceSetting(traceID);
	if (!variable) return nullptr;

	const TclObject& part1Obj = variable->getNameObj();

	static std::string static_string;
	if (flags & TCL_TRACE_READS) {
		setVar(interp, part1Obj, variable->getValue());
	}
	if (flags & TCL_TRACE_WRITES) {
		try {
			Tcl_Obj* v = getVar(interp, part1Obj);
			TclObject newValue(v ? v : Tcl_NewObj());
			variable->setValueDirect(newValue);
			const TclObject& newValue2 = variable->getValue();
			if (newValue != newValue2) {
				setVar(interp, part1Obj, newValue2);
			}
		} catch (CoreException& e) {
			// restore the old value and report the error to Tcl
			setVar(interp, part1Obj, variable->getValue());
			static_string = std::move(e).getMessage();
			return const_cast<char*>(static_string.c_str());
		}
	}
	if ((flags & TCL_TRACE_UNSETS) && !(flags & TCL_INTERP_DESTROYED)) {
		try {
			variable->setValueDirect(variable->getDefaultValue());
		} catch (CoreException& e) {
			std::cerr << "Can't restore default of " << variable->getName()
			          << ": " << e.getMessage() << '\n';
		}
		setVar(interp, part1Obj, variable->getValue());
		Tcl_TraceVar(interp, part1, TCL_TRACE_READS |
		                TCL_TRACE_WRITES | TCL_TRACE_UNSETS,
		             traceProc,
		             std::bit_cast<ClientData>(traceID));
	}
	return nullptr;
}

} // namespace gbcore
