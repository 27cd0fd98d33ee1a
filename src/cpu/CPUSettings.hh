#ifndef CPUSETTINGS_HH
#define CPUSETTINGS_HH

#include "ALU.hh"
#include "BooleanSetting.hh"
#include "EnumSetting.hh"
#include "Instruction.hh"

namespace gbcore {

class CliComm;
class Interpreter;

/** The user visible configuration of the CPU core, exposed as the Tcl
  * variables cpu_condition_encoding, cpu_subtract_flags and cpu_trace.
  */
class CPUSettings
{
public:
	CPUSettings(Interpreter& interpreter, CliComm& cliComm);

	[[nodiscard]] EnumSetting<ConditionEncoding>& getConditionEncodingSetting() { return conditionEncoding; }
	[[nodiscard]] EnumSetting<SubtractFlags>& getSubtractFlagsSetting() { return subtractFlags; }
	[[nodiscard]] BooleanSetting& getTraceSetting() { return trace; }

	[[nodiscard]] ConditionEncoding getConditionEncoding() const { return conditionEncoding.getEnum(); }
	[[nodiscard]] SubtractFlags getSubtractFlags() const { return subtractFlags.getEnum(); }
	[[nodiscard]] bool getTrace() const { return trace.getBoolean(); }

private:
	EnumSetting<ConditionEncoding> conditionEncoding;
	EnumSetting<SubtractFlags> subtractFlags;
	BooleanSetting trace;
};

} // namespace gbcore

#endif
