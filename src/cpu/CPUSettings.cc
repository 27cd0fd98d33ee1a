#include "CPUSettings.hh"

namespace gbcore {

CPUSettings::CPUSettings(Interpreter& interpreter, CliComm& cliComm)
	// 'conventional' tests only Z or C for NZ/NC, 'mask' also requires N
	: conditionEncoding(interpreter, cliComm, "cpu_condition_encoding",
		ConditionEncoding::CONVENTIONAL,
		EnumSetting<ConditionEncoding>::Map{
			{"conventional", ConditionEncoding::CONVENTIONAL},
			{"mask",         ConditionEncoding::MASK}})
	// 'borrow' sets H and C after a subtraction on a borrow,
	// 'no_borrow' sets them when there is none
	, subtractFlags(interpreter, cliComm, "cpu_subtract_flags",
		SubtractFlags::BORROW,
		EnumSetting<SubtractFlags>::Map{
			{"borrow",    SubtractFlags::BORROW},
			{"no_borrow", SubtractFlags::NO_BORROW}})
	// log every executed instruction together with the registers
	, trace(interpreter, cliComm, "cpu_trace", false)
{
}

} // namespace gbcore
