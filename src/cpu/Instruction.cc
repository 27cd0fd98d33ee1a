#include "Instruction.hh"
#include "DecodeFault.hh"

namespace gbcore {

Condition Condition::get(CondCode code, ConditionEncoding encoding)
{
	using enum ConditionEncoding;
	switch (code) {
	case COND_NZ:
		return (encoding == MASK) ? Condition{CPURegs::N_FLAG | CPURegs::Z_FLAG, false}
		                          : Condition{CPURegs::Z_FLAG, true};
	case COND_Z:
		return {CPURegs::Z_FLAG, false};
	case COND_NC:
		return (encoding == MASK) ? Condition{CPURegs::N_FLAG | CPURegs::C_FLAG, false}
		                          : Condition{CPURegs::C_FLAG, true};
	case COND_C:
		return {CPURegs::C_FLAG, false};
	default:
		throw DecodeFault("Invalid condition code ", int(code));
	}
}

} // namespace gbcore
