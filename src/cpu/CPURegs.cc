#include "CPURegs.hh"
#include "ExecutionFault.hh"

namespace gbcore {

[[noreturn]] static void invalidRegister(Reg reg, int width)
{
	throw ExecutionFault("Register code ", int(reg),
	                     " is not a valid ", width, "-bit operand");
}

uint8_t CPURegs::read8(Reg reg) const
{
	if (reg < REG_A || reg > REG_L) invalidRegister(reg, 8);
	return slots[reg - REG_A];
}

void CPURegs::write8(Reg reg, uint8_t value)
{
	switch (reg) {
	case REG_F:
		setF(value);
		break;
	case REG_A: case REG_B: case REG_C: case REG_D:
	case REG_E: case REG_H: case REG_L:
		slots[reg - REG_A] = value;
		break;
	default:
		invalidRegister(reg, 8);
	}
}

uint16_t CPURegs::read16(Reg reg) const
{
	switch (reg) {
	case REG_A:  return getAF();
	case REG_B:  return getBC();
	case REG_D:  return getDE();
	case REG_H:  return getHL();
	case REG_SP: return getSP();
	default:
		invalidRegister(reg, 16);
	}
}

void CPURegs::write16(Reg reg, uint16_t value)
{
	switch (reg) {
	case REG_A:  setAF(value); break;
	case REG_B:  setBC(value); break;
	case REG_D:  setDE(value); break;
	case REG_H:  setHL(value); break;
	case REG_SP: setSP(value); break;
	default:
		invalidRegister(reg, 16);
	}
}

void CPURegs::reset()
{
	slots.fill(0);
	SP_ = 0;
}

} // namespace gbcore
