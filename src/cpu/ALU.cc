#include "ALU.hh"

namespace gbcore::alu {

static constexpr uint8_t Z_FLAG = CPURegs::Z_FLAG;
static constexpr uint8_t N_FLAG = CPURegs::N_FLAG;
static constexpr uint8_t H_FLAG = CPURegs::H_FLAG;
static constexpr uint8_t C_FLAG = CPURegs::C_FLAG;

[[nodiscard]] static constexpr uint8_t zero(unsigned r)
{
	return ((r & 0xFF) == 0) ? Z_FLAG : 0;
}

// Flags after a subtraction: 'halfBorrow' and 'borrow' are the real
// borrows, the polarity decides how they show up in F.
[[nodiscard]] static uint8_t subFlags(uint8_t r, bool halfBorrow, bool borrow,
                                      SubtractFlags polarity)
{
	if (polarity == SubtractFlags::NO_BORROW) {
		halfBorrow = !halfBorrow;
		borrow = !borrow;
	}
	return zero(r) | N_FLAG | (halfBorrow ? H_FLAG : 0) | (borrow ? C_FLAG : 0);
}

uint8_t add8(CPURegs& regs, uint8_t a, uint8_t b)
{
	unsigned res = a + b;
	regs.setF(zero(res) |
	          ((((a & 0x0F) + (b & 0x0F)) > 0x0F) ? H_FLAG : 0) |
	          ((res > 0xFF) ? C_FLAG : 0));
	return uint8_t(res);
}

uint8_t addWithCarry8(CPURegs& regs, uint8_t a, uint8_t b)
{
	unsigned c = regs.getFlag(C_FLAG) ? 1 : 0;
	unsigned res = a + b + c;
	regs.setF(zero(res) |
	          ((((a & 0x0F) + (b & 0x0F) + c) > 0x0F) ? H_FLAG : 0) |
	          ((res > 0xFF) ? C_FLAG : 0));
	return uint8_t(res);
}

uint16_t add16(CPURegs& regs, uint16_t a, uint16_t b)
{
	unsigned res = a + b;
	regs.setF((((res & 0xFFFF) == 0) ? Z_FLAG : 0) |
	          ((((a & 0x0FFF) + (b & 0x0FFF)) > 0x0FFF) ? H_FLAG : 0) |
	          ((res > 0xFFFF) ? C_FLAG : 0));
	return uint16_t(res);
}

uint16_t addSigned16(CPURegs& regs, uint16_t a, int8_t e)
{
	auto low = uint8_t(e);
	regs.setF(((((a & 0x0F) + (low & 0x0F)) > 0x0F) ? H_FLAG : 0) |
	          ((((a & 0xFF) + low) > 0xFF) ? C_FLAG : 0));
	return uint16_t(a + e);
}

uint8_t sub8(CPURegs& regs, uint8_t a, uint8_t b, SubtractFlags polarity)
{
	auto res = uint8_t(a - b);
	regs.setF(subFlags(res, (a & 0x0F) < (b & 0x0F), a < b, polarity));
	return res;
}

uint8_t subWithCarry8(CPURegs& regs, uint8_t a, uint8_t b, SubtractFlags polarity)
{
	unsigned c = regs.getFlag(C_FLAG) ? 1 : 0;
	auto res = uint8_t(a - b - c);
	regs.setF(subFlags(res, unsigned(a & 0x0F) < (b & 0x0F) + c,
	                   unsigned(a) < b + c, polarity));
	return res;
}

uint8_t and8(CPURegs& regs, uint8_t a, uint8_t b)
{
	uint8_t res = a & b;
	regs.setF(zero(res) | H_FLAG);
	return res;
}

uint8_t or8(CPURegs& regs, uint8_t a, uint8_t b)
{
	uint8_t res = a | b;
	regs.setF(zero(res));
	return res;
}

uint8_t xor8(CPURegs& regs, uint8_t a, uint8_t b)
{
	uint8_t res = a ^ b;
	regs.setF(zero(res));
	return res;
}

uint8_t increment8(CPURegs& regs, uint8_t a)
{
	uint8_t c = regs.getF() & C_FLAG;
	uint8_t res = add8(regs, a, 1);
	regs.setF((regs.getF() & ~C_FLAG) | c);
	return res;
}

uint8_t decrement8(CPURegs& regs, uint8_t a, SubtractFlags polarity)
{
	uint8_t c = regs.getF() & C_FLAG;
	uint8_t res = sub8(regs, a, 1, polarity);
	regs.setF((regs.getF() & ~C_FLAG) | c);
	return res;
}

uint16_t increment16(uint16_t a)
{
	return uint16_t(a + 1);
}

uint16_t decrement16(uint16_t a)
{
	return (a == 0) ? 0 : uint16_t(a - 1);
}

// Common tail of the rotate and shift operations.
[[nodiscard]] static uint8_t shifted(CPURegs& regs, uint8_t res, bool carry)
{
	regs.setF(zero(res) | (carry ? C_FLAG : 0));
	return res;
}

uint8_t rotateLeftCircular8(CPURegs& regs, uint8_t a)
{
	return shifted(regs, uint8_t((a << 1) | (a >> 7)), a & 0x80);
}

uint8_t rotateRightCircular8(CPURegs& regs, uint8_t a)
{
	return shifted(regs, uint8_t((a >> 1) | (a << 7)), a & 0x01);
}

uint8_t rotateLeft8(CPURegs& regs, uint8_t a)
{
	unsigned c = regs.getFlag(C_FLAG) ? 0x01 : 0;
	return shifted(regs, uint8_t((a << 1) | c), a & 0x80);
}

uint8_t rotateRight8(CPURegs& regs, uint8_t a)
{
	unsigned c = regs.getFlag(C_FLAG) ? 0x80 : 0;
	return shifted(regs, uint8_t((a >> 1) | c), a & 0x01);
}

uint8_t shiftLeftArithmetic8(CPURegs& regs, uint8_t a)
{
	return shifted(regs, uint8_t(a << 1), a & 0x80);
}

uint8_t shiftRightArithmetic8(CPURegs& regs, uint8_t a)
{
	return shifted(regs, uint8_t((a >> 1) | (a & 0x80)), a & 0x01);
}

uint8_t shiftRightLogical8(CPURegs& regs, uint8_t a)
{
	return shifted(regs, uint8_t(a >> 1), a & 0x01);
}

uint8_t swapNibbles8(CPURegs& regs, uint8_t a)
{
	return shifted(regs, uint8_t((a << 4) | (a >> 4)), false);
}

void testBit8(CPURegs& regs, unsigned bit, uint8_t a)
{
	regs.setF((regs.getF() & (N_FLAG | C_FLAG)) |
	          (((a >> bit) & 1) ? 0 : Z_FLAG) |
	          H_FLAG);
}

uint8_t resetBit8(unsigned bit, uint8_t a)
{
	return uint8_t(a & ~(1 << bit));
}

uint8_t setBit8(unsigned bit, uint8_t a)
{
	return uint8_t(a | (1 << bit));
}

uint8_t decimalAdjust8(CPURegs& regs, uint8_t a)
{
	uint8_t f = regs.getF();
	bool carry = f & C_FLAG;
	unsigned res = a;
	if (f & N_FLAG) {
		if (carry)        res -= 0x60;
		if (f & H_FLAG)   res -= 0x06;
	} else {
		if (carry || (a > 0x99)) {
			res += 0x60;
			carry = true;
		}
		if ((f & H_FLAG) || ((a & 0x0F) > 0x09)) res += 0x06;
	}
	regs.setF(zero(res) | (f & N_FLAG) | (carry ? C_FLAG : 0));
	return uint8_t(res);
}

uint8_t complement8(CPURegs& regs, uint8_t a)
{
	regs.setF((regs.getF() & (Z_FLAG | C_FLAG)) | N_FLAG | H_FLAG);
	return uint8_t(~a);
}

void setCarry(CPURegs& regs)
{
	regs.setF((regs.getF() & Z_FLAG) | C_FLAG);
}

void complementCarry(CPURegs& regs)
{
	regs.setF((regs.getF() & (Z_FLAG | C_FLAG)) ^ C_FLAG);
}

} // namespace gbcore::alu
