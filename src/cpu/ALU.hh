#ifndef ALU_HH
#define ALU_HH

#include "CPURegs.hh"

#include <cstdint>

namespace gbcore {

/** Polarity of the H and C flags after a subtraction.
  * BORROW: the flags are set when a borrow occurs (SM83 hardware).
  * NO_BORROW: the flags are set when no borrow occurs.
  */
enum class SubtractFlags : uint8_t { BORROW, NO_BORROW };

// All operations below compute a fresh flag byte and store it in 'regs'
// (unless documented otherwise). The operands themselves are passed by
// value, the caller stores the result.
namespace alu {

[[nodiscard]] uint8_t add8(CPURegs& regs, uint8_t a, uint8_t b);
[[nodiscard]] uint8_t addWithCarry8(CPURegs& regs, uint8_t a, uint8_t b);
[[nodiscard]] uint16_t add16(CPURegs& regs, uint16_t a, uint16_t b);
/** SP + e8: Z and N cleared, H and C from the unsigned addition of the
  * low byte. */
[[nodiscard]] uint16_t addSigned16(CPURegs& regs, uint16_t a, int8_t e);

[[nodiscard]] uint8_t sub8(CPURegs& regs, uint8_t a, uint8_t b,
                           SubtractFlags polarity = SubtractFlags::BORROW);
[[nodiscard]] uint8_t subWithCarry8(CPURegs& regs, uint8_t a, uint8_t b,
                                    SubtractFlags polarity = SubtractFlags::BORROW);

[[nodiscard]] uint8_t and8(CPURegs& regs, uint8_t a, uint8_t b);
[[nodiscard]] uint8_t or8 (CPURegs& regs, uint8_t a, uint8_t b);
[[nodiscard]] uint8_t xor8(CPURegs& regs, uint8_t a, uint8_t b);

// INC/DEC keep the carry flag.
[[nodiscard]] uint8_t increment8(CPURegs& regs, uint8_t a);
[[nodiscard]] uint8_t decrement8(CPURegs& regs, uint8_t a,
                                 SubtractFlags polarity = SubtractFlags::BORROW);
// No flags. Increment wraps, decrement stops at zero.
[[nodiscard]] uint16_t increment16(uint16_t a);
[[nodiscard]] uint16_t decrement16(uint16_t a);

[[nodiscard]] uint8_t rotateLeftCircular8 (CPURegs& regs, uint8_t a);
[[nodiscard]] uint8_t rotateRightCircular8(CPURegs& regs, uint8_t a);
[[nodiscard]] uint8_t rotateLeft8 (CPURegs& regs, uint8_t a);
[[nodiscard]] uint8_t rotateRight8(CPURegs& regs, uint8_t a);
[[nodiscard]] uint8_t shiftLeftArithmetic8 (CPURegs& regs, uint8_t a);
[[nodiscard]] uint8_t shiftRightArithmetic8(CPURegs& regs, uint8_t a);
[[nodiscard]] uint8_t shiftRightLogical8   (CPURegs& regs, uint8_t a);
[[nodiscard]] uint8_t swapNibbles8(CPURegs& regs, uint8_t a);

/** Z is set when the bit is clear, H is set, N and C are unchanged. */
void testBit8(CPURegs& regs, unsigned bit, uint8_t a);
[[nodiscard]] uint8_t resetBit8(unsigned bit, uint8_t a);
[[nodiscard]] uint8_t setBit8  (unsigned bit, uint8_t a);

[[nodiscard]] uint8_t decimalAdjust8(CPURegs& regs, uint8_t a);
[[nodiscard]] uint8_t complement8(CPURegs& regs, uint8_t a);
void setCarry(CPURegs& regs);
void complementCarry(CPURegs& regs);

} // namespace alu
} // namespace gbcore

#endif
