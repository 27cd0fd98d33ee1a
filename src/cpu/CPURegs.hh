#ifndef CPUREGS_HH
#define CPUREGS_HH

#include <array>
#include <cstdint>

namespace gbcore {

/** Register operand codes, as used in the opcode tables. */
enum Reg : uint8_t {
	REG_INVALID = 0,
	REG_A = 1, REG_F, REG_B, REG_C, REG_D, REG_E, REG_H, REG_L,
	REG_SP = 9,
};

class CPURegs
{
public:
	// flag bits in F
	static constexpr uint8_t Z_FLAG = 0x80;
	static constexpr uint8_t N_FLAG = 0x40;
	static constexpr uint8_t H_FLAG = 0x20;
	static constexpr uint8_t C_FLAG = 0x10;
	static constexpr uint8_t FLAG_MASK = 0xF0;

	CPURegs() { reset(); }

	/** Generic access by operand code.
	  * read8()/write8() accept A..L, read16()/write16() accept the pair
	  * heads A (AF), B (BC), D (DE), H (HL) and SP. Any other code throws
	  * ExecutionFault.
	  */
	[[nodiscard]] uint8_t read8(Reg reg) const;
	void write8(Reg reg, uint8_t value);
	[[nodiscard]] uint16_t read16(Reg reg) const;
	void write16(Reg reg, uint16_t value);

	[[nodiscard]] uint8_t getA() const { return slots[A_SLOT]; }
	[[nodiscard]] uint8_t getF() const { return slots[F_SLOT]; }
	[[nodiscard]] uint8_t getB() const { return slots[B_SLOT]; }
	[[nodiscard]] uint8_t getC() const { return slots[C_SLOT]; }
	[[nodiscard]] uint8_t getD() const { return slots[D_SLOT]; }
	[[nodiscard]] uint8_t getE() const { return slots[E_SLOT]; }
	[[nodiscard]] uint8_t getH() const { return slots[H_SLOT]; }
	[[nodiscard]] uint8_t getL() const { return slots[L_SLOT]; }

	// The first slot of a pair is its low byte.
	[[nodiscard]] uint16_t getAF() const { return pair(A_SLOT); }
	[[nodiscard]] uint16_t getBC() const { return pair(B_SLOT); }
	[[nodiscard]] uint16_t getDE() const { return pair(D_SLOT); }
	[[nodiscard]] uint16_t getHL() const { return pair(H_SLOT); }
	[[nodiscard]] uint16_t getSP() const { return SP_; }

	void setA(uint8_t x) { slots[A_SLOT] = x; }
	void setF(uint8_t x) { slots[F_SLOT] = x & FLAG_MASK; }
	void setB(uint8_t x) { slots[B_SLOT] = x; }
	void setC(uint8_t x) { slots[C_SLOT] = x; }
	void setD(uint8_t x) { slots[D_SLOT] = x; }
	void setE(uint8_t x) { slots[E_SLOT] = x; }
	void setH(uint8_t x) { slots[H_SLOT] = x; }
	void setL(uint8_t x) { slots[L_SLOT] = x; }

	void setAF(uint16_t x) { setPair(A_SLOT, x); slots[F_SLOT] &= FLAG_MASK; }
	void setBC(uint16_t x) { setPair(B_SLOT, x); }
	void setDE(uint16_t x) { setPair(D_SLOT, x); }
	void setHL(uint16_t x) { setPair(H_SLOT, x); }
	void setSP(uint16_t x) { SP_ = x; }

	[[nodiscard]] uint8_t getFlags() const { return getF(); }
	void setFlags(uint8_t f) { setF(f); }
	[[nodiscard]] bool getFlag(uint8_t mask) const { return (getF() & mask) != 0; }

	void reset();

	[[nodiscard]] bool operator==(const CPURegs&) const = default;

private:
	enum Slot : uint8_t {
		A_SLOT, F_SLOT, B_SLOT, C_SLOT, D_SLOT, E_SLOT, H_SLOT, L_SLOT,
		NUM_SLOTS
	};

	[[nodiscard]] uint16_t pair(unsigned first) const {
		return uint16_t(slots[first] | (slots[first + 1] << 8));
	}
	void setPair(unsigned first, uint16_t x) {
		slots[first + 0] = uint8_t(x & 0xFF);
		slots[first + 1] = uint8_t(x >> 8);
	}

	std::array<uint8_t, NUM_SLOTS> slots;
	uint16_t SP_;
};

} // namespace gbcore

#endif
