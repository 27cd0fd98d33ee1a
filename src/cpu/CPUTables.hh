#ifndef CPUTABLES_HH
#define CPUTABLES_HH

#include "CPURegs.hh"
#include "Instruction.hh"

#include <array>
#include <cstdint>

namespace gbcore {

/** Instruction forms, one entry per row of the opcode tables.
  * Forms that only differ in the ALU, shift or bit operation are
  * consecutive so that the operation can be derived from the offset.
  */
enum InstrKind : uint8_t {
	INVALID = 0,
	NOP, HALT, STOP, EXTENDED,

	LD_R_R, LD_R_N, LD_R_M, LD_M_R, LD_XHL_N,
	LD_A_XNN, LD_XNN_A, LD_XNN_SP, LDH_A_XN, LDH_XN_A, LD_A_XC, LD_XC_A,
	LD_RR_NN, LD_SP_HL, LD_HL_SP_E,
	PUSH, POP,

	ADD_R, ADC_R, SUB_R, SBC_R, AND_R, XOR_R, OR_R, CP_R,
	ADD_N, ADC_N, SUB_N, SBC_N, AND_N, XOR_N, OR_N, CP_N,
	ADD_M, ADC_M, SUB_M, SBC_M, AND_M, XOR_M, OR_M, CP_M,

	INC_R, INC_RR, INC_M, DEC_R, DEC_RR, DEC_M,
	ADD_RR_RR, ADD_SP_E,

	RLCA, RRCA, RLA, RRA, DAA, CPL, SCF, CCF,

	JP_NN, JP_CC_NN, JP_HL, JR_E, JR_CC_E,
	CALL_NN, CALL_CC_NN, RET, RET_CC, RST,

	RLC_R, RRC_R, RL_R, RR_R, SLA_R, SRA_R, SWAP_R, SRL_R,
	RLC_M, RRC_M, RL_M, RR_M, SLA_M, SRA_M, SWAP_M, SRL_M,
	BIT_R, RES_R, SET_R,
	BIT_M, RES_M, SET_M,

	NUM_INSTR_KINDS
};

// Operand codes besides the Reg, RegAddr and CondCode values.
static constexpr uint8_t OPERAND_NONE = 0;
static constexpr uint8_t OPERAND_RST_FIRST = 30; // 30..37: vector 0x00..0x38
static constexpr uint8_t OPERAND_BIT_FIRST = 40; // 40..47: bit 0..7

/** The three parallel tables describing one opcode space. */
struct OpcodeTable
{
	std::array<uint8_t, 256> kind = {};
	std::array<uint8_t, 256> src = {};
	std::array<uint8_t, 256> dst = {};
};

namespace tables_impl {

// Operand order of the 3-bit register fields: B C D E H L (HL) A.
inline constexpr std::array<uint8_t, 8> regField = {
	REG_B, REG_C, REG_D, REG_E, REG_H, REG_L, ADDR_HL, REG_A
};

struct Builder
{
	OpcodeTable t;

	constexpr void set(unsigned op, InstrKind kind, uint8_t dst = OPERAND_NONE, uint8_t src = OPERAND_NONE) {
		t.kind[op] = kind;
		t.dst[op] = dst;
		t.src[op] = src;
	}
};

[[nodiscard]] constexpr OpcodeTable makeBaseTable()
{
	Builder b;

	// 0x00-0x3F: four rows that repeat per register pair
	constexpr std::array<uint8_t, 4> pairs = {REG_B, REG_D, REG_H, REG_SP};
	constexpr std::array<uint8_t, 4> pairAddr = {ADDR_BC, ADDR_DE, ADDR_HLI, ADDR_HLD};
	for (unsigned row = 0; row < 4; ++row) {
		unsigned base = row * 0x10;
		b.set(base + 0x1, LD_RR_NN, pairs[row]);
		b.set(base + 0x2, LD_M_R, pairAddr[row], REG_A);
		b.set(base + 0x3, INC_RR, pairs[row]);
		b.set(base + 0x9, ADD_RR_RR, REG_H, pairs[row]);
		b.set(base + 0xA, LD_R_M, REG_A, pairAddr[row]);
		b.set(base + 0xB, DEC_RR, pairs[row]);
	}
	for (unsigned r = 0; r < 8; ++r) {
		unsigned op = r << 3;
		uint8_t reg = regField[r];
		if (reg == ADDR_HL) {
			b.set(op | 4, INC_M, ADDR_HL);
			b.set(op | 5, DEC_M, ADDR_HL);
			b.set(op | 6, LD_XHL_N, ADDR_HL);
		} else {
			b.set(op | 4, INC_R, reg);
			b.set(op | 5, DEC_R, reg);
			b.set(op | 6, LD_R_N, reg);
		}
	}
	b.set(0x00, NOP);
	b.set(0x07, RLCA, REG_A, REG_A);
	b.set(0x08, LD_XNN_SP, ADDR_IMM, REG_SP);
	b.set(0x0F, RRCA, REG_A, REG_A);
	b.set(0x10, STOP);
	b.set(0x17, RLA, REG_A, REG_A);
	b.set(0x18, JR_E);
	b.set(0x1F, RRA, REG_A, REG_A);
	b.set(0x20, JR_CC_E, OPERAND_NONE, COND_NZ);
	b.set(0x27, DAA, REG_A, REG_A);
	b.set(0x28, JR_CC_E, OPERAND_NONE, COND_Z);
	b.set(0x2F, CPL, REG_A, REG_A);
	b.set(0x30, JR_CC_E, OPERAND_NONE, COND_NC);
	b.set(0x37, SCF);
	b.set(0x38, JR_CC_E, OPERAND_NONE, COND_C);
	b.set(0x3F, CCF);

	// 0x40-0x7F: LD r,r'
	for (unsigned op = 0x40; op < 0x80; ++op) {
		uint8_t dst = regField[(op >> 3) & 7];
		uint8_t src = regField[op & 7];
		if (dst == ADDR_HL && src == ADDR_HL) {
			b.set(op, HALT);
		} else if (dst == ADDR_HL) {
			b.set(op, LD_M_R, dst, src);
		} else if (src == ADDR_HL) {
			b.set(op, LD_R_M, dst, src);
		} else {
			b.set(op, LD_R_R, dst, src);
		}
	}

	// 0x80-0xBF: ALU A,r
	for (unsigned op = 0x80; op < 0xC0; ++op) {
		unsigned alu = (op >> 3) & 7;
		uint8_t src = regField[op & 7];
		auto kind = InstrKind(((src == ADDR_HL) ? ADD_M : ADD_R) + alu);
		b.set(op, kind, REG_A, src);
	}

	// 0xC0-0xFF
	constexpr std::array<uint8_t, 4> conds = {COND_NZ, COND_Z, COND_NC, COND_C};
	constexpr std::array<uint8_t, 4> stackRegs = {REG_B, REG_D, REG_H, REG_A};
	for (unsigned i = 0; i < 4; ++i) {
		unsigned base = 0xC0 + i * 0x10;
		b.set(base + 0x1, POP, stackRegs[i]);
		b.set(base + 0x5, PUSH, OPERAND_NONE, stackRegs[i]);
		b.set(base + 0x6, InstrKind(ADD_N + 2 * i), REG_A);
		b.set(base + 0xE, InstrKind(ADD_N + 2 * i + 1), REG_A);
		b.set(base + 0x7, RST, OPERAND_NONE, uint8_t(OPERAND_RST_FIRST + 2 * i));
		b.set(base + 0xF, RST, OPERAND_NONE, uint8_t(OPERAND_RST_FIRST + 2 * i + 1));
	}
	for (unsigned i = 0; i < 2; ++i) {
		unsigned base = 0xC0 + i * 0x10;
		for (unsigned j = 0; j < 2; ++j) {
			uint8_t cond = conds[2 * i + j];
			b.set(base + 8 * j + 0x0, RET_CC, OPERAND_NONE, cond);
			b.set(base + 8 * j + 0x2, JP_CC_NN, OPERAND_NONE, cond);
			b.set(base + 8 * j + 0x4, CALL_CC_NN, OPERAND_NONE, cond);
		}
	}
	b.set(0xC3, JP_NN);
	b.set(0xC9, RET);
	b.set(0xCB, EXTENDED);
	b.set(0xCD, CALL_NN);
	b.set(0xE0, LDH_XN_A, ADDR_IMM, REG_A);
	b.set(0xE2, LD_XC_A, REG_C, REG_A);
	b.set(0xE8, ADD_SP_E, REG_SP, REG_SP);
	b.set(0xE9, JP_HL, OPERAND_NONE, REG_H);
	b.set(0xEA, LD_XNN_A, ADDR_IMM, REG_A);
	b.set(0xF0, LDH_A_XN, REG_A, ADDR_IMM);
	b.set(0xF2, LD_A_XC, REG_A, REG_C);
	b.set(0xF8, LD_HL_SP_E, REG_H, REG_SP);
	b.set(0xF9, LD_SP_HL, REG_SP, REG_H);
	b.set(0xFA, LD_A_XNN, REG_A, ADDR_IMM);
	return b.t;
}

[[nodiscard]] constexpr OpcodeTable makeExtendedTable()
{
	Builder b;
	for (unsigned op = 0; op < 256; ++op) {
		uint8_t reg = regField[op & 7];
		bool mem = reg == ADDR_HL;
		unsigned y = (op >> 3) & 7;
		switch (op >> 6) {
		case 0:
			b.set(op, InstrKind((mem ? RLC_M : RLC_R) + y), reg, reg);
			break;
		case 1:
			b.set(op, mem ? BIT_M : BIT_R, uint8_t(OPERAND_BIT_FIRST + y), reg);
			break;
		case 2:
			b.set(op, mem ? RES_M : RES_R, uint8_t(OPERAND_BIT_FIRST + y), reg);
			break;
		default:
			b.set(op, mem ? SET_M : SET_R, uint8_t(OPERAND_BIT_FIRST + y), reg);
			break;
		}
	}
	return b.t;
}

} // namespace tables_impl

inline constexpr OpcodeTable baseOpcodes = tables_impl::makeBaseTable();
inline constexpr OpcodeTable extendedOpcodes = tables_impl::makeExtendedTable();

} // namespace gbcore

#endif
