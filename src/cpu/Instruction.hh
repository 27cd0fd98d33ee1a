#ifndef INSTRUCTION_HH
#define INSTRUCTION_HH

#include "CPURegs.hh"

#include <cstdint>
#include <variant>

namespace gbcore {

/** Memory addressing modes, as used in the opcode tables.
  * ADDR_HLI and ADDR_HLD access (HL) and then increment/decrement HL.
  */
enum RegAddr : uint8_t {
	ADDR_INVALID = 0,
	ADDR_HL = 10, ADDR_HLI, ADDR_HLD, ADDR_BC, ADDR_DE, ADDR_IMM,
};

enum CondCode : uint8_t {
	COND_NZ = 20, COND_Z, COND_NC, COND_C,
};

/** How the condition codes map onto flag masks. MASK is the literal
  * encoding where NZ and NC also require the N flag.
  */
enum class ConditionEncoding : uint8_t { CONVENTIONAL, MASK };

struct Condition
{
	uint8_t mask;
	bool negate;

	[[nodiscard]] bool test(uint8_t f) const {
		return ((f & mask) == mask) != negate;
	}
	[[nodiscard]] bool operator==(const Condition&) const = default;

	[[nodiscard]] static Condition get(CondCode code, ConditionEncoding encoding);
};

enum class AluOp : uint8_t { ADD, ADC, SUB, SBC, AND, XOR, OR, CP };
enum class ShiftOp : uint8_t { RLC, RRC, RL, RR, SLA, SRA, SWAP, SRL };
enum class BitOp : uint8_t { BIT, RES, SET };

namespace instr {

struct Nop {};
struct Halt {};
struct Stop {};

// loads
struct LdRR     { Reg dst; Reg src; };
struct LdRN     { Reg dst; uint8_t n; };
struct LdRM     { Reg dst; RegAddr addr; };
struct LdMR     { RegAddr addr; Reg src; };
struct LdXhlN   { uint8_t n; };
struct LdAXnn   { uint16_t addr; };
struct LdXnnA   { uint16_t addr; };
struct LdXnnSp  { uint16_t addr; };
struct LdhAXn   { uint8_t offset; };
struct LdhXnA   { uint8_t offset; };
struct LdAXc    {};
struct LdXcA    {};
struct LdRrNn   { Reg dst; uint16_t nn; };
struct LdSpHl   {};
struct LdHlSpE  { int8_t e; };
struct Push     { Reg src; };
struct Pop      { Reg dst; };

// 8-bit arithmetic and logic, always with A as first operand
template<AluOp OP> struct AluR { Reg src; };
template<AluOp OP> struct AluN { uint8_t n; };
template<AluOp OP> struct AluM { RegAddr addr; };

struct IncR     { Reg reg; };
struct IncRr    { Reg reg; };
struct IncM     { RegAddr addr; };
struct DecR     { Reg reg; };
struct DecRr    { Reg reg; };
struct DecM     { RegAddr addr; };
struct AddHlRr  { Reg dst; Reg src; };
struct AddSpE   { int8_t e; };

// accumulator and flag operations
struct Rlca {};
struct Rrca {};
struct Rla  {};
struct Rra  {};
struct Daa  {};
struct Cpl  {};
struct Scf  {};
struct Ccf  {};

// control flow
struct JpNn     { uint16_t addr; };
struct JpCcNn   { Condition cond; uint16_t addr; };
struct JpHl     {};
struct JrE      { int8_t e; };
struct JrCcE    { Condition cond; int8_t e; };
struct CallNn   { uint16_t addr; };
struct CallCcNn { Condition cond; uint16_t addr; };
struct Ret      {};
struct RetCc    { Condition cond; };
struct Rst      { uint8_t vector; };

// extended (0xCB prefixed) opcode space
template<ShiftOp OP> struct ShiftR { Reg reg; };
template<ShiftOp OP> struct ShiftM { RegAddr addr; };
template<BitOp OP> struct BitR { uint8_t bit; Reg reg; };
template<BitOp OP> struct BitM { uint8_t bit; RegAddr addr; };

} // namespace instr

using Instruction = std::variant<
	instr::Nop, instr::Halt, instr::Stop,

	instr::LdRR, instr::LdRN, instr::LdRM, instr::LdMR, instr::LdXhlN,
	instr::LdAXnn, instr::LdXnnA, instr::LdXnnSp, instr::LdhAXn, instr::LdhXnA,
	instr::LdAXc, instr::LdXcA, instr::LdRrNn, instr::LdSpHl, instr::LdHlSpE,
	instr::Push, instr::Pop,

	instr::AluR<AluOp::ADD>, instr::AluR<AluOp::ADC>, instr::AluR<AluOp::SUB>, instr::AluR<AluOp::SBC>,
	instr::AluR<AluOp::AND>, instr::AluR<AluOp::XOR>, instr::AluR<AluOp::OR>,  instr::AluR<AluOp::CP>,
	instr::AluN<AluOp::ADD>, instr::AluN<AluOp::ADC>, instr::AluN<AluOp::SUB>, instr::AluN<AluOp::SBC>,
	instr::AluN<AluOp::AND>, instr::AluN<AluOp::XOR>, instr::AluN<AluOp::OR>,  instr::AluN<AluOp::CP>,
	instr::AluM<AluOp::ADD>, instr::AluM<AluOp::ADC>, instr::AluM<AluOp::SUB>, instr::AluM<AluOp::SBC>,
	instr::AluM<AluOp::AND>, instr::AluM<AluOp::XOR>, instr::AluM<AluOp::OR>,  instr::AluM<AluOp::CP>,

	instr::IncR, instr::IncRr, instr::IncM, instr::DecR, instr::DecRr, instr::DecM,
	instr::AddHlRr, instr::AddSpE,

	instr::Rlca, instr::Rrca, instr::Rla, instr::Rra,
	instr::Daa, instr::Cpl, instr::Scf, instr::Ccf,

	instr::JpNn, instr::JpCcNn, instr::JpHl, instr::JrE, instr::JrCcE,
	instr::CallNn, instr::CallCcNn, instr::Ret, instr::RetCc, instr::Rst,

	instr::ShiftR<ShiftOp::RLC>, instr::ShiftR<ShiftOp::RRC>, instr::ShiftR<ShiftOp::RL>,  instr::ShiftR<ShiftOp::RR>,
	instr::ShiftR<ShiftOp::SLA>, instr::ShiftR<ShiftOp::SRA>, instr::ShiftR<ShiftOp::SWAP>, instr::ShiftR<ShiftOp::SRL>,
	instr::ShiftM<ShiftOp::RLC>, instr::ShiftM<ShiftOp::RRC>, instr::ShiftM<ShiftOp::RL>,  instr::ShiftM<ShiftOp::RR>,
	instr::ShiftM<ShiftOp::SLA>, instr::ShiftM<ShiftOp::SRA>, instr::ShiftM<ShiftOp::SWAP>, instr::ShiftM<ShiftOp::SRL>,
	instr::BitR<BitOp::BIT>, instr::BitR<BitOp::RES>, instr::BitR<BitOp::SET>,
	instr::BitM<BitOp::BIT>, instr::BitM<BitOp::RES>, instr::BitM<BitOp::SET>
>;

} // namespace gbcore

#endif
