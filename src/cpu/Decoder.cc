#include "Decoder.hh"
#include "CPUTables.hh"
#include "DecodeFault.hh"
#include "MemoryInterface.hh"
#include "strCat.hh"

namespace gbcore {

using namespace instr;

[[nodiscard]] static unsigned immediateBytes(InstrKind kind)
{
	switch (kind) {
	case STOP:
	case LD_R_N: case LD_XHL_N: case LDH_A_XN: case LDH_XN_A:
	case LD_HL_SP_E: case ADD_SP_E: case JR_E: case JR_CC_E:
	case ADD_N: case ADC_N: case SUB_N: case SBC_N:
	case AND_N: case XOR_N: case OR_N:  case CP_N:
		return 1;
	case LD_A_XNN: case LD_XNN_A: case LD_XNN_SP: case LD_RR_NN:
	case JP_NN: case JP_CC_NN: case CALL_NN: case CALL_CC_NN:
		return 2;
	default:
		return 0;
	}
}

// Operand checks. Each throws DecodeFault when the table entry does not
// hold an operand of the expected category.

[[noreturn]] static void badOperand(const char* what, uint8_t code, unsigned opcode)
{
	throw DecodeFault("Opcode #", hex_string<2>(opcode), " has invalid ", what,
	                  " operand ", int(code));
}

[[nodiscard]] static Reg toReg8(uint8_t code, unsigned opcode)
{
	switch (code) {
	case REG_A: case REG_B: case REG_C: case REG_D:
	case REG_E: case REG_H: case REG_L:
		return Reg(code);
	default:
		badOperand("8-bit register", code, opcode);
	}
}

// BC DE HL SP
[[nodiscard]] static Reg toPair(uint8_t code, unsigned opcode)
{
	switch (code) {
	case REG_B: case REG_D: case REG_H: case REG_SP:
		return Reg(code);
	default:
		badOperand("register pair", code, opcode);
	}
}

// BC DE HL AF
[[nodiscard]] static Reg toStackPair(uint8_t code, unsigned opcode)
{
	switch (code) {
	case REG_B: case REG_D: case REG_H: case REG_A:
		return Reg(code);
	default:
		badOperand("stack register", code, opcode);
	}
}

[[nodiscard]] static RegAddr toAddr(uint8_t code, unsigned opcode)
{
	switch (code) {
	case ADDR_HL: case ADDR_HLI: case ADDR_HLD: case ADDR_BC: case ADDR_DE:
		return RegAddr(code);
	default:
		badOperand("addressing", code, opcode);
	}
}

[[nodiscard]] static Condition toCond(uint8_t code, unsigned opcode, ConditionEncoding encoding)
{
	if (code < COND_NZ || code > COND_C) badOperand("condition", code, opcode);
	return Condition::get(CondCode(code), encoding);
}

[[nodiscard]] static uint8_t toRst(uint8_t code, unsigned opcode)
{
	if (code < OPERAND_RST_FIRST || code >= OPERAND_RST_FIRST + 8) badOperand("restart", code, opcode);
	return uint8_t((code - OPERAND_RST_FIRST) * 8);
}

[[nodiscard]] static uint8_t toBit(uint8_t code, unsigned opcode)
{
	if (code < OPERAND_BIT_FIRST || code >= OPERAND_BIT_FIRST + 8) badOperand("bit index", code, opcode);
	return uint8_t(code - OPERAND_BIT_FIRST);
}

// Select the alternative for a runtime operation index.
template<template<AluOp> class T, typename... Args>
[[nodiscard]] static Instruction makeAlu(unsigned op, Args... args)
{
	switch (AluOp(op)) {
	case AluOp::ADD: return T<AluOp::ADD>{args...};
	case AluOp::ADC: return T<AluOp::ADC>{args...};
	case AluOp::SUB: return T<AluOp::SUB>{args...};
	case AluOp::SBC: return T<AluOp::SBC>{args...};
	case AluOp::AND: return T<AluOp::AND>{args...};
	case AluOp::XOR: return T<AluOp::XOR>{args...};
	case AluOp::OR:  return T<AluOp::OR >{args...};
	default:         return T<AluOp::CP >{args...};
	}
}

template<template<ShiftOp> class T, typename... Args>
[[nodiscard]] static Instruction makeShift(unsigned op, Args... args)
{
	switch (ShiftOp(op)) {
	case ShiftOp::RLC:  return T<ShiftOp::RLC >{args...};
	case ShiftOp::RRC:  return T<ShiftOp::RRC >{args...};
	case ShiftOp::RL:   return T<ShiftOp::RL  >{args...};
	case ShiftOp::RR:   return T<ShiftOp::RR  >{args...};
	case ShiftOp::SLA:  return T<ShiftOp::SLA >{args...};
	case ShiftOp::SRA:  return T<ShiftOp::SRA >{args...};
	case ShiftOp::SWAP: return T<ShiftOp::SWAP>{args...};
	default:            return T<ShiftOp::SRL >{args...};
	}
}

template<template<BitOp> class T, typename... Args>
[[nodiscard]] static Instruction makeBit(BitOp op, Args... args)
{
	switch (op) {
	case BitOp::BIT: return T<BitOp::BIT>{args...};
	case BitOp::RES: return T<BitOp::RES>{args...};
	default:         return T<BitOp::SET>{args...};
	}
}

[[nodiscard]] static Instruction buildExtended(unsigned opcode)
{
	auto kind = InstrKind(extendedOpcodes.kind[opcode]);
	uint8_t src = extendedOpcodes.src[opcode];
	uint8_t dst = extendedOpcodes.dst[opcode];
	unsigned code = 0x100 | opcode; // for the error messages
	switch (kind) {
	case RLC_R: case RRC_R: case RL_R: case RR_R:
	case SLA_R: case SRA_R: case SWAP_R: case SRL_R:
		return makeShift<ShiftR>(kind - RLC_R, toReg8(src, code));
	case RLC_M: case RRC_M: case RL_M: case RR_M:
	case SLA_M: case SRA_M: case SWAP_M: case SRL_M:
		return makeShift<ShiftM>(kind - RLC_M, toAddr(src, code));
	case BIT_R: case RES_R: case SET_R:
		return makeBit<BitR>(BitOp(kind - BIT_R), toBit(dst, code), toReg8(src, code));
	case BIT_M: case RES_M: case SET_M:
		return makeBit<BitM>(BitOp(kind - BIT_M), toBit(dst, code), toAddr(src, code));
	default:
		throw DecodeFault("Unassigned opcode #cb #", hex_string<2>(opcode));
	}
}

[[nodiscard]] static Instruction buildBase(
	unsigned opcode, uint8_t n, uint16_t nn, ConditionEncoding encoding)
{
	auto kind = InstrKind(baseOpcodes.kind[opcode]);
	uint8_t src = baseOpcodes.src[opcode];
	uint8_t dst = baseOpcodes.dst[opcode];
	auto e = int8_t(n);
	switch (kind) {
	case NOP:        return Nop{};
	case HALT:       return Halt{};
	case STOP:       return Stop{};

	case LD_R_R:     return LdRR{toReg8(dst, opcode), toReg8(src, opcode)};
	case LD_R_N:     return LdRN{toReg8(dst, opcode), n};
	case LD_R_M:     return LdRM{toReg8(dst, opcode), toAddr(src, opcode)};
	case LD_M_R:     return LdMR{toAddr(dst, opcode), toReg8(src, opcode)};
	case LD_XHL_N:   return LdXhlN{n};
	case LD_A_XNN:   return LdAXnn{nn};
	case LD_XNN_A:   return LdXnnA{nn};
	case LD_XNN_SP:  return LdXnnSp{nn};
	case LDH_A_XN:   return LdhAXn{n};
	case LDH_XN_A:   return LdhXnA{n};
	case LD_A_XC:    return LdAXc{};
	case LD_XC_A:    return LdXcA{};
	case LD_RR_NN:   return LdRrNn{toPair(dst, opcode), nn};
	case LD_SP_HL:   return LdSpHl{};
	case LD_HL_SP_E: return LdHlSpE{e};
	case PUSH:       return Push{toStackPair(src, opcode)};
	case POP:        return Pop{toStackPair(dst, opcode)};

	case ADD_R: case ADC_R: case SUB_R: case SBC_R:
	case AND_R: case XOR_R: case OR_R:  case CP_R:
		return makeAlu<AluR>(kind - ADD_R, toReg8(src, opcode));
	case ADD_N: case ADC_N: case SUB_N: case SBC_N:
	case AND_N: case XOR_N: case OR_N:  case CP_N:
		return makeAlu<AluN>(kind - ADD_N, n);
	case ADD_M: case ADC_M: case SUB_M: case SBC_M:
	case AND_M: case XOR_M: case OR_M:  case CP_M:
		return makeAlu<AluM>(kind - ADD_M, toAddr(src, opcode));

	case INC_R:      return IncR{toReg8(dst, opcode)};
	case INC_RR:     return IncRr{toPair(dst, opcode)};
	case INC_M:      return IncM{toAddr(dst, opcode)};
	case DEC_R:      return DecR{toReg8(dst, opcode)};
	case DEC_RR:     return DecRr{toPair(dst, opcode)};
	case DEC_M:      return DecM{toAddr(dst, opcode)};
	case ADD_RR_RR:  return AddHlRr{toPair(dst, opcode), toPair(src, opcode)};
	case ADD_SP_E:   return AddSpE{e};

	case RLCA:       return Rlca{};
	case RRCA:       return Rrca{};
	case RLA:        return Rla{};
	case RRA:        return Rra{};
	case DAA:        return Daa{};
	case CPL:        return Cpl{};
	case SCF:        return Scf{};
	case CCF:        return Ccf{};

	case JP_NN:      return JpNn{nn};
	case JP_CC_NN:   return JpCcNn{toCond(src, opcode, encoding), nn};
	case JP_HL:      return JpHl{};
	case JR_E:       return JrE{e};
	case JR_CC_E:    return JrCcE{toCond(src, opcode, encoding), e};
	case CALL_NN:    return CallNn{nn};
	case CALL_CC_NN: return CallCcNn{toCond(src, opcode, encoding), nn};
	case RET:        return Ret{};
	case RET_CC:     return RetCc{toCond(src, opcode, encoding)};
	case RST:        return Rst{toRst(src, opcode)};

	default:
		throw DecodeFault("Unassigned opcode #", hex_string<2>(opcode));
	}
}

// 'fetch(pos)' returns the byte at 'pos' or throws DecodeFault.
template<typename Fetch>
[[nodiscard]] static Instruction decodeImpl(Fetch fetch, unsigned& cursor, ConditionEncoding encoding)
{
	unsigned pos = cursor;
	uint8_t opcode = fetch(pos++);
	auto kind = InstrKind(baseOpcodes.kind[opcode]);
	if (kind == EXTENDED) {
		auto result = buildExtended(fetch(pos++));
		cursor = pos;
		return result;
	}
	if (kind == INVALID) {
		throw DecodeFault("Unassigned opcode #", hex_string<2>(opcode));
	}
	uint8_t n = 0;
	uint16_t nn = 0;
	switch (immediateBytes(kind)) {
	case 1:
		n = fetch(pos++);
		break;
	case 2: {
		uint8_t low = fetch(pos++);
		uint8_t high = fetch(pos++);
		nn = uint16_t(low | (high << 8));
		break;
	}
	}
	auto result = buildBase(opcode, n, nn, encoding);
	cursor = pos;
	return result;
}

Instruction decode(std::span<const uint8_t> bytes, unsigned& cursor, ConditionEncoding encoding)
{
	auto fetch = [&](unsigned pos) {
		if (pos >= bytes.size()) {
			throw DecodeFault("Truncated instruction at offset ", cursor);
		}
		return bytes[pos];
	};
	return decodeImpl(fetch, cursor, encoding);
}

Instruction decode(MemoryInterface& memory, unsigned& address, ConditionEncoding encoding)
{
	auto fetch = [&](unsigned pos) {
		if (pos > 0xFFFF) {
			throw DecodeFault("Instruction at #", hex_string<4>(address),
			                  " runs past the end of the address space");
		}
		return memory.readByte(uint16_t(pos));
	};
	return decodeImpl(fetch, address, encoding);
}

std::optional<unsigned> instructionLength(std::span<const uint8_t> bytes)
{
	if (bytes.empty()) return {};
	auto kind = InstrKind(baseOpcodes.kind[bytes[0]]);
	unsigned len;
	if (kind == INVALID) {
		return {};
	} else if (kind == EXTENDED) {
		len = 2;
	} else {
		len = 1 + immediateBytes(kind);
	}
	if (len > bytes.size()) return {};
	return len;
}

} // namespace gbcore
