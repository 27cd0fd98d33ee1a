#include "Dasm.hh"
#include "DecodeFault.hh"
#include "Decoder.hh"

#include "stl.hh"
#include "strCat.hh"

#include <array>
#include <initializer_list>
#include <string_view>
#include <utility>

namespace gbcore {

using namespace instr;

static constexpr char sign(int8_t e)
{
	return (e < 0) ? '-' : '+';
}

static constexpr int abs(int8_t e)
{
	return (e < 0) ? -e : e;
}

void appendAddrAsHex(std::string& output, uint16_t addr)
{
	strAppend(output, '#', hex_string<4>(addr));
}

static void appendByte(std::string& output, uint8_t n)
{
	strAppend(output, '#', hex_string<2>(n));
}

[[nodiscard]] static std::string_view regName(Reg reg)
{
	static constexpr std::array<std::string_view, 10> names = {
		"?", "a", "f", "b", "c", "d", "e", "h", "l", "sp"
	};
	return (reg < names.size()) ? names[reg] : "?";
}

[[nodiscard]] static std::string_view pairName(Reg reg)
{
	switch (reg) {
	case REG_A:  return "af";
	case REG_B:  return "bc";
	case REG_D:  return "de";
	case REG_H:  return "hl";
	case REG_SP: return "sp";
	default:     return "?";
	}
}

[[nodiscard]] static std::string_view addrName(RegAddr addr)
{
	switch (addr) {
	case ADDR_HL:  return "(hl)";
	case ADDR_HLI: return "(hl+)";
	case ADDR_HLD: return "(hl-)";
	case ADDR_BC:  return "(bc)";
	case ADDR_DE:  return "(de)";
	default:       return "(?)";
	}
}

// The condition is stored as a flag mask, find the code it was decoded from.
[[nodiscard]] static std::string_view condName(Condition cond)
{
	static constexpr std::array<std::pair<CondCode, std::string_view>, 4> codes = {{
		{COND_NZ, "nz"}, {COND_Z, "z"}, {COND_NC, "nc"}, {COND_C, "c"}
	}};
	for (auto encoding : {ConditionEncoding::CONVENTIONAL, ConditionEncoding::MASK}) {
		for (const auto& [code, name] : codes) {
			if (Condition::get(code, encoding) == cond) return name;
		}
	}
	return "?";
}

// ADD, ADC and SBC name the accumulator explicitly.
[[nodiscard]] static std::string_view aluName(AluOp op)
{
	static constexpr std::array<std::string_view, 8> names = {
		"add a,", "adc a,", "sub ", "sbc a,", "and ", "xor ", "or ", "cp "
	};
	return names[size_t(op)];
}

[[nodiscard]] static std::string_view shiftName(ShiftOp op)
{
	static constexpr std::array<std::string_view, 8> names = {
		"rlc ", "rrc ", "rl ", "rr ", "sla ", "sra ", "swap ", "srl "
	};
	return names[size_t(op)];
}

[[nodiscard]] static std::string_view bitName(BitOp op)
{
	static constexpr std::array<std::string_view, 3> names = {
		"bit ", "res ", "set "
	};
	return names[size_t(op)];
}

void dasm(const Instruction& instruction, uint16_t nextPc, std::string& dest)
{
	auto& d = dest;
	std::visit(overloaded{
		[&](const Nop&)  { d += "nop"; },
		[&](const Halt&) { d += "halt"; },
		[&](const Stop&) { d += "stop"; },

		[&](const LdRR& i)    { strAppend(d, "ld ", regName(i.dst), ',', regName(i.src)); },
		[&](const LdRN& i)    { strAppend(d, "ld ", regName(i.dst), ','); appendByte(d, i.n); },
		[&](const LdRM& i)    { strAppend(d, "ld ", regName(i.dst), ',', addrName(i.addr)); },
		[&](const LdMR& i)    { strAppend(d, "ld ", addrName(i.addr), ',', regName(i.src)); },
		[&](const LdXhlN& i)  { d += "ld (hl),"; appendByte(d, i.n); },
		[&](const LdAXnn& i)  { d += "ld a,("; appendAddrAsHex(d, i.addr); d += ')'; },
		[&](const LdXnnA& i)  { d += "ld ("; appendAddrAsHex(d, i.addr); d += "),a"; },
		[&](const LdXnnSp& i) { d += "ld ("; appendAddrAsHex(d, i.addr); d += "),sp"; },
		[&](const LdhAXn& i)  { d += "ldh a,("; appendByte(d, i.offset); d += ')'; },
		[&](const LdhXnA& i)  { d += "ldh ("; appendByte(d, i.offset); d += "),a"; },
		[&](const LdAXc&)     { d += "ld a,(c)"; },
		[&](const LdXcA&)     { d += "ld (c),a"; },
		[&](const LdRrNn& i)  { strAppend(d, "ld ", pairName(i.dst), ','); appendAddrAsHex(d, i.nn); },
		[&](const LdSpHl&)    { d += "ld sp,hl"; },
		[&](const LdHlSpE& i) { strAppend(d, "ld hl,sp", sign(i.e), '#', hex_string<2>(abs(i.e))); },
		[&](const Push& i)    { strAppend(d, "push ", pairName(i.src)); },
		[&](const Pop& i)     { strAppend(d, "pop ", pairName(i.dst)); },

		[&]<AluOp OP>(const AluR<OP>& i) { strAppend(d, aluName(OP), regName(i.src)); },
		[&]<AluOp OP>(const AluN<OP>& i) { d += aluName(OP); appendByte(d, i.n); },
		[&]<AluOp OP>(const AluM<OP>& i) { strAppend(d, aluName(OP), addrName(i.addr)); },

		[&](const IncR& i)    { strAppend(d, "inc ", regName(i.reg)); },
		[&](const IncRr& i)   { strAppend(d, "inc ", pairName(i.reg)); },
		[&](const IncM& i)    { strAppend(d, "inc ", addrName(i.addr)); },
		[&](const DecR& i)    { strAppend(d, "dec ", regName(i.reg)); },
		[&](const DecRr& i)   { strAppend(d, "dec ", pairName(i.reg)); },
		[&](const DecM& i)    { strAppend(d, "dec ", addrName(i.addr)); },
		[&](const AddHlRr& i) { strAppend(d, "add ", pairName(i.dst), ',', pairName(i.src)); },
		[&](const AddSpE& i)  { strAppend(d, "add sp,", sign(i.e), '#', hex_string<2>(abs(i.e))); },

		[&](const Rlca&) { d += "rlca"; },
		[&](const Rrca&) { d += "rrca"; },
		[&](const Rla&)  { d += "rla"; },
		[&](const Rra&)  { d += "rra"; },
		[&](const Daa&)  { d += "daa"; },
		[&](const Cpl&)  { d += "cpl"; },
		[&](const Scf&)  { d += "scf"; },
		[&](const Ccf&)  { d += "ccf"; },

		[&](const JpNn& i)     { d += "jp "; appendAddrAsHex(d, i.addr); },
		[&](const JpCcNn& i)   { strAppend(d, "jp ", condName(i.cond), ','); appendAddrAsHex(d, i.addr); },
		[&](const JpHl&)       { d += "jp (hl)"; },
		[&](const JrE& i)      { d += "jr "; appendAddrAsHex(d, uint16_t(nextPc + i.e)); },
		[&](const JrCcE& i)    { strAppend(d, "jr ", condName(i.cond), ','); appendAddrAsHex(d, uint16_t(nextPc + i.e)); },
		[&](const CallNn& i)   { d += "call "; appendAddrAsHex(d, i.addr); },
		[&](const CallCcNn& i) { strAppend(d, "call ", condName(i.cond), ','); appendAddrAsHex(d, i.addr); },
		[&](const Ret&)        { d += "ret"; },
		[&](const RetCc& i)    { strAppend(d, "ret ", condName(i.cond)); },
		[&](const Rst& i)      { d += "rst "; appendByte(d, i.vector); },

		[&]<ShiftOp OP>(const ShiftR<OP>& i) { strAppend(d, shiftName(OP), regName(i.reg)); },
		[&]<ShiftOp OP>(const ShiftM<OP>& i) { strAppend(d, shiftName(OP), addrName(i.addr)); },
		[&]<BitOp OP>(const BitR<OP>& i) { strAppend(d, bitName(OP), i.bit, ',', regName(i.reg)); },
		[&]<BitOp OP>(const BitM<OP>& i) { strAppend(d, bitName(OP), i.bit, ',', addrName(i.addr)); },
	}, instruction);
}

unsigned dasm(std::span<const uint8_t> opcode, uint16_t pc, std::string& dest)
{
	unsigned cursor = 0;
	try {
		auto instruction = decode(opcode, cursor);
		dasm(instruction, uint16_t(pc + cursor), dest);
		return cursor;
	} catch (DecodeFault&) {
		if (opcode.empty()) return 0;
		dest += "db ";
		appendByte(dest, opcode[0]);
		return 1;
	}
}

} // namespace gbcore
