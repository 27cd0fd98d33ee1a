#include "CPUCore.hh"
#include "CPUSettings.hh"
#include "Dasm.hh"
#include "DecodeFault.hh"
#include "Decoder.hh"
#include "ExecutionFault.hh"
#include "SM83.hh"

#include "CliComm.hh"
#include "MemoryFault.hh"
#include "MemoryInterface.hh"

#include "strCat.hh"

#include <utility>
#include <variant>

namespace gbcore {

using namespace instr;

// Applies one instruction to a copy of the register file. Every call
// operator returns the number of T-cycles the instruction took. 'pc'
// already points past the instruction when the call operator runs, it is
// #10000 for an instruction that ends at #FFFF.
class Executor
{
public:
	Executor(CPURegs& R_, unsigned& pc_, MemoryInterface& mem_, SubtractFlags sub_)
		: R(R_), pc(pc_), mem(mem_), sub(sub_) {}

	[[nodiscard]] bool haltRequested() const { return halt; }

	int operator()(const Nop&) { return SM83::CC_NOP; }
	int operator()(const Halt&) { halt = true; return SM83::CC_HALT; }
	int operator()(const Stop&) { halt = true; return SM83::CC_STOP; }

	// loads
	int operator()(const LdRR& i) {
		R.write8(i.dst, R.read8(i.src));
		return SM83::CC_LD_R_R;
	}
	int operator()(const LdRN& i) {
		R.write8(i.dst, i.n);
		return SM83::CC_LD_R_N;
	}
	int operator()(const LdRM& i) {
		R.write8(i.dst, mem.readByte(address(i.addr)));
		return SM83::CC_LD_R_SS;
	}
	int operator()(const LdMR& i) {
		uint8_t value = R.read8(i.src); // before a possible HL update
		mem.writeByte(address(i.addr), value);
		return SM83::CC_LD_R_SS;
	}
	int operator()(const LdXhlN& i) {
		mem.writeByte(R.getHL(), i.n);
		return SM83::CC_LD_HL_N;
	}
	int operator()(const LdAXnn& i) {
		R.setA(mem.readByte(i.addr));
		return SM83::CC_LD_A_NN;
	}
	int operator()(const LdXnnA& i) {
		mem.writeByte(i.addr, R.getA());
		return SM83::CC_LD_A_NN;
	}
	int operator()(const LdXnnSp& i) {
		uint16_t sp = R.getSP();
		mem.writeByte(i.addr, uint8_t(sp & 0xFF));
		mem.writeByte(uint16_t(i.addr + 1), uint8_t(sp >> 8));
		return SM83::CC_LD_NN_SP;
	}
	int operator()(const LdhAXn& i) {
		R.setA(mem.readByte(uint16_t(0xFF00 + i.offset)));
		return SM83::CC_LDH;
	}
	int operator()(const LdhXnA& i) {
		mem.writeByte(uint16_t(0xFF00 + i.offset), R.getA());
		return SM83::CC_LDH;
	}
	int operator()(const LdAXc&) {
		R.setA(mem.readByte(uint16_t(0xFF00 + R.getC())));
		return SM83::CC_LD_C;
	}
	int operator()(const LdXcA&) {
		mem.writeByte(uint16_t(0xFF00 + R.getC()), R.getA());
		return SM83::CC_LD_C;
	}
	int operator()(const LdRrNn& i) {
		R.write16(i.dst, i.nn);
		return SM83::CC_LD_SS_NN;
	}
	int operator()(const LdSpHl&) {
		R.setSP(R.getHL());
		return SM83::CC_LD_SP_HL;
	}
	int operator()(const LdHlSpE& i) {
		R.setHL(alu::addSigned16(R, R.getSP(), i.e));
		return SM83::CC_LD_HL_SPE;
	}
	int operator()(const Push& i) {
		push(R.read16(i.src));
		return SM83::CC_PUSH;
	}
	int operator()(const Pop& i) {
		R.write16(i.dst, pop());
		return SM83::CC_POP;
	}

	// 8-bit arithmetic
	template<AluOp OP> int operator()(const AluR<OP>& i) {
		aluOp<OP>(R.read8(i.src));
		return SM83::CC_ALU_R;
	}
	template<AluOp OP> int operator()(const AluN<OP>& i) {
		aluOp<OP>(i.n);
		return SM83::CC_ALU_N;
	}
	template<AluOp OP> int operator()(const AluM<OP>& i) {
		aluOp<OP>(mem.readByte(address(i.addr)));
		return SM83::CC_ALU_XHL;
	}

	int operator()(const IncR& i) {
		R.write8(i.reg, alu::increment8(R, R.read8(i.reg)));
		return SM83::CC_INC_R;
	}
	int operator()(const DecR& i) {
		R.write8(i.reg, alu::decrement8(R, R.read8(i.reg), sub));
		return SM83::CC_INC_R;
	}
	int operator()(const IncRr& i) {
		R.write16(i.reg, alu::increment16(R.read16(i.reg)));
		return SM83::CC_INC_SS;
	}
	int operator()(const DecRr& i) {
		R.write16(i.reg, alu::decrement16(R.read16(i.reg)));
		return SM83::CC_INC_SS;
	}
	int operator()(const IncM& i) {
		uint16_t addr = address(i.addr);
		mem.writeByte(addr, alu::increment8(R, mem.readByte(addr)));
		return SM83::CC_INC_XHL;
	}
	int operator()(const DecM& i) {
		uint16_t addr = address(i.addr);
		mem.writeByte(addr, alu::decrement8(R, mem.readByte(addr), sub));
		return SM83::CC_INC_XHL;
	}
	int operator()(const AddHlRr& i) {
		R.write16(i.dst, alu::add16(R, R.read16(i.dst), R.read16(i.src)));
		return SM83::CC_ADD_HL_SS;
	}
	int operator()(const AddSpE& i) {
		R.setSP(alu::addSigned16(R, R.getSP(), i.e));
		return SM83::CC_ADD_SP_E;
	}

	// accumulator and flags, the rotates always clear Z
	int operator()(const Rlca&) {
		R.setA(alu::rotateLeftCircular8(R, R.getA()));
		clearZ();
		return SM83::CC_ACC;
	}
	int operator()(const Rrca&) {
		R.setA(alu::rotateRightCircular8(R, R.getA()));
		clearZ();
		return SM83::CC_ACC;
	}
	int operator()(const Rla&) {
		R.setA(alu::rotateLeft8(R, R.getA()));
		clearZ();
		return SM83::CC_ACC;
	}
	int operator()(const Rra&) {
		R.setA(alu::rotateRight8(R, R.getA()));
		clearZ();
		return SM83::CC_ACC;
	}
	int operator()(const Daa&) {
		R.setA(alu::decimalAdjust8(R, R.getA()));
		return SM83::CC_ACC;
	}
	int operator()(const Cpl&) {
		R.setA(alu::complement8(R, R.getA()));
		return SM83::CC_ACC;
	}
	int operator()(const Scf&) {
		alu::setCarry(R);
		return SM83::CC_ACC;
	}
	int operator()(const Ccf&) {
		alu::complementCarry(R);
		return SM83::CC_ACC;
	}

	// control flow
	int operator()(const JpNn& i) {
		pc = i.addr;
		return SM83::CC_JP_A;
	}
	int operator()(const JpCcNn& i) {
		if (!i.cond.test(R.getF())) return SM83::CC_JP_B;
		pc = i.addr;
		return SM83::CC_JP_A;
	}
	int operator()(const JpHl&) {
		pc = R.getHL();
		return SM83::CC_JP_HL;
	}
	int operator()(const JrE& i) {
		jumpRelative(i.e);
		return SM83::CC_JR_A;
	}
	int operator()(const JrCcE& i) {
		if (!i.cond.test(R.getF())) return SM83::CC_JR_B;
		jumpRelative(i.e);
		return SM83::CC_JR_A;
	}
	int operator()(const CallNn& i) {
		call(i.addr);
		return SM83::CC_CALL_A;
	}
	int operator()(const CallCcNn& i) {
		if (!i.cond.test(R.getF())) return SM83::CC_CALL_B;
		call(i.addr);
		return SM83::CC_CALL_A;
	}
	int operator()(const Ret&) {
		pc = pop();
		return SM83::CC_RET;
	}
	int operator()(const RetCc& i) {
		if (!i.cond.test(R.getF())) return SM83::CC_RET_B;
		pc = pop();
		return SM83::CC_RET_A;
	}
	int operator()(const Rst& i) {
		call(i.vector);
		return SM83::CC_RST;
	}

	// extended opcode space
	template<ShiftOp OP> int operator()(const ShiftR<OP>& i) {
		R.write8(i.reg, shiftOp<OP>(R.read8(i.reg)));
		return SM83::CC_CB_R;
	}
	template<ShiftOp OP> int operator()(const ShiftM<OP>& i) {
		uint16_t addr = address(i.addr);
		mem.writeByte(addr, shiftOp<OP>(mem.readByte(addr)));
		return SM83::CC_CB_XHL;
	}
	template<BitOp OP> int operator()(const BitR<OP>& i) {
		uint8_t value = R.read8(i.reg);
		if constexpr (OP == BitOp::BIT) {
			alu::testBit8(R, i.bit, value);
		} else if constexpr (OP == BitOp::RES) {
			R.write8(i.reg, alu::resetBit8(i.bit, value));
		} else {
			R.write8(i.reg, alu::setBit8(i.bit, value));
		}
		return SM83::CC_CB_R;
	}
	template<BitOp OP> int operator()(const BitM<OP>& i) {
		uint16_t addr = address(i.addr);
		uint8_t value = mem.readByte(addr);
		if constexpr (OP == BitOp::BIT) {
			alu::testBit8(R, i.bit, value);
			return SM83::CC_BIT_XHL;
		} else if constexpr (OP == BitOp::RES) {
			mem.writeByte(addr, alu::resetBit8(i.bit, value));
		} else {
			mem.writeByte(addr, alu::setBit8(i.bit, value));
		}
		return SM83::CC_CB_XHL;
	}

private:
	// Address of a memory operand. (HL+) and (HL-) update HL right away,
	// this is fine because a fault discards the register copy anyway.
	[[nodiscard]] uint16_t address(RegAddr mode) {
		switch (mode) {
		case ADDR_HL:
			return R.getHL();
		case ADDR_HLI: {
			uint16_t hl = R.getHL();
			R.setHL(uint16_t(hl + 1));
			return hl;
		}
		case ADDR_HLD: {
			uint16_t hl = R.getHL();
			R.setHL(uint16_t(hl - 1));
			return hl;
		}
		case ADDR_BC:
			return R.getBC();
		case ADDR_DE:
			return R.getDE();
		default:
			throw ExecutionFault("Invalid addressing mode ", int(mode));
		}
	}

	void push(uint16_t value) {
		uint16_t sp = R.getSP();
		mem.writeByte(uint16_t(sp - 1), uint8_t(value >> 8));
		mem.writeByte(uint16_t(sp - 2), uint8_t(value & 0xFF));
		R.setSP(uint16_t(sp - 2));
	}
	[[nodiscard]] uint16_t pop() {
		uint16_t sp = R.getSP();
		uint8_t low  = mem.readByte(sp);
		uint8_t high = mem.readByte(uint16_t(sp + 1));
		R.setSP(uint16_t(sp + 2));
		return uint16_t(low | (high << 8));
	}
	void call(uint16_t target) {
		push(uint16_t(pc));
		pc = target;
	}
	void jumpRelative(int8_t e) {
		int target = int(pc) + e;
		if (target < 0 || target > 0xFFFF) {
			throw ExecutionFault("Relative jump from #", hex_string<4>(uint16_t(pc)),
			                     " by ", int(e), " leaves the address space");
		}
		pc = unsigned(target);
	}

	void clearZ() {
		R.setF(R.getF() & ~CPURegs::Z_FLAG);
	}

	template<AluOp OP> void aluOp(uint8_t value) {
		uint8_t a = R.getA();
		if constexpr (OP == AluOp::ADD) {
			R.setA(alu::add8(R, a, value));
		} else if constexpr (OP == AluOp::ADC) {
			R.setA(alu::addWithCarry8(R, a, value));
		} else if constexpr (OP == AluOp::SUB) {
			R.setA(alu::sub8(R, a, value, sub));
		} else if constexpr (OP == AluOp::SBC) {
			R.setA(alu::subWithCarry8(R, a, value, sub));
		} else if constexpr (OP == AluOp::AND) {
			R.setA(alu::and8(R, a, value));
		} else if constexpr (OP == AluOp::XOR) {
			R.setA(alu::xor8(R, a, value));
		} else if constexpr (OP == AluOp::OR) {
			R.setA(alu::or8(R, a, value));
		} else {
			// compare: only the flags are kept
			(void)alu::sub8(R, a, value, sub);
		}
	}

	template<ShiftOp OP> [[nodiscard]] uint8_t shiftOp(uint8_t value) {
		if constexpr (OP == ShiftOp::RLC) {
			return alu::rotateLeftCircular8(R, value);
		} else if constexpr (OP == ShiftOp::RRC) {
			return alu::rotateRightCircular8(R, value);
		} else if constexpr (OP == ShiftOp::RL) {
			return alu::rotateLeft8(R, value);
		} else if constexpr (OP == ShiftOp::RR) {
			return alu::rotateRight8(R, value);
		} else if constexpr (OP == ShiftOp::SLA) {
			return alu::shiftLeftArithmetic8(R, value);
		} else if constexpr (OP == ShiftOp::SRA) {
			return alu::shiftRightArithmetic8(R, value);
		} else if constexpr (OP == ShiftOp::SWAP) {
			return alu::swapNibbles8(R, value);
		} else {
			return alu::shiftRightLogical8(R, value);
		}
	}

private:
	CPURegs& R;
	unsigned& pc;
	MemoryInterface& mem;
	const SubtractFlags sub;
	bool halt = false;
};


CPUCore::CPUCore(CliComm& cliComm_)
	: cliComm(cliComm_)
{
}

CPUCore::CPUCore(CliComm& cliComm_, CPUSettings& settings_)
	: cliComm(cliComm_)
	, settings(&settings_)
{
	conditionEncoding = settings->getConditionEncoding();
	subtractFlags = settings->getSubtractFlags();
	trace = settings->getTrace();
	settings->getConditionEncodingSetting().attach(*this);
	settings->getSubtractFlagsSetting().attach(*this);
	settings->getTraceSetting().attach(*this);
}

CPUCore::~CPUCore()
{
	if (settings) {
		settings->getTraceSetting().detach(*this);
		settings->getSubtractFlagsSetting().detach(*this);
		settings->getConditionEncodingSetting().detach(*this);
	}
}

void CPUCore::update(const Setting& setting) noexcept
{
	if (&setting == &settings->getConditionEncodingSetting()) {
		conditionEncoding = settings->getConditionEncoding();
	} else if (&setting == &settings->getSubtractFlagsSetting()) {
		subtractFlags = settings->getSubtractFlags();
	} else if (&setting == &settings->getTraceSetting()) {
		trace = settings->getTrace();
	}
}

void CPUCore::reset()
{
	R.reset();
	pc = 0;
	halted = false;
	clock.reset();
}

void CPUCore::traceInstruction(const Instruction& instruction, uint16_t nextPc)
{
	std::string line = strCat(hex_string<4>(pc), " : ");
	dasm(instruction, nextPc, line);
	strAppend(line, " AF=", hex_string<4>(R.getAF()),
	                " BC=", hex_string<4>(R.getBC()),
	                " DE=", hex_string<4>(R.getDE()),
	                " HL=", hex_string<4>(R.getHL()),
	                " SP=", hex_string<4>(R.getSP()));
	cliComm.printInfo(line);
}

StepOutcome CPUCore::fault(StepOutcome::Fault kind, std::string reason)
{
	cliComm.printWarning("CPU fault at #", hex_string<4>(pc), ": ", reason);
	return {StepOutcome::Status::FAULT, kind, std::move(reason)};
}

StepOutcome CPUCore::step(MemoryInterface& memory)
{
	if (halted) return {StepOutcome::Status::HALTED};

	// Execute on copies, only commit when the whole instruction succeeded.
	CPURegs regs = R;
	try {
		unsigned cursor = pc;
		auto instruction = decode(memory, cursor, conditionEncoding);
		if (trace) traceInstruction(instruction, uint16_t(cursor));

		unsigned nextPc = cursor;
		Executor executor(regs, nextPc, memory, subtractFlags);
		int cycles = std::visit(executor, instruction);

		R = regs;
		pc = uint16_t(nextPc); // #10000 wraps to 0
		clock.add(unsigned(cycles));
		if (executor.haltRequested()) {
			halted = true;
			cliComm.printInfo("CPU halted at #", hex_string<4>(pc));
			cliComm.update(CliComm::UpdateType::STATUS, "cpu", "halted");
			return {StepOutcome::Status::HALTED};
		}
		return {StepOutcome::Status::CONTINUE};
	} catch (DecodeFault& e) {
		return fault(StepOutcome::Fault::DECODE, std::move(e).getMessage());
	} catch (ExecutionFault& e) {
		return fault(StepOutcome::Fault::EXECUTION, std::move(e).getMessage());
	} catch (MemoryFault& e) {
		return fault(StepOutcome::Fault::MEMORY, std::move(e).getMessage());
	}
}

} // namespace gbcore
