#include "catch.hpp"

#include "CaptureListener.hh"
#include "CPUCore.hh"
#include "FlatMemory.hh"
#include "GlobalCliComm.hh"

#include <array>
#include <initializer_list>
#include <memory>
#include <vector>

using namespace gbcore;

static constexpr uint8_t Z = CPURegs::Z_FLAG;
static constexpr uint8_t N = CPURegs::N_FLAG;
static constexpr uint8_t H = CPURegs::H_FLAG;
static constexpr uint8_t C = CPURegs::C_FLAG;

namespace {

// A core plus 64kB of memory, the program is loaded at 'origin'.
struct Machine
{
	explicit Machine(std::initializer_list<uint8_t> program, uint16_t origin = 0x0100)
		: core(cliComm)
	{
		listener = static_cast<CaptureListener*>(
			cliComm.addListener(std::make_unique<CaptureListener>()));
		std::vector<uint8_t> bytes(program);
		mem.load(origin, bytes);
		core.setPC(origin);
	}

	StepOutcome step() { return core.step(mem); }
	CPURegs& regs() { return core.getRegisters(); }

	GlobalCliComm cliComm;
	CaptureListener* listener;
	FlatMemory mem;
	CPUCore core;
};

} // namespace

TEST_CASE("CPUCore: LD B,B changes nothing")
{
	Machine m({0x40});
	m.regs().setB(0x42);
	m.regs().setF(Z | C);
	CPURegs before = m.regs();
	auto outcome = m.step();
	CHECK(outcome.isContinue());
	CHECK(m.regs() == before);
	CHECK(m.core.getPC() == 0x0101);
	CHECK(m.core.getClock().getTotalTicks() == 4);
}

TEST_CASE("CPUCore: LD B,n")
{
	Machine m({0x06, 0x2A});
	CHECK(m.step().isContinue());
	CHECK(m.regs().getB() == 0x2A);
	CHECK(m.regs().getF() == 0);
	CHECK(m.core.getPC() == 0x0102);
	CHECK(m.core.getClock().getTotalTicks() == 8);
}

TEST_CASE("CPUCore: INC A wraps and keeps carry")
{
	Machine m({0x3C, 0x3C});
	m.regs().setA(0xFF);
	m.regs().setF(C);
	CHECK(m.step().isContinue());
	CHECK(m.regs().getA() == 0x00);
	CHECK(m.regs().getF() == (Z | H | C));

	m.regs().setA(0xFF);
	m.regs().setF(0);
	CHECK(m.step().isContinue());
	CHECK(m.regs().getF() == (Z | H));
}

TEST_CASE("CPUCore: loads through memory")
{
	SECTION("(HL+) and (HL-)") {
		// LD (HL+),A ; LD (HL-),A ; LD A,(HL-)
		Machine m({0x22, 0x32, 0x3A});
		m.regs().setHL(0xC000);
		m.regs().setA(0x11);
		m.step();
		CHECK(m.mem.peekByte(0xC000) == 0x11);
		CHECK(m.regs().getHL() == 0xC001);
		m.regs().setA(0x22);
		m.step();
		CHECK(m.mem.peekByte(0xC001) == 0x22);
		CHECK(m.regs().getHL() == 0xC000);
		m.step();
		CHECK(m.regs().getA() == 0x11);
		CHECK(m.regs().getHL() == 0xBFFF);
	}
	SECTION("(BC), (DE) and (HL)") {
		// LD (BC),A ; LD A,(DE) ; LD (HL),n ; LD E,(HL)
		Machine m({0x02, 0x1A, 0x36, 0x77, 0x5E});
		m.regs().setBC(0xC010);
		m.regs().setDE(0xC010);
		m.regs().setHL(0xC020);
		m.regs().setA(0x5A);
		m.step();
		m.regs().setA(0);
		m.step();
		CHECK(m.regs().getA() == 0x5A);
		m.step();
		CHECK(m.mem.peekByte(0xC020) == 0x77);
		m.step();
		CHECK(m.regs().getE() == 0x77);
		CHECK(m.core.getClock().getTotalTicks() == 8 + 8 + 12 + 8);
	}
	SECTION("absolute and high page") {
		// LD (#C123),A ; LDH (#80),A ; LD A,(C) ; LD A,(#C123) ; LD (#C200),SP
		Machine m({0xEA, 0x23, 0xC1, 0xE0, 0x80, 0xF2, 0xFA, 0x23, 0xC1, 0x08, 0x00, 0xC2});
		m.regs().setA(0x99);
		m.regs().setC(0x80);
		m.regs().setSP(0xFFFE);
		m.step();
		CHECK(m.mem.peekByte(0xC123) == 0x99);
		m.regs().setA(0x44);
		m.step();
		CHECK(m.mem.peekByte(0xFF80) == 0x44);
		m.regs().setA(0);
		m.step();
		CHECK(m.regs().getA() == 0x44);
		m.step();
		CHECK(m.regs().getA() == 0x99);
		m.step();
		CHECK(m.mem.peekByte(0xC200) == 0xFE);
		CHECK(m.mem.peekByte(0xC201) == 0xFF);
		CHECK(m.core.getPC() == 0x010C);
	}
	SECTION("16-bit") {
		// LD SP,#D000 ; LD HL,SP-2 ; LD SP,HL ; ADD SP,+4
		Machine m({0x31, 0x00, 0xD0, 0xF8, 0xFE, 0xF9, 0xE8, 0x04});
		m.step();
		CHECK(m.regs().getSP() == 0xD000);
		m.step();
		CHECK(m.regs().getHL() == 0xCFFE);
		CHECK(m.regs().getF() == 0);
		m.step();
		CHECK(m.regs().getSP() == 0xCFFE);
		m.step();
		CHECK(m.regs().getSP() == 0xD002);
		CHECK(m.regs().getF() == (H | C)); // from the low byte #FE + #04
	}
}

TEST_CASE("CPUCore: arithmetic")
{
	SECTION("ADD, SUB, CP") {
		// ADD A,B ; SUB #10 ; CP A
		Machine m({0x80, 0xD6, 0x10, 0xBF});
		m.regs().setA(0x08);
		m.regs().setB(0x08);
		m.step();
		CHECK(m.regs().getA() == 0x10);
		CHECK(m.regs().getF() == H);
		m.step();
		CHECK(m.regs().getA() == 0x00);
		CHECK(m.regs().getF() == (Z | N));
		m.regs().setA(0x33);
		m.step();
		CHECK(m.regs().getA() == 0x33); // compare keeps A
		CHECK(m.regs().getF() == (Z | N));
	}
	SECTION("subtract flag polarity") {
		Machine m({0x90, 0x90}); // SUB B
		m.regs().setA(0x00);
		m.regs().setB(0x01);
		m.step();
		CHECK(m.regs().getF() == (N | H | C));
		m.core.setSubtractFlags(SubtractFlags::NO_BORROW);
		m.regs().setA(0x00);
		m.step();
		CHECK(m.regs().getF() == N);
	}
	SECTION("(HL) operand") {
		// AND (HL) ; INC (HL) ; DEC (HL)
		Machine m({0xA6, 0x34, 0x35, 0x35});
		m.regs().setHL(0xC000);
		m.mem.writeByte(0xC000, 0x0F);
		m.regs().setA(0xFF);
		m.step();
		CHECK(m.regs().getA() == 0x0F);
		CHECK(m.regs().getF() == H);
		m.step();
		CHECK(m.mem.peekByte(0xC000) == 0x10);
		CHECK(m.regs().getF() == H);
		m.step();
		m.step();
		CHECK(m.mem.peekByte(0xC000) == 0x0E);
		CHECK(m.regs().getF() == N);
	}
	SECTION("16-bit increment and decrement") {
		// INC BC ; DEC DE ; DEC DE ; ADD HL,BC
		Machine m({0x03, 0x1B, 0x1B, 0x09});
		m.regs().setBC(0xFFFF);
		m.regs().setDE(0x0001);
		m.regs().setHL(0x0FFF);
		m.regs().setF(Z | C);
		m.step();
		CHECK(m.regs().getBC() == 0x0000);
		m.step();
		m.step();
		CHECK(m.regs().getDE() == 0x0000); // stops at zero
		CHECK(m.regs().getF() == (Z | C)); // flags untouched
		m.regs().setBC(0x0001);
		m.step();
		CHECK(m.regs().getHL() == 0x1000);
		CHECK(m.regs().getF() == H);
	}
	SECTION("accumulator rotates clear Z") {
		// RLCA ; RRA ; CPL ; SCF ; CCF
		Machine m({0x07, 0x1F, 0x2F, 0x37, 0x3F});
		m.regs().setA(0x80);
		m.step();
		CHECK(m.regs().getA() == 0x01);
		CHECK(m.regs().getF() == C);
		m.regs().setA(0x00);
		m.regs().setF(0);
		m.step();
		CHECK(m.regs().getA() == 0x00);
		CHECK(m.regs().getF() == 0); // result is zero, Z stays clear
		m.step();
		CHECK(m.regs().getA() == 0xFF);
		CHECK(m.regs().getF() == (N | H));
		m.step();
		CHECK(m.regs().getF() == C);
		m.step();
		CHECK(m.regs().getF() == 0);
	}
	SECTION("DAA") {
		// ADD A,#27 ; DAA
		Machine m({0xC6, 0x27, 0x27});
		m.regs().setA(0x15);
		m.step();
		m.step();
		CHECK(m.regs().getA() == 0x42);
	}
}

TEST_CASE("CPUCore: extended opcodes")
{
	// SWAP A ; BIT 7,(HL) ; SET 7,(HL) ; BIT 7,(HL) ; RES 0,B ; SRL (HL)
	Machine m({0xCB, 0x37, 0xCB, 0x7E, 0xCB, 0xFE, 0xCB, 0x7E, 0xCB, 0x80, 0xCB, 0x3E});
	m.regs().setA(0x12);
	m.regs().setB(0xFF);
	m.regs().setHL(0xC000);
	m.mem.writeByte(0xC000, 0x01);
	m.step();
	CHECK(m.regs().getA() == 0x21);
	CHECK(m.regs().getF() == 0);
	m.step();
	CHECK(m.regs().getF() == (Z | H));
	m.step();
	CHECK(m.mem.peekByte(0xC000) == 0x81);
	m.step();
	CHECK(m.regs().getF() == H);
	m.step();
	CHECK(m.regs().getB() == 0xFE);
	m.step();
	CHECK(m.mem.peekByte(0xC000) == 0x40);
	CHECK(m.regs().getF() == C);
	CHECK(m.core.getClock().getTotalTicks() == 8 + 12 + 16 + 12 + 8 + 16);
}

TEST_CASE("CPUCore: jumps")
{
	SECTION("conditional relative jump not taken") {
		Machine m({0x20, 0x10}); // JR NZ,+16
		m.regs().setF(Z);
		CHECK(m.step().isContinue());
		CHECK(m.core.getPC() == 0x0102);
		CHECK(m.core.getClock().getTotalTicks() == 8);
	}
	SECTION("conditional relative jump taken") {
		Machine m({0x20, 0xFE}); // JR NZ,-2
		CHECK(m.step().isContinue());
		CHECK(m.core.getPC() == 0x0100);
		CHECK(m.core.getClock().getTotalTicks() == 12);
	}
	SECTION("relative jump out of the address space") {
		Machine m({0x18, 0x80}, 0x0000); // JR -128
		auto outcome = m.step();
		CHECK(outcome.isFault());
		CHECK(outcome.fault == StepOutcome::Fault::EXECUTION);
		CHECK(m.core.getPC() == 0x0000);
		CHECK(m.core.getClock().getTotalTicks() == 0);
	}
	SECTION("relative jump ending at the top of memory") {
		Machine m({0x18, 0xFE}, 0xFFFE); // JR -2
		auto outcome = m.step();
		CHECK(outcome.isContinue());
		CHECK(m.core.getPC() == 0xFFFE);
		CHECK(m.core.getClock().getTotalTicks() == 12);
	}
	SECTION("relative jump past the top of memory") {
		Machine m({0x18, 0x01}, 0xFFFE); // JR +1
		auto outcome = m.step();
		CHECK(outcome.fault == StepOutcome::Fault::EXECUTION);
		CHECK(m.core.getPC() == 0xFFFE);
	}
	SECTION("absolute") {
		// JP #0200 ... JP C,#0300 ; JP (HL)
		Machine m({0xC3, 0x00, 0x02});
		m.mem.load(0x0200, std::array<uint8_t, 4>{0xDA, 0x00, 0x03, 0xE9});
		m.regs().setHL(0x1234);
		m.step();
		CHECK(m.core.getPC() == 0x0200);
		m.step();
		CHECK(m.core.getPC() == 0x0203);
		m.step();
		CHECK(m.core.getPC() == 0x1234);
		CHECK(m.core.getClock().getTotalTicks() == 16 + 12 + 4);
	}
	SECTION("mask condition encoding") {
		Machine m({0x20, 0x10, 0x20, 0x10}); // JR NZ,+16
		m.core.setConditionEncoding(ConditionEncoding::MASK);
		m.step(); // N and Z clear: not taken
		CHECK(m.core.getPC() == 0x0102);
		m.regs().setF(N | Z);
		m.step();
		CHECK(m.core.getPC() == 0x0114);
	}
}

TEST_CASE("CPUCore: stack")
{
	SECTION("PUSH and POP") {
		// PUSH BC ; POP AF
		Machine m({0xC5, 0xF1});
		m.regs().setSP(0xD000);
		m.regs().setBC(0x12FF);
		m.step();
		CHECK(m.regs().getSP() == 0xCFFE);
		CHECK(m.mem.peekByte(0xCFFF) == 0x12); // high byte at SP-1
		CHECK(m.mem.peekByte(0xCFFE) == 0xFF); // low byte at SP-2
		m.step();
		CHECK(m.regs().getSP() == 0xD000);
		// A is the low byte of the AF pair
		CHECK(m.regs().getA() == 0xFF);
		CHECK(m.regs().getF() == 0x10); // low nibble dropped
	}
	SECTION("CALL and RET") {
		Machine m({0xCD, 0x00, 0x02}); // CALL #0200
		m.mem.load(0x0200, std::array<uint8_t, 1>{0xC9}); // RET
		m.regs().setSP(0xD000);
		m.step();
		CHECK(m.core.getPC() == 0x0200);
		CHECK(m.regs().getSP() == 0xCFFE);
		CHECK(m.mem.peekByte(0xCFFF) == 0x01);
		CHECK(m.mem.peekByte(0xCFFE) == 0x03);
		m.step();
		CHECK(m.core.getPC() == 0x0103);
		CHECK(m.regs().getSP() == 0xD000);
		CHECK(m.core.getClock().getTotalTicks() == 24 + 16);
	}
	SECTION("conditional CALL and RET") {
		// CALL Z,#0200 ; RET NC (not taken)
		Machine m({0xCC, 0x00, 0x02, 0xD0});
		m.regs().setSP(0xD000);
		m.regs().setF(C);
		m.step();
		CHECK(m.core.getPC() == 0x0103);
		CHECK(m.regs().getSP() == 0xD000);
		m.step();
		CHECK(m.core.getPC() == 0x0104);
		CHECK(m.core.getClock().getTotalTicks() == 12 + 8);
	}
	SECTION("RST") {
		Machine m({0xEF}); // RST #28
		m.regs().setSP(0xD000);
		m.step();
		CHECK(m.core.getPC() == 0x0028);
		CHECK(m.mem.peekByte(0xCFFE) == 0x01);
		CHECK(m.mem.peekByte(0xCFFF) == 0x01);
	}
}

TEST_CASE("CPUCore: halting")
{
	SECTION("HALT") {
		Machine m({0x76, 0x00});
		auto outcome = m.step();
		CHECK(outcome.isHalted());
		CHECK(m.core.isHalted());
		CHECK(m.core.getPC() == 0x0101);
		// stays halted, nothing is fetched
		CHECK(m.step().isHalted());
		CHECK(m.core.getPC() == 0x0101);
		CHECK(m.core.getClock().getTotalTicks() == 4);
		CHECK(m.listener->count(CliComm::LogLevel::INFO) == 1);
		REQUIRE(m.listener->updates.size() == 1);
		CHECK(m.listener->updates[0].type == CliComm::UpdateType::STATUS);
		CHECK(m.listener->updates[0].value == "halted");

		m.core.reset();
		CHECK(!m.core.isHalted());
		CHECK(m.core.getPC() == 0x0000);
		CHECK(m.core.getClock().getTotalTicks() == 0);
	}
	SECTION("STOP is two bytes") {
		Machine m({0x10, 0x00});
		CHECK(m.step().isHalted());
		CHECK(m.core.getPC() == 0x0102);
	}
}

TEST_CASE("CPUCore: faults leave the state unchanged")
{
	SECTION("unassigned opcode") {
		Machine m({0xD3});
		m.regs().setA(0x12);
		CPURegs before = m.regs();
		auto outcome = m.step();
		CHECK(outcome.isFault());
		CHECK(outcome.fault == StepOutcome::Fault::DECODE);
		CHECK(!outcome.reason.empty());
		CHECK(m.regs() == before);
		CHECK(m.core.getPC() == 0x0100);
		CHECK(m.core.getClock().getTotalTicks() == 0);
		CHECK(m.listener->count(CliComm::LogLevel::WARNING) == 1);
	}
	SECTION("memory fault halfway") {
		// LD A,(HL+) with HL outside of a 32kB memory
		GlobalCliComm cliComm;
		cliComm.addListener(std::make_unique<CaptureListener>());
		FlatMemory mem(0x8000);
		mem.load(0x0000, std::array<uint8_t, 1>{0x2A});
		CPUCore core(cliComm);
		core.getRegisters().setHL(0x9000);
		auto outcome = core.step(mem);
		CHECK(outcome.isFault());
		CHECK(outcome.fault == StepOutcome::Fault::MEMORY);
		CHECK(core.getRegisters().getHL() == 0x9000); // no post-increment
		CHECK(core.getPC() == 0x0000);
	}
	SECTION("stack push that faults") {
		GlobalCliComm cliComm;
		cliComm.addListener(std::make_unique<CaptureListener>());
		FlatMemory mem(0x8000);
		mem.load(0x0000, std::array<uint8_t, 3>{0xCD, 0x00, 0x10}); // CALL #1000
		CPUCore core(cliComm);
		core.getRegisters().setSP(0x0000); // pushes to #FFFF
		auto outcome = core.step(mem);
		CHECK(outcome.fault == StepOutcome::Fault::MEMORY);
		CHECK(core.getRegisters().getSP() == 0x0000);
		CHECK(core.getPC() == 0x0000);
	}
}

TEST_CASE("CPUCore: trace output")
{
	Machine m({0x06, 0x2A, 0x00});
	m.core.setTrace(true);
	m.step();
	REQUIRE(m.listener->messages.size() == 1);
	CHECK(m.listener->messages[0].text ==
	      "0100 : ld b,#2a AF=0000 BC=0000 DE=0000 HL=0000 SP=0000");
	m.core.setTrace(false);
	m.step();
	CHECK(m.listener->messages.size() == 1);
}

TEST_CASE("CPUCore: cycle hook")
{
	Machine m({0x00, 0x06, 0x01, 0xD3});
	std::vector<unsigned> consumed;
	m.core.getClock().setHook([&](unsigned ticks) { consumed.push_back(ticks); });
	m.step();
	m.step();
	m.step(); // fault, nothing consumed
	CHECK(consumed == std::vector<unsigned>{4, 8});
	CHECK(m.core.getClock().getTotalTicks() == 12);
}
