#ifndef CPUCORE_HH
#define CPUCORE_HH

#include "ALU.hh"
#include "CPUClock.hh"
#include "CPURegs.hh"
#include "Instruction.hh"
#include "Subject.hh"

#include <cstdint>
#include <string>

namespace gbcore {

class CliComm;
class CPUSettings;
class MemoryInterface;
class Setting;

/** Result of executing (or trying to execute) one instruction. */
struct StepOutcome
{
	enum class Status : uint8_t { CONTINUE, HALTED, FAULT };
	enum class Fault : uint8_t { NONE, DECODE, EXECUTION, MEMORY };

	Status status = Status::CONTINUE;
	Fault fault = Fault::NONE;
	std::string reason; // only for FAULT

	[[nodiscard]] bool isContinue() const { return status == Status::CONTINUE; }
	[[nodiscard]] bool isHalted()   const { return status == Status::HALTED; }
	[[nodiscard]] bool isFault()    const { return status == Status::FAULT; }
};

class CPUCore final : private Observer<Setting>
{
public:
	/** Core with the default configuration (conventional conditions,
	  * borrow flags, no tracing). */
	explicit CPUCore(CliComm& cliComm);
	/** Core that follows the given settings. */
	CPUCore(CliComm& cliComm, CPUSettings& settings);
	~CPUCore();

	CPUCore(const CPUCore&) = delete;
	CPUCore& operator=(const CPUCore&) = delete;

	/** Decode and execute the instruction at PC.
	  * On a fault the registers, PC and cycle counter are left unchanged
	  * (memory writes that already happened are not undone).
	  * Once halted (HALT or STOP) every call returns HALTED without
	  * fetching, until reset().
	  */
	StepOutcome step(MemoryInterface& memory);

	/** Zero all registers and PC, leave the halted state, clear the
	  * cycle counter. */
	void reset();

	[[nodiscard]] CPURegs& getRegisters() { return R; }
	[[nodiscard]] const CPURegs& getRegisters() const { return R; }
	[[nodiscard]] uint16_t getPC() const { return pc; }
	void setPC(uint16_t x) { pc = x; }
	[[nodiscard]] bool isHalted() const { return halted; }

	[[nodiscard]] CPUClock& getClock() { return clock; }
	[[nodiscard]] const CPUClock& getClock() const { return clock; }

	[[nodiscard]] ConditionEncoding getConditionEncoding() const { return conditionEncoding; }
	void setConditionEncoding(ConditionEncoding e) { conditionEncoding = e; }
	[[nodiscard]] SubtractFlags getSubtractFlags() const { return subtractFlags; }
	void setSubtractFlags(SubtractFlags s) { subtractFlags = s; }
	[[nodiscard]] bool getTrace() const { return trace; }
	void setTrace(bool t) { trace = t; }

private:
	// Observer<Setting>
	void update(const Setting& setting) noexcept override;

	void traceInstruction(const Instruction& instruction, uint16_t nextPc);
	StepOutcome fault(StepOutcome::Fault kind, std::string reason);

private:
	CliComm& cliComm;
	CPUSettings* settings = nullptr;

	CPURegs R;
	uint16_t pc = 0;
	bool halted = false;
	CPUClock clock;

	ConditionEncoding conditionEncoding = ConditionEncoding::CONVENTIONAL;
	SubtractFlags subtractFlags = SubtractFlags::BORROW;
	bool trace = false;
};

} // namespace gbcore

#endif
