#ifndef DECODER_HH
#define DECODER_HH

#include "Instruction.hh"

#include <cstdint>
#include <optional>
#include <span>

namespace gbcore {

class MemoryInterface;

/** Decode one instruction starting at bytes[cursor].
  * On success 'cursor' is advanced past the instruction (opcode, escape
  * byte and immediates). Throws DecodeFault for unassigned opcodes,
  * malformed table entries or when the span ends inside the instruction;
  * 'cursor' is left unchanged in that case.
  */
[[nodiscard]] Instruction decode(
	std::span<const uint8_t> bytes, unsigned& cursor,
	ConditionEncoding encoding = ConditionEncoding::CONVENTIONAL);

/** Same, but fetch the bytes via MemoryInterface::readByte() starting at
  * 'address'. An instruction that does not end before 0x10000 is a
  * DecodeFault.
  */
[[nodiscard]] Instruction decode(
	MemoryInterface& memory, unsigned& address,
	ConditionEncoding encoding = ConditionEncoding::CONVENTIONAL);

/** Length in bytes of the instruction at the start of 'bytes', or
  * std::nullopt when it is unassigned or truncated. */
[[nodiscard]] std::optional<unsigned> instructionLength(std::span<const uint8_t> bytes);

} // namespace gbcore

#endif
