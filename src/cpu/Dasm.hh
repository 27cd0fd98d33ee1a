#ifndef DASM_HH
#define DASM_HH

#include "Instruction.hh"

#include <cstdint>
#include <span>
#include <string>

namespace gbcore {

void appendAddrAsHex(std::string& output, uint16_t addr);

/** Disassemble an already decoded instruction.
  * @param instr The instruction
  * @param nextPc Address of the byte following the instruction, used to
  *               calculate the target of relative jumps
  * @param dest String [output] representation of the instruction
  */
void dasm(const Instruction& instr, uint16_t nextPc, std::string& dest);

/** Disassemble
  * @param opcode Buffer containing the machine language instruction
  * @param pc Program Counter used for disassembling relative addresses
  * @param dest String [output] representation of the disassembled opcode
  * @return Length of the disassembled opcode in bytes. Bytes that don't
  *         form a valid instruction are shown as 'db #xx' with length 1.
  */
unsigned dasm(std::span<const uint8_t> opcode, uint16_t pc, std::string& dest);

} // namespace gbcore

#endif
