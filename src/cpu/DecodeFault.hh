#ifndef DECODEFAULT_HH
#define DECODEFAULT_HH

#include "CoreException.hh"

namespace gbcore {

/** The instruction stream could not be turned into an instruction: an
  * unassigned opcode, a malformed opcode table entry or a truncated stream.
  */
class DecodeFault final : public CoreException
{
public:
	using CoreException::CoreException;
};

} // namespace gbcore

#endif
