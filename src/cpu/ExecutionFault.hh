#ifndef EXECUTIONFAULT_HH
#define EXECUTIONFAULT_HH

#include "CoreException.hh"

namespace gbcore {

/** A decoded instruction could not be applied, e.g. a register that is not
  * valid for the operand width or a relative jump outside the address space.
  */
class ExecutionFault final : public CoreException
{
public:
	using CoreException::CoreException;
};

} // namespace gbcore

#endif
