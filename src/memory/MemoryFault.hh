#ifndef MEMORYFAULT_HH
#define MEMORYFAULT_HH

#include "CoreException.hh"

namespace gbcore {

class MemoryFault final : public CoreException
{
public:
	using CoreException::CoreException;
};

} // namespace gbcore

#endif
