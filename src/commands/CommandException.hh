#ifndef COMMANDEXCEPTION_HH
#define COMMANDEXCEPTION_HH

#include "CoreException.hh"

namespace gbcore {

class CommandException : public CoreException
{
public:
	using CoreException::CoreException;
};

} // namespace gbcore

#endif
