#define CATCH_CONFIG_RUNNER
#include "catch.hpp"

#include "CoreException.hh"

#include <tcl.h>

CATCH_TRANSLATE_EXCEPTION(const gbcore::CoreException& e) {
	return e.getMessage();
}

int main(int argc, char* argv[])
{
	// Initialize the Tcl library once per process, before any Tcl call
	// (ctest runs each test case in its own process).
	Tcl_FindExecutable(argv[0]);
	return Catch::Session().run(argc, argv);
}
