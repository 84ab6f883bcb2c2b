#include "ident/OS.h"

#include <unistd.h>

namespace ident
{
	uint64_t OS::processId()
	{
		return uint64_t(::getpid());
	}
}
