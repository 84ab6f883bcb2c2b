#pragma once

#include "ident/Exports.h"

#include <cstdint>

namespace ident
{
	class OS
	{
	public:
		IDENT_EXPORT static uint64_t processId();
	};
}
