#pragma once

#include "ident/Exports.h"
#include "ident/Span.h"

namespace ident
{
	class Rand
	{
	public:
		// fills the buffer from the os randomness source, returns false if the source failed
		IDENT_EXPORT static bool cryptoRand(Span<std::byte> buffer);
	};
}
