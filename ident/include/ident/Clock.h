#pragma once

#include "ident/Exports.h"
#include "ident/UUIDError.h"
#include "ident/Result.h"

#include <cstdint>

namespace ident
{
	class Clock
	{
	public:
		// 100ns ticks between the gregorian reform (1582-10-15T00:00:00Z) and the unix epoch
		static constexpr uint64_t GREGORIAN_TO_UNIX_TICKS = 0x01B21DD213814000ULL;

		// current wall clock time in 100ns ticks since 1582-10-15T00:00:00Z
		IDENT_EXPORT static Result<uint64_t, UUIDError> gregorianTicks(Allocator* allocator);
	};
}
