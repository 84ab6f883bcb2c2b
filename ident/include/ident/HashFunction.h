#pragma once

#include "ident/Span.h"

#include <cstddef>
#include <cstdint>

namespace ident
{
	// fnv-1a hash of a block of bytes
	inline static uint64_t fnva(Span<const std::byte> bytes, uint64_t seed = 0xc70f6907ULL)
	{
		auto h = seed + 0xcbf29ce484222325ULL;
		for (auto b: bytes)
			h = (h ^ uint64_t(b)) * 0x100000001b3ULL;
		return h;
	}
}
