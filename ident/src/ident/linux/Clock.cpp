#include "ident/Clock.h"

#include <time.h>

#include <cerrno>
#include <cstring>

namespace ident
{
	Result<uint64_t, UUIDError> Clock::gregorianTicks(Allocator* allocator)
	{
		timespec ts{};
		if (::clock_gettime(CLOCK_REALTIME, &ts) != 0)
			return UUIDError::clock(allocator, StringView{::strerror(errno)});

		if (ts.tv_sec < 0)
			return UUIDError::clock(allocator, "system clock is before the unix epoch"_sv);

		return uint64_t(ts.tv_sec) * 10'000'000ULL + uint64_t(ts.tv_nsec) / 100ULL + GREGORIAN_TO_UNIX_TICKS;
	}
}
