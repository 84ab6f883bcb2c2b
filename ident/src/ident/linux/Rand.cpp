#include "ident/Rand.h"

#include <sys/random.h>

#include <cerrno>

namespace ident
{
	bool Rand::cryptoRand(Span<std::byte> buffer)
	{
		size_t s = 0;
		while (s < buffer.count())
		{
			auto res = getrandom((char*)buffer.data() + s, buffer.count() - s, 0);
			if (res < 0)
			{
				if (errno == EINTR)
					continue;
				return false;
			}
			s += size_t(res);
		}
		return true;
	}
}
