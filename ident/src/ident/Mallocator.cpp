#include "ident/Mallocator.h"
#include "ident/Assert.h"

#include <tracy/Tracy.hpp>

#include <cstdlib>

namespace ident
{
	void* Mallocator::alloc(size_t size, size_t)
	{
		auto res = ::malloc(size);
		identAssertMsg(res != nullptr || size == 0, "out of memory");
		TracyAllocS(res, size, 10);
		return res;
	}

	void Mallocator::commit(void*, size_t)
	{
		// malloc memory is usable right away
	}

	void Mallocator::release(void*, size_t)
	{
		// nothing to decommit
	}

	void Mallocator::free(void* ptr, size_t)
	{
		if (ptr == nullptr)
			return;
		TracyFreeS(ptr, 10);
		::free(ptr);
	}
}
