#pragma once

#include <cstddef>

namespace ident
{
	// every allocating api in ident takes one of these, memory is reserved with alloc then made
	// usable with commit, and handed back with release then free
	class Allocator
	{
	public:
		virtual ~Allocator() = default;

		virtual void* alloc(size_t size, size_t alignment) = 0;
		virtual void commit(void* ptr, size_t size) = 0;
		virtual void release(void* ptr, size_t size) = 0;
		virtual void free(void* ptr, size_t size) = 0;
	};
}
