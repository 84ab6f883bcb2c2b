#pragma once

#include "ident/Exports.h"
#include "ident/Allocator.h"

namespace ident
{
	class Mallocator: public Allocator
	{
	public:
		IDENT_EXPORT void* alloc(size_t size, size_t alignment) override;
		IDENT_EXPORT void commit(void* ptr, size_t size) override;
		IDENT_EXPORT void release(void* ptr, size_t size) override;
		IDENT_EXPORT void free(void* ptr, size_t size) override;
	};
}
