#pragma once

#include "ident/Assert.h"

#include <cstddef>
#include <cstdint>

namespace ident
{
	template<typename T>
	class Span
	{
		T* m_ptr = nullptr;
		size_t m_count = 0;
	public:
		Span() = default;
		Span(T* ptr, size_t count)
			: m_ptr(ptr)
			, m_count(count)
		{}

		T* begin() const { return m_ptr; }
		T* end() const { return m_ptr + m_count; }

		T& operator[](size_t index) const
		{
			identAssert(index < m_count);
			return m_ptr[index];
		}

		T* data() const { return m_ptr; }

		size_t count() const { return m_count; }
	};
}
