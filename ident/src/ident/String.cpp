#include "ident/String.h"

namespace ident
{
	void String::destroy()
	{
		if (m_allocator == nullptr || m_ptr == nullptr)
			return;

		m_allocator->release(m_ptr, m_capacity);
		m_allocator->free(m_ptr, m_capacity);
		m_ptr = nullptr;
		m_capacity = 0;
		m_count = 0;
	}

	void String::copyFrom(const String& other)
	{
		m_allocator = other.m_allocator;
		m_ptr = nullptr;
		m_count = 0;
		m_capacity = 0;

		if (other.m_count == 0)
			return;

		m_count = other.m_count;
		// +1 for the null terminator
		m_capacity = m_count + 1;

		m_ptr = (char*)m_allocator->alloc(m_capacity, alignof(char));
		m_allocator->commit(m_ptr, m_capacity);

		::memcpy(m_ptr, other.m_ptr, m_count);
		m_ptr[m_count] = '\0';
	}

	void String::moveFrom(String&& other)
	{
		m_allocator = other.m_allocator;
		m_ptr = other.m_ptr;
		m_count = other.m_count;
		m_capacity = other.m_capacity;

		other.m_ptr = nullptr;
		other.m_count = 0;
		other.m_capacity = 0;
	}

	void String::grow(size_t new_capacity)
	{
		auto new_ptr = (char*)m_allocator->alloc(new_capacity, alignof(char));
		m_allocator->commit(new_ptr, new_capacity);

		if (m_ptr)
		{
			::memcpy(new_ptr, m_ptr, m_count);
			m_allocator->release(m_ptr, m_capacity);
			m_allocator->free(m_ptr, m_capacity);
		}

		m_ptr = new_ptr;
		m_capacity = new_capacity;
	}

	void String::ensureSpaceExists(size_t count)
	{
		if (m_count + count > m_capacity)
		{
			auto new_capacity = m_capacity * 2;
			if (new_capacity == 0)
				new_capacity = 8;

			if (new_capacity < m_count + count)
				new_capacity = m_count + count;

			grow(new_capacity);
		}
	}

	void String::resize(size_t new_count)
	{
		// +1 for the null terminator
		if (new_count + 1 > m_capacity)
			grow(new_count + 1);

		if (new_count > m_count)
			::memset(m_ptr + m_count, 0, new_count - m_count);
		m_count = new_count;
		m_ptr[m_count] = '\0';
	}

	String::String(StringView str, Allocator* allocator)
		: m_allocator(allocator)
	{
		if (str.count() != 0)
		{
			m_count = str.count();
			m_capacity = m_count + 1;

			m_ptr = (char*)m_allocator->alloc(m_capacity, alignof(char));
			m_allocator->commit(m_ptr, m_capacity);

			::memcpy(m_ptr, str.begin(), m_count);
			m_ptr[m_count] = '\0';
		}
	}

	void String::push(StringView str)
	{
		if (str.count() == 0)
			return;

		// +1 for the null terminator
		ensureSpaceExists(str.count() + 1);
		::memcpy(m_ptr + m_count, str.begin(), str.count());
		m_count += str.count();
		m_ptr[m_count] = '\0';
	}

	void String::pushByte(char v)
	{
		// +2 = 1 for the byte + 1 for the null termination
		ensureSpaceExists(2);
		m_ptr[m_count++] = v;
		m_ptr[m_count] = '\0';
	}
}
