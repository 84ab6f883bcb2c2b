#pragma once

#include "ident/Allocator.h"
#include "ident/Assert.h"

#include <cstdint>
#include <type_traits>
#include <new>
#include <utility>

namespace ident
{
	template<typename T>
	class Array
	{
		Allocator* m_allocator = nullptr;
		T* m_ptr = nullptr;
		size_t m_capacity = 0;
		size_t m_count = 0;

		void destroy()
		{
			for (size_t i = 0; i < m_count; ++i)
				m_ptr[i].~T();
			if (m_ptr == nullptr)
				return;
			m_allocator->release(m_ptr, m_capacity * sizeof(T));
			m_allocator->free(m_ptr, m_capacity * sizeof(T));
		}

		void copyFrom(const Array& other)
		{
			m_allocator = other.m_allocator;
			m_count = other.m_count;
			m_capacity = m_count;
			m_ptr = nullptr;
			if (m_capacity == 0)
				return;
			m_ptr = (T*)m_allocator->alloc(sizeof(T) * m_capacity, alignof(T));
			m_allocator->commit(m_ptr, sizeof(T) * m_capacity);
			for (size_t i = 0; i < m_count; ++i)
				::new (m_ptr + i) T(other.m_ptr[i]);
		}

		void moveFrom(Array&& other)
		{
			m_allocator = other.m_allocator;
			m_ptr = other.m_ptr;
			m_count = other.m_count;
			m_capacity = other.m_capacity;

			other.m_ptr = nullptr;
			other.m_count = 0;
			other.m_capacity = 0;
		}

		void grow(size_t new_capacity)
		{
			identAssert(new_capacity <= SIZE_MAX / sizeof(T));
			auto new_ptr = (T*)m_allocator->alloc(sizeof(T) * new_capacity, alignof(T));
			m_allocator->commit(new_ptr, sizeof(T) * new_capacity);
			for (size_t i = 0; i < m_count; ++i)
			{
				if constexpr (std::is_move_constructible_v<T>)
					::new (new_ptr + i) T(std::move(m_ptr[i]));
				else
					::new (new_ptr + i) T(m_ptr[i]);
				m_ptr[i].~T();
			}

			if (m_ptr)
			{
				m_allocator->release(m_ptr, sizeof(T) * m_capacity);
				m_allocator->free(m_ptr, sizeof(T) * m_capacity);
			}

			m_ptr = new_ptr;
			m_capacity = new_capacity;
		}

		void ensureSpaceExists(size_t i = 1)
		{
			if (m_count + i > m_capacity)
			{
				size_t new_capacity = m_capacity * 2;
				if (new_capacity == 0)
					new_capacity = 8;

				if (new_capacity < m_count + i)
					new_capacity = m_count + i;

				grow(new_capacity);
			}
		}

	public:
		explicit Array(Allocator* a)
			: m_allocator(a)
		{}

		Array(const Array& other)
		{
			copyFrom(other);
		}

		Array(Array&& other)
		{
			moveFrom(std::move(other));
		}

		Array& operator=(const Array& other)
		{
			destroy();
			copyFrom(other);
			return *this;
		}

		Array& operator=(Array&& other)
		{
			destroy();
			moveFrom(std::move(other));
			return *this;
		}

		~Array()
		{
			destroy();
		}

		T& operator[](size_t i)
		{
			identAssert(i < m_count);
			return m_ptr[i];
		}

		const T& operator[](size_t i) const
		{
			identAssert(i < m_count);
			return m_ptr[i];
		}

		size_t count() const { return m_count; }
		size_t capacity() const { return m_capacity; }
		Allocator* allocator() const { return m_allocator; }

		T* data() { return m_ptr; }
		const T* data() const { return m_ptr; }

		// makes room for exactly extra_count more elements
		void reserve(size_t extra_count)
		{
			if (m_count + extra_count > m_capacity)
				grow(m_count + extra_count);
		}

		template<typename R>
		void push(R&& value)
		{
			ensureSpaceExists();
			::new (m_ptr + m_count) T(std::forward<R>(value));
			++m_count;
		}

		template<typename ... TArgs>
		T& emplace(TArgs&& ... args)
		{
			ensureSpaceExists();
			::new (m_ptr + m_count) T(std::forward<TArgs>(args)...);
			++m_count;
			return m_ptr[m_count - 1];
		}

		T* begin() { return m_ptr; }
		const T* begin() const { return m_ptr; }
		T* end() { return m_ptr + m_count; }
		const T* end() const { return m_ptr + m_count; }
	};
}
