#pragma once

#include "ident/Exports.h"
#include "ident/Allocator.h"
#include "ident/StringView.h"
#include "ident/Assert.h"

#include <fmt/core.h>
#include <fmt/format.h>

#include <cstring>
#include <iterator>
#include <utility>

namespace ident
{
	class String
	{
		Allocator* m_allocator = nullptr;
		char* m_ptr = nullptr;
		size_t m_capacity = 0;
		size_t m_count = 0;

		IDENT_EXPORT void destroy();

		IDENT_EXPORT void copyFrom(const String& other);

		IDENT_EXPORT void moveFrom(String&& other);

		void grow(size_t new_capacity);

		IDENT_EXPORT void ensureSpaceExists(size_t count);

	public:
		explicit String(Allocator* allocator)
			: m_allocator(allocator)
		{}

		IDENT_EXPORT String(StringView str, Allocator* allocator);

		String(const String& other)
		{
			copyFrom(other);
		}

		String(String&& other)
		{
			moveFrom(std::move(other));
		}

		String& operator=(const String& other)
		{
			destroy();
			copyFrom(other);
			return *this;
		}

		String& operator=(String&& other)
		{
			destroy();
			moveFrom(std::move(other));
			return *this;
		}

		~String()
		{
			destroy();
		}

		char& operator[](size_t i)
		{
			identAssert(i < m_count);
			return m_ptr[i];
		}

		const char& operator[](size_t i) const
		{
			identAssert(i < m_count);
			return m_ptr[i];
		}

		operator StringView() const { return StringView{m_ptr, m_count}; }

		size_t count() const { return m_count; }
		size_t capacity() const { return m_capacity; }
		char* data() { return m_ptr; }
		const char* data() const { return m_ptr; }
		Allocator* allocator() const { return m_allocator; }

		IDENT_EXPORT void resize(size_t new_count);
		void reserve(size_t extra_count) { ensureSpaceExists(extra_count); }

		IDENT_EXPORT void push(StringView str);
		IDENT_EXPORT void pushByte(char v);

		bool operator==(const String& other) const { return StringView{*this} == StringView{other}; }
		bool operator!=(const String& other) const { return StringView{*this} != StringView{other}; }
		bool operator<(const String& other) const { return StringView{*this} < StringView{other}; }
		bool operator==(StringView other) const { return StringView{*this} == other; }
		bool operator!=(StringView other) const { return StringView{*this} != other; }

		const char* begin() const { return m_ptr; }
		char* begin() { return m_ptr; }
		const char* end() const { return m_ptr + m_count; }
		char* end() { return m_ptr + m_count; }
	};

	class StringBackInserter
	{
		String* m_str = nullptr;
	public:
		using iterator_category = std::output_iterator_tag;
		using difference_type = ptrdiff_t;
		using value_type = char;
		using pointer = char*;
		using reference = char&;

		StringBackInserter(String* str)
			: m_str(str)
		{}

		StringBackInserter& operator=(char v)
		{
			m_str->pushByte(v);
			return *this;
		}

		StringBackInserter& operator*() { return *this; }
		StringBackInserter& operator++() { return *this; }
		StringBackInserter& operator++(int) { return *this; }
	};

	template<typename ... Args>
	[[nodiscard]] inline String strf(Allocator* allocator, StringView format, Args&& ... args)
	{
		String out{allocator};
		StringBackInserter it{&out};
		fmt::format_to(it, fmt::runtime(fmt::string_view{format.data(), format.count()}), std::forward<Args>(args)...);
		return out;
	}
}

namespace fmt
{
	template<>
	struct formatter<ident::String>
	{
		template<typename ParseContext>
		constexpr auto parse(ParseContext& ctx)
		{
			return ctx.begin();
		}

		template<typename FormatContext>
		auto format(const ident::String& str, FormatContext& ctx) const
		{
			return fmt::format_to(ctx.out(), "{}", fmt::string_view{str.data(), str.count()});
		}
	};
}
