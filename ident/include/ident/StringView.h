#pragma once

#include "ident/Exports.h"
#include "ident/Span.h"
#include "ident/Assert.h"

#include <fmt/core.h>
#include <fmt/format.h>

#include <cstring>
#include <cstdint>

namespace ident
{
	class String;

	class StringView
	{
		friend class String;

		const char* m_begin = nullptr;
		size_t m_count = 0;

		IDENT_EXPORT static int cmp(StringView a, StringView b);
	public:
		StringView() = default;

		explicit StringView(const char* ptr)
		{
			m_begin = ptr;
			m_count = ::strlen(ptr);
		}

		StringView(const char* begin, size_t count)
			: m_begin(begin)
			, m_count(count)
		{}

		StringView(const Span<const std::byte>& span)
			: m_begin((const char*)span.data())
			, m_count(span.count())
		{}

		operator Span<const std::byte>() const
		{
			return Span<const std::byte>{(const std::byte*)m_begin, m_count};
		}

		const char& operator[](size_t i) const
		{
			identAssert(i < m_count);
			return m_begin[i];
		}

		size_t count() const { return m_count; }

		const char* data() const { return m_begin; }
		const char* begin() const { return m_begin; }
		const char* end() const { return m_begin + m_count; }

		// returns the index of the first occurance of the given byte or SIZE_MAX
		IDENT_EXPORT size_t find(char target, size_t start = 0) const;

		bool operator==(StringView other) const
		{
			if (m_begin == other.m_begin && m_count == other.m_count)
				return true;

			return cmp(*this, other) == 0;
		}
		bool operator!=(StringView other) const { return !operator==(other); }
		bool operator<(StringView other) const { return cmp(*this, other) < 0; }
		bool operator<=(StringView other) const { return cmp(*this, other) <= 0; }
		bool operator>(StringView other) const { return cmp(*this, other) > 0; }
		bool operator>=(StringView other) const { return cmp(*this, other) >= 0; }

		StringView slice(size_t start, size_t end) const
		{
			identAssert(start <= end && end <= m_count);
			return StringView{m_begin + start, end - start};
		}

		bool startsWith(StringView str) const
		{
			if (str.m_count > m_count)
				return false;

			return slice(0, str.m_count) == str;
		}

		bool endsWith(StringView str) const
		{
			if (str.m_count > m_count)
				return false;

			return slice(m_count - str.m_count, m_count) == str;
		}

		// trims ascii whitespace from both ends
		IDENT_EXPORT StringView trim() const;
	};
}

inline static ident::StringView operator "" _sv(const char* ptr, size_t len)
{
	return ident::StringView(ptr, len);
}

namespace fmt
{
	template<>
	struct formatter<ident::StringView>
	{
		template<typename ParseContext>
		constexpr auto parse(ParseContext& ctx)
		{
			return ctx.begin();
		}

		template<typename FormatContext>
		auto format(const ident::StringView& str, FormatContext& ctx) const
		{
			return fmt::format_to(ctx.out(), "{}", fmt::string_view{str.data(), str.count()});
		}
	};
}
