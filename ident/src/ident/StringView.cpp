#include "ident/StringView.h"

namespace ident
{
	inline static bool isSpace(char c)
	{
		return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
	}

	int StringView::cmp(StringView a, StringView b)
	{
		auto count = a.m_count < b.m_count ? a.m_count : b.m_count;
		if (count > 0)
		{
			auto res = ::memcmp(a.m_begin, b.m_begin, count);
			if (res != 0)
				return res;
		}

		if (a.m_count < b.m_count)
			return -1;
		else if (a.m_count > b.m_count)
			return 1;
		return 0;
	}

	size_t StringView::find(char target, size_t start) const
	{
		for (size_t i = start; i < m_count; ++i)
			if (m_begin[i] == target)
				return i;
		return SIZE_MAX;
	}

	StringView StringView::trim() const
	{
		size_t first = 0;
		while (first < m_count && isSpace(m_begin[first]))
			++first;

		size_t last = m_count;
		while (last > first && isSpace(m_begin[last - 1]))
			--last;

		return slice(first, last);
	}
}
