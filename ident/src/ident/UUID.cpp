#include "ident/UUID.h"

namespace ident
{
	constexpr static const char HEX_DIGITS[] = "0123456789abcdef";

	// offsets of the hyphens in the canonical form
	constexpr static size_t HYPHENS[] = {8, 13, 18, 23};

	inline static bool isHyphenOffset(size_t i)
	{
		for (auto h: HYPHENS)
			if (h == i)
				return true;
		return false;
	}

	inline static int hexValue(char c)
	{
		if (c >= '0' && c <= '9')
			return c - '0';
		if (c >= 'a' && c <= 'f')
			return 10 + c - 'a';
		if (c >= 'A' && c <= 'F')
			return 10 + c - 'A';
		return -1;
	}

	Result<UUID, UUIDError> UUID::parse(StringView str, Allocator* allocator)
	{
		if (str.count() != CANONICAL_LENGTH)
		{
			auto reason = strf(allocator, "expected {} characters, found {}"_sv, CANONICAL_LENGTH, str.count());
			return UUIDError::parse(allocator, reason, str);
		}

		UUID res{};
		size_t index = 0;
		for (size_t i = 0; i < CANONICAL_LENGTH; i += 2)
		{
			if (isHyphenOffset(i))
			{
				if (str[i] != '-')
				{
					auto reason = strf(allocator, "expected '-' at position {}, found '{}'"_sv, i, str[i]);
					return UUIDError::parse(allocator, reason, str);
				}
				// hyphens shift the digit pairs by one
				++i;
			}

			auto hi = hexValue(str[i]);
			if (hi < 0)
			{
				auto reason = strf(allocator, "invalid hex digit '{}' at position {}"_sv, str[i], i);
				return UUIDError::parse(allocator, reason, str);
			}

			auto lo = hexValue(str[i + 1]);
			if (lo < 0)
			{
				auto reason = strf(allocator, "invalid hex digit '{}' at position {}"_sv, str[i + 1], i + 1);
				return UUIDError::parse(allocator, reason, str);
			}

			res.m_bytes[index++] = uint8_t((hi << 4) | lo);
		}

		identAssert(index == SIZE);
		return res;
	}

	void UUID::formatInto(char* out, bool hyphens) const
	{
		for (size_t i = 0; i < SIZE; ++i)
		{
			if (hyphens && (i == 4 || i == 6 || i == 8 || i == 10))
				*out++ = '-';
			*out++ = HEX_DIGITS[m_bytes[i] >> 4];
			*out++ = HEX_DIGITS[m_bytes[i] & 0x0f];
		}
	}

	String UUID::toString(Allocator* allocator) const
	{
		String res{allocator};
		res.resize(CANONICAL_LENGTH);
		formatInto(res.data(), true);
		return res;
	}

	String UUID::hex(Allocator* allocator) const
	{
		String res{allocator};
		res.resize(HEX_LENGTH);
		formatInto(res.data(), false);
		return res;
	}
}
