#pragma once

#include "ident/Exports.h"
#include "ident/Result.h"
#include "ident/Span.h"
#include "ident/String.h"
#include "ident/UUIDError.h"

#include <fmt/core.h>

#include <cstdint>
#include <cstring>

namespace ident
{
	class UUIDGenerator;

	// 128-bit rfc 4122 uuid stored as 16 big-endian octets
	// xxxxxxxx-xxxx-Vxxx-Nxxx-xxxxxxxxxxxx
	// 0..3 time_low, 4..5 time_mid, 6..7 time_hi_and_version, 8 clock_seq_hi_and_reserved,
	// 9 clock_seq_low, 10..15 node
	class UUID
	{
		friend class UUIDGenerator;

		uint8_t m_bytes[16];

	public:
		static constexpr size_t SIZE = 16;
		static constexpr size_t CANONICAL_LENGTH = 36;
		static constexpr size_t HEX_LENGTH = 32;

		// indicated by a bit pattern in octet 8, marked with N in xxxxxxxx-xxxx-xxxx-Nxxx-xxxxxxxxxxxx
		enum UUID_VARIANT
		{
			// NCS backward compatibility
			// N bit pattern: 0xxx
			UUID_VARIANT_NCS,

			// RFC 4122/DCE 1.1
			// N bit pattern: 10xx
			UUID_VARIANT_RFC,

			// Microsoft Corporation backward compatibility
			// N bit pattern: 110x
			UUID_VARIANT_MICROSOFT,

			// reserved for possible future definition
			// N bit pattern: 111x
			UUID_VARIANT_RESERVED,
		};

		// indicated by the high nibble of octet 6, marked with V in xxxxxxxx-xxxx-Vxxx-xxxx-xxxxxxxxxxxx
		enum UUID_VERSION
		{
			// nil uuids or versions ident doesn't know about
			UUID_VERSION_NONE,
			// time-based
			UUID_VERSION_TIME_BASED,
			// DCE security, with embedded POSIX UIDs
			UUID_VERSION_DCE_SECURITY,
			// name-based with MD5 hashing
			UUID_VERSION_NAME_BASED_MD5,
			// randomly generated
			UUID_VERSION_RANDOM_NUMBER_BASED,
			// name-based with SHA1 hashing
			UUID_VERSION_NAME_BASED_SHA1,
		};

		// parses the canonical 36 character hyphenated form, hex digits in either case
		IDENT_EXPORT static Result<UUID, UUIDError> parse(StringView str, Allocator* allocator);

		UUID()
		{
			::memset(m_bytes, 0, sizeof(m_bytes));
		}

		explicit UUID(const uint8_t (&bytes)[16])
		{
			::memcpy(m_bytes, bytes, sizeof(m_bytes));
		}

		UUID(const UUID& other) = default;
		UUID(UUID&& other) = default;
		UUID& operator=(const UUID& other) = default;
		UUID& operator=(UUID&& other) = default;
		~UUID() = default;

		bool operator==(const UUID& other) const
		{
			return ::memcmp(m_bytes, other.m_bytes, sizeof(m_bytes)) == 0;
		}

		bool operator!=(const UUID& other) const
		{
			return !(*this == other);
		}

		bool operator<(const UUID& other) const
		{
			return ::memcmp(m_bytes, other.m_bytes, sizeof(m_bytes)) < 0;
		}

		bool operator>(const UUID& other) const
		{
			return ::memcmp(m_bytes, other.m_bytes, sizeof(m_bytes)) > 0;
		}

		bool operator<=(const UUID& other) const
		{
			return ::memcmp(m_bytes, other.m_bytes, sizeof(m_bytes)) <= 0;
		}

		bool operator>=(const UUID& other) const
		{
			return ::memcmp(m_bytes, other.m_bytes, sizeof(m_bytes)) >= 0;
		}

		const uint8_t& operator[](size_t i) const
		{
			identAssert(i < SIZE);
			return m_bytes[i];
		}

		Span<const std::byte> bytes() const
		{
			return {reinterpret_cast<const std::byte*>(m_bytes), SIZE};
		}

		bool isNull() const
		{
			for (size_t i = 0; i < SIZE; ++i)
			{
				if (m_bytes[i] != 0)
					return false;
			}
			return true;
		}

		// raw version nibble, 0..15
		int versionNumber() const
		{
			return (m_bytes[6] >> 4) & 0x0f;
		}

		UUID_VARIANT variant() const
		{
			if ((m_bytes[8] & 0x80) == 0)
				return UUID_VARIANT_NCS;
			else if ((m_bytes[8] & 0xc0) == 0x80)
				return UUID_VARIANT_RFC;
			else if ((m_bytes[8] & 0xe0) == 0xc0)
				return UUID_VARIANT_MICROSOFT;
			else
				return UUID_VARIANT_RESERVED;
		}

		UUID_VERSION version() const
		{
			switch (versionNumber())
			{
			case 1: return UUID_VERSION_TIME_BASED;
			case 2: return UUID_VERSION_DCE_SECURITY;
			case 3: return UUID_VERSION_NAME_BASED_MD5;
			case 4: return UUID_VERSION_RANDOM_NUMBER_BASED;
			case 5: return UUID_VERSION_NAME_BASED_SHA1;
			default: return UUID_VERSION_NONE;
			}
		}

		// canonical lowercase hyphenated form
		IDENT_EXPORT String toString(Allocator* allocator) const;

		// 32 lowercase hex digits without hyphens
		IDENT_EXPORT String hex(Allocator* allocator) const;

		// writes the lowercase hex form into out, CANONICAL_LENGTH chars with hyphens and
		// HEX_LENGTH without, no null terminator
		IDENT_EXPORT void formatInto(char* out, bool hyphens) const;
	};
}

namespace fmt
{
	template<>
	struct formatter<ident::UUID>
	{
		template<typename ParseContext>
		constexpr auto parse(ParseContext& ctx)
		{
			return ctx.begin();
		}

		template<typename FormatContext>
		auto format(const ident::UUID& value, FormatContext& ctx) const
		{
			char buffer[ident::UUID::CANONICAL_LENGTH];
			value.formatInto(buffer, true);
			return fmt::format_to(ctx.out(), "{}", fmt::string_view{buffer, sizeof(buffer)});
		}
	};
}
