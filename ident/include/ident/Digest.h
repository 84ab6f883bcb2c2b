#pragma once

#include "ident/Exports.h"
#include "ident/Span.h"
#include "ident/StringView.h"

#include <fmt/core.h>

#include <cstddef>

typedef struct evp_md_ctx_st EVP_MD_CTX;
typedef struct evp_md_st EVP_MD;

namespace ident
{
	class MD5
	{
		friend class MD5Hasher;
		std::byte m_digest[16];
	public:
		static constexpr size_t SIZE = 16;

		IDENT_EXPORT static MD5 hash(Span<const std::byte> bytes);

		static MD5 hash(StringView str)
		{
			return hash(Span<const std::byte>{str});
		}

		Span<const std::byte> asBytes() const
		{
			return {m_digest, SIZE};
		}
	};

	class SHA1
	{
		friend class SHA1Hasher;
		std::byte m_digest[20];
	public:
		static constexpr size_t SIZE = 20;

		IDENT_EXPORT static SHA1 hash(Span<const std::byte> bytes);

		static SHA1 hash(StringView str)
		{
			return hash(Span<const std::byte>{str});
		}

		Span<const std::byte> asBytes() const
		{
			return {m_digest, SIZE};
		}
	};

	// incremental openssl EVP digest, owns the digest context
	class EVPHasher
	{
		EVP_MD_CTX* m_ctx = nullptr;
	protected:
		IDENT_EXPORT explicit EVPHasher(const EVP_MD* md);
		IDENT_EXPORT void finalInto(std::byte* digest, size_t size);
	public:
		EVPHasher(const EVPHasher&) = delete;
		EVPHasher& operator=(const EVPHasher&) = delete;
		IDENT_EXPORT EVPHasher(EVPHasher&& other);
		IDENT_EXPORT EVPHasher& operator=(EVPHasher&& other);
		IDENT_EXPORT ~EVPHasher();

		IDENT_EXPORT void hash(Span<const std::byte> bytes);

		void hash(StringView str)
		{
			hash(Span<const std::byte>{str});
		}
	};

	class MD5Hasher: public EVPHasher
	{
	public:
		IDENT_EXPORT MD5Hasher();

		MD5 final()
		{
			MD5 res{};
			finalInto(res.m_digest, MD5::SIZE);
			return res;
		}
	};

	class SHA1Hasher: public EVPHasher
	{
	public:
		IDENT_EXPORT SHA1Hasher();

		SHA1 final()
		{
			SHA1 res{};
			finalInto(res.m_digest, SHA1::SIZE);
			return res;
		}
	};
}

namespace fmt
{
	template<>
	struct formatter<ident::MD5>
	{
		template<typename ParseContext>
		constexpr auto parse(ParseContext& ctx)
		{
			return ctx.begin();
		}

		template<typename FormatContext>
		auto format(const ident::MD5& md5, FormatContext& ctx) const
		{
			for (auto b: md5.asBytes())
				fmt::format_to(ctx.out(), "{:02x}", int(b));
			return ctx.out();
		}
	};

	template<>
	struct formatter<ident::SHA1>
	{
		template<typename ParseContext>
		constexpr auto parse(ParseContext& ctx)
		{
			return ctx.begin();
		}

		template<typename FormatContext>
		auto format(const ident::SHA1& sha, FormatContext& ctx) const
		{
			for (auto b: sha.asBytes())
				fmt::format_to(ctx.out(), "{:02x}", int(b));
			return ctx.out();
		}
	};
}
