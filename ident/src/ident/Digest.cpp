#include "ident/Digest.h"
#include "ident/Assert.h"

#include <openssl/evp.h>

#include <cstring>
#include <utility>

namespace ident
{
	EVPHasher::EVPHasher(const EVP_MD* md)
	{
		m_ctx = EVP_MD_CTX_new();
		identAssert(m_ctx != nullptr);
		[[maybe_unused]] auto ok = EVP_DigestInit_ex(m_ctx, md, nullptr);
		identAssert(ok == 1);
	}

	void EVPHasher::finalInto(std::byte* digest, size_t size)
	{
		unsigned char buffer[EVP_MAX_MD_SIZE];
		unsigned int length = 0;
		[[maybe_unused]] auto ok = EVP_DigestFinal_ex(m_ctx, buffer, &length);
		identAssert(ok == 1 && length == size);
		::memcpy(digest, buffer, size);
	}

	EVPHasher::EVPHasher(EVPHasher&& other)
		: m_ctx(other.m_ctx)
	{
		other.m_ctx = nullptr;
	}

	EVPHasher& EVPHasher::operator=(EVPHasher&& other)
	{
		std::swap(m_ctx, other.m_ctx);
		return *this;
	}

	EVPHasher::~EVPHasher()
	{
		if (m_ctx)
			EVP_MD_CTX_free(m_ctx);
	}

	void EVPHasher::hash(Span<const std::byte> bytes)
	{
		[[maybe_unused]] auto ok = EVP_DigestUpdate(m_ctx, bytes.data(), bytes.count());
		identAssert(ok == 1);
	}

	MD5Hasher::MD5Hasher()
		: EVPHasher(EVP_md5())
	{}

	SHA1Hasher::SHA1Hasher()
		: EVPHasher(EVP_sha1())
	{}

	MD5 MD5::hash(Span<const std::byte> bytes)
	{
		MD5Hasher hasher;
		hasher.hash(bytes);
		return hasher.final();
	}

	SHA1 SHA1::hash(Span<const std::byte> bytes)
	{
		SHA1Hasher hasher;
		hasher.hash(bytes);
		return hasher.final();
	}
}
