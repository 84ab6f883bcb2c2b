#pragma once

#include "ident/Exports.h"
#include "ident/Array.h"
#include "ident/Result.h"
#include "ident/UUID.h"
#include "ident/UUIDError.h"

#include <cstdint>

namespace ident
{
	// 48-bit node field of version 1 uuids
	struct NodeId
	{
		uint8_t bytes[6];
	};

	class UUIDGenerator
	{
		template<typename THasher>
		static UUID nameBased(const UUID& ns, StringView name, uint8_t version);

		static void stamp(UUID& uuid, uint8_t version)
		{
			uuid.m_bytes[6] = uint8_t((uuid.m_bytes[6] & 0x0f) | (version << 4));
			// variant is 10
			uuid.m_bytes[8] = uint8_t((uuid.m_bytes[8] & 0x3f) | 0x80);
		}

	public:
		// largest batch generateV4Batch accepts, 256MiB of uuids
		static constexpr size_t MAX_BATCH_COUNT = size_t(1) << 24;

		// random uuid
		IDENT_EXPORT static UUID generateV4();

		// count independent random uuids, randomness for the whole batch is drawn at once,
		// fails without allocating if count is above MAX_BATCH_COUNT
		IDENT_EXPORT static Result<Array<UUID>, UUIDError> generateV4Batch(size_t count, Allocator* allocator);

		// time-based uuid from the current wall clock, the per-process clock sequence and node id,
		// fails only if the system clock can't be read
		IDENT_EXPORT static Result<UUID, UUIDError> generateV1(Allocator* allocator);

		// name-based uuid with MD5 hashing of the namespace bytes followed by the name bytes
		IDENT_EXPORT static UUID generateV3(const UUID& ns, StringView name);
		IDENT_EXPORT static Result<UUID, UUIDError> generateV3(StringView ns, StringView name, Allocator* allocator);

		// name-based uuid with SHA1 hashing of the namespace bytes followed by the name bytes
		IDENT_EXPORT static UUID generateV5(const UUID& ns, StringView name);
		IDENT_EXPORT static Result<UUID, UUIDError> generateV5(StringView ns, StringView name, Allocator* allocator);

		// resolves NAMESPACE_DNS, NAMESPACE_URL, NAMESPACE_OID and NAMESPACE_X500 (case sensitive)
		// to the well-known rfc 4122 namespaces, any other token is parsed as a canonical uuid
		IDENT_EXPORT static Result<UUID, UUIDError> resolveNamespace(StringView token, Allocator* allocator);

		// node id used by version 1 uuids, computed once per process with the multicast bit set
		IDENT_EXPORT static NodeId nodeId();

		// timestamp of a version 1 uuid in 100ns ticks since 1582-10-15T00:00:00Z
		IDENT_EXPORT static uint64_t timestampOf(const UUID& uuid);

		// 14-bit clock sequence of a version 1 uuid
		IDENT_EXPORT static uint16_t clockSequenceOf(const UUID& uuid);
	};
}
