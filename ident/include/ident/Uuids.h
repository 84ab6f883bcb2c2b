#pragma once

#include "ident/Exports.h"
#include "ident/Array.h"
#include "ident/Result.h"
#include "ident/String.h"
#include "ident/UUID.h"
#include "ident/UUIDError.h"

namespace ident
{
	// canonical forms of the well-known namespaces, usable as the namespace argument of uuid3/uuid5
	inline const StringView NAMESPACE_DNS{"6ba7b810-9dad-11d1-80b4-00c04fd430c8", 36};
	inline const StringView NAMESPACE_URL{"6ba7b811-9dad-11d1-80b4-00c04fd430c8", 36};
	inline const StringView NAMESPACE_OID{"6ba7b812-9dad-11d1-80b4-00c04fd430c8", 36};
	inline const StringView NAMESPACE_X500{"6ba7b814-9dad-11d1-80b4-00c04fd430c8", 36};

	IDENT_EXPORT Result<String, UUIDError> uuid1(Allocator* allocator);
	IDENT_EXPORT Result<String, UUIDError> uuid3(StringView ns, StringView name, Allocator* allocator);
	IDENT_EXPORT String uuid4(Allocator* allocator);
	IDENT_EXPORT Result<String, UUIDError> uuid5(StringView ns, StringView name, Allocator* allocator);
	IDENT_EXPORT Result<Array<String>, UUIDError> uuid4Batch(size_t count, Allocator* allocator);

	// a fresh random uuid value
	IDENT_EXPORT UUID makeUUID();
	// uuid value parsed from its canonical form
	IDENT_EXPORT Result<UUID, UUIDError> makeUUID(StringView str, Allocator* allocator);
}
