#include "ident/Uuids.h"
#include "ident/UUIDGenerator.h"

namespace ident
{
	template<typename TResult>
	inline static Result<String, UUIDError> formatResult(TResult&& result, Allocator* allocator)
	{
		if (result.isError())
			return result.releaseError();
		return result.value().toString(allocator);
	}

	Result<String, UUIDError> uuid1(Allocator* allocator)
	{
		return formatResult(UUIDGenerator::generateV1(allocator), allocator);
	}

	Result<String, UUIDError> uuid3(StringView ns, StringView name, Allocator* allocator)
	{
		return formatResult(UUIDGenerator::generateV3(ns, name, allocator), allocator);
	}

	String uuid4(Allocator* allocator)
	{
		return UUIDGenerator::generateV4().toString(allocator);
	}

	Result<String, UUIDError> uuid5(StringView ns, StringView name, Allocator* allocator)
	{
		return formatResult(UUIDGenerator::generateV5(ns, name, allocator), allocator);
	}

	Result<Array<String>, UUIDError> uuid4Batch(size_t count, Allocator* allocator)
	{
		auto uuidsResult = UUIDGenerator::generateV4Batch(count, allocator);
		if (uuidsResult.isError())
			return uuidsResult.releaseError();

		Array<String> res{allocator};
		if (count == 0)
			return res;

		res.reserve(count);
		for (const auto& uuid: uuidsResult.value())
			res.push(uuid.toString(allocator));
		return res;
	}

	UUID makeUUID()
	{
		return UUIDGenerator::generateV4();
	}

	Result<UUID, UUIDError> makeUUID(StringView str, Allocator* allocator)
	{
		return UUID::parse(str, allocator);
	}
}
