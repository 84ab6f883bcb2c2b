#include "ident/UUIDGenerator.h"
#include "ident/Clock.h"
#include "ident/Digest.h"
#include "ident/HashFunction.h"
#include "ident/OS.h"
#include "ident/Rand.h"

#include <cstring>
#include <mutex>
#include <type_traits>

namespace ident
{
	static_assert(sizeof(UUID) == UUID::SIZE && std::is_trivially_copyable_v<UUID>, "uuid arrays are filled as raw bytes");

	struct WellKnownNamespace
	{
		const char* name;
		uint8_t bytes[16];
	};

	// rfc 4122 appendix C
	constexpr static WellKnownNamespace WELL_KNOWN_NAMESPACES[] = {
		{"NAMESPACE_DNS",  {0x6b, 0xa7, 0xb8, 0x10, 0x9d, 0xad, 0x11, 0xd1, 0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}},
		{"NAMESPACE_URL",  {0x6b, 0xa7, 0xb8, 0x11, 0x9d, 0xad, 0x11, 0xd1, 0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}},
		{"NAMESPACE_OID",  {0x6b, 0xa7, 0xb8, 0x12, 0x9d, 0xad, 0x11, 0xd1, 0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}},
		{"NAMESPACE_X500", {0x6b, 0xa7, 0xb8, 0x14, 0x9d, 0xad, 0x11, 0xd1, 0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}},
	};

	// process wide state of version 1 generation
	class V1State
	{
		NodeId m_node{};
		std::mutex m_mutex;
		uint64_t m_lastTick = 0;
		uint16_t m_clockSequence = 0;

	public:
		V1State()
		{
			uint64_t seed = 0;
			uint16_t clockSequence = 0;
			[[maybe_unused]] auto ok = Rand::cryptoRand(Span<std::byte>{(std::byte*)&seed, sizeof(seed)});
			identAssert(ok);
			ok = Rand::cryptoRand(Span<std::byte>{(std::byte*)&clockSequence, sizeof(clockSequence)});
			identAssert(ok);

			auto pid = OS::processId();
			auto hash = fnva(Span<const std::byte>{(const std::byte*)&pid, sizeof(pid)}, seed);
			for (size_t i = 0; i < 6; ++i)
				m_node.bytes[i] = uint8_t(hash >> (8 * i));
			// multicast bit (high bit of the last byte) marks the node as not being a real mac
			// address, the low bit of the same byte is kept set too
			m_node.bytes[5] |= 0x81;

			m_clockSequence = uint16_t(clockSequence & 0x3fff);
		}

		const NodeId& node() const { return m_node; }

		// returns the clock sequence to use with the given tick, the sequence moves whenever the
		// clock fails to move forward
		uint16_t clockSequenceFor(uint64_t tick)
		{
			std::scoped_lock lock(m_mutex);
			if (tick <= m_lastTick)
				m_clockSequence = uint16_t((m_clockSequence + 1) & 0x3fff);
			else
				m_lastTick = tick;
			return m_clockSequence;
		}
	};

	inline static V1State& v1State()
	{
		static V1State state;
		return state;
	}

	template<typename THasher>
	UUID UUIDGenerator::nameBased(const UUID& ns, StringView name, uint8_t version)
	{
		THasher hasher;
		hasher.hash(ns.bytes());
		hasher.hash(name);
		auto digest = hasher.final();

		UUID res;
		::memcpy(res.m_bytes, digest.asBytes().data(), UUID::SIZE);
		stamp(res, version);
		return res;
	}

	UUID UUIDGenerator::generateV4()
	{
		UUID uuid;
		[[maybe_unused]] auto ok = Rand::cryptoRand(Span<std::byte>{(std::byte*)uuid.m_bytes, UUID::SIZE});
		identAssert(ok);
		stamp(uuid, 4);
		return uuid;
	}

	Result<Array<UUID>, UUIDError> UUIDGenerator::generateV4Batch(size_t count, Allocator* allocator)
	{
		if (count > MAX_BATCH_COUNT)
		{
			auto reason = strf(allocator, "requested {} uuids, at most {} are allowed"_sv, count, MAX_BATCH_COUNT);
			return UUIDError::batchCount(allocator, reason);
		}

		Array<UUID> res{allocator};
		if (count == 0)
			return res;

		res.reserve(count);
		for (size_t i = 0; i < count; ++i)
			res.emplace();

		[[maybe_unused]] auto ok = Rand::cryptoRand(Span<std::byte>{(std::byte*)res.data(), count * UUID::SIZE});
		identAssert(ok);
		for (auto& uuid: res)
			stamp(uuid, 4);
		return res;
	}

	Result<UUID, UUIDError> UUIDGenerator::generateV1(Allocator* allocator)
	{
		auto tickResult = Clock::gregorianTicks(allocator);
		if (tickResult.isError())
			return tickResult.releaseError();
		auto tick = tickResult.value();

		auto& state = v1State();
		auto clockSequence = state.clockSequenceFor(tick);

		UUID uuid;
		auto timeLow = uint32_t(tick);
		auto timeMid = uint16_t(tick >> 32);
		auto timeHi = uint16_t((tick >> 48) & 0x0fff);

		uuid.m_bytes[0] = uint8_t(timeLow >> 24);
		uuid.m_bytes[1] = uint8_t(timeLow >> 16);
		uuid.m_bytes[2] = uint8_t(timeLow >> 8);
		uuid.m_bytes[3] = uint8_t(timeLow);
		uuid.m_bytes[4] = uint8_t(timeMid >> 8);
		uuid.m_bytes[5] = uint8_t(timeMid);
		uuid.m_bytes[6] = uint8_t(timeHi >> 8);
		uuid.m_bytes[7] = uint8_t(timeHi);
		uuid.m_bytes[8] = uint8_t(clockSequence >> 8);
		uuid.m_bytes[9] = uint8_t(clockSequence);
		::memcpy(uuid.m_bytes + 10, state.node().bytes, sizeof(NodeId::bytes));
		stamp(uuid, 1);
		return uuid;
	}

	UUID UUIDGenerator::generateV3(const UUID& ns, StringView name)
	{
		return nameBased<MD5Hasher>(ns, name, 3);
	}

	Result<UUID, UUIDError> UUIDGenerator::generateV3(StringView ns, StringView name, Allocator* allocator)
	{
		auto nsResult = resolveNamespace(ns, allocator);
		if (nsResult.isError())
			return nsResult.releaseError();
		return generateV3(nsResult.value(), name);
	}

	UUID UUIDGenerator::generateV5(const UUID& ns, StringView name)
	{
		return nameBased<SHA1Hasher>(ns, name, 5);
	}

	Result<UUID, UUIDError> UUIDGenerator::generateV5(StringView ns, StringView name, Allocator* allocator)
	{
		auto nsResult = resolveNamespace(ns, allocator);
		if (nsResult.isError())
			return nsResult.releaseError();
		return generateV5(nsResult.value(), name);
	}

	Result<UUID, UUIDError> UUIDGenerator::resolveNamespace(StringView token, Allocator* allocator)
	{
		for (const auto& ns: WELL_KNOWN_NAMESPACES)
			if (token == StringView{ns.name})
				return UUID{ns.bytes};

		auto parseResult = UUID::parse(token, allocator);
		if (parseResult.isError())
		{
			auto reason = strf(allocator, "not a well-known namespace name or uuid, {}"_sv, parseResult.error().message());
			return UUIDError::invalidNamespace(allocator, reason, token);
		}
		return parseResult.releaseValue();
	}

	NodeId UUIDGenerator::nodeId()
	{
		return v1State().node();
	}

	uint64_t UUIDGenerator::timestampOf(const UUID& uuid)
	{
		uint64_t timeLow = (uint64_t(uuid[0]) << 24) | (uint64_t(uuid[1]) << 16) | (uint64_t(uuid[2]) << 8) | uint64_t(uuid[3]);
		uint64_t timeMid = (uint64_t(uuid[4]) << 8) | uint64_t(uuid[5]);
		uint64_t timeHi = (uint64_t(uuid[6] & 0x0f) << 8) | uint64_t(uuid[7]);
		return (timeHi << 48) | (timeMid << 32) | timeLow;
	}

	uint16_t UUIDGenerator::clockSequenceOf(const UUID& uuid)
	{
		return uint16_t(((uuid[8] & 0x3f) << 8) | uuid[9]);
	}
}
