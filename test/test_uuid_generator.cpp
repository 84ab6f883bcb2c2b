#include <doctest/doctest.h>

#include <ident/UUIDGenerator.h>
#include <ident/Clock.h>
#include <ident/Mallocator.h>
#include <ident/String.h>

#include <atomic>
#include <cstdint>
#include <thread>
#include <utility>
#include <vector>

static bool isRfcVariant(const ident::UUID& uuid)
{
	return (uuid[8] & 0xc0) == 0x80;
}

TEST_CASE("ident::UUIDGenerator v4")
{
	ident::Mallocator allocator;

	for (size_t i = 0; i < 1000; ++i)
	{
		auto uuid = ident::UUIDGenerator::generateV4();
		REQUIRE(uuid.versionNumber() == 4);
		REQUIRE(uuid.version() == ident::UUID::UUID_VERSION_RANDOM_NUMBER_BASED);
		REQUIRE(isRfcVariant(uuid));

		auto parsed = ident::UUID::parse(uuid.toString(&allocator), &allocator);
		REQUIRE(parsed.isError() == false);
		REQUIRE(parsed.value() == uuid);
	}
}

TEST_CASE("ident::UUIDGenerator v4 batch")
{
	ident::Mallocator allocator;

	auto empty = ident::UUIDGenerator::generateV4Batch(0, &allocator).releaseValue();
	REQUIRE(empty.count() == 0);
	REQUIRE(empty.capacity() == 0);

	auto single = ident::UUIDGenerator::generateV4Batch(1, &allocator).releaseValue();
	REQUIRE(single.count() == 1);
	REQUIRE(single[0].versionNumber() == 4);
	REQUIRE(isRfcVariant(single[0]));

	auto batch = ident::UUIDGenerator::generateV4Batch(10000, &allocator).releaseValue();
	REQUIRE(batch.count() == 10000);
	REQUIRE(batch.capacity() == 10000);
	for (const auto& uuid: batch)
	{
		REQUIRE(uuid.versionNumber() == 4);
		REQUIRE(isRfcVariant(uuid));
	}
}

TEST_CASE("ident::UUIDGenerator v4 batch limit")
{
	ident::Mallocator allocator;

	auto atLimit = ident::UUIDGenerator::MAX_BATCH_COUNT;
	REQUIRE(atLimit <= SIZE_MAX / sizeof(ident::UUID));

	size_t tooLarge[] = {atLimit + 1, SIZE_MAX / ident::UUID::SIZE + 2, SIZE_MAX};
	for (auto count: tooLarge)
	{
		auto res = ident::UUIDGenerator::generateV4Batch(count, &allocator);
		REQUIRE(res.isError());
		REQUIRE(res.error().kind() == ident::UUIDError::KIND_BATCH_COUNT);
		REQUIRE(res.error().message().count() > 0);
	}

	auto res = ident::UUIDGenerator::generateV4Batch(atLimit + 1, &allocator);
	auto message = ident::strf(&allocator, "{}"_sv, res.error());
	auto expected = ident::strf(&allocator, "invalid batch count, requested {} uuids, at most {} are allowed"_sv, atLimit + 1, atLimit);
	REQUIRE(message == expected);
}

TEST_CASE("ident::UUIDGenerator clock errors")
{
	ident::Mallocator allocator;

	auto err = ident::UUIDError::clock(&allocator, "clock_gettime failed, Invalid argument"_sv);
	REQUIRE(err.kind() == ident::UUIDError::KIND_CLOCK);
	REQUIRE(err.message() == "clock_gettime failed, Invalid argument"_sv);
	REQUIRE(err.input().count() == 0);

	ident::Result<uint64_t, ident::UUIDError> ticks = std::move(err);
	REQUIRE(ticks.isError());
	auto message = ident::strf(&allocator, "{}"_sv, ticks.error());
	REQUIRE(message == "clock error, clock_gettime failed, Invalid argument"_sv);
}

TEST_CASE("ident::UUIDGenerator v1")
{
	ident::Mallocator allocator;

	auto before = ident::Clock::gregorianTicks(&allocator);
	REQUIRE(before.isError() == false);

	auto res = ident::UUIDGenerator::generateV1(&allocator);
	REQUIRE(res.isError() == false);
	auto uuid = res.releaseValue();

	auto after = ident::Clock::gregorianTicks(&allocator);
	REQUIRE(after.isError() == false);

	REQUIRE(uuid.versionNumber() == 1);
	REQUIRE(uuid.version() == ident::UUID::UUID_VERSION_TIME_BASED);
	REQUIRE(isRfcVariant(uuid));

	auto timestamp = ident::UUIDGenerator::timestampOf(uuid);
	REQUIRE(timestamp >= before.value());
	REQUIRE(timestamp <= after.value());

	auto node = ident::UUIDGenerator::nodeId();
	for (size_t i = 0; i < 6; ++i)
		REQUIRE(uuid[10 + i] == node.bytes[i]);

	auto parsed = ident::UUID::parse(uuid.toString(&allocator), &allocator);
	REQUIRE(parsed.isError() == false);
	REQUIRE(parsed.value() == uuid);
}

TEST_CASE("ident::UUIDGenerator v1 timestamps are close to the unix clock")
{
	ident::Mallocator allocator;

	auto uuid = ident::UUIDGenerator::generateV1(&allocator).releaseValue();
	auto unixTicks = ident::UUIDGenerator::timestampOf(uuid) - ident::Clock::GREGORIAN_TO_UNIX_TICKS;
	auto unixSeconds = unixTicks / 10'000'000ULL;

	// 2020-01-01 and 2200-01-01
	REQUIRE(unixSeconds > 1577836800ULL);
	REQUIRE(unixSeconds < 7258118400ULL);
}

TEST_CASE("ident::UUIDGenerator v1 node id")
{
	ident::Mallocator allocator;

	auto node = ident::UUIDGenerator::nodeId();
	REQUIRE((node.bytes[5] & 0x80) == 0x80);
	REQUIRE((node.bytes[5] & 0x01) == 0x01);

	auto again = ident::UUIDGenerator::nodeId();
	for (size_t i = 0; i < 6; ++i)
		REQUIRE(node.bytes[i] == again.bytes[i]);

	auto uuid = ident::UUIDGenerator::generateV1(&allocator).releaseValue();
	REQUIRE((uuid[15] & 0x80) == 0x80);
	REQUIRE(uuid[15] == node.bytes[5]);
}

TEST_CASE("ident::UUIDGenerator v1 under concurrent first access")
{
	constexpr size_t THREADS = 8;
	constexpr size_t PER_THREAD = 1000;

	ident::Mallocator allocator;
	std::vector<std::vector<ident::UUID>> results(THREADS);
	std::atomic<size_t> failures = 0;

	std::vector<std::thread> threads;
	for (size_t t = 0; t < THREADS; ++t)
	{
		threads.emplace_back([&, t] {
			for (size_t i = 0; i < PER_THREAD; ++i)
			{
				auto res = ident::UUIDGenerator::generateV1(&allocator);
				if (res.isError())
				{
					++failures;
					continue;
				}
				results[t].push_back(res.releaseValue());
			}
		});
	}
	for (auto& thread: threads)
		thread.join();

	REQUIRE(failures.load() == 0);

	auto node = ident::UUIDGenerator::nodeId();
	for (const auto& perThread: results)
	{
		REQUIRE(perThread.size() == PER_THREAD);
		for (const auto& uuid: perThread)
		{
			REQUIRE(uuid.versionNumber() == 1);
			REQUIRE(isRfcVariant(uuid));
			for (size_t i = 0; i < 6; ++i)
				REQUIRE(uuid[10 + i] == node.bytes[i]);
		}
	}
}

TEST_CASE("ident::UUIDGenerator v1 clock sequence moves when the clock doesn't")
{
	ident::Mallocator allocator;

	auto first = ident::UUIDGenerator::generateV1(&allocator).releaseValue();
	for (size_t i = 0; i < 1000; ++i)
	{
		auto next = ident::UUIDGenerator::generateV1(&allocator).releaseValue();
		auto firstTick = ident::UUIDGenerator::timestampOf(first);
		auto nextTick = ident::UUIDGenerator::timestampOf(next);
		if (nextTick <= firstTick)
			REQUIRE(ident::UUIDGenerator::clockSequenceOf(next) != ident::UUIDGenerator::clockSequenceOf(first));
		first = next;
	}
}

TEST_CASE("ident::UUIDGenerator v3 and v5 known vectors")
{
	ident::Mallocator allocator;

	struct Vector
	{
		ident::StringView ns;
		ident::StringView name;
		int version;
		ident::StringView expected;
	};

	Vector vectors[] = {
		{"NAMESPACE_DNS"_sv, "example.com"_sv, 5, "cfbff0d1-9375-5685-968c-48ce8b15ae17"_sv},
		{"NAMESPACE_DNS"_sv, "python.org"_sv, 3, "6fa459ea-ee8a-3ca4-894e-db77e160355e"_sv},
		{"NAMESPACE_DNS"_sv, "python.org"_sv, 5, "886313e1-3b8a-5372-9b90-0c9aee199e5d"_sv},
		{"NAMESPACE_URL"_sv, "https://example.com/"_sv, 3, "b9dcdff8-af4a-365d-8043-0f8361942709"_sv},
		{"NAMESPACE_OID"_sv, "1.3.6.1"_sv, 5, "1447fa61-5277-5fef-a9b3-fbc6e44f4af3"_sv},
		{"NAMESPACE_X500"_sv, "cn=ident"_sv, 5, "695572b0-37ee-5616-80ef-f85250d94c5f"_sv},
		{"6ba7b810-9dad-11d1-80b4-00c04fd430c8"_sv, ""_sv, 3, "c87ee674-4ddc-3efe-a74e-dfe25da5d7b3"_sv},
	};

	for (const auto& vector: vectors)
	{
		auto res = vector.version == 3 ?
			ident::UUIDGenerator::generateV3(vector.ns, vector.name, &allocator) :
			ident::UUIDGenerator::generateV5(vector.ns, vector.name, &allocator);
		REQUIRE(res.isError() == false);
		REQUIRE(res.value().versionNumber() == vector.version);
		REQUIRE(isRfcVariant(res.value()));
		REQUIRE(res.value().toString(&allocator) == vector.expected);
	}
}

TEST_CASE("ident::UUIDGenerator v3 and v5 are deterministic and distinct")
{
	ident::Mallocator allocator;

	ident::StringView names[] = {""_sv, "a"_sv, "example.com"_sv, "\xc3\xa9t\xc3\xa9"_sv, "a much longer name that spans more than a single digest block of sixty four bytes"_sv};
	ident::StringView namespaces[] = {"NAMESPACE_DNS"_sv, "NAMESPACE_URL"_sv, "NAMESPACE_OID"_sv, "NAMESPACE_X500"_sv, "62013b88-fa54-4008-8d42-f9ca4889e0b5"_sv};

	for (auto ns: namespaces)
	{
		for (auto name: names)
		{
			auto v3a = ident::UUIDGenerator::generateV3(ns, name, &allocator).releaseValue();
			auto v3b = ident::UUIDGenerator::generateV3(ns, name, &allocator).releaseValue();
			auto v5a = ident::UUIDGenerator::generateV5(ns, name, &allocator).releaseValue();
			auto v5b = ident::UUIDGenerator::generateV5(ns, name, &allocator).releaseValue();

			REQUIRE(v3a == v3b);
			REQUIRE(v5a == v5b);
			REQUIRE(v3a != v5a);
			REQUIRE(v3a.versionNumber() == 3);
			REQUIRE(v5a.versionNumber() == 5);
		}
	}
}

TEST_CASE("ident::UUIDGenerator v3 and v5 with a resolved namespace")
{
	ident::Mallocator allocator;

	auto ns = ident::UUIDGenerator::resolveNamespace("NAMESPACE_DNS"_sv, &allocator).releaseValue();
	auto v5 = ident::UUIDGenerator::generateV5(ns, "example.com"_sv);
	REQUIRE(v5.toString(&allocator) == "cfbff0d1-9375-5685-968c-48ce8b15ae17"_sv);

	auto v3 = ident::UUIDGenerator::generateV3(ns, "python.org"_sv);
	REQUIRE(v3.toString(&allocator) == "6fa459ea-ee8a-3ca4-894e-db77e160355e"_sv);
}

TEST_CASE("ident::UUIDGenerator namespace resolution")
{
	ident::Mallocator allocator;

	auto named = ident::UUIDGenerator::resolveNamespace("NAMESPACE_URL"_sv, &allocator);
	auto literal = ident::UUID::parse("6ba7b811-9dad-11d1-80b4-00c04fd430c8"_sv, &allocator);
	REQUIRE(named.isError() == false);
	REQUIRE(literal.isError() == false);
	REQUIRE(named.value() == literal.value());

	auto dns = ident::UUIDGenerator::resolveNamespace("NAMESPACE_DNS"_sv, &allocator);
	REQUIRE(dns.value().toString(&allocator) == "6ba7b810-9dad-11d1-80b4-00c04fd430c8"_sv);
	auto oid = ident::UUIDGenerator::resolveNamespace("NAMESPACE_OID"_sv, &allocator);
	REQUIRE(oid.value().toString(&allocator) == "6ba7b812-9dad-11d1-80b4-00c04fd430c8"_sv);
	auto x500 = ident::UUIDGenerator::resolveNamespace("NAMESPACE_X500"_sv, &allocator);
	REQUIRE(x500.value().toString(&allocator) == "6ba7b814-9dad-11d1-80b4-00c04fd430c8"_sv);

	auto upper = ident::UUIDGenerator::resolveNamespace("6BA7B811-9DAD-11D1-80B4-00C04FD430C8"_sv, &allocator);
	REQUIRE(upper.isError() == false);
	REQUIRE(upper.value() == literal.value());

	ident::StringView invalid[] = {"namespace_dns"_sv, "NAMESPACE_FOO"_sv, ""_sv, "not a namespace"_sv, " NAMESPACE_DNS"_sv};
	for (auto token: invalid)
	{
		auto res = ident::UUIDGenerator::resolveNamespace(token, &allocator);
		REQUIRE(res.isError());
		REQUIRE(res.error().kind() == ident::UUIDError::KIND_NAMESPACE);
		REQUIRE(res.error().input() == token);
	}

	auto v3 = ident::UUIDGenerator::generateV3("bogus"_sv, "name"_sv, &allocator);
	REQUIRE(v3.isError());
	REQUIRE(v3.error().kind() == ident::UUIDError::KIND_NAMESPACE);

	auto v5 = ident::UUIDGenerator::generateV5("bogus"_sv, "name"_sv, &allocator);
	REQUIRE(v5.isError());
	REQUIRE(v5.error().kind() == ident::UUIDError::KIND_NAMESPACE);
}
