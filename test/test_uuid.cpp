#include <doctest/doctest.h>

#include <ident/UUID.h>
#include <ident/UUIDGenerator.h>
#include <ident/Mallocator.h>
#include <ident/String.h>

#include <algorithm>

TEST_CASE("basic ident::UUID test")
{
	ident::Mallocator allocator;
	auto uuids = ident::UUIDGenerator::generateV4Batch(10000, &allocator).releaseValue();
	REQUIRE(uuids.count() == 10000);

	std::sort(uuids.begin(), uuids.end());
	for (size_t i = 1; i < uuids.count(); ++i)
		REQUIRE(uuids[i - 1] != uuids[i]);
}

TEST_CASE("ident::UUID parsing")
{
	ident::Mallocator allocator;

	auto id = ident::UUIDGenerator::generateV4();
	auto str = ident::strf(&allocator, "{}"_sv, id);
	auto id2 = ident::UUID::parse(str, &allocator);
	REQUIRE(id2.isError() == false);
	REQUIRE(id == id2.value());

	auto res = ident::UUID::parse("this is not an UUID"_sv, &allocator);
	REQUIRE(res.isError());
	REQUIRE(res.error().kind() == ident::UUIDError::KIND_PARSE);
	REQUIRE(res.error().input() == "this is not an UUID"_sv);

	auto upper = ident::UUID::parse("62013B88-FA54-4008-8D42-F9CA4889e0B5"_sv, &allocator);
	REQUIRE(upper.isError() == false);
	REQUIRE(upper.value().toString(&allocator) == "62013b88-fa54-4008-8d42-f9ca4889e0b5"_sv);

	auto nil = ident::strf(&allocator, "{}"_sv, ident::UUID{});
	REQUIRE(nil == "00000000-0000-0000-0000-000000000000"_sv);

	auto nilResult = ident::UUID::parse("00000000-0000-0000-0000-000000000000"_sv, &allocator);
	REQUIRE(nilResult.isError() == false);
	REQUIRE(nilResult.value() == ident::UUID{});
	REQUIRE(nilResult.value().isNull());
}

TEST_CASE("ident::UUID rejects non canonical text")
{
	ident::Mallocator allocator;

	const char* invalid[] = {
		"",
		// too long and too short
		"62013B88-FA54-4008-8D42-F9CA4889e0B5AA",
		"62013B88-FA54-4008-8D42-F9CA4889e0B",
		// non hex
		"62013BX8-FA54-4008-8D42-F9CA4889e0B5",
		"62013b88-fa54-4008-8d42-f9ca4889e0bg",
		// hyphens in the wrong place
		"62013B88,FA54-4008-8D42-F9CA4889e0B5",
		"62013B8-8FA54-4008-8D42-F9CA4889e0B5",
		"62013b88fa54-4008-8d42-f9ca4889e0b5-",
		// no hyphens at all
		"62013b88fa5440088d42f9ca4889e0b5",
		// braces and urn forms are not canonical
		"{62013b88-fa54-4008-8d42-f9ca4889e0}",
		"urn:uuid:62013b88-fa54-4008-8d42-f9ca4889e0b5",
		// whitespace
		" 62013b88-fa54-4008-8d42-f9ca4889e0b",
	};

	for (auto text: invalid)
	{
		auto res = ident::UUID::parse(ident::StringView{text}, &allocator);
		CHECK_MESSAGE(res.isError(), text);
		if (res.isError())
		{
			REQUIRE(res.error().kind() == ident::UUIDError::KIND_PARSE);
			REQUIRE(res.error().message().count() > 0);
		}
	}

	auto res = ident::UUID::parse("62013b88-fa54-4008-8d42-f9ca4889e0b"_sv, &allocator);
	REQUIRE(res.isError());
	auto message = ident::strf(&allocator, "{}"_sv, res.error());
	REQUIRE(message == "invalid uuid '62013b88-fa54-4008-8d42-f9ca4889e0b', expected 36 characters, found 35"_sv);
}

TEST_CASE("ident::UUID accessors")
{
	ident::Mallocator allocator;

	auto res = ident::UUID::parse("cfbff0d1-9375-5685-968c-48ce8b15ae17"_sv, &allocator);
	REQUIRE(res.isError() == false);
	auto uuid = res.releaseValue();

	REQUIRE(uuid.hex(&allocator) == "cfbff0d193755685968c48ce8b15ae17"_sv);
	REQUIRE(uuid.versionNumber() == 5);
	REQUIRE(uuid.version() == ident::UUID::UUID_VERSION_NAME_BASED_SHA1);
	REQUIRE(uuid.variant() == ident::UUID::UUID_VARIANT_RFC);

	auto bytes = uuid.bytes();
	REQUIRE(bytes.count() == 16);
	REQUIRE(bytes[0] == std::byte{0xcf});
	REQUIRE(bytes[6] == std::byte{0x56});
	REQUIRE(bytes[15] == std::byte{0x17});
	REQUIRE(uuid[8] == 0x96);
}

TEST_CASE("ident::UUID tolerates any version nibble in parsed input")
{
	ident::Mallocator allocator;

	auto v0 = ident::UUID::parse("00000000-0000-0000-0000-000000000000"_sv, &allocator);
	REQUIRE(v0.value().versionNumber() == 0);
	REQUIRE(v0.value().version() == ident::UUID::UUID_VERSION_NONE);
	REQUIRE(v0.value().variant() == ident::UUID::UUID_VARIANT_NCS);

	auto v15 = ident::UUID::parse("ffffffff-ffff-ffff-ffff-ffffffffffff"_sv, &allocator);
	REQUIRE(v15.value().versionNumber() == 15);
	REQUIRE(v15.value().version() == ident::UUID::UUID_VERSION_NONE);
	REQUIRE(v15.value().variant() == ident::UUID::UUID_VARIANT_RESERVED);

	auto v7 = ident::UUID::parse("017f22e2-79b0-7cc3-98c4-dc0c0c07398f"_sv, &allocator);
	REQUIRE(v7.value().versionNumber() == 7);

	auto ms = ident::UUID::parse("00000000-0000-2000-c000-000000000000"_sv, &allocator);
	REQUIRE(ms.value().version() == ident::UUID::UUID_VERSION_DCE_SECURITY);
	REQUIRE(ms.value().variant() == ident::UUID::UUID_VARIANT_MICROSOFT);
}

TEST_CASE("ident::UUID ordering")
{
	ident::Mallocator allocator;

	auto a = ident::UUID::parse("00000000-0000-0000-0000-000000000001"_sv, &allocator).releaseValue();
	auto b = ident::UUID::parse("00000000-0000-0000-0000-000000000002"_sv, &allocator).releaseValue();
	auto c = ident::UUID::parse("10000000-0000-0000-0000-000000000000"_sv, &allocator).releaseValue();

	REQUIRE(a < b);
	REQUIRE(b < c);
	REQUIRE(c > a);
	REQUIRE(a <= a);
	REQUIRE(a >= a);
	REQUIRE(a != b);

	auto copy = b;
	REQUIRE(copy == b);
}
