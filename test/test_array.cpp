#include <doctest/doctest.h>

#include <ident/Array.h>
#include <ident/Mallocator.h>
#include <ident/String.h>

TEST_CASE("ident::Array basics")
{
	ident::Mallocator allocator;

	ident::Array<int> array{&allocator};
	REQUIRE(array.count() == 0);
	REQUIRE(array.capacity() == 0);

	for (int i = 0; i < 100; ++i)
		array.push(i);
	REQUIRE(array.count() == 100);

	int sum = 0;
	for (auto v: array)
		sum += v;
	REQUIRE(sum == 4950);

	auto copy = array;
	REQUIRE(copy.count() == 100);
	REQUIRE(copy[99] == 99);

	auto moved = std::move(copy);
	REQUIRE(moved.count() == 100);
	REQUIRE(copy.count() == 0);
}

TEST_CASE("ident::Array reserve is exact")
{
	ident::Mallocator allocator;

	ident::Array<ident::String> array{&allocator};
	array.reserve(3);
	REQUIRE(array.capacity() == 3);

	array.push(ident::String{"a"_sv, &allocator});
	array.emplace("b"_sv, &allocator);
	array.push(ident::String{"c"_sv, &allocator});
	REQUIRE(array.capacity() == 3);
	REQUIRE(array[1] == "b"_sv);
}
