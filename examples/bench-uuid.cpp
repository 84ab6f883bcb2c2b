#include <ident/Mallocator.h>
#include <ident/UUID.h>
#include <ident/UUIDGenerator.h>
#include <ident/Uuids.h>

#define ANKERL_NANOBENCH_IMPLEMENT 1
#include <nanobench.h>

#include <cstdlib>

int main(int argc, char** argv)
{
	ident::Mallocator allocator;
	ankerl::nanobench::Bench bench{};
	bench.minEpochIterations(10000);

	bench.run("ident::uuid1", [&] {
		auto res = ident::uuid1(&allocator);
		ankerl::nanobench::doNotOptimizeAway(res.isError());
	});

	bench.run("ident::uuid3", [&] {
		auto res = ident::uuid3("NAMESPACE_DNS"_sv, "python.org"_sv, &allocator);
		ankerl::nanobench::doNotOptimizeAway(res.isError());
	});

	bench.run("ident::uuid4", [&] {
		auto res = ident::uuid4(&allocator);
		ankerl::nanobench::doNotOptimizeAway(res.count());
	});

	bench.run("ident::uuid5", [&] {
		auto res = ident::uuid5(ident::NAMESPACE_DNS, "python.org"_sv, &allocator);
		ankerl::nanobench::doNotOptimizeAway(res.isError());
	});

	bench.batch(1000).run("ident::uuid4Batch(1000)", [&] {
		auto res = ident::uuid4Batch(1000, &allocator);
		ankerl::nanobench::doNotOptimizeAway(res.value().count());
	});

	bench.batch(1).run("ident::UUID::parse", [&] {
		auto res = ident::UUID::parse("cfbff0d1-9375-5685-968c-48ce8b15ae17"_sv, &allocator);
		ankerl::nanobench::doNotOptimizeAway(res.isError());
	});

	return EXIT_SUCCESS;
}
