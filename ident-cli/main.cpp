#include <ident/Mallocator.h>
#include <ident/Log.h>
#include <ident/Assert.h>
#include <ident/StringView.h>
#include <ident/Result.h>
#include <ident/Uuids.h>
#include <ident/UUIDGenerator.h>

#include <fmt/core.h>

#include <charconv>
#include <cstdlib>
#include <initializer_list>

auto HELP = R"""(ident-cli generates and inspects rfc 4122 uuids
ident-cli command [options]
COMMANDS:
  help: prints this message
    - ident-cli help
  uuid1: time-based uuid
    - ident-cli uuid1
  uuid4: random uuids, one per line
    - ident-cli uuid4 -count 10
  uuid3: name-based uuid with MD5 hashing
    - ident-cli uuid3 -namespace NAMESPACE_DNS -name example.com
  uuid5: name-based uuid with SHA1 hashing
    - ident-cli uuid5 -namespace 6ba7b811-9dad-11d1-80b4-00c04fd430c8 -name https://example.com
  inspect: prints the fields of a uuid
    - ident-cli inspect -uuid cfbff0d1-9375-5685-968c-48ce8b15ae17
namespaces can be NAMESPACE_DNS, NAMESPACE_URL, NAMESPACE_OID, NAMESPACE_X500 or any canonical uuid
)"""_sv;

struct Option
{
	ident::StringView name;
	ident::StringView& value;
	bool required = true;
};

class Args
{
	struct KeyValue
	{
		ident::StringView key;
		ident::StringView value;
	};

	ident::Allocator* m_allocator = nullptr;
	ident::StringView m_command;
	ident::Array<KeyValue> m_options;

	Args(ident::Allocator* allocator)
		: m_allocator(allocator),
		  m_options(allocator)
	{}

	const KeyValue* lookup(ident::StringView key) const
	{
		for (const auto& option: m_options)
			if (option.key == key)
				return &option;
		return nullptr;
	}

public:
	static ident::Result<Args> parse(int argc, char** argv, ident::Allocator* allocator)
	{
		if (argc < 2)
			return ident::errf(allocator, "no command found"_sv);

		Args res{allocator};
		res.m_command = ident::StringView{argv[1]};
		for (int i = 2; i < argc; ++i)
		{
			auto option = ident::StringView{argv[i]};
			if (option.startsWith("-"_sv))
			{
				option = option.slice(1, option.count()).trim();
				if (i + 1 < argc)
				{
					if (res.hasOption(option))
						return ident::errf(allocator, "option {} is already defined"_sv, option);

					auto value = ident::StringView{argv[i + 1]}.trim();
					++i;
					res.m_options.push(KeyValue{option, value});
				}
				else
				{
					return ident::errf(allocator, "option {} has no value"_sv, option);
				}
			}
			else
			{
				return ident::errf(allocator, "unknown option, {}"_sv, option);
			}
		}
		return res;
	}

	ident::StringView command() const { return m_command; }
	bool hasOption(ident::StringView key) const { return lookup(key) != nullptr; }
	ident::StringView getOption(ident::StringView key) const { return lookup(key)->value; }
	ident::HumanError loadOptions(std::initializer_list<Option> options) const
	{
		for (auto& option: options)
		{
			if (hasOption(option.name))
			{
				option.value = getOption(option.name);
			}
			else if (option.required)
			{
				return ident::errf(m_allocator, "required option '{}' doesn't exist"_sv, option.name);
			}
		}
		return {};
	}
};

static ident::StringView variantName(ident::UUID::UUID_VARIANT variant)
{
	switch (variant)
	{
	case ident::UUID::UUID_VARIANT_NCS: return "ncs"_sv;
	case ident::UUID::UUID_VARIANT_RFC: return "rfc 4122"_sv;
	case ident::UUID::UUID_VARIANT_MICROSOFT: return "microsoft"_sv;
	case ident::UUID::UUID_VARIANT_RESERVED: return "reserved"_sv;
	default: return "unknown"_sv;
	}
}

int main(int argc, char** argv)
{
	ident::Mallocator allocator{};
	ident::Log log{&allocator, "ident-cli"_sv};
	ident::setAssertLog(&log);

	auto argsResult = Args::parse(argc, argv, &allocator);
	if (argsResult.isError())
	{
		log.critical("failed to parse cli arguments, {}"_sv, argsResult.releaseError());
		log.info("{}"_sv, HELP);
		return EXIT_FAILURE;
	}
	auto args = argsResult.releaseValue();

	if (args.command() == "help"_sv)
	{
		log.info("{}"_sv, HELP);
		return EXIT_SUCCESS;
	}
	else if (args.command() == "uuid1"_sv)
	{
		auto uuidResult = ident::uuid1(&allocator);
		if (uuidResult.isError())
		{
			log.critical("failed to generate uuid1, {}"_sv, uuidResult.releaseError());
			return EXIT_FAILURE;
		}
		fmt::print("{}\n", uuidResult.value());
		return EXIT_SUCCESS;
	}
	else if (args.command() == "uuid4"_sv)
	{
		ident::StringView count;
		auto err = args.loadOptions({
			{"count"_sv, count, false},
		});
		if (err)
		{
			log.critical("failed to parse uuid4 command arguments, {}"_sv, err);
			return EXIT_FAILURE;
		}

		size_t parsedCount = 1;
		if (count.count() > 0)
		{
			auto res = std::from_chars(count.begin(), count.end(), parsedCount);
			if (res.ec != std::errc() || res.ptr != count.end())
			{
				log.critical("failed to parse count value '{}' as positive integer"_sv, count);
				return EXIT_FAILURE;
			}
		}

		auto uuidsResult = ident::uuid4Batch(parsedCount, &allocator);
		if (uuidsResult.isError())
		{
			log.critical("failed to generate uuid4, {}"_sv, uuidsResult.releaseError());
			return EXIT_FAILURE;
		}
		for (const auto& uuid: uuidsResult.value())
			fmt::print("{}\n", uuid);
		return EXIT_SUCCESS;
	}
	else if (args.command() == "uuid3"_sv || args.command() == "uuid5"_sv)
	{
		ident::StringView ns, name;
		auto err = args.loadOptions({
			{"namespace"_sv, ns},
			{"name"_sv, name},
		});
		if (err)
		{
			log.critical("failed to parse {} command arguments, {}"_sv, args.command(), err);
			return EXIT_FAILURE;
		}

		auto uuidResult = args.command() == "uuid3"_sv ? ident::uuid3(ns, name, &allocator) : ident::uuid5(ns, name, &allocator);
		if (uuidResult.isError())
		{
			log.critical("failed to generate {}, {}"_sv, args.command(), uuidResult.releaseError());
			return EXIT_FAILURE;
		}
		fmt::print("{}\n", uuidResult.value());
		return EXIT_SUCCESS;
	}
	else if (args.command() == "inspect"_sv)
	{
		ident::StringView text;
		auto err = args.loadOptions({
			{"uuid"_sv, text},
		});
		if (err)
		{
			log.critical("failed to parse inspect command arguments, {}"_sv, err);
			return EXIT_FAILURE;
		}

		auto uuidResult = ident::makeUUID(text, &allocator);
		if (uuidResult.isError())
		{
			log.critical("{}"_sv, uuidResult.releaseError());
			return EXIT_FAILURE;
		}
		auto uuid = uuidResult.releaseValue();

		fmt::print("canonical: {}\n", uuid);
		fmt::print("hex: {}\n", uuid.hex(&allocator));
		fmt::print("version: {}\n", uuid.versionNumber());
		fmt::print("variant: {}\n", variantName(uuid.variant()));
		if (uuid.version() == ident::UUID::UUID_VERSION_TIME_BASED)
		{
			fmt::print("timestamp: {}\n", ident::UUIDGenerator::timestampOf(uuid));
			fmt::print("clock sequence: {}\n", ident::UUIDGenerator::clockSequenceOf(uuid));
		}
		return EXIT_SUCCESS;
	}

	log.critical("unknown command '{}'"_sv, args.command());
	log.info("{}"_sv, HELP);
	return EXIT_FAILURE;
}
