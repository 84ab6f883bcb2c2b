#pragma once

#include "ident/String.h"
#include "ident/StringView.h"

#include <fmt/core.h>

#include <utility>

namespace ident
{
	// typed failure of the uuid operations, carries a human readable reason and the input that
	// caused it
	class [[nodiscard]] UUIDError
	{
	public:
		enum KIND
		{
			// text is not a canonical xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx uuid
			KIND_PARSE,
			// namespace token is neither a well-known namespace name nor a canonical uuid
			KIND_NAMESPACE,
			// the system clock could not be read
			KIND_CLOCK,
			// batch size is above UUIDGenerator::MAX_BATCH_COUNT
			KIND_BATCH_COUNT,
		};

	private:
		KIND m_kind = KIND_PARSE;
		String m_message;
		String m_input;

		UUIDError(KIND kind, String message, String input)
			: m_kind(kind),
			  m_message(std::move(message)),
			  m_input(std::move(input))
		{}

	public:
		static UUIDError parse(Allocator* allocator, StringView reason, StringView input)
		{
			return UUIDError{KIND_PARSE, String{reason, allocator}, String{input, allocator}};
		}

		static UUIDError invalidNamespace(Allocator* allocator, StringView reason, StringView token)
		{
			return UUIDError{KIND_NAMESPACE, String{reason, allocator}, String{token, allocator}};
		}

		static UUIDError clock(Allocator* allocator, StringView reason)
		{
			return UUIDError{KIND_CLOCK, String{reason, allocator}, String{allocator}};
		}

		static UUIDError batchCount(Allocator* allocator, StringView reason)
		{
			return UUIDError{KIND_BATCH_COUNT, String{reason, allocator}, String{allocator}};
		}

		KIND kind() const { return m_kind; }
		StringView message() const { return m_message; }
		StringView input() const { return m_input; }
	};
}

namespace fmt
{
	template<>
	struct formatter<ident::UUIDError>
	{
		template<typename ParseContext>
		constexpr auto parse(ParseContext& ctx)
		{
			return ctx.begin();
		}

		template<typename FormatContext>
		auto format(const ident::UUIDError& err, FormatContext& ctx) const
		{
			switch (err.kind())
			{
			case ident::UUIDError::KIND_PARSE:
				return fmt::format_to(ctx.out(), "invalid uuid '{}', {}", err.input(), err.message());
			case ident::UUIDError::KIND_NAMESPACE:
				return fmt::format_to(ctx.out(), "invalid namespace '{}', {}", err.input(), err.message());
			case ident::UUIDError::KIND_BATCH_COUNT:
				return fmt::format_to(ctx.out(), "invalid batch count, {}", err.message());
			case ident::UUIDError::KIND_CLOCK:
			default:
				return fmt::format_to(ctx.out(), "clock error, {}", err.message());
			}
		}
	};
}
