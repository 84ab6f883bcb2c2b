#pragma once

#include "ident/String.h"
#include "ident/StringView.h"
#include "ident/Assert.h"

#include <new>
#include <type_traits>
#include <utility>

#include <fmt/core.h>

namespace ident
{
	// error message for humans
	class [[nodiscard]] HumanError
	{
		String m_message;
	public:
		HumanError()
			: m_message(nullptr)
		{}

		explicit HumanError(String message) : m_message(std::move(message)) {}

		StringView message() const { return m_message; }

		operator bool() const { return m_message.count() > 0; }
	};

	template<typename T, typename E = HumanError>
	class Result
	{
		enum STATE
		{
			STATE_EMPTY,
			STATE_VALUE,
			STATE_ERROR,
		};

		static constexpr auto SIZE = sizeof(T) > sizeof(E) ? sizeof(T) : sizeof(E);
		static constexpr auto ALIGNMENT = alignof(T) > alignof(E) ? alignof(T) : alignof(E);
		alignas(ALIGNMENT) unsigned char m_storage[SIZE];
		STATE m_state = STATE_EMPTY;

		void destroy()
		{
			if (m_state == STATE_VALUE)
				reinterpret_cast<T*>(m_storage)->~T();
			else if (m_state == STATE_ERROR)
				reinterpret_cast<E*>(m_storage)->~E();
			m_state = STATE_EMPTY;
		}

	public:
		template<typename U, typename = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Result> && !std::is_same_v<std::decay_t<U>, E>>>
		Result(U&& value)
		{
			::new (m_storage) T(std::forward<U>(value));
			m_state = STATE_VALUE;
		}

		Result(E&& error)
		{
			::new (m_storage) E(std::move(error));
			m_state = STATE_ERROR;
		}

		Result(Result&& other)
		{
			if (other.m_state == STATE_VALUE)
			{
				::new (m_storage) T(other.releaseValue());
				m_state = STATE_VALUE;
			}
			else if (other.m_state == STATE_ERROR)
			{
				::new (m_storage) E(other.releaseError());
				m_state = STATE_ERROR;
			}
		}

		Result(const Result&) = delete;
		Result& operator=(const Result&) = delete;
		Result& operator=(Result&&) = delete;

		~Result()
		{
			destroy();
		}

		bool isError() const { return m_state == STATE_ERROR; }

		T& value()
		{
			identAssert(m_state == STATE_VALUE);
			return *reinterpret_cast<T*>(m_storage);
		}
		const T& value() const
		{
			identAssert(m_state == STATE_VALUE);
			return *reinterpret_cast<const T*>(m_storage);
		}

		E& error()
		{
			identAssert(m_state == STATE_ERROR);
			return *reinterpret_cast<E*>(m_storage);
		}
		const E& error() const
		{
			identAssert(m_state == STATE_ERROR);
			return *reinterpret_cast<const E*>(m_storage);
		}

		T releaseValue()
		{
			identAssert(m_state == STATE_VALUE);
			auto ptr = reinterpret_cast<T*>(m_storage);
			T res{std::move(*ptr)};
			ptr->~T();
			m_state = STATE_EMPTY;
			return res;
		}
		E releaseError()
		{
			identAssert(m_state == STATE_ERROR);
			auto ptr = reinterpret_cast<E*>(m_storage);
			E res{std::move(*ptr)};
			ptr->~E();
			m_state = STATE_EMPTY;
			return res;
		}
	};

	template<typename ... Args>
	inline HumanError errf(Allocator* allocator, StringView format, Args&& ... args)
	{
		return HumanError{strf(allocator, format, std::forward<Args>(args)...)};
	}
}

namespace fmt
{
	template<>
	struct formatter<ident::HumanError>
	{
		template<typename ParseContext>
		constexpr auto parse(ParseContext& ctx)
		{
			return ctx.begin();
		}

		template<typename FormatContext>
		auto format(const ident::HumanError& err, FormatContext& ctx) const
		{
			return fmt::format_to(ctx.out(), "{}", err.message());
		}
	};
}
