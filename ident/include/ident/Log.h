#pragma once

#include "ident/StringView.h"
#include "ident/Allocator.h"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <string>
#include <utility>

namespace ident
{
	class Log
	{
		Allocator* m_allocator = nullptr;
		std::shared_ptr<spdlog::logger> m_logger;
	public:
		using level = spdlog::level::level_enum;

		explicit Log(Allocator* allocator, StringView name = "ident"_sv)
			: m_allocator(allocator)
		{
			auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
			m_logger = std::make_shared<spdlog::logger>(std::string{name.data(), name.count()}, std::move(sink));
			setPattern("[%H:%M:%S.%e %z] [thread %t] [%^%l%$] [%n] %v"_sv);
			setFlushLevel(level::err);

			#if defined(DEBUG)
			setLevel(level::trace);
			#endif
		}

		Log(Allocator* allocator, std::shared_ptr<spdlog::logger> logger)
			: m_allocator(allocator),
			  m_logger(std::move(logger))
		{}

		Allocator* allocator() const
		{
			return m_allocator;
		}

		void setLevel(level level)
		{
			m_logger->set_level(level);
		}

		void setPattern(StringView pattern)
		{
			m_logger->set_pattern(std::string{pattern.data(), pattern.count()});
		}

		void setFlushLevel(level level)
		{
			m_logger->flush_on(level);
		}

		template<typename ... TArgs>
		void trace(StringView format, TArgs&& ... args)
		{
			m_logger->trace(fmt::runtime(fmt::string_view{format.data(), format.count()}), std::forward<TArgs>(args)...);
		}

		template<typename ... TArgs>
		void debug(StringView format, TArgs&& ... args)
		{
			m_logger->debug(fmt::runtime(fmt::string_view{format.data(), format.count()}), std::forward<TArgs>(args)...);
		}

		template<typename ... TArgs>
		void info(StringView format, TArgs&& ... args)
		{
			m_logger->info(fmt::runtime(fmt::string_view{format.data(), format.count()}), std::forward<TArgs>(args)...);
		}

		template<typename ... TArgs>
		void warn(StringView format, TArgs&& ... args)
		{
			m_logger->warn(fmt::runtime(fmt::string_view{format.data(), format.count()}), std::forward<TArgs>(args)...);
		}

		template<typename ... TArgs>
		void error(StringView format, TArgs&& ... args)
		{
			m_logger->error(fmt::runtime(fmt::string_view{format.data(), format.count()}), std::forward<TArgs>(args)...);
		}

		template<typename ... TArgs>
		void critical(StringView format, TArgs&& ... args)
		{
			m_logger->critical(fmt::runtime(fmt::string_view{format.data(), format.count()}), std::forward<TArgs>(args)...);
		}
	};
}
