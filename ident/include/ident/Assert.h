#pragma once

#include "ident/Exports.h"

#include <source_location>

#if IDENT_COMPILER_MSVC
	#define identDebugBreak() __debugbreak()
#elif IDENT_COMPILER_CLANG || IDENT_COMPILER_GNU
	#define identDebugBreak() __builtin_trap()
#else
	#error unknown compiler
#endif

namespace ident
{
	class Log;

	// replaces the log assertion failures are reported to and returns the previous one
	IDENT_EXPORT Log* setAssertLog(Log* log);
	IDENT_EXPORT void _reportAssert(const char* expr, const char* msg, const std::source_location location = std::source_location::current());
}

#ifdef IDENT_ENABLE_ASSERTS
	#define identAssertMsg(expr, message) do { if (expr) {} else { ident::_reportAssert(#expr, message); identDebugBreak(); } } while(false)
	#define identAssert(expr) do { if (expr) {} else { ident::_reportAssert(#expr, nullptr); identDebugBreak(); } } while(false)
#else
	#define identAssertMsg(expr, message) ((void)0)
	#define identAssert(expr) ((void)0)
#endif

#define identUnreachable() identAssertMsg(false, "unreachable")
#define identUnreachableMsg(message) identAssertMsg(false, message)
