#include "ident/Assert.h"
#include "ident/Mallocator.h"
#include "ident/Log.h"

namespace ident
{
	inline Log* defaultAssertLog()
	{
		static Mallocator mallocator;
		static Log log{&mallocator};
		return &log;
	}

	inline Log* ASSERT_LOG = defaultAssertLog();

	Log* setAssertLog(Log* log)
	{
		auto res = ASSERT_LOG;
		ASSERT_LOG = log;
		return res;
	}

	void _reportAssert(const char* expr, const char* msg, const std::source_location location)
	{
		auto log = ASSERT_LOG;
		if (msg)
			log->critical("Assertion Failure: {}, message: {}, in file: {}, function: {}, line: {}"_sv, expr, msg, location.file_name(), location.function_name(), location.line());
		else
			log->critical("Assertion Failure: {}, in file: {}, function: {}, line: {}"_sv, expr, location.file_name(), location.function_name(), location.line());
	}
}
