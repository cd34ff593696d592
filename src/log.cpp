#include "stanza/log.hpp"

#include <cstdio>
#include <cstdarg>

namespace Stanza {

    int logLevel = Default;

    namespace {
        int filteredLog(LogLevel level, const char * format, va_list list)
        {
            if (level < logLevel) return 0; // Skip logging if set as-is

            FILE * o = level > Info ? stderr : stdout;
            int ret = std::vfprintf(o, format, list);
            std::fputs("\n", o);
            return ret + 1;
        }
    }

    // Log information to the appropriate output. Use printf like formatting here
    int log(LogLevel level, const char * format, ...)
    {
        va_list list;
        va_start(list, format);
        int ret = filteredLog(level, format, list);
        va_end(list);
        return ret;
    }

} // namespace Stanza
