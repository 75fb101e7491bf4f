#pragma once

#include <ostream>

#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>

namespace mypv {

class Log {
    public:
        enum severity
        {
            critical,
            error,
            warn,
            info,
            debug,
            trace
        };

        /**
         * Setup text sink on std::clog. Records more verbose than
         * level are dropped. If disabled is set, nothing is logged.
         * */
        static void init_logging(severity level, bool disabled = false);

        /**
         * Map command line verbosity 1-6 to severity, 0 means off
         * */
        static bool fromVerbosity(int verbosity, severity& level);
};

std::ostream& operator<< (std::ostream& strm, Log::severity level);

}
