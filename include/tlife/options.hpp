#ifndef TLIFE_OPTIONS_INCLUDED
#define TLIFE_OPTIONS_INCLUDED

#include <string>

namespace tlife
{
	// Settings taken from the command line.
	struct options
	{
		int interval_ms;	// Initial tick interval
		int step_ms;		// Change in interval per speed key
		bool help;

		options() : interval_ms(500), step_ms(50), help(false) { }
	};

	// Parses "life [interval_ms [step_ms]]" or "life -h".
	// Throws std::invalid_argument on a bad value.
	options parse_options(int argc, const char * const argv[]);

	std::string usage(const std::string & program);
}

#endif
