#include <tlife/options.hpp>

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <stdexcept>

namespace
{
	int parse_milliseconds(const char * text, const char * name)
	{
		char * end;
		errno = 0;
		const long value = std::strtol(text, &end, 10);
		if( end==text || *end || errno==ERANGE || value<0 || value>INT_MAX )
			throw std::invalid_argument(std::string("invalid ") + name + ": " + text);
		return int(value);
	}
}

tlife::options tlife::parse_options(int argc, const char * const argv[])
{
	options opts;
	if( argc>1 )
	{
		const std::string first = argv[1];
		if( first=="-h" || first=="--help" )
		{
			opts.help = true;
			return opts;
		}
		opts.interval_ms = parse_milliseconds(argv[1], "interval");
	}
	if( argc>2 )
	{
		opts.step_ms = parse_milliseconds(argv[2], "step");
		if( opts.step_ms==0 )
			throw std::invalid_argument("step must be positive");
	}
	if( argc>3 )
		throw std::invalid_argument("too many arguments");
	return opts;
}

std::string tlife::usage(const std::string & program)
{
	return "usage: " + program + " [interval_ms [step_ms]]\n"
		"  interval_ms  initial delay between generations (default 500)\n"
		"  step_ms      change in delay per arrow key (default 50)\n"
		"keys: space play/pause, left faster, right slower,\n"
		"      mouse click toggles a cell, q/Esc/Enter quit\n";
}
