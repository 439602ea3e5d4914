#undef NDEBUG

#include <tlife/options.hpp>

#include <iostream>
#include <cassert>
#include <stdexcept>

namespace
{
	bool rejects(int argc, const char * const argv[])
	{
		try
		{
			tlife::parse_options(argc, argv);
		}
		catch( std::invalid_argument & )
		{
			return true;
		}
		return false;
	}
}

void test_defaults()
{
	const char * argv[] = { "life" };
	tlife::options opts = tlife::parse_options(1, argv);
	assert( opts.interval_ms==500 );
	assert( opts.step_ms==50 );
	assert( !opts.help );
}

void test_values()
{
	const char * argv[] = { "life", "200", "25" };
	tlife::options opts = tlife::parse_options(2, argv);
	assert( opts.interval_ms==200 );
	assert( opts.step_ms==50 );

	opts = tlife::parse_options(3, argv);
	assert( opts.interval_ms==200 );
	assert( opts.step_ms==25 );

	const char * zero[] = { "life", "0" };
	assert( tlife::parse_options(2, zero).interval_ms==0 );
}

void test_help()
{
	const char * argv[] = { "life", "--help" };
	assert( tlife::parse_options(2, argv).help );
	const char * shortv[] = { "life", "-h" };
	assert( tlife::parse_options(2, shortv).help );
	assert( tlife::usage("life").find("usage: life") == 0 );
}

void test_bad_values()
{
	const char * letters[] = { "life", "fast" };
	const char * negative[] = { "life", "-5" };
	const char * trailing[] = { "life", "10ms" };
	const char * empty[] = { "life", "" };
	const char * huge[] = { "life", "99999999999999999999" };
	const char * zero_step[] = { "life", "100", "0" };
	const char * extra[] = { "life", "100", "10", "1" };

	assert( rejects(2, letters) );
	assert( rejects(2, negative) );
	assert( rejects(2, trailing) );
	assert( rejects(2, empty) );
	assert( rejects(2, huge) );
	assert( rejects(3, zero_step) );
	assert( rejects(4, extra) );
}

int main()
{
	test_defaults();
	test_values();
	test_help();
	test_bad_values();

	std::cout << "All tests passed!\n";
	return 0;
}
