#include <tlife/curses_screen.hpp>
#include <tlife/input.hpp>
#include <tlife/metronome.hpp>
#include <tlife/options.hpp>
#include <tlife/scheduler.hpp>
#include <tlife/session.hpp>
#include <tlife/ticker.hpp>

#include <cstdio>	// std::cout etc is not threadsafe
#include <stdexcept>

/* Conway's Game of Life, in a variant, on a torus filling the terminal.
 * The session is an active object; keyboard and mouse input and the
 * metronome's ticks are all messages to it.
 */

int main(int argc, char**argv)
{
	tlife::options opts;
	try
	{
		opts = tlife::parse_options(argc, argv);
	}
	catch( std::invalid_argument & ex )
	{
		fprintf(stderr, "life: %s\n%s", ex.what(), tlife::usage(argv[0]).c_str());
		return 2;
	}

	if( opts.help )
	{
		fputs(tlife::usage(argv[0]).c_str(), stdout);
		return 0;
	}

	try
	{
		tlife::curses_screen display;
		tlife::scheduler sched;
		tlife::metronome clock(opts.interval_ms);
		tlife::session game(display, clock, opts.step_ms, sched);

		// One worker thread is enough, since all the work is in one object.
		tlife::run workers(1, sched);
		tlife::ticker beat(game, clock);

		game(tlife::session::redraw());
		tlife::input_reader(display, game, clock).run();
	}
	catch( std::exception & ex )
	{
		fprintf(stderr, "life: %s\n", ex.what());
		return 1;
	}
	return 0;
}
