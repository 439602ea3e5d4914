#ifndef TLIFE_SESSION_INCLUDED
#define TLIFE_SESSION_INCLUDED

#include "object.hpp"
#include "grid.hpp"

#include <string>

namespace tlife
{
	class screen;
	class metronome;

	// Width of the status panel to the left of the grid.
	const int status_width = 10;

	/*	Active object which owns the grid, the simulation state and the screen.
		All input and all ticks arrive as messages, so the state is only ever
		touched by one thread at a time.
	  */
	class session : public object<session>
	{
	public:
		// List of messages:

		// Start or stop the simulation.
		struct toggle_play { };

		// Shorten or lengthen the tick interval.
		struct faster { };
		struct slower { };

		// Pointer press at a screen position.
		struct click { int x, y; };

		// The terminal has a new size.
		struct resize { int width, height; };

		// The metronome has beaten.
		struct tick { };

		// Paint everything.
		struct redraw { };

		// Stop the simulation and both activities.
		struct quit { };

		// Implementation:
		void active_method( toggle_play&& );
		void active_method( faster&& );
		void active_method( slower&& );
		void active_method( click&& );
		void active_method( resize&& );
		void active_method( tick&& );
		void active_method( redraw&& );
		void active_method( quit&& );

		// Sized to the current screen, less the status panel.
		session(screen & display, metronome & clock, int interval_step_ms,
				scheduler_type & sched = default_scheduler);

		// Accessors. Only safe when no messages are being processed.
		const tlife::grid & board() const { return m_grid; }
		bool running() const { return m_running; }
		int tick_interval() const { return m_interval; }
		bool finished() const { return m_finished; }

	private:
		void draw_cell(int x, int y, bool alive);
		void draw_status();
		void emit_text(int x, int y, const std::string & text);

		screen & m_screen;
		metronome & m_clock;
		tlife::grid m_grid;
		bool m_running;
		bool m_finished;
		int m_interval;
		const int m_step;
	};
}

#endif
