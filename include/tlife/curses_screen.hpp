#ifndef TLIFE_CURSES_SCREEN_INCLUDED
#define TLIFE_CURSES_SCREEN_INCLUDED

#include "object.hpp"
#include "screen.hpp"

namespace tlife
{
	struct curses_terminal;

	/*	The terminal, driven by ncurses.
		Events are polled from one thread while another draws, so every call
		into ncurses is made under a lock.
		Construction puts the terminal into raw mode with mouse reporting;
		destruction restores it.
	  */
	class curses_screen : public screen
	{
	public:
		// Throws std::runtime_error if the terminal cannot be initialised.
		curses_screen();
		~curses_screen();

		void size(int & width, int & height) const;
		void set_cell(int x, int y, char glyph);
		void clear();
		void show();
		void sync();
		bool poll_event(event & ev, int timeout_ms);

	private:
		curses_screen(const curses_screen&);
		curses_screen & operator=(const curses_screen&);

		event translate(int ch);

		mutable platform::mutex m_mutex;
		curses_terminal * m_terminal;
		bool m_buffered;	// ncurses may hold input which poll() cannot see
		pointer_tracker m_pointer;
	};
}

#endif
