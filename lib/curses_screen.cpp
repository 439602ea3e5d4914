#include <tlife/curses_screen.hpp>

#include <cerrno>
#include <clocale>
#include <cstdio>
#include <stdexcept>

#include <poll.h>
#include <unistd.h>

// Use the ncurses functions rather than its macros, which clash with clear() and friends.
#define NCURSES_NOMACROS
#include <curses.h>

namespace
{
	// Releases and motion are needed to follow drags.
	const mmask_t pointer_events = BUTTON1_PRESSED | BUTTON1_CLICKED | BUTTON1_RELEASED |
		BUTTON2_PRESSED | BUTTON2_CLICKED | BUTTON2_RELEASED |
		BUTTON3_PRESSED | BUTTON3_CLICKED | BUTTON3_RELEASED |
		REPORT_MOUSE_POSITION;

	// Milliseconds ncurses waits to tell Esc from the start of an escape sequence.
	const int escape_delay = 25;

	unsigned pressed_buttons(mmask_t state)
	{
		unsigned buttons=0;
		if( state & (BUTTON1_PRESSED|BUTTON1_CLICKED) ) buttons |= tlife::buttons::button1;
		if( state & (BUTTON2_PRESSED|BUTTON2_CLICKED) ) buttons |= tlife::buttons::button2;
		if( state & (BUTTON3_PRESSED|BUTTON3_CLICKED) ) buttons |= tlife::buttons::button3;
		return buttons;
	}

	// A click is a press and a release in one report.
	unsigned released_buttons(mmask_t state)
	{
		unsigned buttons=0;
		if( state & (BUTTON1_RELEASED|BUTTON1_CLICKED) ) buttons |= tlife::buttons::button1;
		if( state & (BUTTON2_RELEASED|BUTTON2_CLICKED) ) buttons |= tlife::buttons::button2;
		if( state & (BUTTON3_RELEASED|BUTTON3_CLICKED) ) buttons |= tlife::buttons::button3;
		return buttons;
	}
}

struct tlife::curses_terminal
{
	SCREEN * term;
};

tlife::curses_screen::curses_screen() : m_terminal(new curses_terminal), m_buffered(false)
{
	std::setlocale(LC_ALL, "");

	m_terminal->term = newterm(nullptr, stdout, stdin);
	if( !m_terminal->term )
	{
		delete m_terminal;
		throw std::runtime_error("cannot initialise the terminal");
	}
	set_term(m_terminal->term);

	cbreak();
	noecho();
	nonl();
	curs_set(0);
	keypad(stdscr, TRUE);
	nodelay(stdscr, TRUE);
	set_escdelay(escape_delay);
	mousemask(pointer_events, nullptr);
	mouseinterval(0);	// Report presses straight away
	werase(stdscr);
	wrefresh(stdscr);
}

tlife::curses_screen::~curses_screen()
{
	endwin();
	delscreen(m_terminal->term);
	delete m_terminal;
}

void tlife::curses_screen::size(int & width, int & height) const
{
	platform::lock_guard<platform::mutex> lock(m_mutex);
	width = getmaxx(stdscr);
	height = getmaxy(stdscr);
}

void tlife::curses_screen::set_cell(int x, int y, char glyph)
{
	platform::lock_guard<platform::mutex> lock(m_mutex);
	// Fails at the bottom right corner, after drawing the glyph.
	mvwaddch(stdscr, y, x, chtype(static_cast<unsigned char>(glyph)));
}

void tlife::curses_screen::clear()
{
	platform::lock_guard<platform::mutex> lock(m_mutex);
	werase(stdscr);
}

void tlife::curses_screen::show()
{
	platform::lock_guard<platform::mutex> lock(m_mutex);
	wrefresh(stdscr);
}

void tlife::curses_screen::sync()
{
	platform::lock_guard<platform::mutex> lock(m_mutex);
	clearok(stdscr, TRUE);
	wrefresh(stdscr);
}

bool tlife::curses_screen::poll_event(event & ev, int timeout_ms)
{
	if( !m_buffered )
	{
		// Wait outside the lock so that drawing carries on meanwhile.
		pollfd input = { STDIN_FILENO, POLLIN, 0 };
		const int ready = ::poll(&input, 1, timeout_ms);
		if( ready<0 && errno!=EINTR )
			throw std::runtime_error("cannot read from the terminal");

		// SIGWINCH interrupts poll(), and ncurses then reports KEY_RESIZE.
		if( ready==0 )
			return false;
	}

	platform::lock_guard<platform::mutex> lock(m_mutex);
	const int ch = wgetch(stdscr);
	m_buffered = ch!=ERR;
	if( ch==ERR )
		return false;

	ev = translate(ch);
	return ev.kind!=event::none;
}

// Called with the lock held.
tlife::event tlife::curses_screen::translate(int ch)
{
	switch( ch )
	{
	case KEY_RESIZE:
		return event::resized(getmaxx(stdscr), getmaxy(stdscr));

	case KEY_MOUSE:
		{
			MEVENT mouse;
			if( getmouse(&mouse)!=OK )
				return event();
			const unsigned buttons = m_pointer.report(pressed_buttons(mouse.bstate),
				released_buttons(mouse.bstate), (mouse.bstate & REPORT_MOUSE_POSITION)!=0);
			if( !buttons )
				return event();
			return event::mouse_press(buttons, mouse.x, mouse.y);
		}

	case KEY_LEFT:
		return event::key_press(keys::left);
	case KEY_RIGHT:
		return event::key_press(keys::right);
	case KEY_UP:
		return event::key_press(keys::up);
	case KEY_DOWN:
		return event::key_press(keys::down);

	case KEY_ENTER:
	case '\n':
	case '\r':
		return event::key_press(keys::enter);

	default:
		return event::key_press(ch);
	}
}
