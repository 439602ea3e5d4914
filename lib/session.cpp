#include <tlife/session.hpp>
#include <tlife/metronome.hpp>
#include <tlife/screen.hpp>

#include <sstream>
#include <stdexcept>

namespace
{
	const char alive_glyph = 'X';
	const char dead_glyph = ' ';
	const int status_lines = 3;

	tlife::grid initial_grid(const tlife::screen & display)
	{
		int width, height;
		display.size(width, height);
		width -= tlife::status_width;
		if( width<1 || height<1 )
			throw std::runtime_error("terminal is too small");
		return tlife::grid(width, height);
	}

	// Hands the beat back however the tick handler exits.
	struct beat_guard
	{
		explicit beat_guard(tlife::metronome & clock) : m_clock(clock) { }
		~beat_guard() { m_clock.beat_done(); }
	private:
		beat_guard(const beat_guard&);
		beat_guard & operator=(const beat_guard&);

		tlife::metronome & m_clock;
	};
}

tlife::session::session(screen & display, metronome & clock, int interval_step_ms, scheduler_type & sched) :
	object<session>(sched),
	m_screen(display),
	m_clock(clock),
	m_grid(initial_grid(display)),
	m_running(false),
	m_finished(false),
	m_interval(clock.interval()),
	m_step(interval_step_ms)
{
}

void tlife::session::active_method( toggle_play&& )
{
	if( m_finished ) return;
	m_running = !m_running;
	draw_status();
	m_screen.show();
}

void tlife::session::active_method( faster&& )
{
	if( m_finished ) return;
	m_interval -= m_step;
	if( m_interval<0 ) m_interval=0;
	m_clock.set_interval(m_interval);
}

void tlife::session::active_method( slower&& )
{
	if( m_finished ) return;
	m_interval += m_step;
	m_clock.set_interval(m_interval);
}

void tlife::session::active_method( click&& click )
{
	if( m_finished ) return;

	const int x = click.x - status_width, y = click.y;
	if( x<0 || y<0 || x>=m_grid.width() || y>=m_grid.height() )
		return;

	draw_cell(x, y, m_grid.toggle(x, y));
	m_screen.show();
}

void tlife::session::active_method( resize&& resize )
{
	if( m_finished ) return;

	// Never step a grid which is being resized.
	m_running = false;

	const int width = resize.width - status_width, height = resize.height;
	if( width<1 || height<1 )
	{
		draw_status();
		m_screen.show();
		return;
	}

	m_screen.clear();
	grid::cells live = m_grid.resize(width, height);
	for(grid::cells::const_iterator i=live.begin(); i!=live.end(); ++i)
		draw_cell(i->x, i->y, i->alive);
	draw_status();
	m_screen.sync();
}

void tlife::session::active_method( tick&& )
{
	beat_guard beat(m_clock);
	if( m_finished || !m_running ) return;

	grid::cells changed = m_grid.step();
	for(grid::cells::const_iterator i=changed.begin(); i!=changed.end(); ++i)
		draw_cell(i->x, i->y, i->alive);
	draw_status();
	m_screen.show();
}

void tlife::session::active_method( redraw&& )
{
	if( m_finished ) return;

	m_screen.clear();
	for(int y=0; y<m_grid.height(); ++y)
		for(int x=0; x<m_grid.width(); ++x)
			if( m_grid.alive(x,y) )
				draw_cell(x, y, true);
	draw_status();
	m_screen.show();
}

void tlife::session::active_method( quit&& )
{
	m_finished = true;
	m_running = false;
	m_clock.stop();
}

void tlife::session::draw_cell(int x, int y, bool alive)
{
	m_screen.set_cell(x + status_width, y, alive ? alive_glyph : dead_glyph);
}

void tlife::session::draw_status()
{
	for(int y=0; y<status_lines; ++y)
		for(int x=0; x<status_width; ++x)
			m_screen.set_cell(x, y, ' ');

	std::ostringstream size, generation;
	size << m_grid.width() << 'x' << m_grid.height();
	generation << "Gen: " << m_grid.generation();

	emit_text(0, 0, size.str());
	emit_text(0, 1, m_running ? "Play" : "Pause");
	emit_text(0, 2, generation.str());
}

// Text is clipped to the status panel.
void tlife::session::emit_text(int x, int y, const std::string & text)
{
	for(std::string::const_iterator c=text.begin(); c!=text.end() && x<status_width; ++c, ++x)
		m_screen.set_cell(x, y, *c);
}
