#include <tlife/input.hpp>
#include <tlife/metronome.hpp>
#include <tlife/session.hpp>

tlife::input_reader::input_reader(screen & display, session & target, metronome & clock) :
	m_screen(display), m_session(target), m_clock(clock)
{
}

void tlife::input_reader::run()
{
	while( !m_clock.stopped() )
	{
		event ev;
		if( m_screen.poll_event(ev, input_poll_ms) && !dispatch(ev) )
			return;
	}
}

bool tlife::input_reader::dispatch(const event & ev)
{
	switch( ev.kind )
	{
	case event::key:
		return dispatch_key(ev.code);

	case event::mouse:
		if( ev.buttons & buttons::button1 )
		{
			session::click click = { ev.x, ev.y };
			m_session(click);
		}
		return true;

	case event::resize:
		{
			session::resize resize = { ev.width, ev.height };
			m_session(resize);
		}
		return true;

	default:
		return true;
	}
}

bool tlife::input_reader::dispatch_key(int code)
{
	switch( code )
	{
	case keys::escape:
	case keys::enter:
	case 'q':
	case 'Q':
		m_session(session::quit());
		return false;

	case ' ':
		m_session(session::toggle_play());
		break;

	case keys::left:
		m_session(session::faster());
		break;

	case keys::right:
		m_session(session::slower());
		break;
	}
	return true;
}
