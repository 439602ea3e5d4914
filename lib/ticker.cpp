#include <tlife/ticker.hpp>
#include <tlife/metronome.hpp>
#include <tlife/session.hpp>

tlife::ticker::ticker(session & target, metronome & clock) :
	m_session(target),
	m_clock(clock),
	m_thread( platform::bind( &ticker::thread_fn, this ) )
{
}

tlife::ticker::~ticker()
{
	m_clock.stop();
	m_thread.join();
}

void tlife::ticker::thread_fn()
{
	while( m_clock.wait_beat() )
		m_session(session::tick());
}
