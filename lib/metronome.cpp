#include <tlife/metronome.hpp>

#ifndef TLIFE_USE_BOOST
	#include <chrono>
#endif

tlife::metronome::metronome(int interval_ms) :
	m_interval(interval_ms<0 ? 0 : interval_ms), m_pending(false), m_stopped(false)
{
}

void tlife::metronome::set_interval(int interval_ms)
{
	platform::lock_guard<platform::mutex> lock(m_mutex);
	m_interval = interval_ms<0 ? 0 : interval_ms;
}

int tlife::metronome::interval() const
{
	platform::lock_guard<platform::mutex> lock(m_mutex);
	return m_interval;
}

bool tlife::metronome::wait_beat()
{
	platform::unique_lock<platform::mutex> lock(m_mutex);

	// Re-arm only once the previous beat has been consumed.
	while( m_pending && !m_stopped )
		m_ready.wait(lock);

#ifdef TLIFE_USE_BOOST
	const boost::system_time deadline =
		boost::get_system_time() + boost::posix_time::milliseconds(m_interval);
	while( !m_stopped && m_ready.timed_wait(lock, deadline) )
		;
#else
	const std::chrono::steady_clock::time_point deadline =
		std::chrono::steady_clock::now() + std::chrono::milliseconds(m_interval);
	while( !m_stopped && m_ready.wait_until(lock, deadline)==std::cv_status::no_timeout )
		;
#endif

	if( m_stopped ) return false;
	m_pending = true;
	return true;
}

void tlife::metronome::beat_done()
{
	platform::lock_guard<platform::mutex> lock(m_mutex);
	m_pending = false;
	m_ready.notify_all();
}

bool tlife::metronome::pending() const
{
	platform::lock_guard<platform::mutex> lock(m_mutex);
	return m_pending;
}

void tlife::metronome::stop()
{
	platform::lock_guard<platform::mutex> lock(m_mutex);
	m_stopped = true;
	m_ready.notify_all();
}

bool tlife::metronome::stopped() const
{
	platform::lock_guard<platform::mutex> lock(m_mutex);
	return m_stopped;
}
