#ifndef TLIFE_TICKER_INCLUDED
#define TLIFE_TICKER_INCLUDED

#include "object.hpp"

namespace tlife
{
	class session;
	class metronome;

	// The tick activity: a thread which sends session::tick on every beat
	// of the metronome. Destroying the ticker stops the metronome.
	class ticker
	{
	public:
		ticker(session & target, metronome & clock);
		~ticker();

	private:
		ticker(const ticker&);
		ticker & operator=(const ticker&);

		void thread_fn();

		session & m_session;
		metronome & m_clock;
		platform::thread m_thread;
	};
}

#endif
