#ifndef TLIFE_METRONOME_INCLUDED
#define TLIFE_METRONOME_INCLUDED

#include "object.hpp"

#ifdef TLIFE_USE_BOOST
	#include <boost/thread/condition_variable.hpp>
#else
	#include <condition_variable>
#endif

namespace tlife
{
	/*	Paces the simulation and carries the termination signal.
		A beat is given out by wait_beat() once the interval has elapsed,
		and the next interval only starts when the beat has been consumed
		with beat_done(). Changes to the interval apply from the next beat.
	  */
	class metronome
	{
	public:
		explicit metronome(int interval_ms);

		void set_interval(int interval_ms);
		int interval() const;

		// Blocks until the next beat. Returns false once stopped.
		bool wait_beat();

		void beat_done();

		// True while a beat is out and not yet consumed.
		bool pending() const;

		// Raises the termination signal and wakes all waiters.
		void stop();
		bool stopped() const;

	private:
		metronome(const metronome&);
		metronome & operator=(const metronome&);

		mutable platform::mutex m_mutex;
		platform::condition_variable m_ready;
		int m_interval;
		bool m_pending;		// A beat has been given out and not yet consumed
		bool m_stopped;
	};
}

#endif
