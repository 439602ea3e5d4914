#ifndef TLIFE_SCHEDULER_INCLUDED
#define TLIFE_SCHEDULER_INCLUDED

#include "object.hpp"

#ifdef TLIFE_USE_BOOST
	#include <boost/thread/condition_variable.hpp>
#else
	#include <condition_variable>
#endif

namespace tlife
{
	// Represents a pool of active objects which can be executed in a thread pool.
	class scheduler
	{
	public:
		typedef any_object * ObjectPtr;

		scheduler();

		// Used by an active object to signal that there are messages to process.
		void activate(ObjectPtr) throw();

		// Thread tracking:
		void start_work() throw();
		void stop_work() throw();

		// Runs in current thread until there are no more messages in the entire pool
		// and no other thread is working.
		// Can be run concurrently.
		void run();

		// Runs one activated object.
		// Returns true if there are still messages to be processed,
		// false if no more messages are available.
		// Can be run concurrently.
		bool run_one();

	private:
		platform::mutex m_mutex;
		any_object *m_head, *m_tail;   // List of activated objects.
		platform::condition_variable m_ready;
		int m_busy_count;	// Used to work out when we have actually finished.

		bool run_managed() throw();
		bool locked_run_one(platform::unique_lock<platform::mutex> & lock);
	};
}

#endif
