#ifndef TLIFE_INPUT_INCLUDED
#define TLIFE_INPUT_INCLUDED

#include "screen.hpp"

namespace tlife
{
	class session;
	class metronome;

	// Milliseconds to wait for input before checking for termination.
	const int input_poll_ms = 50;

	/*	The input-reaction activity.
		Reads events from the screen and sends the matching messages to the
		session, until the user quits or the metronome is stopped.
	  */
	class input_reader
	{
	public:
		input_reader(screen & display, session & target, metronome & clock);

		// Runs in the calling thread.
		void run();

		// Sends the message for one event.
		// Returns false if the event asks to quit.
		bool dispatch(const event & ev);

	private:
		bool dispatch_key(int code);

		screen & m_screen;
		session & m_session;
		metronome & m_clock;
	};
}

#endif
