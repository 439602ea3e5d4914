#ifndef TLIFE_SCREEN_INCLUDED
#define TLIFE_SCREEN_INCLUDED

namespace tlife
{
	// Key codes delivered in key events.
	// Printable characters are delivered as themselves.
	namespace keys
	{
		enum
		{
			enter = 13,
			escape = 27,
			left = 0x1001,
			right = 0x1002,
			up = 0x1003,
			down = 0x1004
		};
	}

	// Pointer buttons delivered in mouse events.
	namespace buttons
	{
		enum
		{
			button1 = 1,
			button2 = 2,
			button3 = 4
		};
	}

	// One input event from the terminal.
	struct event
	{
		enum kind_type { none, key, mouse, resize };

		kind_type kind;
		int code;				// key
		unsigned buttons;		// mouse
		int x, y;				// mouse, screen coordinates
		int width, height;		// resize, terminal size

		event() : kind(none), code(0), buttons(0), x(0), y(0), width(0), height(0) { }

		static event key_press(int code)
		{
			event e;
			e.kind = key;
			e.code = code;
			return e;
		}

		static event mouse_press(unsigned buttons, int x, int y)
		{
			event e;
			e.kind = mouse;
			e.buttons = buttons;
			e.x = x;
			e.y = y;
			return e;
		}

		static event resized(int width, int height)
		{
			event e;
			e.kind = resize;
			e.width = width;
			e.height = height;
			return e;
		}
	};

	/*	Follows the pointer buttons across raw terminal reports.
		Motion while a button is held reads as a press of that button, so
		dragging across cells presses each of them in turn.
	  */
	class pointer_tracker
	{
	public:
		pointer_tracker() : m_held(0) { }

		// Returns the buttons to deliver as a mouse event, or 0 for none.
		unsigned report(unsigned pressed, unsigned released, bool moved);

		unsigned held() const { return m_held; }

	private:
		unsigned m_held;
	};

	// The display surface and event source.
	// Coordinates are screen columns and rows from the top left.
	class screen
	{
	public:
		virtual ~screen();

		virtual void size(int & width, int & height) const=0;

		virtual void set_cell(int x, int y, char glyph)=0;

		// Blanks the whole display.
		virtual void clear()=0;

		// Makes pending changes visible.
		virtual void show()=0;

		// Repaints the whole display, after the terminal has been resized.
		virtual void sync()=0;

		// Waits up to timeout_ms for the next event.
		// Returns false if there was none.
		virtual bool poll_event(event & ev, int timeout_ms)=0;
	};
}

#endif
