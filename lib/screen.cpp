#include <tlife/screen.hpp>

tlife::screen::~screen()
{
}

unsigned tlife::pointer_tracker::report(unsigned pressed, unsigned released, bool moved)
{
	unsigned buttons = pressed;
	m_held = (m_held | pressed) & ~released;
	if( moved ) buttons |= m_held;
	return buttons;
}
