#ifndef TLIFE_GRID_INCLUDED
#define TLIFE_GRID_INCLUDED

#include <cstddef>
#include <vector>

namespace tlife
{
	// A cell position together with its (new) state.
	struct cell
	{
		int x, y;
		bool alive;
	};

	inline bool operator==(const cell & a, const cell & b)
	{
		return a.x==b.x && a.y==b.y && a.alive==b.alive;
	}

	/*	A toroidal field of cells, stored row-major.
		The neighbour count is taken over the 3x3 block around a cell, the
		cell itself included. A count of 3 gives a live cell, exactly 4 keeps
		the cell as it is, anything else gives a dead cell.
		Width and height must be at least 1.
	  */
	class grid
	{
	public:
		typedef std::vector<cell> cells;

		grid(int width, int height);

		int width() const { return m_width; }
		int height() const { return m_height; }
		unsigned long generation() const { return m_generation; }

		bool alive(int x, int y) const { return m_cells[index(x,y)]!=0; }

		// Number of live cells.
		std::size_t population() const;

		// Live cells in the wrapped 3x3 block centred on (x,y), 0..9.
		int neighbour_count(int x, int y) const;

		bool next_state(int x, int y) const;

		// Computes the next generation and returns the cells which changed.
		cells step();

		// Flips a single cell and returns its new state.
		bool toggle(int x, int y);

		// Keeps the overlapping region; returns the live cells after resizing.
		cells resize(int width, int height);

	private:
		std::size_t index(int x, int y) const { return std::size_t(y)*m_width + x; }

		int m_width, m_height;
		unsigned long m_generation;
		std::vector<unsigned char> m_cells;
	};
}

#endif
