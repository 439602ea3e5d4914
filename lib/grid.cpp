#include <tlife/grid.hpp>

#include <algorithm>

tlife::grid::grid(int width, int height) :
	m_width(width), m_height(height), m_generation(0),
	m_cells(std::size_t(width)*height, 0)
{
}

std::size_t tlife::grid::population() const
{
	return std::count(m_cells.begin(), m_cells.end(), 1);
}

int tlife::grid::neighbour_count(int x, int y) const
{
	int count=0;
	for(int dy=-1; dy<=1; ++dy)
		for(int dx=-1; dx<=1; ++dx)
		{
			int nx=x+dx, ny=y+dy;
			if( nx<0 ) nx=m_width-1;
			else if( nx==m_width ) nx=0;
			if( ny<0 ) ny=m_height-1;
			else if( ny==m_height ) ny=0;

			count += m_cells[index(nx,ny)];
		}
	return count;
}

bool tlife::grid::next_state(int x, int y) const
{
	switch( neighbour_count(x,y) )
	{
	case 3:
		return true;
	case 4:
		return alive(x,y);
	default:
		return false;
	}
}

tlife::grid::cells tlife::grid::step()
{
	std::vector<unsigned char> next(m_cells.size());
	cells changed;

	for(int y=0; y<m_height; ++y)
		for(int x=0; x<m_width; ++x)
		{
			std::size_t i = index(x,y);
			next[i] = next_state(x,y);
			if( next[i]!=m_cells[i] )
			{
				cell c = { x, y, next[i]!=0 };
				changed.push_back(c);
			}
		}

	m_cells.swap(next);
	++m_generation;
	return changed;
}

bool tlife::grid::toggle(int x, int y)
{
	unsigned char & c = m_cells[index(x,y)];
	c ^= 1;
	return c!=0;
}

tlife::grid::cells tlife::grid::resize(int width, int height)
{
	std::vector<unsigned char> resized(std::size_t(width)*height, 0);
	cells live;

	const int w = std::min(width, m_width), h = std::min(height, m_height);
	for(int y=0; y<h; ++y)
		for(int x=0; x<w; ++x)
			if( alive(x,y) )
			{
				resized[std::size_t(y)*width + x] = 1;
				cell c = { x, y, true };
				live.push_back(c);
			}

	m_cells.swap(resized);
	m_width = width;
	m_height = height;
	return live;
}
