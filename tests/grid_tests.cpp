#undef NDEBUG

#include <tlife/grid.hpp>

#include <iostream>
#include <cassert>

namespace
{
	bool contains(const tlife::grid::cells & cells, int x, int y, bool alive)
	{
		tlife::cell c = { x, y, alive };
		for(tlife::grid::cells::const_iterator i=cells.begin(); i!=cells.end(); ++i)
			if( *i == c ) return true;
		return false;
	}

	bool same_cells(const tlife::grid & a, const tlife::grid & b)
	{
		if( a.width()!=b.width() || a.height()!=b.height() ) return false;
		for(int y=0; y<a.height(); ++y)
			for(int x=0; x<a.width(); ++x)
				if( a.alive(x,y)!=b.alive(x,y) ) return false;
		return true;
	}
}

void test_new_grid_is_dead()
{
	tlife::grid g(7,5);
	assert( g.width()==7 && g.height()==5 );
	assert( g.generation()==0 );
	assert( g.population()==0 );
	for(int y=0; y<5; ++y)
		for(int x=0; x<7; ++x)
			assert( !g.alive(x,y) );
}

void test_neighbours_wrap()
{
	const int w=6, h=5;
	tlife::grid g(w,h);
	g.toggle(0,0);

	assert( g.neighbour_count(w-1,h-1)==1 );
	assert( g.neighbour_count(w-1,0)==1 );
	assert( g.neighbour_count(0,h-1)==1 );
	assert( g.neighbour_count(1,1)==1 );
	assert( g.neighbour_count(1,0)==1 );
	assert( g.neighbour_count(0,1)==1 );

	// A cell counts itself, and distant cells see nothing.
	assert( g.neighbour_count(0,0)==1 );
	assert( g.neighbour_count(3,2)==0 );
	assert( g.neighbour_count(w-2,0)==0 );
}

void test_neighbours_on_tiny_grid()
{
	// On a 1x1 torus every offset wraps back to the cell itself.
	tlife::grid g(1,1);
	g.toggle(0,0);
	assert( g.neighbour_count(0,0)==9 );
	tlife::grid::cells changed = g.step();
	assert( changed.size()==1 );
	assert( contains(changed, 0, 0, false) );
}

void test_rule()
{
	tlife::grid g(5,5);

	// Dead cell with 3 neighbours is born.
	g.toggle(1,1); g.toggle(2,1); g.toggle(3,1);
	assert( g.neighbour_count(2,2)==3 );
	assert( g.next_state(2,2) );

	// Dead cell with 4 neighbours stays dead.
	g.toggle(2,3);
	assert( g.neighbour_count(2,2)==4 );
	assert( !g.next_state(2,2) );

	// Live cell among 4 others counts 5 and dies.
	g.toggle(2,2);
	assert( g.neighbour_count(2,2)==5 );
	assert( !g.next_state(2,2) );

	// Live cell among 2 others counts 3 and lives.
	g.toggle(1,1); g.toggle(3,1);
	assert( g.neighbour_count(2,2)==3 );
	assert( g.next_state(2,2) );

	// Live cell among 3 others counts 4 and is kept.
	g.toggle(1,1);
	assert( g.neighbour_count(2,2)==4 );
	assert( g.next_state(2,2) );

	// Live cell with a single other counts 2 and dies.
	g.toggle(1,1); g.toggle(2,3);
	assert( g.neighbour_count(2,2)==2 );
	assert( !g.next_state(2,2) );
}

void test_dead_grid_stays_dead()
{
	tlife::grid g(9,4);
	for(int i=0; i<5; ++i)
	{
		assert( g.step().empty() );
		assert( g.population()==0 );
	}
}

void test_single_cell_fixture()
{
	tlife::grid g(3,3);
	g.toggle(1,1);

	for(int y=0; y<3; ++y)
		for(int x=0; x<3; ++x)
			assert( g.neighbour_count(x,y)==1 );

	tlife::grid::cells changed = g.step();
	assert( changed.size()==1 );
	assert( contains(changed, 1, 1, false) );
	assert( g.population()==0 );
}

void test_blinker_changes()
{
	// A vertical line of three turns horizontal and back.
	tlife::grid g(5,5);
	g.toggle(2,1); g.toggle(2,2); g.toggle(2,3);

	tlife::grid::cells changed = g.step();
	assert( changed.size()==4 );
	assert( contains(changed, 2, 1, false) );
	assert( contains(changed, 2, 3, false) );
	assert( contains(changed, 1, 2, true) );
	assert( contains(changed, 3, 2, true) );
	assert( g.alive(1,2) && g.alive(2,2) && g.alive(3,2) );
	assert( g.population()==3 );

	changed = g.step();
	assert( changed.size()==4 );
	assert( g.alive(2,1) && g.alive(2,2) && g.alive(2,3) );
	assert( g.population()==3 );
}

void test_block_is_still()
{
	tlife::grid g(6,6);
	g.toggle(1,1); g.toggle(2,1); g.toggle(1,2); g.toggle(2,2);
	assert( g.step().empty() );
	assert( g.population()==4 );
	assert( g.generation()==1 );
}

void test_step_is_pure()
{
	tlife::grid a(8,6);
	a.toggle(0,0); a.toggle(1,0); a.toggle(7,5); a.toggle(3,3); a.toggle(4,3); a.toggle(3,4);
	tlife::grid b(a);

	tlife::grid::cells ca = a.step(), cb = b.step();
	assert( ca == cb );
	assert( same_cells(a,b) );
}

void test_changed_set_is_exact()
{
	tlife::grid g(8,6);
	g.toggle(0,0); g.toggle(1,0); g.toggle(7,5); g.toggle(3,3); g.toggle(4,3); g.toggle(3,4);
	const tlife::grid before(g);

	tlife::grid::cells changed = g.step();
	for(int y=0; y<g.height(); ++y)
		for(int x=0; x<g.width(); ++x)
		{
			const bool differs = before.alive(x,y)!=g.alive(x,y);
			assert( differs == contains(changed, x, y, g.alive(x,y)) );
		}
}

void test_toggle_twice()
{
	tlife::grid g(4,4);
	assert( g.toggle(2,3) );
	assert( g.alive(2,3) );
	assert( !g.toggle(2,3) );
	assert( !g.alive(2,3) );
	assert( g.population()==0 );
}

void test_resize_grow()
{
	tlife::grid g(4,4);
	g.toggle(3,3);

	tlife::grid::cells live = g.resize(6,6);
	assert( g.width()==6 && g.height()==6 );
	assert( live.size()==1 );
	assert( contains(live, 3, 3, true) );
	assert( g.alive(3,3) );
	assert( g.population()==1 );
}

void test_resize_shrink()
{
	tlife::grid g(4,4);
	g.toggle(3,3);

	tlife::grid::cells live = g.resize(2,2);
	assert( g.width()==2 && g.height()==2 );
	assert( live.empty() );
	assert( g.population()==0 );
}

void test_resize_keeps_overlap()
{
	tlife::grid g(5,3);
	g.toggle(0,0); g.toggle(4,0); g.toggle(1,2);

	// Wider but shorter: (1,2) falls off, the others stay.
	tlife::grid::cells live = g.resize(8,2);
	assert( live.size()==2 );
	assert( g.alive(0,0) && g.alive(4,0) );
	for(int x=5; x<8; ++x)
		assert( !g.alive(x,0) && !g.alive(x,1) );
	assert( g.population()==2 );
}

void test_generation_counting()
{
	tlife::grid g(4,4);
	g.toggle(1,1);
	assert( g.generation()==0 );
	g.step();
	assert( g.generation()==1 );
	g.toggle(2,2);
	g.resize(5,5);
	assert( g.generation()==1 );
	g.step();
	g.step();
	assert( g.generation()==3 );
}

int main()
{
	test_new_grid_is_dead();
	test_neighbours_wrap();
	test_neighbours_on_tiny_grid();
	test_rule();
	test_dead_grid_stays_dead();
	test_single_cell_fixture();
	test_blinker_changes();
	test_block_is_still();
	test_step_is_pure();
	test_changed_set_is_exact();
	test_toggle_twice();
	test_resize_grow();
	test_resize_shrink();
	test_resize_keeps_overlap();
	test_generation_counting();

	std::cout << "All tests passed!\n";
	return 0;
}
