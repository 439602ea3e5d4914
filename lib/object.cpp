#include <tlife/object.hpp>
#include <tlife/scheduler.hpp>

#include <cstdio>
#include <stdexcept>

// Our global variable, the scheduler.
// It appears to offer some background facility such as a thread, and
// use of it is optional.
tlife::scheduler tlife::default_scheduler;

tlife::scheduler::scheduler() : m_head(nullptr), m_tail(nullptr), m_busy_count(0)
{
}

tlife::any_object::~any_object()
{
}

// Used by an active object to signal that there are messages to process.
// An object is only ever activated once at a time, by the message that made
// its queue non-empty, so it is on this list at most once.
void tlife::scheduler::activate(ObjectPtr p) throw()
{
	platform::lock_guard<platform::mutex> lock(m_mutex);
	p->m_next = nullptr;
	if( m_tail )
		m_tail->m_next = p;
	else
		m_head = p;
	m_tail = p;
	m_ready.notify_one();
}

// Run one item, return true if an item was run.
bool tlife::scheduler::locked_run_one(platform::unique_lock<platform::mutex> & lock)
{
	if( m_head )
	{
		ObjectPtr p = m_head;
		m_head = p->m_next;
		if( !m_head ) m_tail = nullptr;
		lock.unlock();
		p->run_some();
		lock.lock();
		return true;
	}
	return false;
}

// Runs until there are no more messages in the entire pool.
// Returns false when nothing is activated and nobody else is busy.
bool tlife::scheduler::run_managed() throw()
{
	platform::unique_lock<platform::mutex> lock(m_mutex);
	++m_busy_count;
	while( locked_run_one(lock) )
		;

	// Can be non-zero if the queues are empty, but other threads are processing.
	// The result of processing could be to add more activated objects.
	if( 0!=--m_busy_count )
	{
		if( !m_head )
			m_ready.wait(lock);
		return true;
	}
	m_ready.notify_all();
	return false;
}

bool tlife::scheduler::run_one()
{
	platform::unique_lock<platform::mutex> lock(m_mutex);
	++m_busy_count;
	locked_run_one(lock);
	--m_busy_count;
	return m_head!=nullptr;
}

void tlife::scheduler::run()
{
	while( run_managed() )
		;
}

void tlife::scheduler::start_work() throw()
{
	platform::lock_guard<platform::mutex> lock(m_mutex);
	++m_busy_count;
}

void tlife::scheduler::stop_work() throw()
{
	platform::lock_guard<platform::mutex> lock(m_mutex);
	if( 0==--m_busy_count )
	{
		m_ready.notify_all();
	}
}

tlife::run::run(int num_threads, scheduler & sched) :
	m_scheduler(sched)
{
	if( num_threads<1 ) num_threads=4;
	m_scheduler.start_work();	// Prevent threads from exiting prematurely
	for( int t=0; t<num_threads; ++t )
#ifdef TLIFE_USE_BOOST
		m_threads.add_thread(new platform::thread( platform::bind(&scheduler::run, &sched) ) );
#else
		m_threads.push_back(platform::thread( platform::bind(&scheduler::run, &sched) ) );
#endif
}

tlife::run::~run()
{
	m_scheduler.stop_work();
#ifdef TLIFE_USE_BOOST
	m_threads.join_all();
#else
	for(threads::iterator t=m_threads.begin(); t!=m_threads.end(); ++t)
		t->join();
#endif
}

void tlife::any_object::exception_handler() throw()
{
	try
	{
		throw;
	}
	catch( std::exception & ex )
	{
		// std::cerr is NOT threadsafe.
		fprintf(stderr, "Unhandled exception during message processing: %s\n", ex.what());
	}
	catch( ... )
	{
		fprintf(stderr, "Unhandled exception during message processing\n");
	}
}

tlife::schedule::thread_pool::thread_pool(type & p) : m_pool(&p)
{
}

void tlife::schedule::thread_pool::set_scheduler(type&p)
{
	m_pool = &p;
}

void tlife::schedule::thread_pool::activate(any_object * obj)
{
	if(m_pool) m_pool->activate(obj);
}
