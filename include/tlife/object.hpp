/* Cppao: C++ Active Objects library
 * Copyright (C) Calum Grant 2012
 */

#ifndef TLIFE_OBJECT_INCLUDED
#define TLIFE_OBJECT_INCLUDED

#include <tlife/config.hpp>

#include <cstddef>
#include <exception>
#include <type_traits>
#include <utility>
#include <vector>

#ifdef TLIFE_USE_BOOST
	#include <boost/thread.hpp>
	#include <boost/thread/mutex.hpp>
	#include <boost/bind.hpp>

	namespace tlife
	{
		namespace platform
		{
			using namespace boost;
		}
	}
#else
	#include <functional>
	#include <mutex>
	#include <thread>

	namespace tlife
	{
		namespace platform
		{
			using namespace std;
		}
	}
#endif


namespace tlife
{
	// Interface of all active objects.
	struct any_object
	{
		any_object() : m_next(nullptr) { }
		virtual ~any_object();
		virtual bool run_some(int n=100) throw()=0;
		virtual void exception_handler() throw();
		any_object * m_next;	// Link in the scheduler's list of activated objects
	};

	class scheduler;

	// As a convenience, provide a global variable to run all active objects.
	extern scheduler default_scheduler;

	namespace schedule	// Schedulers
	{
		// The object is scheduled using a thread pool (tlife::run)
		struct thread_pool
		{
			typedef tlife::scheduler type;
			thread_pool(type&);

			void set_scheduler(type&p);
			void activate(any_object * obj);
		private:
			type * m_pool;
		};
	}

	namespace queueing	// The queuing policy classes
	{
		// Default message queue shared between all message types.
		class shared
		{
		   struct message
		   {
			   message() : m_next(nullptr) { }
			   virtual ~message() { }
			   virtual void run()=0;
			   message *m_next;
		   };
		public:
			shared() : m_head(nullptr), m_tail(nullptr) { }

			~shared()
			{
				while( message * m = m_head )
				{
					m_head = m->m_next;
					delete m;
				}
			}

			// Returns true if the queue was empty, so the object needs activating.
			template<typename Fn>
			bool enqueue_fn( Fn && fn )
			{
				typedef typename std::decay<Fn>::type fn_type;
				return enqueue( new run_impl<fn_type>(std::forward<Fn>(fn)) );
			}

			bool empty() const
			{
				platform::lock_guard<platform::mutex> lock(m_mutex);
				return !m_head;
			}

			std::size_t size() const
			{
				platform::lock_guard<platform::mutex> lock(m_mutex);
				std::size_t n=0;
				for(message * m=m_head; m; m=m->m_next)
					++n;
				return n;
			}

			// Runs up to n messages; returns true if messages remain.
			// The head stays in the queue whilst it runs, so that enqueue_fn()
			// does not reactivate the object from inside its own message.
			bool run_some(any_object * o, int n=100) throw()
			{
				platform::unique_lock<platform::mutex> lock(m_mutex);
				while( m_head && n-->0)
				{
					message * m = m_head;

					lock.unlock();
					try
					{
						m->run();
					}
					catch (...)
					{
						o->exception_handler();
					}
					lock.lock();
					m_head = m_head->m_next;
					if(!m_head) m_tail=nullptr;
					delete m;
				}
				return m_head!=nullptr;
			}

		private:
			shared(const shared&);
			shared & operator=(const shared&);

			// Push to tail, pop from head:
			message *m_head, *m_tail;

			bool enqueue(message*impl)
			{
				platform::lock_guard<platform::mutex> lock(m_mutex);
				if( m_tail )
				{
					m_tail->m_next = impl;
					m_tail = impl;
					return false;
				}
				else
				{
					m_head = m_tail = impl;
					return true;
				}
			}

			template<typename Fn>
			struct run_impl : public message
			{
				template<typename F>
				explicit run_impl(F && fn) : m_fn(std::forward<F>(fn)) { }
				Fn m_fn;
				void run()
				{
					m_fn();
				}
			};

			mutable platform::mutex m_mutex;
		};
	}

	template<typename Schedule, typename Queue>
	class object_impl : public any_object
	{
	public:
		typedef Schedule schedule_type;
		typedef Queue queue_type;
		typedef typename schedule_type::type scheduler_type;
		typedef std::size_t size_type;

		explicit object_impl(scheduler_type & tp = default_scheduler) : m_schedule(tp) { }

		// Destroying an object with pending messages is a programming error.
		~object_impl() { if(!m_queue.empty()) std::terminate(); }

		// Run a few messages from the queue.
		// If we still have messages, then reactivate this object.
		bool run_some(int n) throw()
		{
			if( m_queue.run_some(this, n) )
			{
				m_schedule.activate(this);
				return true;
			}
			return false;
		}

		// Not threadsafe; must be called before message processing.
		void set_scheduler(scheduler_type & sch)
		{
			m_schedule.set_scheduler(sch);
		}

		size_type size() const
		{
			return m_queue.size();
		}

		bool empty() const
		{
			return m_queue.empty();
		}

	protected:
		template<typename T>
		void active_fn(T && fn)
		{
			if( m_queue.enqueue_fn(std::forward<T>(fn)) )
				m_schedule.activate(this);
		}

	private:
		schedule_type m_schedule;
		queue_type m_queue;
	};

	// The default object type.
	typedef object_impl<schedule::thread_pool, queueing::shared> basic;

	/*	This is the base class of all active objects.
		Its main role is to implement operator(), which queues a message
		for the derived class's active_method() overload of the same type.
	  */
	template<typename Derived, typename ObjectType=basic>
	struct object : public ObjectType
	{
		typedef ObjectType object_type;
		typedef Derived derived_type;
		typedef typename ObjectType::scheduler_type scheduler_type;

		explicit object(scheduler_type & sched = default_scheduler) : object_type(sched)
		{
		}

		template<typename T>
		derived_type & operator()(T && msg)
		{
			typename std::decay<T>::type msg2(std::forward<T>(msg));
			derived_type * self = static_cast<derived_type*>(this);
			this->active_fn( [self,msg2]() mutable { self->active_method(std::move(msg2)); } );
			return *self;
		}

		template<typename T1, typename T2>
		derived_type & operator()(T1 a1, T2 a2)
		{
			derived_type * self = static_cast<derived_type*>(this);
			this->active_fn( [self,a1,a2]() mutable { self->active_method(std::move(a1),std::move(a2)); } );
			return *self;
		}
	};

	// Runs the scheduler in a number of threads until destroyed
	// and there is no more work.
	class run
	{
	public:
		explicit run(int threads=platform::thread::hardware_concurrency(), scheduler & sched = default_scheduler);
		~run();
	private:
		run(const run&);
		run & operator=(const run&);
		scheduler & m_scheduler;
#ifdef TLIFE_USE_BOOST
		typedef boost::thread_group threads;
#else
		typedef std::vector<platform::thread> threads;
#endif
		threads m_threads;
	};
} // namespace tlife


#endif
