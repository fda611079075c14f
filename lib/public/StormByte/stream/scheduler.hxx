#pragma once

#include <StormByte/stream/typedefs.hxx>

#include <condition_variable>
#include <deque>
#include <mutex>

/**
 * @namespace Stream
 * @brief Namespace for chunked streaming components in the StormByte library.
 *
 * The Stream namespace provides readable, writable, duplex and transform
 * streams with bounded buffering and backpressure, plus the coordinators
 * that pipe them together.
 */
namespace StormByte::Stream {
	/**
	 * @class Scheduler
	 * @brief Cooperative FIFO task queue driving a group of streams.
	 *
	 * @par Overview
	 *  Streams never emit events or hand chunks to sinks from inside the call
	 *  that caused them (`Push`, `Write`, `Resume`...). Instead they post a
	 *  task to the Scheduler they are bound to. Whoever runs the scheduler
	 *  (Run(), RunUntil() or a Pipeline) executes those tasks one at a time in
	 *  posting order, which gives every stream bound to it a single logical
	 *  flow of control.
	 *
	 * @par Thread safety
	 *  Post() and Stop() may be called from any thread; this is how sources
	 *  and sinks that complete on foreign threads hand their results back.
	 *  Tasks themselves run on the thread calling Run()/RunUntil(). Only one
	 *  thread may run a given scheduler at a time. Independent schedulers may
	 *  run in parallel on different threads.
	 *
	 * @par Exceptions
	 *  An exception thrown by a task propagates out of the running call; the
	 *  task is already removed from the queue and remaining tasks stay queued.
	 */
	class STORMBYTE_STREAM_PUBLIC Scheduler final {
		public:
			/**
			 * @brief Construct an empty, running scheduler.
			 */
			Scheduler() noexcept									= default;

			Scheduler(const Scheduler&)								= delete;
			Scheduler(Scheduler&&)									= delete;
			~Scheduler() noexcept									= default;
			Scheduler& operator=(const Scheduler&)					= delete;
			Scheduler& operator=(Scheduler&&)						= delete;

			/**
			 * @brief Check whether Stop() was requested.
			 */
			bool 													IsStopped() const noexcept;

			/**
			 * @brief Number of tasks waiting to run.
			 */
			std::size_t 											Pending() const noexcept;

			/**
			 * @brief Queue a task (thread-safe).
			 * @param task Task to run after every task already queued.
			 */
			void 													Post(Task&& task);

			/**
			 * @brief Queue a task (thread-safe, copy version).
			 * @param task Task to run after every task already queued.
			 */
			void 													Post(const Task& task);

			/**
			 * @brief Clear the stop flag so the scheduler can be run again.
			 */
			void 													Restart() noexcept;

			/**
			 * @brief Run queued tasks until the queue is empty.
			 * @return Number of tasks executed.
			 * @details Tasks posted while running are executed too. Returns
			 *          immediately (without waiting) once the queue is empty.
			 */
			std::size_t 											Run();

			/**
			 * @brief Run a single queued task, if any.
			 * @return true if a task was executed.
			 */
			bool 													RunOne();

			/**
			 * @brief Run tasks, waiting for new ones, until @p done is satisfied.
			 * @param done Predicate evaluated on the running thread before each task.
			 * @return Number of tasks executed.
			 * @details Blocks while the queue is empty. Returns when @p done
			 *          returns true or Stop() is called. Any state @p done inspects
			 *          must be changed by a task (or followed by a Post()), otherwise
			 *          the waiting thread is not woken up to observe it.
			 */
			std::size_t 											RunUntil(const std::function<bool()>& done);

			/**
			 * @brief Wake every RunUntil() caller and make it return (thread-safe).
			 */
			void 													Stop() noexcept;

		private:
			mutable std::mutex m_mutex;								///< Mutex protecting the queue.
			std::condition_variable m_cv;							///< Signals posted tasks and stop.
			std::deque<Task> m_tasks;								///< Pending tasks.
			bool m_stopped {false};									///< Stop requested.

			/**
			 * @brief Pop the next task.
			 * @param task Receives the task.
			 * @param wait Whether to block until a task is posted or Stop() is called.
			 * @return true if a task was popped.
			 */
			bool 													Next(Task& task, bool wait);
	};
}
