#pragma once

#include <StormByte/stream/scheduler.hxx>
#include <StormByte/stream/signal.hxx>

#include <memory>
#include <string>

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
	 * @brief Listener for error events.
	 */
	using ErrorHandler = std::function<void(const ErrorPointer&)>;

	/**
	 * @brief Listener for argument-less events (drain, end, finish, close).
	 */
	using EventHandler = std::function<void()>;

	/**
	 * @class Stream
	 * @brief Lifecycle shared by every stream type.
	 *
	 * @par Overview
	 *  Stream holds what readable and writable sides have in common: the
	 *  Scheduler the stream is bound to, the optional logger, the destroyed /
	 *  errored terminal state and the error and close events. Readable and
	 *  Writable derive virtually from it so that a Duplex has a single
	 *  lifecycle for both of its sides.
	 *
	 * @par Ownership
	 *  Streams must be owned by a `std::shared_ptr` (create them with
	 *  `std::make_shared`). Deferred work is posted to the scheduler guarded by
	 *  a weak reference, so work queued for a stream that has been released is
	 *  skipped, and a stream not owned by a `std::shared_ptr` never runs its
	 *  deferred work.
	 *
	 * @par Destroy
	 *  Destroy() is terminal and idempotent. It discards buffered chunks
	 *  immediately, then emits the error event (when an error was given),
	 *  the close event and the destroyed event on the next scheduler turn. No chunk is emitted or
	 *  delivered after Destroy().
	 */
	class STORMBYTE_STREAM_PUBLIC Stream: public std::enable_shared_from_this<Stream> {
		public:
			Stream(const Stream&)										= delete;
			Stream(Stream&&)											= delete;

			/**
			 * @brief Virtual destructor.
			 */
			virtual ~Stream() noexcept									= default;

			Stream& operator=(const Stream&)							= delete;
			Stream& operator=(Stream&&)									= delete;

			/**
			 * @brief Destroy the stream without an error.
			 * @details The stream reaches its destroyed terminal state and only
			 *          the close event is emitted.
			 */
			void 														Destroy() noexcept;

			/**
			 * @brief Destroy the stream with an error.
			 * @param error Error reported through OnError(). A null pointer is
			 *        equivalent to Destroy().
			 */
			void 														Destroy(ErrorPointer error) noexcept;

			/**
			 * @brief Error the stream was destroyed with, if any.
			 */
			inline const ErrorPointer& 									GetError() const noexcept {
				return m_error;
			}

			/**
			 * @brief Scheduler this stream is bound to.
			 */
			inline const std::shared_ptr<Scheduler>& 					GetScheduler() const noexcept {
				return m_scheduler;
			}

			/**
			 * @brief Whether the close event was emitted (or is scheduled).
			 */
			inline bool 												IsClosed() const noexcept {
				return m_closed;
			}

			/**
			 * @brief Whether Destroy() was called (with or without error).
			 */
			inline bool 												IsDestroyed() const noexcept {
				return m_destroyed;
			}

			/**
			 * @brief Whether the stream was destroyed with an error.
			 */
			inline bool 												IsErrored() const noexcept {
				return m_destroyed && m_error != nullptr;
			}

			/**
			 * @brief Human readable stream type used in logs.
			 */
			virtual const char* 										Kind() const noexcept = 0;

			/**
			 * @brief Remove a listener registered on any event of this stream.
			 * @param id Identifier returned when registering.
			 * @return true if a listener was removed.
			 */
			virtual bool 												Off(const ListenerId& id) noexcept;

			/**
			 * @brief Register a close listener.
			 * @details Close fires at most once, after the stream is done (ended,
			 *          finished or both for duplexes) or destroyed, unless
			 *          `Options::emit_close` is false.
			 */
			ListenerId 													OnClose(EventHandler handler);

			/**
			 * @brief Register an error listener.
			 * @details Errors fire at most once, when the stream is destroyed with
			 *          an error. Without any error listener the error is logged.
			 */
			ListenerId 													OnError(ErrorHandler handler);

			/**
			 * @brief Register a destroy listener.
			 * @details Called once after Destroy(), with the error the stream was
			 *          destroyed with (null when none), after the error and close
			 *          events. Unlike close it fires whatever `Options::emit_close`
			 *          says, so coordinators always learn about a destroy.
			 */
			ListenerId 													OnDestroyed(ErrorHandler handler);

		protected:
			std::shared_ptr<Scheduler> m_scheduler;						///< Scheduler running deferred work.
			std::shared_ptr<Logger::Log> m_log;							///< Optional logger.

			/**
			 * @brief Construct Stream.
			 * @param scheduler Scheduler the stream is bound to.
			 * @param options Options providing the logger and close policy.
			 */
			Stream(std::shared_ptr<Scheduler> scheduler, const Options& options) noexcept;

			/**
			 * @brief Run @p task on a later scheduler turn while the stream is alive.
			 * @param task Work to run.
			 */
			void 														Defer(Task&& task);

			/**
			 * @brief Whether every side of the stream completed normally.
			 */
			virtual bool 												IsDone() const noexcept = 0;

			/**
			 * @brief Write a line to the logger, if any.
			 * @param level Log level.
			 * @param message Message, prefixed with Kind().
			 */
			void 														Log(const Logger::Level& level, const std::string& message) const noexcept;

			/**
			 * @brief Schedule the close event once IsDone() holds.
			 */
			void 														MaybeClose() noexcept;

			/**
			 * @brief Allocate a listener identifier unique to this stream.
			 */
			inline ListenerId 											NextListenerId() noexcept {
				return ++m_last_listener;
			}

			/**
			 * @brief Hook run synchronously inside Destroy() to discard buffers.
			 */
			virtual void 												OnDestroy() noexcept = 0;

		private:
			Signal<const ErrorPointer&> m_on_error;						///< Error listeners.
			Signal<> m_on_close;										///< Close listeners.
			Signal<const ErrorPointer&> m_on_destroyed;					///< Destroy listeners.
			ErrorPointer m_error;										///< Error destroyed with.
			ListenerId m_last_listener {0};								///< Last listener id handed out.
			bool m_destroyed {false};									///< Destroy() called.
			bool m_closed {false};										///< Close emitted or scheduled.
			bool m_emit_close {true};									///< Close emission policy.

			/**
			 * @brief Emit the error event, logging it when nobody listens.
			 */
			void 														EmitError() const;
	};
}
