#pragma once

#include <StormByte/stream/chunk_buffer.hxx>
#include <StormByte/stream/sink.hxx>
#include <StormByte/stream/stream.hxx>

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
	 * @class Writable
	 * @brief Stream accepting chunks and delivering them to a ChunkSink in order.
	 *
	 * @par Overview
	 *  Write() queues a chunk and returns immediately. Queued chunks are handed
	 *  to the sink on later scheduler turns, strictly one at a time: the next
	 *  chunk is only delivered after the sink acknowledged the previous one.
	 *
	 * @par Backpressure
	 *  Write() returns false once the queued plus in-flight size reaches the
	 *  high-water mark. The producer should then wait for the drain event,
	 *  which fires once when the size drops back below the mark. The write
	 *  itself is always accepted unless `max_buffered` would be exceeded.
	 *
	 * @par State machine
	 *  @code{.text}
	 *  Idle -> Active -> Ending -> Finished
	 *  (any non terminal state) -> Errored | Destroyed
	 *  @endcode
	 *  Finish fires exactly once, after End() was called, every queued chunk
	 *  was acknowledged and the sink flushed through ChunkSink::Final().
	 *
	 * @par Faults
	 *  A sink error destroys the stream with that error (as a SinkFault unless
	 *  it is already one of the typed stream errors). Delivery is never
	 *  retried and queued chunks are discarded.
	 *
	 * @see Readable, Duplex, Pipe()
	 */
	class STORMBYTE_STREAM_PUBLIC Writable: public virtual Stream {
		public:
			/**
			 * @enum State
			 * @brief Observable writable-side state.
			 */
			enum class State {
				Idle,													///< Nothing written yet.
				Active,													///< Accepting writes.
				Ending,													///< End() called, flushing.
				Finished,												///< Everything delivered.
				Errored,												///< Destroyed with an error.
				Destroyed												///< Destroyed without an error.
			};

			/**
			 * @brief Construct a Writable delivering to @p sink.
			 * @param scheduler Scheduler the stream is bound to.
			 * @param sink Destination of the chunks.
			 * @param options Stream options.
			 */
			Writable(std::shared_ptr<Scheduler> scheduler, ChunkSink::PointerType sink, const Options& options = {});

			/**
			 * @brief Construct a Writable delivering to a clone of @p sink.
			 * @param scheduler Scheduler the stream is bound to.
			 * @param sink Destination of the chunks, cloned.
			 * @param options Stream options.
			 */
			inline Writable(std::shared_ptr<Scheduler> scheduler, const ChunkSink& sink, const Options& options = {}):
				Writable(std::move(scheduler), sink.Clone(), options) {}

			/**
			 * @brief Virtual destructor.
			 */
			virtual ~Writable() noexcept								= default;

			/**
			 * @brief Hold deliveries until a matching Uncork().
			 * @details Corks nest; End() removes every cork.
			 */
			void 														Cork() noexcept;

			/**
			 * @brief Signal that no more chunks will be written.
			 * @return `ProtocolViolation` when called twice or after Destroy().
			 */
			ExpectedVoid<Error> 										End();

			/**
			 * @brief Write a last chunk, then End().
			 * @param chunk Final chunk.
			 * @return Error of the write or of End().
			 */
			ExpectedVoid<Error> 										End(Chunk chunk);

			/**
			 * @brief Whether deliveries are held by Cork().
			 */
			inline bool 												IsCorked() const noexcept {
				return m_corked > 0;
			}

			/**
			 * @brief Whether End() was called.
			 */
			inline bool 												IsEnding() const noexcept {
				return m_ending;
			}

			/**
			 * @brief Whether the finish event was reached.
			 */
			inline bool 												IsFinished() const noexcept {
				return m_finished;
			}

			/**
			 * @brief Whether the writable side is in object mode.
			 */
			inline bool 												IsWritableObjectMode() const noexcept {
				return m_buffer.IsObjectMode();
			}

			const char* 												Kind() const noexcept override;

			/**
			 * @brief Whether a write returned false and drain was not emitted yet.
			 */
			inline bool 												NeedsDrain() const noexcept {
				return m_need_drain;
			}

			bool 														Off(const ListenerId& id) noexcept override;

			/**
			 * @brief Register a drain listener.
			 */
			ListenerId 													OnDrain(EventHandler handler);

			/**
			 * @brief Register a finish listener (fires exactly once).
			 */
			ListenerId 													OnFinish(EventHandler handler);

			/**
			 * @brief Uncork once.
			 */
			void 														Uncork() noexcept;

			/**
			 * @brief Accounted size queued or in flight to the sink.
			 */
			inline std::size_t 											WritableBytes() const noexcept {
				return m_buffer.BufferedBytes() + m_in_flight;
			}

			/**
			 * @brief High-water mark of the writable side.
			 */
			inline std::size_t 											WritableHighWaterMark() const noexcept {
				return m_buffer.HighWaterMark();
			}

			/**
			 * @brief Current writable-side state.
			 */
			State 														WritableState() const noexcept;

			/**
			 * @brief Queue a chunk for delivery.
			 * @param chunk Chunk to take ownership of.
			 * @return false when the caller should wait for drain, true otherwise.
			 *         `ProtocolViolation` after End() or Destroy(), or for an object
			 *         chunk written to a byte stream.
			 *         `BackpressureOverrun` when `max_buffered` would be exceeded; the
			 *         stream is destroyed with it.
			 */
			Expected<bool, Error> 										Write(Chunk chunk);

		protected:
			/**
			 * @brief Construct a Writable whose Deliver() is provided by a subclass.
			 * @param scheduler Scheduler the stream is bound to.
			 * @param options Stream options.
			 */
			Writable(std::shared_ptr<Scheduler> scheduler, const Options& options);

			/**
			 * @brief Hand one chunk to the destination.
			 * @param chunk Chunk to deliver.
			 * @param ack Acknowledgement, callable once from any thread.
			 */
			virtual void 												Deliver(Chunk&& chunk, SinkAck&& ack) noexcept;

			/**
			 * @brief Flush the destination once every chunk was delivered.
			 * @param ack Acknowledgement, callable once from any thread.
			 */
			virtual void 												DoFinal(SinkAck&& ack) noexcept;

			bool 														IsDone() const noexcept override;

			/**
			 * @brief Emit drain if a write asked for it and backpressure is gone.
			 */
			void 														MaybeEmitDrain() noexcept;

			/**
			 * @brief Whether writers must wait for drain.
			 * @return true while queued plus in-flight size reaches the high-water mark.
			 */
			virtual bool 												NeedsBackpressure() const noexcept;

			void 														OnDestroy() noexcept override;

			/**
			 * @brief Hook run right after the finish event was emitted.
			 */
			virtual void 												OnFinished() noexcept {}

		private:
			ChunkBuffer m_buffer;										///< Queued chunks.
			ChunkSink::PointerType m_sink;								///< Destination.
			Signal<> m_on_drain;										///< Drain listeners.
			Signal<> m_on_finish;										///< Finish listeners.
			std::size_t m_max_buffered;									///< Hard cap, 0 = unbounded.
			std::size_t m_in_flight {0};								///< Accounted size being delivered.
			std::size_t m_corked {0};									///< Cork depth.
			bool m_active {false};										///< Something was written.
			bool m_ending {false};										///< End() called.
			bool m_finished {false};									///< Finish reached.
			bool m_finalizing {false};									///< DoFinal() outstanding.
			bool m_delivering {false};									///< Deliver() outstanding.
			bool m_need_drain {false};									///< A write returned false.
			bool m_write_scheduled {false};								///< WriteNext() queued.

			/**
			 * @brief Wrap a delivery failure into a typed stream error.
			 */
			static ErrorPointer 										AsSinkFault(const ErrorPointer& error);

			/**
			 * @brief Run DoFinal() and finish once everything was delivered.
			 */
			void 														MaybeFinish() noexcept;

			/**
			 * @brief Handle the acknowledgement of the in-flight chunk.
			 */
			void 														OnDelivered(ExpectedVoid<Error>&& result) noexcept;

			/**
			 * @brief Handle the acknowledgement of DoFinal().
			 */
			void 														OnFinal(ExpectedVoid<Error>&& result) noexcept;

			/**
			 * @brief Wrap @p handler into an acknowledgement posted back onto the scheduler.
			 * @details Acknowledgements after the first one are logged and ignored.
			 */
			SinkAck 													MakeAck(std::function<void(ExpectedVoid<Error>&&)>&& handler);

			/**
			 * @brief Queue WriteNext() if not already queued.
			 */
			void 														ScheduleWrite() noexcept;

			/**
			 * @brief Deliver the next queued chunk.
			 */
			void 														WriteNext() noexcept;
	};
}
