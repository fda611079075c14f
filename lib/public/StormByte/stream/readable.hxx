#pragma once

#include <StormByte/stream/chunk_buffer.hxx>
#include <StormByte/stream/source.hxx>
#include <StormByte/stream/stream.hxx>

#include <optional>
#include <vector>

/**
 * @namespace Stream
 * @brief Namespace for chunked streaming components in the StormByte library.
 *
 * The Stream namespace provides readable, writable, duplex and transform
 * streams with bounded buffering and backpressure, plus the coordinators
 * that pipe them together.
 */
namespace StormByte::Stream {
	class PipeHandle;

	/**
	 * @brief Listener for data events.
	 */
	using DataHandler = std::function<void(const Chunk&)>;

	/**
	 * @class Readable
	 * @brief Stream producing chunks, consumed either pushed (flowing) or pulled (paused).
	 *
	 * @par Overview
	 *  Chunks enter through Push(), called by the producer directly or by the
	 *  stream itself with chunks pulled from an optional ChunkSource. They wait
	 *  in a ChunkBuffer until consumed. End of data is the explicit PushEnd()
	 *  signal, never an empty chunk.
	 *
	 * @par Consumption modes
	 *  - Flowing: every buffered chunk is handed to the data listeners on a
	 *    later scheduler turn, in push order, without explicit pulls.
	 *  - Paused: nothing is emitted; the consumer calls Read().
	 *
	 * @par State machine
	 *  @code{.text}
	 *  Idle -> Flowing <-> Paused -> Ended
	 *  (any non terminal state) -> Errored | Destroyed
	 *  @endcode
	 *  - Idle -> Flowing: first OnData() registration, or Resume().
	 *  - Idle -> Paused: Pause() or the first Read().
	 *  - Flowing <-> Paused: Pause() / Resume(); both are idempotent.
	 *  - -> Ended: once PushEnd() was called, the buffer is drained and the
	 *    stream is being consumed. The end event fires exactly once.
	 *  - -> Errored / Destroyed: Destroy(), a source fault or a
	 *    BackpressureOverrun. Buffered chunks are discarded.
	 *
	 * @par Source pulls
	 *  With a ChunkSource the stream pulls one chunk at a time, only while its
	 *  buffer is below the high-water mark and a consumer wants data (flowing,
	 *  or a Read() found the buffer short). Faults are not retried.
	 *
	 * @see Writable, Duplex, Pipe()
	 */
	class STORMBYTE_STREAM_PUBLIC Readable: public virtual Stream {
		friend class PipeHandle;
		public:
			/**
			 * @enum State
			 * @brief Observable readable-side state.
			 */
			enum class State {
				Idle,													///< No consumer yet.
				Flowing,												///< Chunks are emitted automatically.
				Paused,													///< Chunks wait for Read().
				Ended,													///< EOF reached and drained.
				Errored,												///< Destroyed with an error.
				Destroyed												///< Destroyed without an error.
			};

			/**
			 * @brief Construct a Readable fed only through Push().
			 * @param scheduler Scheduler the stream is bound to.
			 * @param options Stream options.
			 */
			Readable(std::shared_ptr<Scheduler> scheduler, const Options& options = {});

			/**
			 * @brief Construct a Readable pulling from @p source.
			 * @param scheduler Scheduler the stream is bound to.
			 * @param source Source of chunks; may be null.
			 * @param options Stream options.
			 */
			Readable(std::shared_ptr<Scheduler> scheduler, ChunkSource::PointerType source, const Options& options = {});

			/**
			 * @brief Construct a Readable pulling from a clone of @p source.
			 * @param scheduler Scheduler the stream is bound to.
			 * @param source Source of chunks, cloned.
			 * @param options Stream options.
			 */
			inline Readable(std::shared_ptr<Scheduler> scheduler, const ChunkSource& source, const Options& options = {}):
				Readable(std::move(scheduler), source.Clone(), options) {}

			/**
			 * @brief Virtual destructor.
			 */
			virtual ~Readable() noexcept								= default;

			/**
			 * @brief Build a Readable replaying @p chunks, then ending.
			 * @param scheduler Scheduler the stream is bound to.
			 * @param chunks Chunks produced in order.
			 * @param options Stream options.
			 * @return The new stream.
			 */
			static std::shared_ptr<Readable> 							From(std::shared_ptr<Scheduler> scheduler, std::vector<Chunk> chunks, const Options& options = {});

			/**
			 * @brief Whether the end event was reached.
			 */
			inline bool 												IsEnded() const noexcept {
				return m_ended;
			}

			/**
			 * @brief Whether PushEnd() was called (chunks may still be buffered).
			 */
			inline bool 												IsEoF() const noexcept {
				return m_eof;
			}

			/**
			 * @brief Whether the readable side is flowing.
			 */
			inline bool 												IsFlowing() const noexcept {
				return m_state == State::Flowing && !IsDestroyed();
			}

			/**
			 * @brief Whether the readable side is paused.
			 */
			inline bool 												IsPaused() const noexcept {
				return m_state == State::Paused && !IsDestroyed();
			}

			/**
			 * @brief Whether the readable side is in object mode.
			 */
			inline bool 												IsReadableObjectMode() const noexcept {
				return m_buffer.IsObjectMode();
			}

			const char* 												Kind() const noexcept override;

			bool 														Off(const ListenerId& id) noexcept override;

			/**
			 * @brief Register a data listener.
			 * @param handler Called with every emitted chunk, in push order.
			 * @return Listener identifier.
			 * @note Side effect: an Idle stream switches to flowing mode.
			 */
			ListenerId 													OnData(DataHandler handler);

			/**
			 * @brief Register an end listener (fires exactly once).
			 */
			ListenerId 													OnEnd(EventHandler handler);

			/**
			 * @brief Register a readable listener.
			 * @details Fires on a later turn whenever data or EOF becomes
			 *          available while the stream is not flowing, so pull
			 *          consumers know when to call Read().
			 */
			ListenerId 													OnReadable(EventHandler handler);

			/**
			 * @brief Switch to paused mode (idempotent).
			 */
			void 														Pause() noexcept;

			/**
			 * @brief Append a chunk to the buffer.
			 * @param chunk Chunk to take ownership of.
			 * @return false when the buffer is now at or above its high-water mark
			 *         (advisory: the producer should slow down), true otherwise.
			 *         `ProtocolViolation` after PushEnd() or Destroy(), or when an
			 *         object chunk is pushed to a byte stream.
			 *         `BackpressureOverrun` when `max_buffered` would be exceeded; the
			 *         stream is destroyed with it.
			 */
			Expected<bool, Error> 										Push(Chunk chunk);

			/**
			 * @brief Signal that no more chunks will be pushed.
			 * @return `ProtocolViolation` when called twice or after Destroy().
			 */
			ExpectedVoid<Error> 										PushEnd();

			/**
			 * @brief Pull the next chunk.
			 * @param max_bytes When greater than 0, a longer byte chunk is split and
			 *        only its first @p max_bytes bytes are returned; the rest stays
			 *        buffered.
			 * @return The chunk, `std::nullopt` when nothing is buffered right now
			 *         (which is not necessarily the end), or `ReadError` once
			 *         destroyed.
			 * @note The first Read() on an Idle stream switches it to paused mode.
			 */
			Expected<std::optional<Chunk>, Error> 						Read(const std::size_t& max_bytes = 0);

			/**
			 * @brief Accounted size of the buffered chunks.
			 */
			inline std::size_t 											ReadableBytes() const noexcept {
				return m_buffer.BufferedBytes();
			}

			/**
			 * @brief High-water mark of the readable buffer.
			 */
			inline std::size_t 											ReadableHighWaterMark() const noexcept {
				return m_buffer.HighWaterMark();
			}

			/**
			 * @brief Current readable-side state.
			 */
			State 														ReadableState() const noexcept;

			/**
			 * @brief Switch to flowing mode (idempotent).
			 */
			void 														Resume() noexcept;

		protected:
			/**
			 * @brief Request more data for the buffer.
			 * @details Called when the buffer is below its high-water mark, EOF was
			 *          not pushed and a consumer wants data. The default
			 *          implementation pulls one chunk from the ChunkSource.
			 */
			virtual void 												Demand() noexcept;

			bool 														IsDone() const noexcept override;

			/**
			 * @brief Hook run right after the end event was emitted.
			 */
			virtual void 												OnEnded() noexcept {}

			void 														OnDestroy() noexcept override;

			/**
			 * @brief Whether the readable buffer reached its high-water mark.
			 */
			inline bool 												ReadableFull() const noexcept {
				return m_buffer.IsAboveHighWaterMark();
			}

		private:
			ChunkBuffer m_buffer;										///< Pending chunks.
			ChunkSource::PointerType m_source;							///< Optional source.
			Signal<const Chunk&> m_on_data;								///< Data listeners.
			Signal<> m_on_end;											///< End listeners.
			Signal<> m_on_readable;										///< Readable listeners.
			std::size_t m_max_buffered;									///< Hard cap, 0 = unbounded.
			std::size_t m_await_drain {0};								///< Pipes waiting for a drain.
			State m_state {State::Idle};								///< Mode (never Errored/Destroyed).
			bool m_eof {false};											///< PushEnd() called.
			bool m_ended {false};										///< End reached.
			bool m_flow_scheduled {false};								///< Flow() queued.
			bool m_readable_scheduled {false};							///< Readable event queued.
			bool m_pulling {false};										///< Source pull outstanding.
			bool m_read_demand {false};									///< Read() asked for data.

			/**
			 * @brief Emit buffered chunks while flowing.
			 */
			void 														Flow();

			/**
			 * @brief Call Demand() when the buffer has room and data is wanted.
			 */
			void 														MaybeDemand() noexcept;

			/**
			 * @brief Reach Ended when EOF was pushed and the buffer is drained.
			 */
			void 														MaybeEnd() noexcept;

			/**
			 * @brief Handle the outcome of a source pull.
			 * @param result Chunk, EOF or error.
			 */
			void 														OnPulled(SourceResult&& result) noexcept;

			/**
			 * @brief Queue Flow() if not already queued.
			 */
			void 														ScheduleFlow() noexcept;

			/**
			 * @brief Queue the readable event if anybody listens.
			 */
			void 														ScheduleReadable() noexcept;
	};
}
