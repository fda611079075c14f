#pragma once

#include <StormByte/stream/readable.hxx>
#include <StormByte/stream/writable.hxx>

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
	/**
	 * @struct PipeOptions
	 * @brief Options for Pipe().
	 */
	struct STORMBYTE_STREAM_PUBLIC PipeOptions {
		bool end {true};										///< End the destination when the source ends.
	};

	class PipeHandle;				///< Forward declaration of PipeHandle class.

	/**
	 * @brief Connect @p source to @p destination.
	 * @param source Upstream stream, switched to flowing mode.
	 * @param destination Downstream stream.
	 * @param options Pipe options.
	 * @return Handle to the pipe, usable for Unpipe().
	 * @note Chains are built from several pipes: `Pipe(a, t); Pipe(t, b);`.
	 */
	STORMBYTE_STREAM_PUBLIC std::shared_ptr<PipeHandle> 				Pipe(const std::shared_ptr<Readable>& source, const std::shared_ptr<Writable>& destination, const PipeOptions& options = {});

	/**
	 * @class PipeHandle
	 * @brief Wiring between one Readable and one Writable.
	 *
	 * @par Overview
	 *  The handle only owns listener registrations; it keeps weak references to
	 *  both streams, so it never extends their lifetime. The listeners keep the
	 *  handle alive until the pipe is torn down, which happens when the source
	 *  ends, when either side is destroyed, or on Unpipe().
	 *
	 * @par Flow control
	 *  Every chunk emitted by the source is written to the destination. When
	 *  Write() returns false the source is paused immediately, before it emits
	 *  another chunk, and resumed on the destination drain once no other pipe
	 *  from the same source still waits for a drain.
	 *
	 * @par Errors
	 *  Destroying one side before it completed destroys the other side with the
	 *  same error (or without error when it had none). Piping a source that
	 *  already ended ends the destination on the next scheduler turn.
	 */
	class STORMBYTE_STREAM_PUBLIC PipeHandle final: public std::enable_shared_from_this<PipeHandle> {
		friend std::shared_ptr<PipeHandle> Pipe(const std::shared_ptr<Readable>&, const std::shared_ptr<Writable>&, const PipeOptions&);
		public:
			/**
			 * @brief Construct an unattached PipeHandle; use Pipe() instead.
			 * @param source Upstream stream.
			 * @param destination Downstream stream.
			 * @param options Pipe options.
			 */
			PipeHandle(const std::shared_ptr<Readable>& source, const std::shared_ptr<Writable>& destination, const PipeOptions& options) noexcept;

			PipeHandle(const PipeHandle&)								= delete;
			PipeHandle(PipeHandle&&)									= delete;
			~PipeHandle() noexcept										= default;
			PipeHandle& operator=(const PipeHandle&)					= delete;
			PipeHandle& operator=(PipeHandle&&)							= delete;

			/**
			 * @brief Whether the pipe is still wired.
			 */
			inline bool 												IsActive() const noexcept {
				return m_active;
			}

			/**
			 * @brief Whether the source is paused waiting for the destination drain.
			 */
			inline bool 												IsAwaitingDrain() const noexcept {
				return m_awaiting_drain;
			}

			/**
			 * @brief Disconnect the pipe without changing the state of either stream.
			 */
			void 														Unpipe() noexcept;

		private:
			std::weak_ptr<Readable> m_source;							///< Upstream.
			std::weak_ptr<Writable> m_destination;						///< Downstream.
			PipeOptions m_options;										///< Options.
			std::vector<ListenerId> m_source_listeners;					///< Registrations on the source.
			std::vector<ListenerId> m_destination_listeners;			///< Registrations on the destination.
			bool m_active {false};										///< Wired.
			bool m_awaiting_drain {false};								///< Source paused by this pipe.

			/**
			 * @brief Register the listeners on both streams and start the flow.
			 */
			void 														Attach();

			void 														OnData(const Chunk& chunk);
			void 														OnDestinationDestroyed(const ErrorPointer& error) noexcept;
			void 														OnDrain() noexcept;
			void 														OnSourceDestroyed(const ErrorPointer& error) noexcept;
			void 														OnSourceEnd() noexcept;

			/**
			 * @brief Release the drain wait of this pipe on the source.
			 * @return true when no pipe from the source waits for a drain anymore.
			 */
			bool 														ReleaseDrain(Readable& source) noexcept;

			/**
			 * @brief Propagate an end or destroy that happened before Attach().
			 */
			void 														Settle() noexcept;
	};
}
