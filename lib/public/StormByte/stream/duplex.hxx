#pragma once

#include <StormByte/stream/readable.hxx>
#include <StormByte/stream/writable.hxx>

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
	 * @class Duplex
	 * @brief Stream that is both Readable and Writable.
	 *
	 * @par Overview
	 *  Both sides have their own buffer, high-water mark and state machine
	 *  and are not coupled: what is written is delivered to the sink, what is
	 *  read comes from the source. They share a single lifecycle, so destroying
	 *  the duplex destroys both sides and close fires once, after the readable
	 *  side ended and the writable side finished.
	 *
	 * @par Half open
	 *  With `Options::allow_half_open` set (the default) either side may
	 *  complete while the other keeps working. Without it the writable side is
	 *  ended when the readable side ends, and the readable side gets its end of
	 *  stream when the writable side finishes.
	 */
	class STORMBYTE_STREAM_PUBLIC Duplex: public Readable, public Writable {
		public:
			/**
			 * @brief Construct a Duplex sharing one set of options.
			 * @param scheduler Scheduler the stream is bound to.
			 * @param source Source for the readable side; may be null.
			 * @param sink Sink for the writable side.
			 * @param options Options for both sides.
			 */
			Duplex(std::shared_ptr<Scheduler> scheduler, ChunkSource::PointerType source, ChunkSink::PointerType sink, const Options& options = {});

			/**
			 * @brief Construct a Duplex with separate options per side.
			 * @param scheduler Scheduler the stream is bound to.
			 * @param source Source for the readable side; may be null.
			 * @param sink Sink for the writable side.
			 * @param readable_options Options for the readable side. Its half open
			 *        policy applies to the whole duplex.
			 * @details Both sides share one lifecycle: the readable side logger is
			 *          used, or the writable one when the readable side has none,
			 *          and close is emitted only when both sides allow it.
			 * @param writable_options Options for the writable side.
			 */
			Duplex(std::shared_ptr<Scheduler> scheduler, ChunkSource::PointerType source, ChunkSink::PointerType sink, const Options& readable_options, const Options& writable_options);

			/**
			 * @brief Virtual destructor.
			 */
			virtual ~Duplex() noexcept									= default;

			/**
			 * @brief Whether either side may complete alone.
			 */
			inline bool 												AllowHalfOpen() const noexcept {
				return m_allow_half_open;
			}

			const char* 												Kind() const noexcept override;

			bool 														Off(const ListenerId& id) noexcept override;

		protected:
			/**
			 * @brief Construct a Duplex whose writable side is handled by a subclass.
			 * @param scheduler Scheduler the stream is bound to.
			 * @param readable_options Options for the readable side.
			 * @param writable_options Options for the writable side.
			 */
			Duplex(std::shared_ptr<Scheduler> scheduler, const Options& readable_options, const Options& writable_options);

			bool 														IsDone() const noexcept override;

			/**
			 * @brief Options of the lifecycle shared by both sides.
			 * @param readable_options Options for the readable side.
			 * @param writable_options Options for the writable side.
			 */
			static Options 												SharedOptions(const Options& readable_options, const Options& writable_options);

			void 														OnDestroy() noexcept override;

			void 														OnEnded() noexcept override;

			void 														OnFinished() noexcept override;

		private:
			bool m_allow_half_open;										///< Half open policy.
	};
}
