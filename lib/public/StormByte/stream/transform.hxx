#pragma once

#include <StormByte/stream/duplex.hxx>

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
	 * @brief Outcome of transforming one chunk: zero, one or many output chunks.
	 */
	using TransformResult = Expected<std::vector<Chunk>, Error>;

	/**
	 * @brief Completion callback handed to a TransformFunction.
	 */
	using TransformCallback = std::function<void(TransformResult)>;

	/**
	 * @brief Asynchronous transformation: completes by calling the callback once,
	 *        from any thread, possibly after returning.
	 * @note The chunk reference is only valid during the call; copy it to use it later.
	 */
	using TransformFunction = std::function<void(const Chunk&, TransformCallback)>;

	/**
	 * @brief Synchronous transformation.
	 */
	using SyncTransformFunction = std::function<TransformResult(const Chunk&)>;

	/**
	 * @brief Flush step run once after End(), producing the last output chunks.
	 */
	using FlushFunction = std::function<TransformResult()>;

	/**
	 * @class Transform
	 * @brief Duplex whose readable side outputs the transformed writable input.
	 *
	 * @par Overview
	 *  Every chunk written is delivered to the transformation function, in
	 *  order and one at a time; the next input is only handed over once the
	 *  previous one completed. The outputs are pushed to the readable side.
	 *  After End() the optional flush function runs, its outputs are pushed and
	 *  the readable side gets its end of stream.
	 *
	 * @par Backpressure
	 *  Both sides are coupled. While the readable side is at or above its
	 *  high-water mark Write() returns false and the completion of the current
	 *  input is held until the readable side was consumed below the mark, so a
	 *  slow reader stops the writer.
	 *
	 * @par Errors
	 *  An error returned by the transformation or flush function destroys the
	 *  stream with that error.
	 */
	class STORMBYTE_STREAM_PUBLIC Transform: public Duplex {
		public:
			/**
			 * @brief Construct an asynchronous Transform.
			 * @param scheduler Scheduler the stream is bound to.
			 * @param function Transformation function.
			 * @param options Options for both sides.
			 */
			Transform(std::shared_ptr<Scheduler> scheduler, TransformFunction function, const Options& options = {});

			/**
			 * @brief Construct an asynchronous Transform with a flush step.
			 * @param scheduler Scheduler the stream is bound to.
			 * @param function Transformation function.
			 * @param flush Flush function; may be empty.
			 * @param options Options for both sides.
			 */
			Transform(std::shared_ptr<Scheduler> scheduler, TransformFunction function, FlushFunction flush, const Options& options = {});

			/**
			 * @brief Construct an asynchronous Transform with separate options per side.
			 * @param scheduler Scheduler the stream is bound to.
			 * @param function Transformation function.
			 * @param flush Flush function; may be empty.
			 * @param readable_options Options for the output side.
			 * @param writable_options Options for the input side.
			 */
			Transform(std::shared_ptr<Scheduler> scheduler, TransformFunction function, FlushFunction flush, const Options& readable_options, const Options& writable_options);

			/**
			 * @brief Construct a synchronous Transform.
			 * @param scheduler Scheduler the stream is bound to.
			 * @param function Synchronous transformation function.
			 * @param options Options for both sides.
			 */
			Transform(std::shared_ptr<Scheduler> scheduler, SyncTransformFunction function, const Options& options = {});

			/**
			 * @brief Construct a synchronous Transform with a flush step.
			 * @param scheduler Scheduler the stream is bound to.
			 * @param function Synchronous transformation function.
			 * @param flush Flush function; may be empty.
			 * @param options Options for both sides.
			 */
			Transform(std::shared_ptr<Scheduler> scheduler, SyncTransformFunction function, FlushFunction flush, const Options& options = {});

			/**
			 * @brief Virtual destructor.
			 */
			virtual ~Transform() noexcept								= default;

			const char* 												Kind() const noexcept override;

		protected:
			void 														Deliver(Chunk&& chunk, SinkAck&& ack) noexcept override;

			void 														Demand() noexcept override;

			void 														DoFinal(SinkAck&& ack) noexcept override;

			bool 														NeedsBackpressure() const noexcept override;

			void 														OnDestroy() noexcept override;

		private:
			TransformFunction m_function;								///< Transformation.
			FlushFunction m_flush;										///< Optional flush step.
			SinkAck m_held_ack;											///< Completion held by backpressure.

			/**
			 * @brief Adapt a synchronous function to the asynchronous signature.
			 */
			static TransformFunction 									Asynchronous(SyncTransformFunction function);

			/**
			 * @brief Push outputs to the readable side.
			 * @return false if the stream was destroyed meanwhile.
			 */
			bool 														PushOutputs(TransformResult&& result) noexcept;

			/**
			 * @brief Handle the completion of one input chunk.
			 */
			void 														OnTransformed(TransformResult&& result, SinkAck&& ack) noexcept;
	};
}
