#pragma once

#include <StormByte/stream/pipe.hxx>
#include <StormByte/stream/transform.hxx>

#include <atomic>
#include <memory>
#include <thread>
#include <utility>

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
	 * @brief Completion callback of a Pipeline run; the error is null on success.
	 */
	using PipelineCallback = std::function<void(const ErrorPointer&)>;

	/**
	 * @class Pipeline
	 * @brief Multi-stage chain of Transform streams between a source and a destination.
	 *
	 * @par Overview
	 * Pipeline keeps an ordered list of Transform stages. Process() pipes the
	 * source through every stage into the destination, runs the scheduler they
	 * share and reports the outcome once through the completion callback.
	 *
	 * @par Example
	 * @code{.cpp}
	 * auto scheduler = std::make_shared<Scheduler>();
	 * auto source = Readable::From(scheduler, {Chunk("hello"), Chunk("world")});
	 * auto sink = std::make_shared<CollectorSink>();
	 * auto destination = std::make_shared<Writable>(scheduler, sink);
	 *
	 * Pipeline pipeline;
	 * pipeline.AddStage(std::make_shared<Transform>(scheduler, SyncTransformFunction([](const Chunk& chunk) {
	 *     return TransformResult(std::vector<Chunk>{chunk});
	 * })));
	 * pipeline.Process(source, destination, ExecutionMode::Sync, [](const ErrorPointer& error) {
	 *     // error is null when the destination finished
	 * });
	 * @endcode
	 *
	 * @par Execution modes
	 * - `ExecutionMode::Sync`: the scheduler runs in the caller's thread and
	 *   Process() returns after the callback was called.
	 * - `ExecutionMode::Async`: the scheduler runs in a dedicated thread;
	 *   Process() returns immediately. Wait() (or the destructor) joins it. The
	 *   callback runs on that thread.
	 *
	 * @par Error handling
	 * The callback is called exactly once: without error after the destination
	 * finished, or with the first error raised by any stream, after every
	 * stream of the run was destroyed with it.
	 *
	 * @par Multiple invocations
	 * Stages are streams and can only carry one run. Calling Process() while a
	 * previous run is still in progress returns a `ProtocolViolation`.
	 *
	 * @see Transform, Pipe(), ExecutionMode
	 */
	class STORMBYTE_STREAM_PUBLIC Pipeline final {
		public:
			/**
			 * @brief Construct an empty pipeline.
			 * @param log Optional logger for run transitions.
			 */
			Pipeline(std::shared_ptr<Logger::Log> log = nullptr) noexcept;

			Pipeline(const Pipeline& other)							= delete;
			Pipeline(Pipeline&& other)								= delete;

			/**
			 * @brief Destructor
			 * @details Aborts a running pipeline and joins its thread.
			 */
			~Pipeline() noexcept;

			Pipeline& operator=(const Pipeline& other)				= delete;
			Pipeline& operator=(Pipeline&& other)					= delete;

			/**
			 * @brief Add a processing stage to the pipeline.
			 * @param stage Transform executed after the previously added stages.
			 */
			void 													AddStage(std::shared_ptr<Transform> stage);

			/**
			 * @brief Abort a running pipeline (thread-safe).
			 * @param error Error reported to the callback; a generic one when null.
			 */
			void 													Destroy(ErrorPointer error = nullptr) noexcept;

			/**
			 * @brief Whether a run is in progress.
			 */
			inline bool 											IsRunning() const noexcept {
				return m_running.load();
			}

			/**
			 * @brief Execute the pipeline.
			 * @param source Stream feeding the first stage.
			 * @param destination Stream fed by the last stage.
			 * @param mode Execution mode.
			 * @param callback Completion callback, called exactly once.
			 * @return `ProtocolViolation` when a run is in progress, a stream is
			 *         missing, already ended or destroyed, or the streams are not
			 *         bound to the same Scheduler.
			 */
			ExpectedVoid<Error> 									Process(std::shared_ptr<Readable> source, std::shared_ptr<Writable> destination, const ExecutionMode& mode, PipelineCallback callback);

			/**
			 * @brief Number of stages.
			 */
			inline std::size_t 										Stages() const noexcept {
				return m_stages.size();
			}

			/**
			 * @brief Join the thread of an asynchronous run.
			 */
			void 													Wait() noexcept;

		private:
			std::vector<std::shared_ptr<Transform>> m_stages;		///< Stages in order.
			std::shared_ptr<Logger::Log> m_log;						///< Optional logger.
			std::shared_ptr<Scheduler> m_scheduler;					///< Scheduler of the current run.
			std::shared_ptr<Readable> m_source;						///< Source of the current run.
			std::shared_ptr<Writable> m_destination;				///< Destination of the current run.
			std::vector<std::shared_ptr<PipeHandle>> m_pipes;		///< Pipes of the current run.
			std::vector<std::pair<std::shared_ptr<Stream>, ListenerId>> m_listeners; ///< Run listeners.
			PipelineCallback m_callback;							///< Completion callback.
			std::thread m_thread;									///< Async runner.
			std::atomic<bool> m_running {false};					///< Run in progress.
			bool m_completed {false};								///< Callback called.
			std::shared_ptr<bool> m_alive {std::make_shared<bool>(true)}; ///< Expires with the pipeline.

			/**
			 * @brief Finish the run once, destroying every stream on error.
			 * @param error Outcome, null on success.
			 */
			void 													Complete(const ErrorPointer& error);

			/**
			 * @brief Run the scheduler until the run completes, then flush pending events.
			 */
			void 													Run();
	};
}
