#pragma once

#include <StormByte/stream/exception.hxx>
#include <StormByte/logger/log.hxx>
#include <StormByte/expected.hxx>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
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
	class Chunk;					///< Forward declaration of Chunk class.
	class Readable;					///< Forward declaration of Readable class.
	class Writable;					///< Forward declaration of Writable class.

	using DataType = std::vector<std::byte>;

	template<class Exception>
	using ExpectedVoid = Expected<void, Exception>;

	/**
	 * @brief Shared error handle as carried by `Expected` and error events.
	 */
	using ErrorPointer = std::shared_ptr<Error>;

	/**
	 * @brief Identifier returned when registering a listener.
	 * @details Identifiers are unique per stream and are used with `Stream::Off()`.
	 */
	using ListenerId = std::uint64_t;

	/**
	 * @brief Unit of work queued on a Scheduler.
	 */
	using Task = std::function<void()>;

	/**
	 * @brief Default high-water mark in bytes for byte streams.
	 */
	inline constexpr std::size_t DefaultHighWaterMark = 16 * 1024;

	/**
	 * @brief Default high-water mark in chunks for object-mode streams.
	 */
	inline constexpr std::size_t DefaultObjectHighWaterMark = 16;

	/**
	 * @struct Options
	 * @brief Construction-time configuration shared by every stream type.
	 *
	 * @par Fields
	 *  - `high_water_mark`: threshold at which backpressure is signalled. When
	 *    unset it defaults to @ref DefaultHighWaterMark bytes, or to
	 *    @ref DefaultObjectHighWaterMark chunks in object mode.
	 *  - `object_mode`: chunks are opaque typed values and each one accounts
	 *    as a single unit instead of its byte length.
	 *  - `max_buffered`: hard cap on buffered units (0 means unbounded). A
	 *    producer exceeding it gets a @ref BackpressureOverrun.
	 *  - `emit_close`: whether a close event is emitted once the stream is done.
	 *  - `allow_half_open`: Duplex only; when false the writable side is ended
	 *    as soon as the readable side ends.
	 *  - `log`: optional logger used for lifecycle and fault tracing.
	 */
	struct STORMBYTE_STREAM_PUBLIC Options {
		std::optional<std::size_t> high_water_mark;			///< Backpressure threshold.
		bool object_mode {false};							///< Opaque chunk accounting.
		std::size_t max_buffered {0};						///< Hard cap (0 = unbounded).
		bool emit_close {true};								///< Emit close when done.
		bool allow_half_open {true};						///< Duplex half-open policy.
		std::shared_ptr<Logger::Log> log;					///< Optional logger.

		/**
		 * @brief Effective high-water mark after applying defaults.
		 * @return The configured threshold or the default for the mode.
		 */
		inline std::size_t 									HighWaterMark() const noexcept {
			if (high_water_mark)
				return *high_water_mark;
			return object_mode ? DefaultObjectHighWaterMark : DefaultHighWaterMark;
		}
	};

	/**
	 * @brief Execution mode selector for pipeline processing.
	 *
	 * @details Defines where the scheduler driving a Pipeline runs when
	 *          invoking Pipeline::Process():
	 *          - ExecutionMode::Sync  : the scheduler runs in the caller's
	 *                                   thread until the pipeline completes.
	 *          - ExecutionMode::Async : the scheduler runs in a dedicated
	 *                                   thread; Pipeline::Wait() joins it.
	 *
	 * @see Pipeline::Process()
	 */
	enum class STORMBYTE_STREAM_PUBLIC ExecutionMode {
		Sync,   ///< Run the scheduler in the caller's thread.
		Async   ///< Run the scheduler in a dedicated thread.
	};
}
