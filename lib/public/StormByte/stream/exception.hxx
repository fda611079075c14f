#pragma once

#include <StormByte/stream/visibility.h>
#include <StormByte/exception.hxx>

/**
 * @namespace Stream
 * @brief Namespace for chunked streaming components in the StormByte library.
 *
 * The Stream namespace provides readable, writable, duplex and transform
 * streams with bounded buffering and backpressure, plus the coordinators
 * that pipe them together.
 */
namespace StormByte::Stream {
	// Generic Stream exceptions
	class STORMBYTE_STREAM_PUBLIC Exception: public StormByte::Exception {
		public:
			template <typename... Args>
			Exception(const std::string& component, std::format_string<Args...> fmt, Args&&... args):
			StormByte::Exception("Stream::" + component, fmt, std::forward<Args>(args)...) {}
	};

	/**
	 * @class Error
	 * @brief General exception class for stream errors.
	 *
	 * @details Every error surfaced through an `OnError` listener or returned
	 *          inside an `Expected` derives from this class, so callers can
	 *          hold them as `std::shared_ptr<Error>` regardless of the cause.
	 */
	class STORMBYTE_STREAM_PUBLIC Error: public Exception {
		public:
			using Exception::Exception;
	};

	/**
	 * @class ReadError
	 * @brief Exception class for read errors from chunk buffers and readables.
	 *
	 * @details Returned when dequeuing from an empty buffer or reading from a
	 *          stream which is already destroyed.
	 */
	class STORMBYTE_STREAM_PUBLIC ReadError: public Error {
		public:
			template <typename... Args>
			ReadError(std::format_string<Args...> fmt, Args&&... args):
			Error("ReadError", fmt, std::forward<Args>(args)...) {}
	};

	/**
	 * @class SourceFault
	 * @brief The external chunk source failed to produce a chunk.
	 *
	 * @details Terminal for the readable that owns the source. It is never
	 *          retried by the stream.
	 */
	class STORMBYTE_STREAM_PUBLIC SourceFault: public Error {
		public:
			template <typename... Args>
			SourceFault(std::format_string<Args...> fmt, Args&&... args):
			Error("SourceFault", fmt, std::forward<Args>(args)...) {}
	};

	/**
	 * @class SinkFault
	 * @brief The external chunk sink rejected or failed to accept a chunk.
	 *
	 * @details Terminal for the writable that owns the sink. The failed chunk
	 *          is not delivered again.
	 */
	class STORMBYTE_STREAM_PUBLIC SinkFault: public Error {
		public:
			template <typename... Args>
			SinkFault(std::format_string<Args...> fmt, Args&&... args):
			Error("SinkFault", fmt, std::forward<Args>(args)...) {}
	};

	/**
	 * @class ProtocolViolation
	 * @brief A caller broke the stream state machine.
	 *
	 * @details Examples are `Write()` after `End()`, `Push()` after EOF or any
	 *          operation after `Destroy()`. It is returned synchronously to the
	 *          violating caller and leaves the stream state untouched.
	 */
	class STORMBYTE_STREAM_PUBLIC ProtocolViolation: public Error {
		public:
			template <typename... Args>
			ProtocolViolation(std::format_string<Args...> fmt, Args&&... args):
			Error("ProtocolViolation", fmt, std::forward<Args>(args)...) {}
	};

	/**
	 * @class BackpressureOverrun
	 * @brief A producer ignored backpressure beyond the configured hard cap.
	 *
	 * @details Only raised when `Options::max_buffered` is set. The stream is
	 *          destroyed with this error.
	 */
	class STORMBYTE_STREAM_PUBLIC BackpressureOverrun: public Error {
		public:
			template <typename... Args>
			BackpressureOverrun(std::format_string<Args...> fmt, Args&&... args):
			Error("BackpressureOverrun", fmt, std::forward<Args>(args)...) {}
	};
}
