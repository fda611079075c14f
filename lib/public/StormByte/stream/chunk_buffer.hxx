#pragma once

#include <StormByte/stream/chunk.hxx>

#include <deque>
#include <span>
#include <sstream>
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
	* @class ChunkBuffer
	* @brief Ordered queue of pending chunks with byte accounting.
	*
	* @par Overview
	*  Every stream side owns exactly one ChunkBuffer. Chunks are kept in push
	*  order and handed out in that same order; ownership of a chunk moves to
	*  the caller on Dequeue(). The buffer keeps a running total of the
	*  accounted size of the queued chunks and compares it against a
	*  high-water mark to drive backpressure.
	*
	* @par Accounting
	*  In byte mode a chunk accounts for its byte length (so zero-length chunks
	*  account for nothing but still occupy a slot). In object mode every chunk
	*  accounts for exactly one unit.
	*
	* @par Thread safety
	*  This class is **not thread-safe**. Streams only touch their buffers from
	*  the thread running their Scheduler.
	*/
	class STORMBYTE_STREAM_PUBLIC ChunkBuffer {
		public:
			/**
			 * 	@brief Construct ChunkBuffer.
			 *  @param high_water_mark Threshold for IsAboveHighWaterMark().
			 *  @param object_mode Whether each chunk accounts as one unit.
			 */
			inline ChunkBuffer(const std::size_t& high_water_mark = DefaultHighWaterMark, bool object_mode = false) noexcept:
				m_high_water_mark(high_water_mark), m_object_mode(object_mode) {}

			ChunkBuffer(const ChunkBuffer& other)							= default;
			ChunkBuffer(ChunkBuffer&& other) noexcept;
			~ChunkBuffer() noexcept											= default;
			ChunkBuffer& operator=(const ChunkBuffer& other)				= default;
			ChunkBuffer& operator=(ChunkBuffer&& other) noexcept;

			/**
			 * @brief Accounted size of a chunk for this buffer's mode.
			 * @param chunk Chunk to measure.
			 * @return 1 in object mode, the byte length otherwise.
			 */
			inline std::size_t 												Accounted(const Chunk& chunk) const noexcept {
				return m_object_mode ? 1 : chunk.Size();
			}

			/**
			 * @brief Get the accounted size of every queued chunk.
			 * @return Sum of Accounted() over the queue.
			 */
			inline std::size_t 												BufferedBytes() const noexcept {
				return m_buffered;
			}

			/**
			 * @brief Remove every queued chunk.
			 * @return Number of chunks discarded.
			 */
			std::size_t 													Clear() noexcept;

			/**
			 * @brief Number of queued chunks.
			 */
			inline std::size_t 												Count() const noexcept {
				return m_chunks.size();
			}

			/**
			 * @brief Remove and return the oldest chunk.
			 * @param max_bytes When greater than 0 and the front is a byte chunk
			 *        longer than this, only its first @p max_bytes bytes are
			 *        returned and the remainder stays at the front.
			 * @return The chunk or `ReadError` when the buffer is empty.
			 */
			Expected<Chunk, ReadError> 										Dequeue(const std::size_t& max_bytes = 0) noexcept;

			/**
			 * @brief Check if the buffer holds no chunk.
			 * @note A buffer holding only zero-length chunks is not empty.
			 */
			inline bool 													Empty() const noexcept {
				return m_chunks.empty();
			}

			/**
			 * @brief Append a chunk at the back of the queue.
			 * @param chunk Chunk to take ownership of.
			 * @return `ProtocolViolation` when an object chunk is enqueued in a
			 *         byte-mode buffer.
			 */
			ExpectedVoid<ProtocolViolation> 								Enqueue(Chunk&& chunk) noexcept;

			/**
			 * @brief Non-destructive peek at the oldest chunk.
			 * @return A copy of the front chunk or `ReadError` when empty.
			 */
			Expected<Chunk, ReadError> 										Front() const noexcept;

			/**
			 * @brief Produce a hexdump of the queued chunks.
			 * @param collumns Number of bytes per line (0 -> default 16).
			 * @param byte_limit Maximum number of bytes dumped per chunk (0 -> no limit).
			 * @return A formatted string starting with a `Chunks:` / `Buffered:`
			 *         header followed by one block per chunk. Object chunks are
			 *         listed as `<object>`.
			 * Example output:
			 * @code{.text}
			 * Chunks: 1
			 * Buffered: 5 / 16384
			 * Chunk 0 (5 bytes)
			 * 00000000: 68 65 6C 6C 6F                                   hello
			 * @endcode
			 */
			std::string 													HexDump(const std::size_t& collumns = 16, const std::size_t& byte_limit = 0) const noexcept;

			/**
			 * @brief Configured high-water mark.
			 */
			inline std::size_t 												HighWaterMark() const noexcept {
				return m_high_water_mark;
			}

			/**
			 * @brief Whether buffered size reached the high-water mark.
			 * @return true when BufferedBytes() >= HighWaterMark().
			 */
			inline bool 													IsAboveHighWaterMark() const noexcept {
				return m_buffered >= m_high_water_mark;
			}

			/**
			 * @brief Whether this buffer accounts chunks as single units.
			 */
			inline bool 													IsObjectMode() const noexcept {
				return m_object_mode;
			}

		private:
			std::deque<Chunk> m_chunks;										///< Pending chunks in push order.
			std::size_t m_buffered {0};										///< Accounted size of m_chunks.
			std::size_t m_high_water_mark;									///< Backpressure threshold.
			bool m_object_mode;												///< Accounting mode.

			/**
			 * @brief Produce a hexdump of the given data span.
			 * @param data Span of bytes to format.
			 * @param collumns Number of bytes per line.
			 * @return Formatted hexdump string without trailing newline.
			 */
			static std::string 												FormatHexLines(std::span<const std::byte> data, std::size_t collumns) noexcept;
	};
}
