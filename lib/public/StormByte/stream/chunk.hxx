#pragma once

#include <StormByte/stream/typedefs.hxx>

#include <any>
#include <span>
#include <string>
#include <string_view>
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
	 * @class Chunk
	 * @brief Immutable unit of data moving through a stream.
	 *
	 * @par Overview
	 *  A chunk holds either an owned byte vector or, for object-mode streams,
	 *  an opaque typed value. Byte chunks copy the caller's data on
	 *  construction (or adopt it on move) so the caller may reuse its own
	 *  storage right after pushing. There is no mutating accessor: once built,
	 *  a chunk's contents never change.
	 *
	 * @par Empty chunks
	 *  A zero-length byte chunk is a valid chunk. End of stream is always an
	 *  explicit signal (`Readable::PushEnd()`, `Writable::End()`), never
	 *  inferred from an empty chunk.
	 */
	class STORMBYTE_STREAM_PUBLIC Chunk {
		public:
			/**
			 * @brief Construct an empty byte chunk.
			 */
			Chunk() noexcept											= default;

			/**
			 * @brief Construct a byte chunk copying @p data.
			 * @param data Bytes to copy.
			 */
			inline Chunk(const DataType& data): m_data(data) {}

			/**
			 * @brief Construct a byte chunk adopting @p data.
			 * @param data Bytes to move into the chunk.
			 */
			inline Chunk(DataType&& data) noexcept: m_data(std::move(data)) {}

			/**
			 * @brief Construct a byte chunk copying a byte span.
			 * @param data Bytes to copy.
			 */
			inline Chunk(std::span<const std::byte> data): m_data(data.begin(), data.end()) {}

			/**
			 * @brief Construct a byte chunk from text.
			 * @param data Characters copied byte by byte.
			 */
			Chunk(std::string_view data);

			/**
			 * @brief Construct a byte chunk from a string.
			 * @param data Characters copied byte by byte.
			 */
			inline Chunk(const std::string& data): Chunk(std::string_view(data)) {}

			/**
			 * @brief Construct a byte chunk from a C string.
			 * @param data Null terminated characters copied byte by byte.
			 */
			inline Chunk(const char* data): Chunk(std::string_view(data)) {}

			Chunk(const Chunk& other)									= default;
			Chunk(Chunk&& other) noexcept								= default;
			~Chunk() noexcept											= default;
			Chunk& operator=(const Chunk& other)						= default;
			Chunk& operator=(Chunk&& other) noexcept					= default;

			/**
			 * @brief Equality comparison.
			 * @details Byte chunks compare by content. Object chunks never compare
			 *          equal since their payload type is opaque.
			 */
			bool operator==(const Chunk& other) const noexcept;

			/**
			 * @brief Inequality comparison.
			 *
			 * Negates `operator==`.
			 */
			inline bool operator!=(const Chunk& other) const noexcept {
				return !(*this == other);
			}

			/**
			 * @brief Build an object-mode chunk holding @p value.
			 * @tparam T Stored value type.
			 * @param value Value to store.
			 * @return The object chunk.
			 */
			template<class T>
			static Chunk 												Object(T&& value) {
				Chunk chunk;
				chunk.m_object = std::forward<T>(value);
				chunk.m_is_object = true;
				return chunk;
			}

			/**
			 * @brief Retrieve the stored object.
			 * @tparam T Expected stored type.
			 * @return A copy of the value, or `ReadError` when this is not an
			 *         object chunk holding a @p T.
			 */
			template<class T>
			Expected<T, ReadError> 										As() const {
				if (!m_is_object)
					return StormByte::Unexpected(ReadError("Chunk does not hold an object"));
				const T* value = std::any_cast<T>(&m_object);
				if (!value)
					return StormByte::Unexpected(ReadError("Chunk object type mismatch"));
				return *value;
			}

			/**
			 * @brief Byte contents of the chunk.
			 * @return Read-only view of the bytes (empty for object chunks).
			 */
			inline std::span<const std::byte> 							Data() const noexcept {
				return { m_data.data(), m_data.size() };
			}

			/**
			 * @brief Check whether the chunk carries no bytes.
			 * @return true for zero-length byte chunks and object chunks.
			 */
			inline bool 												Empty() const noexcept {
				return m_data.empty();
			}

			/**
			 * @brief Check whether this chunk is an object-mode chunk.
			 */
			inline bool 												IsObject() const noexcept {
				return m_is_object;
			}

			/**
			 * @brief Byte length of the chunk.
			 * @return Number of bytes; 0 for object chunks.
			 */
			inline std::size_t 											Size() const noexcept {
				return m_data.size();
			}

			/**
			 * @brief Split a byte chunk at @p count consuming it.
			 * @param count Number of leading bytes in the first part.
			 * @return The leading part and the remainder. When @p count is not
			 *         smaller than Size() the remainder is empty.
			 */
			std::pair<Chunk, Chunk> 									Split(const std::size_t& count) &&;

			/**
			 * @brief Interpret the bytes as text.
			 * @return The bytes as a string; empty for object chunks.
			 */
			std::string 												ToString() const;

			/**
			 * @brief Type-erased access to the stored object.
			 */
			inline const std::any& 										Value() const noexcept {
				return m_object;
			}

		private:
			DataType m_data;											///< Owned bytes for byte chunks.
			std::any m_object;											///< Payload for object chunks.
			bool m_is_object {false};									///< Whether the chunk is an object chunk.
	};
}
