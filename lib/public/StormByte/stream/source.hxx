#pragma once

#include <StormByte/stream/chunk.hxx>
#include <StormByte/clonable.hxx>

#include <functional>
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
	/**
	 * @brief Outcome of a source pull.
	 * @details A chunk, `std::nullopt` for end of data, or the error that
	 *          prevented producing a chunk.
	 */
	using SourceResult = Expected<std::optional<Chunk>, Error>;

	/**
	 * @brief Completion callback handed to ChunkSource::Pull().
	 */
	using SourceCallback = std::function<void(SourceResult)>;

	/**
	 * @brief Synchronous producer function wrapped by FunctionSource.
	 */
	using SourceFunction = std::function<SourceResult()>;

	/**
	 * @class ChunkSource
	 * @brief Interface for producing chunks from an external origin.
	 * @details Implementations wrap a file, a socket or any other producer.
	 *          A Readable calls Pull() only when its buffer has room and never
	 *          issues a second Pull() before the first one completed.
	 * @note This class is intended to be used as a base class for specific
	 *       implementations that handle different types of origins.
	 */
	class STORMBYTE_STREAM_PUBLIC ChunkSource: public Clonable<ChunkSource, std::shared_ptr<ChunkSource>> {
		public:
			/**
			 * @brief Construct ChunkSource.
			 */
			ChunkSource() noexcept 												= default;

			/**
			 * @brief Copy constructor.
			 * @param other ChunkSource to copy from.
			 */
			ChunkSource(const ChunkSource& other) 								= default;

			/**
			 * @brief Move constructor.
			 * @param other ChunkSource to move from.
			 */
			ChunkSource(ChunkSource&& other) noexcept 							= default;

			/**
			 * @brief Destructor.
			 */
			virtual ~ChunkSource() noexcept 									= default;

			/**
			 * @brief Copy assignment operator.
			 * @param other ChunkSource to copy from.
			 * @return Reference to this ChunkSource.
			 */
			ChunkSource& operator=(const ChunkSource& other) 					= default;

			/**
			 * @brief Move assignment operator.
			 * @param other ChunkSource to move from.
			 * @return Reference to this ChunkSource.
			 */
			ChunkSource& operator=(ChunkSource&& other) noexcept 				= default;

			/**
			 * @brief Produce the next chunk.
			 * @param done Callback invoked exactly once with the result. It may be
			 *        invoked before Pull() returns or later, from any thread.
			 */
			virtual void 														Pull(SourceCallback&& done) noexcept = 0;
	};

	/**
	 * @class FunctionSource
	 * @brief ChunkSource calling a synchronous function for every pull.
	 */
	class STORMBYTE_STREAM_PUBLIC FunctionSource final: public ChunkSource {
		public:
			/**
			 * @brief Construct FunctionSource.
			 * @param function Function returning the next chunk, `std::nullopt`
			 *        at end of data or an error.
			 */
			inline FunctionSource(const SourceFunction& function) noexcept:
				m_function(function) {}

			FunctionSource(const FunctionSource& other) 						= default;
			FunctionSource(FunctionSource&& other) noexcept 					= default;
			~FunctionSource() noexcept 											= default;
			FunctionSource& operator=(const FunctionSource& other)				= default;
			FunctionSource& operator=(FunctionSource&& other) noexcept 			= default;

			/**
			 * @brief Clone this FunctionSource.
			 * @return Pointer to the cloned FunctionSource.
			 */
			inline PointerType 													Clone() const noexcept override {
				return MakePointer<FunctionSource>(*this);
			}

			/**
			 * @brief Move this FunctionSource.
			 * @return Pointer to the moved FunctionSource.
			 */
			inline PointerType 													Move() noexcept override {
				return MakePointer<FunctionSource>(std::move(*this));
			}

			void 																Pull(SourceCallback&& done) noexcept override;

		private:
			SourceFunction m_function;											///< Wrapped producer.
	};

	/**
	 * @class VectorSource
	 * @brief ChunkSource replaying a fixed list of chunks, then end of data.
	 */
	class STORMBYTE_STREAM_PUBLIC VectorSource final: public ChunkSource {
		public:
			/**
			 * @brief Construct VectorSource.
			 * @param chunks Chunks produced in order.
			 */
			inline VectorSource(std::vector<Chunk> chunks) noexcept:
				m_chunks(std::move(chunks)) {}

			VectorSource(const VectorSource& other) 							= default;
			VectorSource(VectorSource&& other) noexcept 						= default;
			~VectorSource() noexcept 											= default;
			VectorSource& operator=(const VectorSource& other)					= default;
			VectorSource& operator=(VectorSource&& other) noexcept 				= default;

			/**
			 * @brief Clone this VectorSource, including its position.
			 * @return Pointer to the cloned VectorSource.
			 */
			inline PointerType 													Clone() const noexcept override {
				return MakePointer<VectorSource>(*this);
			}

			/**
			 * @brief Move this VectorSource.
			 * @return Pointer to the moved VectorSource.
			 */
			inline PointerType 													Move() noexcept override {
				return MakePointer<VectorSource>(std::move(*this));
			}

			/**
			 * @brief Number of chunks already produced.
			 */
			inline std::size_t 													Produced() const noexcept {
				return m_position;
			}

			void 																Pull(SourceCallback&& done) noexcept override;

		private:
			std::vector<Chunk> m_chunks;										///< Chunks to replay.
			std::size_t m_position {0};											///< Next chunk index.
	};
}
