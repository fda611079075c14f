#pragma once

#include <StormByte/stream/chunk.hxx>
#include <StormByte/clonable.hxx>

#include <functional>
#include <string>
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
	 * @brief Acknowledgement callback handed to ChunkSink::Accept() and Final().
	 * @details Called once with success or with the error that prevented the
	 *          sink from taking the chunk.
	 */
	using SinkAck = std::function<void(ExpectedVoid<Error>)>;

	/**
	 * @brief Synchronous consumer function wrapped by FunctionSink.
	 */
	using SinkFunction = std::function<ExpectedVoid<Error>(const Chunk&)>;

	/**
	 * @class ChunkSink
	 * @brief Interface for delivering chunks to an external destination.
	 * @details A Writable hands chunks to Accept() strictly one at a time and
	 *          in order: the next Accept() is only issued once the previous
	 *          acknowledgement arrived.
	 * @note This class is intended to be used as a base class for specific
	 *       implementations that handle different types of destinations.
	 */
	class STORMBYTE_STREAM_PUBLIC ChunkSink: public Clonable<ChunkSink, std::shared_ptr<ChunkSink>> {
		public:
			/**
			 * @brief Construct ChunkSink.
			 */
			ChunkSink() noexcept 												= default;

			/**
			 * @brief Copy constructor.
			 * @param other ChunkSink to copy from.
			 */
			ChunkSink(const ChunkSink& other) 									= default;

			/**
			 * @brief Move constructor.
			 * @param other ChunkSink to move from.
			 */
			ChunkSink(ChunkSink&& other) noexcept 								= default;

			/**
			 * @brief Destructor.
			 */
			virtual ~ChunkSink() noexcept 										= default;

			/**
			 * @brief Copy assignment operator.
			 * @param other ChunkSink to copy from.
			 * @return Reference to this ChunkSink.
			 */
			ChunkSink& operator=(const ChunkSink& other) 						= default;

			/**
			 * @brief Move assignment operator.
			 * @param other ChunkSink to move from.
			 * @return Reference to this ChunkSink.
			 */
			ChunkSink& operator=(ChunkSink&& other) noexcept 					= default;

			/**
			 * @brief Take ownership of a chunk.
			 * @param chunk Chunk being delivered.
			 * @param ack Acknowledgement to call once the chunk is fully accepted
			 *        (or rejected). It may be called before Accept() returns or
			 *        later, from any thread.
			 */
			virtual void 														Accept(Chunk&& chunk, SinkAck&& ack) noexcept = 0;

			/**
			 * @brief Flush step run once after the last chunk, before finish.
			 * @param ack Acknowledgement for the flush.
			 * @note Default implementation acknowledges immediately.
			 */
			virtual void 														Final(SinkAck&& ack) noexcept;
	};

	/**
	 * @class FunctionSink
	 * @brief ChunkSink calling a synchronous function for every chunk.
	 */
	class STORMBYTE_STREAM_PUBLIC FunctionSink final: public ChunkSink {
		public:
			/**
			 * @brief Construct FunctionSink.
			 * @param function Function consuming one chunk.
			 */
			inline FunctionSink(const SinkFunction& function) noexcept:
				m_function(function) {}

			FunctionSink(const FunctionSink& other) 							= default;
			FunctionSink(FunctionSink&& other) noexcept 						= default;
			~FunctionSink() noexcept 											= default;
			FunctionSink& operator=(const FunctionSink& other)					= default;
			FunctionSink& operator=(FunctionSink&& other) noexcept 				= default;

			/**
			 * @brief Clone this FunctionSink.
			 * @return Pointer to the cloned FunctionSink.
			 */
			inline PointerType 													Clone() const noexcept override {
				return MakePointer<FunctionSink>(*this);
			}

			/**
			 * @brief Move this FunctionSink.
			 * @return Pointer to the moved FunctionSink.
			 */
			inline PointerType 													Move() noexcept override {
				return MakePointer<FunctionSink>(std::move(*this));
			}

			void 																Accept(Chunk&& chunk, SinkAck&& ack) noexcept override;

		private:
			SinkFunction m_function;											///< Wrapped consumer.
	};

	/**
	 * @class CollectorSink
	 * @brief ChunkSink keeping every accepted chunk in memory.
	 * @details Useful as the final destination of a pipeline whose output is
	 *          small, and for inspecting what a stream delivered.
	 */
	class STORMBYTE_STREAM_PUBLIC CollectorSink final: public ChunkSink {
		public:
			CollectorSink() noexcept											= default;
			CollectorSink(const CollectorSink& other) 							= default;
			CollectorSink(CollectorSink&& other) noexcept 						= default;
			~CollectorSink() noexcept 											= default;
			CollectorSink& operator=(const CollectorSink& other)				= default;
			CollectorSink& operator=(CollectorSink&& other) noexcept 			= default;

			/**
			 * @brief Clone this CollectorSink, including collected chunks.
			 * @return Pointer to the cloned CollectorSink.
			 */
			inline PointerType 													Clone() const noexcept override {
				return MakePointer<CollectorSink>(*this);
			}

			/**
			 * @brief Move this CollectorSink.
			 * @return Pointer to the moved CollectorSink.
			 */
			inline PointerType 													Move() noexcept override {
				return MakePointer<CollectorSink>(std::move(*this));
			}

			void 																Accept(Chunk&& chunk, SinkAck&& ack) noexcept override;

			/**
			 * @brief Total bytes accepted so far.
			 */
			inline std::size_t 													Bytes() const noexcept {
				return m_bytes;
			}

			/**
			 * @brief Accepted chunks in delivery order.
			 */
			inline const std::vector<Chunk>& 									Chunks() const noexcept {
				return m_chunks;
			}

			/**
			 * @brief Whether Final() was called.
			 */
			inline bool 														Finalized() const noexcept {
				return m_finalized;
			}

			void 																Final(SinkAck&& ack) noexcept override;

			/**
			 * @brief Concatenation of every accepted byte chunk as text.
			 */
			std::string 														ToString() const;

		private:
			std::vector<Chunk> m_chunks;										///< Accepted chunks.
			std::size_t m_bytes {0};											///< Sum of accepted bytes.
			bool m_finalized {false};											///< Final() seen.
	};
}
