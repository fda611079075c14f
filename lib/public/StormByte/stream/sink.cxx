#include <StormByte/stream/sink.hxx>

using namespace StormByte::Stream;

void ChunkSink::Final(SinkAck&& ack) noexcept {
	ack({});
}

void FunctionSink::Accept(Chunk&& chunk, SinkAck&& ack) noexcept {
	if (!m_function) {
		ack(StormByte::Unexpected(SinkFault("No sink function defined")));
		return;
	}
	ack(m_function(chunk));
}

void CollectorSink::Accept(Chunk&& chunk, SinkAck&& ack) noexcept {
	m_bytes += chunk.Size();
	m_chunks.push_back(std::move(chunk));
	ack({});
}

void CollectorSink::Final(SinkAck&& ack) noexcept {
	m_finalized = true;
	ack({});
}

std::string CollectorSink::ToString() const {
	std::string result;
	result.reserve(m_bytes);
	for (const auto& chunk: m_chunks)
		result += chunk.ToString();
	return result;
}
