#include <StormByte/stream/source.hxx>

using namespace StormByte::Stream;

void FunctionSource::Pull(SourceCallback&& done) noexcept {
	if (!m_function) {
		done(StormByte::Unexpected(SourceFault("No source function defined")));
		return;
	}
	done(m_function());
}

void VectorSource::Pull(SourceCallback&& done) noexcept {
	if (m_position >= m_chunks.size()) {
		done(std::optional<Chunk>());
		return;
	}
	done(std::optional<Chunk>(m_chunks[m_position++]));
}
