#include <StormByte/stream/chunk_buffer.hxx>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <vector>

using namespace StormByte::Stream;

ChunkBuffer::ChunkBuffer(ChunkBuffer&& other) noexcept:
m_chunks(std::move(other.m_chunks)), m_buffered(other.m_buffered),
m_high_water_mark(other.m_high_water_mark), m_object_mode(other.m_object_mode) {
	other.m_chunks.clear();
	other.m_buffered = 0;
}

ChunkBuffer& ChunkBuffer::operator=(ChunkBuffer&& other) noexcept {
	if (this != &other) {
		m_chunks = std::move(other.m_chunks);
		m_buffered = other.m_buffered;
		m_high_water_mark = other.m_high_water_mark;
		m_object_mode = other.m_object_mode;
		other.m_chunks.clear();
		other.m_buffered = 0;
	}
	return *this;
}

std::size_t ChunkBuffer::Clear() noexcept {
	const std::size_t discarded = m_chunks.size();
	m_chunks.clear();
	m_buffered = 0;
	return discarded;
}

StormByte::Expected<Chunk, ReadError> ChunkBuffer::Dequeue(const std::size_t& max_bytes) noexcept {
	if (m_chunks.empty())
		return StormByte::Unexpected(ReadError("Dequeue from empty chunk buffer"));

	Chunk& front = m_chunks.front();
	if (max_bytes > 0 && !front.IsObject() && front.Size() > max_bytes) {
		// Partial dequeue: the remainder replaces the front in place
		auto [head, tail] = std::move(front).Split(max_bytes);
		m_buffered -= Accounted(head);
		front = std::move(tail);
		return std::move(head);
	}

	Chunk chunk = std::move(front);
	m_chunks.pop_front();
	m_buffered -= Accounted(chunk);
	return chunk;
}

ExpectedVoid<ProtocolViolation> ChunkBuffer::Enqueue(Chunk&& chunk) noexcept {
	if (chunk.IsObject() && !m_object_mode)
		return StormByte::Unexpected(ProtocolViolation("Object chunk pushed to a byte mode buffer"));

	m_buffered += Accounted(chunk);
	m_chunks.push_back(std::move(chunk));
	return {};
}

StormByte::Expected<Chunk, ReadError> ChunkBuffer::Front() const noexcept {
	if (m_chunks.empty())
		return StormByte::Unexpected(ReadError("Peek on empty chunk buffer"));
	return m_chunks.front();
}

std::string ChunkBuffer::HexDump(const std::size_t& collumns, const std::size_t& byte_limit) const noexcept {
	const std::size_t cols = (collumns == 0) ? 16 : collumns;

	std::ostringstream oss;
	oss << "Chunks: " << m_chunks.size() << '\n';
	oss << "Buffered: " << m_buffered << " / " << m_high_water_mark;

	for (std::size_t i = 0; i < m_chunks.size(); ++i) {
		const Chunk& chunk = m_chunks[i];
		oss << "\nChunk " << i;
		if (chunk.IsObject()) {
			oss << " <object>";
			continue;
		}
		oss << " (" << chunk.Size() << " bytes)";
		std::span<const std::byte> view = chunk.Data();
		if (byte_limit > 0 && view.size() > byte_limit)
			view = view.first(byte_limit);
		if (!view.empty())
			oss << '\n' << FormatHexLines(view, cols);
	}

	return oss.str();
}

std::string ChunkBuffer::FormatHexLines(std::span<const std::byte> data, std::size_t collumns) noexcept {
	const int offset_width = 8;

	std::vector<std::string> lines;
	for (std::size_t i = 0; i < data.size(); i += collumns) {
		const std::size_t line_end = std::min(data.size(), i + collumns);
		std::ostringstream line;

		line << std::hex << std::uppercase << std::setw(offset_width) << std::setfill('0') << i << ": " << std::dec << std::setfill(' ');

		for (std::size_t j = i; j < i + collumns; ++j) {
			if (j < line_end) {
				const unsigned int val = static_cast<unsigned int>(std::to_integer<unsigned char>(data[j]));
				line << std::hex << std::setw(2) << std::setfill('0') << std::uppercase << val << ' ' << std::dec;
			} else {
				line << "   ";
			}
		}

		line << "  ";

		for (std::size_t j = i; j < line_end; ++j) {
			const unsigned char c = std::to_integer<unsigned char>(data[j]);
			if (std::isprint(c)) line << static_cast<char>(c);
			else line << '.';
		}

		lines.push_back(line.str());
	}

	std::ostringstream oss;
	for (std::size_t li = 0; li < lines.size(); ++li) {
		oss << lines[li];
		if (li + 1 < lines.size()) oss << '\n';
	}

	return oss.str();
}
