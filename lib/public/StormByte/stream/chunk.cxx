#include <StormByte/stream/chunk.hxx>
#include <StormByte/string.hxx>

#include <algorithm>
#include <iterator>

using namespace StormByte::Stream;

Chunk::Chunk(std::string_view data): m_data(StormByte::String::ToByteVector(std::string(data))) {}

bool Chunk::operator==(const Chunk& other) const noexcept {
	if (m_is_object || other.m_is_object)
		return false;
	return m_data == other.m_data;
}

std::pair<Chunk, Chunk> Chunk::Split(const std::size_t& count) && {
	if (m_is_object || count >= m_data.size())
		return { std::move(*this), Chunk() };

	DataType tail(
		std::make_move_iterator(m_data.begin() + static_cast<std::ptrdiff_t>(count)),
		std::make_move_iterator(m_data.end())
	);
	m_data.resize(count);
	return { Chunk(std::move(m_data)), Chunk(std::move(tail)) };
}

std::string Chunk::ToString() const {
	if (m_is_object)
		return {};
	return StormByte::String::FromByteVector(m_data);
}
