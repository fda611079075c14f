#include <StormByte/stream/pipe.hxx>

using namespace StormByte::Stream;

namespace StormByte::Stream {
	std::shared_ptr<PipeHandle> Pipe(const std::shared_ptr<Readable>& source, const std::shared_ptr<Writable>& destination, const PipeOptions& options) {
		auto handle = std::make_shared<PipeHandle>(source, destination, options);
		handle->Attach();
		return handle;
	}
}

PipeHandle::PipeHandle(const std::shared_ptr<Readable>& source, const std::shared_ptr<Writable>& destination, const PipeOptions& options) noexcept:
m_source(source), m_destination(destination), m_options(options) {}

void PipeHandle::Unpipe() noexcept {
	if (!m_active)
		return;
	m_active = false;

	auto source = m_source.lock();
	if (source) {
		for (const auto& id: m_source_listeners)
			source->Off(id);
		if (m_awaiting_drain)
			ReleaseDrain(*source);
		source->Log(Logger::Level::Debug, "unpiped");
	}
	if (auto destination = m_destination.lock()) {
		for (const auto& id: m_destination_listeners)
			destination->Off(id);
	}
	m_source_listeners.clear();
	m_destination_listeners.clear();
}

void PipeHandle::Attach() {
	auto source = m_source.lock();
	auto destination = m_destination.lock();
	if (!source || !destination)
		return;

	m_active = true;
	auto self = shared_from_this();
	m_destination_listeners.push_back(destination->OnDrain([self]() { self->OnDrain(); }));
	m_destination_listeners.push_back(destination->OnDestroyed([self](const ErrorPointer& error) { self->OnDestinationDestroyed(error); }));
	m_source_listeners.push_back(source->OnEnd([self]() { self->OnSourceEnd(); }));
	m_source_listeners.push_back(source->OnDestroyed([self](const ErrorPointer& error) { self->OnSourceDestroyed(error); }));
	m_source_listeners.push_back(source->OnData([self](const Chunk& chunk) { self->OnData(chunk); }));

	source->Log(Logger::Level::Debug, std::string("piped to ") + destination->Kind());

	// Either side may already be past the events the listeners wait for
	if (source->IsDestroyed() || destination->IsDestroyed() || source->IsEnded()) {
		source->GetScheduler()->Post([self]() { self->Settle(); });
		return;
	}
	// A source explicitly paused before piping starts flowing too
	source->Resume();
}

void PipeHandle::OnData(const Chunk& chunk) {
	if (!m_active)
		return;
	auto source = m_source.lock();
	auto destination = m_destination.lock();
	if (!source || !destination)
		return;

	auto written = destination->Write(chunk);
	if (!written) {
		if (destination->IsDestroyed()) {
			OnDestinationDestroyed(destination->GetError());
			return;
		}
		source->Log(Logger::Level::Warning, written.error()->what());
		source->Destroy(written.error());
		Unpipe();
		return;
	}

	if (!written.value() && !m_awaiting_drain) {
		m_awaiting_drain = true;
		++source->m_await_drain;
		source->Pause();
	}
}

void PipeHandle::OnDestinationDestroyed(const ErrorPointer& error) noexcept {
	if (!m_active)
		return;
	auto destination = m_destination.lock();
	auto source = m_source.lock();
	Unpipe();
	if (!source || (destination && destination->IsFinished()))
		return;

	source->Destroy(error);
}

void PipeHandle::OnDrain() noexcept {
	if (!m_active || !m_awaiting_drain)
		return;
	auto source = m_source.lock();
	if (!source)
		return;

	if (ReleaseDrain(*source))
		source->Resume();
}

void PipeHandle::OnSourceDestroyed(const ErrorPointer& error) noexcept {
	if (!m_active)
		return;
	auto source = m_source.lock();
	auto destination = m_destination.lock();
	Unpipe();
	if (!destination || (source && source->IsEnded()))
		return;

	destination->Destroy(error);
}

void PipeHandle::OnSourceEnd() noexcept {
	if (!m_active)
		return;
	auto destination = m_destination.lock();
	Unpipe();
	if (!destination || !m_options.end || destination->IsEnding() || destination->IsDestroyed())
		return;

	auto ended = destination->End();
	if (!ended)
		destination->Destroy(ended.error());
}

bool PipeHandle::ReleaseDrain(Readable& source) noexcept {
	m_awaiting_drain = false;
	if (source.m_await_drain > 0)
		--source.m_await_drain;
	return source.m_await_drain == 0;
}

void PipeHandle::Settle() noexcept {
	if (!m_active)
		return;
	auto source = m_source.lock();
	auto destination = m_destination.lock();
	if (!source || !destination) {
		Unpipe();
		return;
	}

	if (source->IsDestroyed())
		OnSourceDestroyed(source->GetError());
	else if (destination->IsDestroyed())
		OnDestinationDestroyed(destination->GetError());
	else if (source->IsEnded())
		OnSourceEnd();
}
