#include <StormByte/stream/stream.hxx>

#include <ostream>

using namespace StormByte::Stream;

Stream::Stream(std::shared_ptr<Scheduler> scheduler, const Options& options) noexcept:
m_scheduler(std::move(scheduler)), m_log(options.log), m_emit_close(options.emit_close) {}

void Stream::Destroy() noexcept {
	Destroy(nullptr);
}

void Stream::Destroy(ErrorPointer error) noexcept {
	if (m_destroyed)
		return;

	m_destroyed = true;
	m_error = std::move(error);
	if (m_error)
		Log(Logger::Level::Error, std::string("destroyed with error: ") + m_error->what());
	else
		Log(Logger::Level::Debug, "destroyed");

	OnDestroy();

	const bool emit_close = m_emit_close && !m_closed;
	m_closed = true;
	Defer([this, emit_close]() {
		if (m_error)
			EmitError();
		if (emit_close)
			m_on_close.Emit();
		m_on_destroyed.Emit(m_error);
	});
}

bool Stream::Off(const ListenerId& id) noexcept {
	return m_on_error.Disconnect(id) || m_on_close.Disconnect(id) || m_on_destroyed.Disconnect(id);
}

ListenerId Stream::OnClose(EventHandler handler) {
	const ListenerId id = NextListenerId();
	m_on_close.Connect(id, std::move(handler));
	return id;
}

ListenerId Stream::OnDestroyed(ErrorHandler handler) {
	const ListenerId id = NextListenerId();
	m_on_destroyed.Connect(id, std::move(handler));
	return id;
}

ListenerId Stream::OnError(ErrorHandler handler) {
	const ListenerId id = NextListenerId();
	m_on_error.Connect(id, std::move(handler));
	return id;
}

void Stream::Defer(Task&& task) {
	std::weak_ptr<Stream> weak = weak_from_this();
	m_scheduler->Post([weak, task = std::move(task)]() {
		if (auto self = weak.lock())
			task();
	});
}

void Stream::Log(const Logger::Level& level, const std::string& message) const noexcept {
	if (!m_log)
		return;
	*m_log << level << Kind() << ": " << message << std::endl;
}

void Stream::MaybeClose() noexcept {
	if (m_closed || m_destroyed || !IsDone())
		return;

	m_closed = true;
	if (!m_emit_close)
		return;
	Defer([this]() {
		m_on_close.Emit();
	});
}

void Stream::EmitError() const {
	if (m_on_error.Empty()) {
		Log(Logger::Level::Error, std::string("unhandled error: ") + m_error->what());
		return;
	}
	m_on_error.Emit(m_error);
}
