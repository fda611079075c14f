#include <StormByte/stream/readable.hxx>

#include <format>

using namespace StormByte::Stream;

Readable::Readable(std::shared_ptr<Scheduler> scheduler, const Options& options):
Readable(std::move(scheduler), nullptr, options) {}

Readable::Readable(std::shared_ptr<Scheduler> scheduler, ChunkSource::PointerType source, const Options& options):
Stream(std::move(scheduler), options),
m_buffer(options.HighWaterMark(), options.object_mode), m_source(std::move(source)), m_max_buffered(options.max_buffered) {}

std::shared_ptr<Readable> Readable::From(std::shared_ptr<Scheduler> scheduler, std::vector<Chunk> chunks, const Options& options) {
	return std::make_shared<Readable>(std::move(scheduler), std::make_shared<VectorSource>(std::move(chunks)), options);
}

const char* Readable::Kind() const noexcept {
	return "Readable";
}

bool Readable::Off(const ListenerId& id) noexcept {
	return m_on_data.Disconnect(id) || m_on_end.Disconnect(id) || m_on_readable.Disconnect(id) || Stream::Off(id);
}

ListenerId Readable::OnData(DataHandler handler) {
	const ListenerId id = NextListenerId();
	m_on_data.Connect(id, std::move(handler));
	if (m_state == State::Idle)
		Resume();
	return id;
}

ListenerId Readable::OnEnd(EventHandler handler) {
	const ListenerId id = NextListenerId();
	m_on_end.Connect(id, std::move(handler));
	return id;
}

ListenerId Readable::OnReadable(EventHandler handler) {
	const ListenerId id = NextListenerId();
	m_on_readable.Connect(id, std::move(handler));
	if (!m_buffer.Empty() || m_eof)
		ScheduleReadable();
	return id;
}

void Readable::Pause() noexcept {
	if (IsDestroyed() || m_state == State::Ended || m_state == State::Paused)
		return;

	Log(Logger::Level::LowLevel, "paused");
	m_state = State::Paused;
}

StormByte::Expected<bool, Error> Readable::Push(Chunk chunk) {
	if (IsDestroyed())
		return StormByte::Unexpected(ProtocolViolation("Push after destroy"));
	if (m_eof)
		return StormByte::Unexpected(ProtocolViolation("Push after end of stream"));
	if (chunk.IsObject() && !m_buffer.IsObjectMode())
		return StormByte::Unexpected(ProtocolViolation("Object chunk pushed to a byte stream"));

	const std::size_t incoming = m_buffer.Accounted(chunk);
	if (m_max_buffered > 0 && m_buffer.BufferedBytes() + incoming > m_max_buffered) {
		BackpressureOverrun error("Buffering {} more would exceed the limit of {} ({} buffered)", incoming, m_max_buffered, m_buffer.BufferedBytes());
		Destroy(std::make_shared<BackpressureOverrun>(error));
		return StormByte::Unexpected(std::move(error));
	}

	auto enqueued = m_buffer.Enqueue(std::move(chunk));
	if (!enqueued)
		return StormByte::Unexpected(ProtocolViolation("{}", enqueued.error()->what()));

	if (m_state == State::Flowing)
		ScheduleFlow();
	else
		ScheduleReadable();

	if (m_buffer.IsAboveHighWaterMark()) {
		Log(Logger::Level::LowLevel, std::format("buffer at {} of {}, backpressure", m_buffer.BufferedBytes(), m_buffer.HighWaterMark()));
		return false;
	}
	return true;
}

ExpectedVoid<Error> Readable::PushEnd() {
	if (IsDestroyed())
		return StormByte::Unexpected(ProtocolViolation("End of stream pushed after destroy"));
	if (m_eof)
		return StormByte::Unexpected(ProtocolViolation("End of stream pushed twice"));

	m_eof = true;
	Log(Logger::Level::Debug, "end of stream pushed");
	if (m_state == State::Flowing)
		ScheduleFlow();
	else {
		ScheduleReadable();
		MaybeEnd();
	}
	return {};
}

StormByte::Expected<std::optional<Chunk>, Error> Readable::Read(const std::size_t& max_bytes) {
	if (IsDestroyed())
		return StormByte::Unexpected(ReadError("Read from a destroyed stream"));
	if (m_state == State::Idle)
		m_state = State::Paused;

	if (m_buffer.Empty()) {
		if (m_eof)
			MaybeEnd();
		else {
			m_read_demand = true;
			MaybeDemand();
		}
		return std::optional<Chunk>();
	}

	auto chunk = m_buffer.Dequeue(max_bytes);
	if (!chunk)
		return StormByte::Unexpected(ReadError("{}", chunk.error()->what()));

	MaybeEnd();
	m_read_demand = true;
	MaybeDemand();
	return std::optional<Chunk>(std::move(chunk.value()));
}

Readable::State Readable::ReadableState() const noexcept {
	if (IsDestroyed())
		return IsErrored() ? State::Errored : State::Destroyed;
	return m_state;
}

void Readable::Resume() noexcept {
	if (IsDestroyed() || m_state == State::Ended || m_state == State::Flowing)
		return;

	Log(Logger::Level::LowLevel, "resumed");
	m_state = State::Flowing;
	ScheduleFlow();
}

void Readable::Demand() noexcept {
	if (!m_source || m_pulling)
		return;

	m_pulling = true;
	Defer([this]() {
		if (IsDestroyed() || m_eof) {
			m_pulling = false;
			return;
		}

		std::weak_ptr<Stream> weak = weak_from_this();
		std::shared_ptr<Scheduler> scheduler = m_scheduler;
		m_source->Pull([weak, scheduler, this](SourceResult result) {
			// The source may answer from any thread, hop back onto the scheduler
			scheduler->Post([weak, this, result = std::move(result)]() mutable {
				if (auto self = weak.lock())
					OnPulled(std::move(result));
			});
		});
	});
}

bool Readable::IsDone() const noexcept {
	return m_ended;
}

void Readable::OnDestroy() noexcept {
	if (m_log && !m_buffer.Empty())
		Log(Logger::Level::LowLevel, "discarding\n" + m_buffer.HexDump(16, 64));
	const std::size_t discarded = m_buffer.Clear();
	if (discarded > 0)
		Log(Logger::Level::Debug, std::format("discarded {} buffered chunks", discarded));
	m_on_data.Clear();
}

void Readable::Flow() {
	m_flow_scheduled = false;
	if (IsDestroyed())
		return;

	// State is checked again after every emission: a listener may pause or destroy
	while (m_state == State::Flowing && !IsDestroyed() && !m_buffer.Empty()) {
		auto chunk = m_buffer.Dequeue();
		if (!chunk)
			break;
		m_on_data.Emit(chunk.value());
	}

	MaybeEnd();
	MaybeDemand();
}

void Readable::MaybeDemand() noexcept {
	if (IsDestroyed() || m_eof || m_buffer.IsAboveHighWaterMark())
		return;
	if (m_state != State::Flowing && !m_read_demand)
		return;

	m_read_demand = false;
	Demand();
}

void Readable::MaybeEnd() noexcept {
	if (!m_eof || m_ended || IsDestroyed() || !m_buffer.Empty() || m_state == State::Idle)
		return;

	m_ended = true;
	m_state = State::Ended;
	Log(Logger::Level::Debug, "ended");
	Defer([this]() {
		if (IsDestroyed())
			return;
		m_on_end.Emit();
		OnEnded();
		MaybeClose();
	});
}

void Readable::OnPulled(SourceResult&& result) noexcept {
	m_pulling = false;
	if (IsDestroyed())
		return;

	if (!result) {
		auto fault = std::dynamic_pointer_cast<SourceFault>(result.error());
		if (!fault)
			fault = std::make_shared<SourceFault>(SourceFault("{}", result.error()->what()));
		Destroy(fault);
		return;
	}

	if (!result->has_value()) {
		auto ended = PushEnd();
		if (!ended)
			Log(Logger::Level::Warning, ended.error()->what());
		return;
	}

	// Further pulls come from Flow() or the next Read(), once the chunk was consumed
	auto pushed = Push(std::move(result->value()));
	if (!pushed)
		Log(Logger::Level::Warning, pushed.error()->what());
}

void Readable::ScheduleFlow() noexcept {
	if (m_flow_scheduled)
		return;

	m_flow_scheduled = true;
	Defer([this]() {
		Flow();
	});
}

void Readable::ScheduleReadable() noexcept {
	if (m_readable_scheduled || m_on_readable.Empty())
		return;

	m_readable_scheduled = true;
	Defer([this]() {
		m_readable_scheduled = false;
		if (!IsDestroyed() && m_state != State::Flowing)
			m_on_readable.Emit();
	});
}
