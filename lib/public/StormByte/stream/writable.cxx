#include <StormByte/stream/writable.hxx>

#include <expected>
#include <format>

using namespace StormByte::Stream;

Writable::Writable(std::shared_ptr<Scheduler> scheduler, ChunkSink::PointerType sink, const Options& options):
Stream(std::move(scheduler), options),
m_buffer(options.HighWaterMark(), options.object_mode), m_sink(std::move(sink)), m_max_buffered(options.max_buffered) {}

Writable::Writable(std::shared_ptr<Scheduler> scheduler, const Options& options):
Writable(std::move(scheduler), nullptr, options) {}

void Writable::Cork() noexcept {
	if (IsDestroyed() || m_ending)
		return;
	++m_corked;
}

ExpectedVoid<Error> Writable::End() {
	if (IsDestroyed())
		return StormByte::Unexpected(ProtocolViolation("End after destroy"));
	if (m_ending)
		return StormByte::Unexpected(ProtocolViolation("End called twice"));

	m_ending = true;
	m_corked = 0;
	Log(Logger::Level::Debug, std::format("ending with {} queued", WritableBytes()));
	ScheduleWrite();
	return {};
}

ExpectedVoid<Error> Writable::End(Chunk chunk) {
	if (m_ending)
		return StormByte::Unexpected(ProtocolViolation("End called twice"));

	auto written = Write(std::move(chunk));
	if (!written)
		return std::unexpected(written.error());
	return End();
}

const char* Writable::Kind() const noexcept {
	return "Writable";
}

bool Writable::Off(const ListenerId& id) noexcept {
	return m_on_drain.Disconnect(id) || m_on_finish.Disconnect(id) || Stream::Off(id);
}

ListenerId Writable::OnDrain(EventHandler handler) {
	const ListenerId id = NextListenerId();
	m_on_drain.Connect(id, std::move(handler));
	return id;
}

ListenerId Writable::OnFinish(EventHandler handler) {
	const ListenerId id = NextListenerId();
	m_on_finish.Connect(id, std::move(handler));
	return id;
}

void Writable::Uncork() noexcept {
	if (m_corked == 0)
		return;
	if (--m_corked == 0 && !m_buffer.Empty())
		ScheduleWrite();
}

Writable::State Writable::WritableState() const noexcept {
	if (IsDestroyed())
		return IsErrored() ? State::Errored : State::Destroyed;
	if (m_finished)
		return State::Finished;
	if (m_ending)
		return State::Ending;
	return m_active ? State::Active : State::Idle;
}

StormByte::Expected<bool, Error> Writable::Write(Chunk chunk) {
	if (IsDestroyed())
		return StormByte::Unexpected(ProtocolViolation("Write after destroy"));
	if (m_ending)
		return StormByte::Unexpected(ProtocolViolation("Write after end"));
	if (chunk.IsObject() && !m_buffer.IsObjectMode())
		return StormByte::Unexpected(ProtocolViolation("Object chunk written to a byte stream"));

	const std::size_t incoming = m_buffer.Accounted(chunk);
	if (m_max_buffered > 0 && WritableBytes() + incoming > m_max_buffered) {
		BackpressureOverrun error("Queueing {} more would exceed the limit of {} ({} queued)", incoming, m_max_buffered, WritableBytes());
		Destroy(std::make_shared<BackpressureOverrun>(error));
		return StormByte::Unexpected(std::move(error));
	}

	auto enqueued = m_buffer.Enqueue(std::move(chunk));
	if (!enqueued)
		return StormByte::Unexpected(ProtocolViolation("{}", enqueued.error()->what()));

	m_active = true;
	if (m_corked == 0)
		ScheduleWrite();

	if (NeedsBackpressure()) {
		if (!m_need_drain)
			Log(Logger::Level::LowLevel, std::format("{} queued of {}, waiting for drain", WritableBytes(), WritableHighWaterMark()));
		m_need_drain = true;
		return false;
	}
	return true;
}

void Writable::Deliver(Chunk&& chunk, SinkAck&& ack) noexcept {
	if (!m_sink) {
		ack(StormByte::Unexpected(SinkFault("No sink attached")));
		return;
	}
	m_sink->Accept(std::move(chunk), std::move(ack));
}

void Writable::DoFinal(SinkAck&& ack) noexcept {
	if (!m_sink) {
		ack({});
		return;
	}
	m_sink->Final(std::move(ack));
}

bool Writable::IsDone() const noexcept {
	return m_finished;
}

void Writable::MaybeEmitDrain() noexcept {
	if (!m_need_drain || IsDestroyed() || NeedsBackpressure())
		return;

	m_need_drain = false;
	Log(Logger::Level::LowLevel, "drain");
	Defer([this]() {
		if (!IsDestroyed())
			m_on_drain.Emit();
	});
}

bool Writable::NeedsBackpressure() const noexcept {
	return WritableBytes() >= m_buffer.HighWaterMark();
}

void Writable::OnDestroy() noexcept {
	if (m_log && !m_buffer.Empty())
		Log(Logger::Level::LowLevel, "discarding\n" + m_buffer.HexDump(16, 64));
	const std::size_t discarded = m_buffer.Clear();
	if (discarded > 0)
		Log(Logger::Level::Debug, std::format("discarded {} queued chunks", discarded));
	m_in_flight = 0;
	m_on_drain.Clear();
}

ErrorPointer Writable::AsSinkFault(const ErrorPointer& error) {
	if (std::dynamic_pointer_cast<SinkFault>(error) || std::dynamic_pointer_cast<SourceFault>(error)
		|| std::dynamic_pointer_cast<ProtocolViolation>(error) || std::dynamic_pointer_cast<BackpressureOverrun>(error))
		return error;
	return std::make_shared<SinkFault>(SinkFault("{}", error->what()));
}

void Writable::MaybeFinish() noexcept {
	if (!m_ending || m_finished || m_finalizing || m_delivering || !m_buffer.Empty() || IsDestroyed())
		return;

	m_finalizing = true;
	DoFinal(MakeAck([this](ExpectedVoid<Error>&& result) {
		OnFinal(std::move(result));
	}));
}

void Writable::OnDelivered(ExpectedVoid<Error>&& result) noexcept {
	m_delivering = false;
	m_in_flight = 0;
	if (IsDestroyed())
		return;

	if (!result) {
		Destroy(AsSinkFault(result.error()));
		return;
	}

	MaybeEmitDrain();
	if (m_buffer.Empty())
		MaybeFinish();
	else
		ScheduleWrite();
}

void Writable::OnFinal(ExpectedVoid<Error>&& result) noexcept {
	m_finalizing = false;
	if (IsDestroyed())
		return;

	if (!result) {
		Destroy(AsSinkFault(result.error()));
		return;
	}

	m_finished = true;
	Log(Logger::Level::Debug, "finished");
	m_on_finish.Emit();
	OnFinished();
	MaybeClose();
}

SinkAck Writable::MakeAck(std::function<void(ExpectedVoid<Error>&&)>&& handler) {
	std::weak_ptr<Stream> weak = weak_from_this();
	std::shared_ptr<Scheduler> scheduler = m_scheduler;
	auto acked = std::make_shared<bool>(false);
	return [weak, scheduler, acked, handler = std::move(handler), this](ExpectedVoid<Error> result) {
		// The sink may acknowledge from any thread, hop back onto the scheduler
		scheduler->Post([weak, acked, handler, this, result = std::move(result)]() mutable {
			auto self = weak.lock();
			if (!self)
				return;
			if (*acked) {
				Log(Logger::Level::Warning, "duplicate acknowledgement ignored");
				return;
			}
			*acked = true;
			handler(std::move(result));
		});
	};
}

void Writable::ScheduleWrite() noexcept {
	if (m_write_scheduled || m_delivering)
		return;

	m_write_scheduled = true;
	Defer([this]() {
		m_write_scheduled = false;
		WriteNext();
	});
}

void Writable::WriteNext() noexcept {
	if (IsDestroyed() || m_delivering || m_corked > 0)
		return;

	if (m_buffer.Empty()) {
		MaybeFinish();
		return;
	}

	auto chunk = m_buffer.Dequeue();
	if (!chunk) {
		Destroy(std::make_shared<ReadError>(ReadError("{}", chunk.error()->what())));
		return;
	}

	m_in_flight = m_buffer.Accounted(chunk.value());
	m_delivering = true;
	Deliver(std::move(chunk.value()), MakeAck([this](ExpectedVoid<Error>&& result) {
		OnDelivered(std::move(result));
	}));
}
