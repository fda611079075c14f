#include <StormByte/stream/transform.hxx>

#include <format>

using namespace StormByte::Stream;

Transform::Transform(std::shared_ptr<Scheduler> scheduler, TransformFunction function, const Options& options):
Transform(std::move(scheduler), std::move(function), nullptr, options, options) {}

Transform::Transform(std::shared_ptr<Scheduler> scheduler, TransformFunction function, FlushFunction flush, const Options& options):
Transform(std::move(scheduler), std::move(function), std::move(flush), options, options) {}

Transform::Transform(std::shared_ptr<Scheduler> scheduler, TransformFunction function, FlushFunction flush, const Options& readable_options, const Options& writable_options):
Stream(scheduler, SharedOptions(readable_options, writable_options)),
Duplex(scheduler, readable_options, writable_options),
m_function(std::move(function)), m_flush(std::move(flush)) {}

Transform::Transform(std::shared_ptr<Scheduler> scheduler, SyncTransformFunction function, const Options& options):
Transform(std::move(scheduler), Asynchronous(std::move(function)), nullptr, options, options) {}

Transform::Transform(std::shared_ptr<Scheduler> scheduler, SyncTransformFunction function, FlushFunction flush, const Options& options):
Transform(std::move(scheduler), Asynchronous(std::move(function)), std::move(flush), options, options) {}

const char* Transform::Kind() const noexcept {
	return "Transform";
}

void Transform::Deliver(Chunk&& chunk, SinkAck&& ack) noexcept {
	if (!m_function) {
		ack(StormByte::Unexpected(SinkFault("No transform function defined")));
		return;
	}

	std::weak_ptr<Stream> weak = weak_from_this();
	std::shared_ptr<Scheduler> scheduler = m_scheduler;
	auto completed = std::make_shared<bool>(false);
	m_function(chunk, [weak, scheduler, completed, this, ack = std::move(ack)](TransformResult result) {
		// The function may complete from any thread, hop back onto the scheduler
		scheduler->Post([weak, completed, this, ack, result = std::move(result)]() mutable {
			auto self = weak.lock();
			if (!self)
				return;
			if (*completed) {
				Log(Logger::Level::Warning, "transform completed twice, ignored");
				return;
			}
			*completed = true;
			OnTransformed(std::move(result), std::move(ack));
		});
	});
}

void Transform::Demand() noexcept {
	if (m_held_ack) {
		Log(Logger::Level::LowLevel, "output consumed, releasing input");
		SinkAck ack = std::move(m_held_ack);
		m_held_ack = nullptr;
		ack({});
	}
	MaybeEmitDrain();
}

void Transform::DoFinal(SinkAck&& ack) noexcept {
	if (m_flush) {
		Log(Logger::Level::Debug, "flushing");
		if (!PushOutputs(m_flush()))
			return;
	}

	auto ended = PushEnd();
	if (!ended)
		Log(Logger::Level::Warning, ended.error()->what());
	ack({});
}

bool Transform::NeedsBackpressure() const noexcept {
	return Writable::NeedsBackpressure() || ReadableFull();
}

void Transform::OnDestroy() noexcept {
	Duplex::OnDestroy();
	m_held_ack = nullptr;
}

TransformFunction Transform::Asynchronous(SyncTransformFunction function) {
	if (!function)
		return nullptr;
	return [function = std::move(function)](const Chunk& chunk, TransformCallback done) {
		done(function(chunk));
	};
}

bool Transform::PushOutputs(TransformResult&& result) noexcept {
	if (IsDestroyed())
		return false;

	if (!result) {
		Destroy(result.error());
		return false;
	}

	for (auto& output: result.value()) {
		auto pushed = Push(std::move(output));
		if (!pushed) {
			Log(Logger::Level::Warning, pushed.error()->what());
			if (!IsDestroyed())
				Destroy(std::make_shared<ProtocolViolation>(ProtocolViolation("{}", pushed.error()->what())));
			return false;
		}
	}
	return true;
}

void Transform::OnTransformed(TransformResult&& result, SinkAck&& ack) noexcept {
	if (!PushOutputs(std::move(result)))
		return;

	if (ReadableFull()) {
		Log(Logger::Level::LowLevel, std::format("output at {} of {}, holding input", ReadableBytes(), ReadableHighWaterMark()));
		m_held_ack = std::move(ack);
		return;
	}
	ack({});
}
