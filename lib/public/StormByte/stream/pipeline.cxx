#include <StormByte/stream/pipeline.hxx>

#include <exception>
#include <ostream>

using namespace StormByte::Stream;

Pipeline::Pipeline(std::shared_ptr<Logger::Log> log) noexcept: m_log(std::move(log)) {}

Pipeline::~Pipeline() noexcept {
	Destroy();
	Wait();
}

void Pipeline::AddStage(std::shared_ptr<Transform> stage) {
	m_stages.push_back(std::move(stage));
}

void Pipeline::Destroy(ErrorPointer error) noexcept {
	if (!m_running.load() || !m_scheduler)
		return;

	if (!error)
		error = std::make_shared<Error>(Error("Pipeline", "Pipeline destroyed before completion"));
	// Posted work may outlive the pipeline when the scheduler runs again later
	std::weak_ptr<bool> alive = m_alive;
	m_scheduler->Post([this, alive, error]() {
		if (alive.lock())
			Complete(error);
	});
}

ExpectedVoid<Error> Pipeline::Process(std::shared_ptr<Readable> source, std::shared_ptr<Writable> destination, const ExecutionMode& mode, PipelineCallback callback) {
	if (m_running.load())
		return StormByte::Unexpected(ProtocolViolation("Pipeline is already running"));
	// This guards double calls and does no harm in the first call
	Wait();

	if (!source || !destination)
		return StormByte::Unexpected(ProtocolViolation("Pipeline needs a source and a destination"));
	if (source->IsEnded() || source->IsDestroyed())
		return StormByte::Unexpected(ProtocolViolation("Pipeline source already ended or destroyed"));
	for (const auto& stage: m_stages) {
		if (!stage)
			return StormByte::Unexpected(ProtocolViolation("Pipeline stage is null"));
		if (stage->GetScheduler() != source->GetScheduler())
			return StormByte::Unexpected(ProtocolViolation("Pipeline stage {} is bound to another scheduler", stage->Kind()));
		if (stage->IsEnded() || stage->IsEnding() || stage->IsDestroyed())
			return StormByte::Unexpected(ProtocolViolation("Pipeline stage {} already ended or destroyed", stage->Kind()));
	}
	if (destination->GetScheduler() != source->GetScheduler())
		return StormByte::Unexpected(ProtocolViolation("Pipeline destination is bound to another scheduler"));
	if (destination->IsEnding() || destination->IsDestroyed())
		return StormByte::Unexpected(ProtocolViolation("Pipeline destination already ended or destroyed"));

	m_scheduler = source->GetScheduler();
	m_source = std::move(source);
	m_destination = std::move(destination);
	m_callback = std::move(callback);
	m_completed = false;
	m_running.store(true);

	// Wire source -> stages -> destination
	std::vector<std::shared_ptr<Stream>> streams { m_source };
	std::shared_ptr<Readable> upstream = m_source;
	for (const auto& stage: m_stages) {
		m_pipes.push_back(Pipe(upstream, stage));
		streams.push_back(stage);
		upstream = stage;
	}
	m_pipes.push_back(Pipe(upstream, m_destination));
	streams.push_back(m_destination);

	for (const auto& stream: streams) {
		m_listeners.emplace_back(stream, stream->OnDestroyed([this, kind = stream->Kind()](const ErrorPointer& error) {
			Complete(error ? error : std::make_shared<Error>(Error("Pipeline", "{} destroyed before completion", kind)));
		}));
	}
	m_listeners.emplace_back(m_destination, m_destination->OnFinish([this]() { Complete(nullptr); }));

	if (m_log)
		*m_log << Logger::Level::Debug << "Pipeline: running " << m_stages.size() << " stages" << std::endl;

	if (mode == ExecutionMode::Async)
		m_thread = std::thread([this]() { Run(); });
	else
		Run();
	return {};
}

void Pipeline::Wait() noexcept {
	if (m_thread.joinable())
		m_thread.join();
}

void Pipeline::Complete(const ErrorPointer& error) {
	if (m_completed)
		return;
	m_completed = true;

	for (const auto& [stream, id]: m_listeners)
		stream->Off(id);
	m_listeners.clear();

	if (error) {
		if (m_log)
			*m_log << Logger::Level::Error << "Pipeline: failed: " << error->what() << std::endl;
		m_source->Destroy(error);
		for (const auto& stage: m_stages)
			stage->Destroy(error);
		m_destination->Destroy(error);
	}
	else if (m_log)
		*m_log << Logger::Level::Debug << "Pipeline: completed" << std::endl;

	for (const auto& pipe: m_pipes)
		pipe->Unpipe();
	m_pipes.clear();

	PipelineCallback callback = std::move(m_callback);
	m_callback = nullptr;
	m_running.store(false);
	if (callback)
		callback(error);
}

void Pipeline::Run() {
	try {
		m_scheduler->RunUntil([this]() { return m_completed; });
		// Error and close events of destroyed streams are still queued
		m_scheduler->Run();
	}
	catch (const std::exception& e) {
		// A throwing listener leaves the streams half way: fail the run
		Complete(std::make_shared<Error>(Error("Pipeline", "{}", e.what())));
		m_scheduler->Run();
	}
	m_source.reset();
	m_destination.reset();
}
