#include <StormByte/stream/duplex.hxx>

using namespace StormByte::Stream;

Duplex::Duplex(std::shared_ptr<Scheduler> scheduler, ChunkSource::PointerType source, ChunkSink::PointerType sink, const Options& options):
Duplex(std::move(scheduler), std::move(source), std::move(sink), options, options) {}

Duplex::Duplex(std::shared_ptr<Scheduler> scheduler, ChunkSource::PointerType source, ChunkSink::PointerType sink, const Options& readable_options, const Options& writable_options):
Stream(scheduler, SharedOptions(readable_options, writable_options)),
Readable(scheduler, std::move(source), readable_options),
Writable(scheduler, std::move(sink), writable_options),
m_allow_half_open(readable_options.allow_half_open) {}

Duplex::Duplex(std::shared_ptr<Scheduler> scheduler, const Options& readable_options, const Options& writable_options):
Stream(scheduler, SharedOptions(readable_options, writable_options)),
Readable(scheduler, readable_options),
Writable(scheduler, writable_options),
m_allow_half_open(readable_options.allow_half_open) {}

const char* Duplex::Kind() const noexcept {
	return "Duplex";
}

bool Duplex::Off(const ListenerId& id) noexcept {
	return Readable::Off(id) || Writable::Off(id);
}

Options Duplex::SharedOptions(const Options& readable_options, const Options& writable_options) {
	Options shared = readable_options;
	if (!shared.log)
		shared.log = writable_options.log;
	shared.emit_close = readable_options.emit_close && writable_options.emit_close;
	return shared;
}

bool Duplex::IsDone() const noexcept {
	return Readable::IsDone() && Writable::IsDone();
}

void Duplex::OnDestroy() noexcept {
	Readable::OnDestroy();
	Writable::OnDestroy();
}

void Duplex::OnEnded() noexcept {
	if (m_allow_half_open || IsEnding() || IsDestroyed())
		return;

	Log(Logger::Level::Debug, "readable side ended, ending writable side");
	auto ended = End();
	if (!ended)
		Log(Logger::Level::Warning, ended.error()->what());
}

void Duplex::OnFinished() noexcept {
	if (m_allow_half_open || IsEoF() || IsDestroyed())
		return;

	Log(Logger::Level::Debug, "writable side finished, ending readable side");
	auto ended = PushEnd();
	if (!ended)
		Log(Logger::Level::Warning, ended.error()->what());
}
