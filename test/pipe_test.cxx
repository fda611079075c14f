#include <StormByte/stream/pipe.hxx>
#include <StormByte/stream/transform.hxx>
#include <StormByte/test_handlers.h>

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

using StormByte::Stream::Chunk;
using StormByte::Stream::CollectorSink;
using StormByte::Stream::Error;
using StormByte::Stream::ErrorPointer;
using StormByte::Stream::ExpectedVoid;
using StormByte::Stream::FunctionSink;
using StormByte::Stream::FunctionSource;
using StormByte::Stream::Options;
using StormByte::Stream::Pipe;
using StormByte::Stream::PipeOptions;
using StormByte::Stream::Readable;
using StormByte::Stream::Scheduler;
using StormByte::Stream::SinkFault;
using StormByte::Stream::SourceFault;
using StormByte::Stream::SourceResult;
using StormByte::Stream::Transform;
using StormByte::Stream::TransformResult;
using StormByte::Stream::Writable;

namespace {
	Options WithHighWaterMark(std::size_t hwm) {
		Options options;
		options.high_water_mark = hwm;
		return options;
	}

	std::vector<Chunk> Chunks(std::initializer_list<const char*> parts) {
		std::vector<Chunk> chunks;
		for (const char* part: parts)
			chunks.emplace_back(part);
		return chunks;
	}
}

int test_pipe_simple() {
	auto scheduler = std::make_shared<Scheduler>();
	auto source = Readable::From(scheduler, Chunks({"a", "b", "c"}));
	auto sink = std::make_shared<CollectorSink>();
	auto destination = std::make_shared<Writable>(scheduler, sink);
	auto handle = Pipe(source, destination);
	ASSERT_TRUE("test_pipe_simple active", handle->IsActive());
	ASSERT_TRUE("test_pipe_simple flowing", source->IsFlowing());
	scheduler->Run();
	ASSERT_EQUAL("test_pipe_simple content", std::string("abc"), sink->ToString());
	ASSERT_TRUE("test_pipe_simple source ended", source->IsEnded());
	ASSERT_TRUE("test_pipe_simple destination finished", destination->IsFinished());
	ASSERT_FALSE("test_pipe_simple inactive", handle->IsActive());
	RETURN_TEST("test_pipe_simple", 0);
}

int test_pipe_pulled_source_bounded() {
	auto scheduler = std::make_shared<Scheduler>();
	int pulls = 0;
	auto source = std::make_shared<Readable>(scheduler, FunctionSource([&pulls]() -> SourceResult {
		if (pulls == 10)
			return std::optional<Chunk>();
		++pulls;
		return std::optional<Chunk>(Chunk("xx"));
	}));
	auto sink = std::make_shared<CollectorSink>();
	auto destination = std::make_shared<Writable>(scheduler, sink, WithHighWaterMark(4));
	std::size_t max_queued = 0;
	(void)Pipe(source, destination);
	source->OnData([&max_queued, raw = destination.get()](const Chunk&) {
		max_queued = std::max(max_queued, raw->WritableBytes());
	});
	scheduler->Run();
	ASSERT_EQUAL("test_pipe_pulled_source_bounded bytes", static_cast<std::size_t>(20), sink->Bytes());
	ASSERT_EQUAL("test_pipe_pulled_source_bounded pulls", 10, pulls);
	ASSERT_TRUE("test_pipe_pulled_source_bounded bounded", max_queued <= destination->WritableHighWaterMark());
	ASSERT_TRUE("test_pipe_pulled_source_bounded finished", destination->IsFinished());
	RETURN_TEST("test_pipe_pulled_source_bounded", 0);
}

int test_pipe_backpressure_pauses_source() {
	auto scheduler = std::make_shared<Scheduler>();
	auto source = std::make_shared<Readable>(scheduler);
	std::vector<std::string> events;
	auto destination = std::make_shared<Writable>(scheduler, FunctionSink([&events](const Chunk& chunk) -> ExpectedVoid<Error> {
		events.push_back("accept " + chunk.ToString());
		return {};
	}), WithHighWaterMark(2));
	destination->OnDrain([&events]() { events.push_back("drain"); });
	(void)Pipe(source, destination);

	bool paused_after_first = false;
	source->OnData([&](const Chunk& chunk) {
		if (events.empty())
			paused_after_first = source->IsPaused();
		events.push_back("data " + chunk.ToString());
	});
	(void)source->Push(Chunk("aaa"));
	(void)source->Push(Chunk("bbb"));
	(void)source->Push(Chunk("ccc"));
	(void)source->PushEnd();
	scheduler->Run();

	ASSERT_FALSE("test_pipe_backpressure_pauses_source events", events.empty());
	ASSERT_EQUAL("test_pipe_backpressure_pauses_source first", std::string("data aaa"), events.front());
	// The pipe pauses the source from the same data event
	ASSERT_TRUE("test_pipe_backpressure_pauses_source paused", paused_after_first);

	const auto first_drain = std::find(events.begin(), events.end(), std::string("drain"));
	ASSERT_TRUE("test_pipe_backpressure_pauses_source drained", first_drain != events.end());
	const auto accepted_before = std::count_if(events.begin(), first_drain, [](const std::string& event) {
		return event.rfind("accept ", 0) == 0;
	});
	ASSERT_EQUAL("test_pipe_backpressure_pauses_source one accepted", static_cast<std::ptrdiff_t>(1), accepted_before);
	const auto second = std::find(events.begin(), events.end(), std::string("data bbb"));
	ASSERT_TRUE("test_pipe_backpressure_pauses_source second emitted", second != events.end());
	ASSERT_TRUE("test_pipe_backpressure_pauses_source second after drain", second > first_drain);
	ASSERT_TRUE("test_pipe_backpressure_pauses_source finished", destination->IsFinished());
	RETURN_TEST("test_pipe_backpressure_pauses_source", 0);
}

int test_pipe_sink_fault_stops_source() {
	auto scheduler = std::make_shared<Scheduler>();
	int pulls = 0;
	int accepted = 0;
	auto source = std::make_shared<Readable>(scheduler, FunctionSource([&pulls]() -> SourceResult {
		++pulls;
		return std::optional<Chunk>(Chunk("c" + std::to_string(pulls)));
	}));
	auto destination = std::make_shared<Writable>(scheduler, FunctionSink([&accepted](const Chunk&) -> ExpectedVoid<Error> {
		if (++accepted == 2)
			return StormByte::Unexpected(SinkFault("disk full"));
		return {};
	}), WithHighWaterMark(1));
	ErrorPointer source_error;
	source->OnError([&source_error](const ErrorPointer& error) { source_error = error; });
	(void)Pipe(source, destination);
	scheduler->Run();
	ASSERT_EQUAL("test_pipe_sink_fault_stops_source accepted", 2, accepted);
	ASSERT_EQUAL("test_pipe_sink_fault_stops_source no third pull", 2, pulls);
	ASSERT_TRUE("test_pipe_sink_fault_stops_source destination", destination->IsErrored());
	ASSERT_TRUE("test_pipe_sink_fault_stops_source source", source->IsErrored());
	ASSERT_TRUE("test_pipe_sink_fault_stops_source type", dynamic_cast<SinkFault*>(source_error.get()) != nullptr);
	ASSERT_TRUE("test_pipe_sink_fault_stops_source same error", source_error == destination->GetError());
	RETURN_TEST("test_pipe_sink_fault_stops_source", 0);
}

int test_pipe_source_fault_reaches_destination() {
	auto scheduler = std::make_shared<Scheduler>();
	int pulls = 0;
	auto source = std::make_shared<Readable>(scheduler, FunctionSource([&pulls]() -> SourceResult {
		if (++pulls == 2)
			return StormByte::Unexpected(SourceFault("connection reset"));
		return std::optional<Chunk>(Chunk("first"));
	}));
	auto sink = std::make_shared<CollectorSink>();
	auto destination = std::make_shared<Writable>(scheduler, sink);
	ErrorPointer destination_error;
	destination->OnError([&destination_error](const ErrorPointer& error) { destination_error = error; });
	(void)Pipe(source, destination);
	scheduler->Run();
	ASSERT_TRUE("test_pipe_source_fault_reaches_destination source", source->IsErrored());
	ASSERT_TRUE("test_pipe_source_fault_reaches_destination type", dynamic_cast<SourceFault*>(destination_error.get()) != nullptr);
	ASSERT_FALSE("test_pipe_source_fault_reaches_destination not finalized", sink->Finalized());
	ASSERT_FALSE("test_pipe_source_fault_reaches_destination not finished", destination->IsFinished());
	RETURN_TEST("test_pipe_source_fault_reaches_destination", 0);
}

int test_pipe_unpipe() {
	auto scheduler = std::make_shared<Scheduler>();
	auto source = std::make_shared<Readable>(scheduler);
	auto sink = std::make_shared<CollectorSink>();
	auto destination = std::make_shared<Writable>(scheduler, sink);
	auto handle = Pipe(source, destination);
	(void)source->Push(Chunk("before"));
	scheduler->Run();
	handle->Unpipe();
	ASSERT_FALSE("test_pipe_unpipe inactive", handle->IsActive());
	(void)source->Push(Chunk("after"));
	(void)source->PushEnd();
	scheduler->Run();
	ASSERT_EQUAL("test_pipe_unpipe content", std::string("before"), sink->ToString());
	ASSERT_FALSE("test_pipe_unpipe destination left open", destination->IsEnding());
	handle->Unpipe();
	RETURN_TEST("test_pipe_unpipe", 0);
}

int test_pipe_without_end() {
	auto scheduler = std::make_shared<Scheduler>();
	auto source = Readable::From(scheduler, Chunks({"x"}));
	auto sink = std::make_shared<CollectorSink>();
	auto destination = std::make_shared<Writable>(scheduler, sink);
	PipeOptions options;
	options.end = false;
	(void)Pipe(source, destination, options);
	scheduler->Run();
	ASSERT_TRUE("test_pipe_without_end source ended", source->IsEnded());
	ASSERT_FALSE("test_pipe_without_end destination open", destination->IsEnding());
	(void)destination->Write(Chunk("y"));
	(void)destination->End();
	scheduler->Run();
	ASSERT_EQUAL("test_pipe_without_end content", std::string("xy"), sink->ToString());
	ASSERT_TRUE("test_pipe_without_end finished", destination->IsFinished());
	RETURN_TEST("test_pipe_without_end", 0);
}

int test_pipe_through_transform() {
	auto scheduler = std::make_shared<Scheduler>();
	auto source = Readable::From(scheduler, Chunks({"ab", "cd", "ef"}));
	auto reverse = std::make_shared<Transform>(scheduler, [](const Chunk& chunk) -> TransformResult {
		std::string text = chunk.ToString();
		std::reverse(text.begin(), text.end());
		return std::vector<Chunk>{Chunk(text)};
	}, WithHighWaterMark(2));
	auto sink = std::make_shared<CollectorSink>();
	auto destination = std::make_shared<Writable>(scheduler, sink, WithHighWaterMark(2));
	(void)Pipe(source, reverse);
	(void)Pipe(reverse, destination);
	scheduler->Run();
	ASSERT_EQUAL("test_pipe_through_transform content", std::string("badcfe"), sink->ToString());
	ASSERT_TRUE("test_pipe_through_transform transform closed", reverse->IsClosed());
	ASSERT_TRUE("test_pipe_through_transform finished", destination->IsFinished());
	RETURN_TEST("test_pipe_through_transform", 0);
}

int test_pipe_fan_out() {
	auto scheduler = std::make_shared<Scheduler>();
	auto source = Readable::From(scheduler, Chunks({"1", "2", "3", "4", "5"}));
	auto slow_sink = std::make_shared<CollectorSink>();
	auto fast_sink = std::make_shared<CollectorSink>();
	auto slow = std::make_shared<Writable>(scheduler, slow_sink, WithHighWaterMark(1));
	auto fast = std::make_shared<Writable>(scheduler, fast_sink);
	(void)Pipe(source, slow);
	(void)Pipe(source, fast);
	scheduler->Run();
	ASSERT_EQUAL("test_pipe_fan_out slow", std::string("12345"), slow_sink->ToString());
	ASSERT_EQUAL("test_pipe_fan_out fast", std::string("12345"), fast_sink->ToString());
	ASSERT_TRUE("test_pipe_fan_out slow finished", slow->IsFinished());
	ASSERT_TRUE("test_pipe_fan_out fast finished", fast->IsFinished());
	RETURN_TEST("test_pipe_fan_out", 0);
}

int test_pipe_destination_closed_early() {
	auto scheduler = std::make_shared<Scheduler>();
	auto source = std::make_shared<Readable>(scheduler);
	auto destination = std::make_shared<Writable>(scheduler, CollectorSink());
	int source_errors = 0;
	source->OnError([&source_errors](const ErrorPointer&) { ++source_errors; });
	(void)Pipe(source, destination);
	(void)source->Push(Chunk("data"));
	scheduler->Run();
	destination->Destroy();
	scheduler->Run();
	ASSERT_TRUE("test_pipe_destination_closed_early source destroyed", source->IsDestroyed());
	ASSERT_FALSE("test_pipe_destination_closed_early no error", source->IsErrored());
	ASSERT_EQUAL("test_pipe_destination_closed_early no error event", 0, source_errors);
	RETURN_TEST("test_pipe_destination_closed_early", 0);
}

int test_pipe_ended_source_ends_destination() {
	auto scheduler = std::make_shared<Scheduler>();
	auto source = Readable::From(scheduler, Chunks({"ab"}));
	std::string consumed;
	source->OnData([&consumed](const Chunk& chunk) { consumed += chunk.ToString(); });
	scheduler->Run();
	ASSERT_TRUE("test_pipe_ended_source_ends_destination source ended", source->IsEnded());

	auto sink = std::make_shared<CollectorSink>();
	auto destination = std::make_shared<Writable>(scheduler, sink);
	auto handle = Pipe(source, destination);
	scheduler->Run();
	ASSERT_EQUAL("test_pipe_ended_source_ends_destination consumed", std::string("ab"), consumed);
	ASSERT_TRUE("test_pipe_ended_source_ends_destination finished", destination->IsFinished());
	ASSERT_TRUE("test_pipe_ended_source_ends_destination finalized", sink->Finalized());
	ASSERT_TRUE("test_pipe_ended_source_ends_destination nothing written", sink->Chunks().empty());
	ASSERT_FALSE("test_pipe_ended_source_ends_destination inactive", handle->IsActive());
	RETURN_TEST("test_pipe_ended_source_ends_destination", 0);
}

int test_pipe_onto_destroyed_destination() {
	auto scheduler = std::make_shared<Scheduler>();
	auto source = std::make_shared<Readable>(scheduler);
	(void)source->Push(Chunk("lost"));
	auto destination = std::make_shared<Writable>(scheduler, CollectorSink());
	auto fault = std::make_shared<SinkFault>(SinkFault("device gone"));
	destination->Destroy(fault);
	auto handle = Pipe(source, destination);
	scheduler->Run();
	ASSERT_TRUE("test_pipe_onto_destroyed_destination source errored", source->IsErrored());
	ASSERT_TRUE("test_pipe_onto_destroyed_destination same error", source->GetError() == destination->GetError());
	ASSERT_FALSE("test_pipe_onto_destroyed_destination inactive", handle->IsActive());
	RETURN_TEST("test_pipe_onto_destroyed_destination", 0);
}

int test_pipe_destination_destroyed_without_close() {
	auto scheduler = std::make_shared<Scheduler>();
	int pulls = 0;
	auto source = std::make_shared<Readable>(scheduler, FunctionSource([&pulls]() -> SourceResult {
		if (pulls == 5)
			return std::optional<Chunk>();
		++pulls;
		return std::optional<Chunk>(Chunk("chunk"));
	}));
	Options quiet;
	quiet.emit_close = false;
	auto sink = std::make_shared<CollectorSink>();
	auto destination = std::make_shared<Writable>(scheduler, sink, quiet);
	auto handle = Pipe(source, destination);
	destination->Destroy();
	scheduler->Run();
	ASSERT_TRUE("test_pipe_destination_destroyed_without_close source destroyed", source->IsDestroyed());
	ASSERT_FALSE("test_pipe_destination_destroyed_without_close no error", source->IsErrored());
	ASSERT_FALSE("test_pipe_destination_destroyed_without_close not ended", source->IsEnded());
	ASSERT_TRUE("test_pipe_destination_destroyed_without_close nothing delivered", sink->Chunks().empty());
	ASSERT_FALSE("test_pipe_destination_destroyed_without_close inactive", handle->IsActive());
	RETURN_TEST("test_pipe_destination_destroyed_without_close", 0);
}

int test_pipe_source_destroyed_without_close() {
	auto scheduler = std::make_shared<Scheduler>();
	Options quiet;
	quiet.emit_close = false;
	auto source = std::make_shared<Readable>(scheduler, quiet);
	auto destination = std::make_shared<Writable>(scheduler, CollectorSink());
	auto handle = Pipe(source, destination);
	(void)source->Push(Chunk("partial"));
	scheduler->Run();
	source->Destroy();
	scheduler->Run();
	ASSERT_TRUE("test_pipe_source_destroyed_without_close destination destroyed", destination->IsDestroyed());
	ASSERT_FALSE("test_pipe_source_destroyed_without_close destination not ending", destination->IsEnding());
	ASSERT_FALSE("test_pipe_source_destroyed_without_close destination not finished", destination->IsFinished());
	ASSERT_FALSE("test_pipe_source_destroyed_without_close inactive", handle->IsActive());
	RETURN_TEST("test_pipe_source_destroyed_without_close", 0);
}

int test_pipe_resumes_paused_source() {
	auto scheduler = std::make_shared<Scheduler>();
	auto source = Readable::From(scheduler, Chunks({"p"}));
	source->Pause();
	auto sink = std::make_shared<CollectorSink>();
	auto destination = std::make_shared<Writable>(scheduler, sink);
	(void)Pipe(source, destination);
	ASSERT_TRUE("test_pipe_resumes_paused_source flowing", source->IsFlowing());
	scheduler->Run();
	ASSERT_EQUAL("test_pipe_resumes_paused_source content", std::string("p"), sink->ToString());
	RETURN_TEST("test_pipe_resumes_paused_source", 0);
}

int main() {
	int result = 0;
	result += test_pipe_simple();
	result += test_pipe_pulled_source_bounded();
	result += test_pipe_backpressure_pauses_source();
	result += test_pipe_sink_fault_stops_source();
	result += test_pipe_source_fault_reaches_destination();
	result += test_pipe_unpipe();
	result += test_pipe_without_end();
	result += test_pipe_through_transform();
	result += test_pipe_fan_out();
	result += test_pipe_destination_closed_early();
	result += test_pipe_ended_source_ends_destination();
	result += test_pipe_onto_destroyed_destination();
	result += test_pipe_destination_destroyed_without_close();
	result += test_pipe_source_destroyed_without_close();
	result += test_pipe_resumes_paused_source();

	if (result == 0) {
		std::cout << "Pipe tests passed!" << std::endl;
	} else {
		std::cout << result << " Pipe tests failed." << std::endl;
	}
	return result;
}
