#include <StormByte/stream/transform.hxx>
#include <StormByte/test_handlers.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using StormByte::Stream::Chunk;
using StormByte::Stream::Error;
using StormByte::Stream::ErrorPointer;
using StormByte::Stream::Options;
using StormByte::Stream::ProtocolViolation;
using StormByte::Stream::Scheduler;
using StormByte::Stream::Transform;
using StormByte::Stream::TransformCallback;
using StormByte::Stream::TransformResult;

namespace {
	TransformResult Uppercase(const Chunk& chunk) {
		std::string text = chunk.ToString();
		std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
		return std::vector<Chunk>{Chunk(text)};
	}
}

int test_transform_uppercase() {
	auto scheduler = std::make_shared<Scheduler>();
	auto transform = std::make_shared<Transform>(scheduler, Uppercase);
	std::string output;
	int ends = 0;
	int closes = 0;
	transform->OnData([&output](const Chunk& chunk) { output += chunk.ToString(); });
	transform->OnEnd([&ends]() { ++ends; });
	transform->OnClose([&closes]() { ++closes; });
	(void)transform->Write(Chunk("hello "));
	(void)transform->Write(Chunk("world"));
	(void)transform->End();
	scheduler->Run();
	ASSERT_EQUAL("test_transform_uppercase output", std::string("HELLO WORLD"), output);
	ASSERT_EQUAL("test_transform_uppercase end once", 1, ends);
	ASSERT_TRUE("test_transform_uppercase finished", transform->IsFinished());
	ASSERT_EQUAL("test_transform_uppercase close once", 1, closes);
	ASSERT_EQUAL("test_transform_uppercase kind", std::string("Transform"), std::string(transform->Kind()));
	RETURN_TEST("test_transform_uppercase", 0);
}

int test_transform_async_completion() {
	auto scheduler = std::make_shared<Scheduler>();
	std::vector<std::thread> workers;
	auto transform = std::make_shared<Transform>(scheduler, [&workers](const Chunk& chunk, TransformCallback done) {
		// Completes after returning, from another thread
		workers.emplace_back([copy = chunk, done = std::move(done)]() {
			std::this_thread::sleep_for(std::chrono::milliseconds(2));
			done(std::vector<Chunk>{Chunk("[" + copy.ToString() + "]")});
		});
	});
	std::string output;
	bool ended = false;
	transform->OnData([&output](const Chunk& chunk) { output += chunk.ToString(); });
	transform->OnEnd([&ended]() { ended = true; });
	(void)transform->Write(Chunk("a"));
	(void)transform->Write(Chunk("b"));
	(void)transform->Write(Chunk("c"));
	(void)transform->End();
	scheduler->RunUntil([&ended]() { return ended; });
	for (auto& worker: workers)
		worker.join();
	ASSERT_EQUAL("test_transform_async_completion order", std::string("[a][b][c]"), output);
	ASSERT_EQUAL("test_transform_async_completion workers", static_cast<std::size_t>(3), workers.size());
	RETURN_TEST("test_transform_async_completion", 0);
}

int test_transform_zero_or_many_outputs() {
	auto scheduler = std::make_shared<Scheduler>();
	auto transform = std::make_shared<Transform>(scheduler, [](const Chunk& chunk) -> TransformResult {
		std::vector<Chunk> outputs;
		const std::string text = chunk.ToString();
		if (text == "skip")
			return outputs;
		for (char c: text)
			outputs.emplace_back(std::string(1, c));
		return outputs;
	});
	std::vector<std::string> received;
	transform->OnData([&received](const Chunk& chunk) { received.push_back(chunk.ToString()); });
	(void)transform->Write(Chunk("ab"));
	(void)transform->Write(Chunk("skip"));
	(void)transform->Write(Chunk("c"));
	(void)transform->End();
	scheduler->Run();
	ASSERT_EQUAL("test_transform_zero_or_many_outputs count", static_cast<std::size_t>(3), received.size());
	ASSERT_EQUAL("test_transform_zero_or_many_outputs first", std::string("a"), received[0]);
	ASSERT_EQUAL("test_transform_zero_or_many_outputs second", std::string("b"), received[1]);
	ASSERT_EQUAL("test_transform_zero_or_many_outputs third", std::string("c"), received[2]);
	ASSERT_TRUE("test_transform_zero_or_many_outputs ended", transform->IsEnded());
	RETURN_TEST("test_transform_zero_or_many_outputs", 0);
}

int test_transform_flush() {
	auto scheduler = std::make_shared<Scheduler>();
	std::size_t total = 0;
	auto transform = std::make_shared<Transform>(scheduler,
		[&total](const Chunk& chunk) -> TransformResult {
			total += chunk.Size();
			return std::vector<Chunk>{};
		},
		[&total]() -> TransformResult {
			return std::vector<Chunk>{Chunk("total=" + std::to_string(total))};
		});
	std::string output;
	std::vector<std::string> events;
	transform->OnData([&output](const Chunk& chunk) { output += chunk.ToString(); });
	transform->OnEnd([&events]() { events.push_back("end"); });
	transform->OnFinish([&events]() { events.push_back("finish"); });
	(void)transform->Write(Chunk("12345"));
	(void)transform->Write(Chunk("678"));
	(void)transform->End();
	scheduler->Run();
	ASSERT_EQUAL("test_transform_flush output", std::string("total=8"), output);
	ASSERT_EQUAL("test_transform_flush events", static_cast<std::size_t>(2), events.size());
	ASSERT_EQUAL("test_transform_flush finish first", std::string("finish"), events[0]);
	ASSERT_EQUAL("test_transform_flush then end", std::string("end"), events[1]);
	RETURN_TEST("test_transform_flush", 0);
}

int test_transform_error_destroys() {
	auto scheduler = std::make_shared<Scheduler>();
	int calls = 0;
	auto transform = std::make_shared<Transform>(scheduler, [&calls](const Chunk& chunk) -> TransformResult {
		++calls;
		if (chunk.ToString() == "bad")
			return StormByte::Unexpected(Error("Parser", "bad input"));
		return std::vector<Chunk>{chunk};
	});
	std::string output;
	ErrorPointer reported;
	int errors = 0;
	transform->OnData([&output](const Chunk& chunk) { output += chunk.ToString(); });
	transform->OnError([&](const ErrorPointer& error) { reported = error; ++errors; });
	(void)transform->Write(Chunk("good"));
	(void)transform->Write(Chunk("bad"));
	(void)transform->Write(Chunk("never"));
	scheduler->Run();
	ASSERT_EQUAL("test_transform_error_destroys calls", 2, calls);
	ASSERT_EQUAL("test_transform_error_destroys output", std::string("good"), output);
	ASSERT_EQUAL("test_transform_error_destroys error once", 1, errors);
	ASSERT_TRUE("test_transform_error_destroys same error", reported != nullptr && std::string(reported->what()).find("bad input") != std::string::npos);
	ASSERT_TRUE("test_transform_error_destroys errored", transform->IsErrored());
	auto write = transform->Write(Chunk("late"));
	ASSERT_TRUE("test_transform_error_destroys write after", !write && dynamic_cast<ProtocolViolation*>(write.error().get()) != nullptr);
	RETURN_TEST("test_transform_error_destroys", 0);
}

int test_transform_flush_error_destroys() {
	auto scheduler = std::make_shared<Scheduler>();
	auto transform = std::make_shared<Transform>(scheduler, Uppercase, []() -> TransformResult {
		return StormByte::Unexpected(Error("Flush", "truncated input"));
	});
	int errors = 0;
	int finishes = 0;
	transform->OnData([](const Chunk&) {});
	transform->OnError([&errors](const ErrorPointer&) { ++errors; });
	transform->OnFinish([&finishes]() { ++finishes; });
	(void)transform->Write(Chunk("x"));
	(void)transform->End();
	scheduler->Run();
	ASSERT_EQUAL("test_transform_flush_error_destroys error", 1, errors);
	ASSERT_EQUAL("test_transform_flush_error_destroys no finish", 0, finishes);
	ASSERT_FALSE("test_transform_flush_error_destroys not ended", transform->IsEnded());
	RETURN_TEST("test_transform_flush_error_destroys", 0);
}

int test_transform_slow_reader_stops_writer() {
	auto scheduler = std::make_shared<Scheduler>();
	Options readable_options;
	readable_options.high_water_mark = 4;
	Options writable_options;
	writable_options.high_water_mark = 100;
	int calls = 0;
	auto transform = std::make_shared<Transform>(scheduler,
		[&calls](const Chunk& chunk, TransformCallback done) {
			++calls;
			done(Uppercase(chunk));
		},
		nullptr, readable_options, writable_options);
	int drains = 0;
	transform->OnDrain([&drains]() { ++drains; });

	ASSERT_TRUE("test_transform_slow_reader_stops_writer first", transform->Write(Chunk("abcd")).value());
	scheduler->Run();
	ASSERT_EQUAL("test_transform_slow_reader_stops_writer output held", static_cast<std::size_t>(4), transform->ReadableBytes());

	// The readable side is full: the writer is told to wait
	ASSERT_FALSE("test_transform_slow_reader_stops_writer second", transform->Write(Chunk("efgh")).value());
	scheduler->Run();
	ASSERT_EQUAL("test_transform_slow_reader_stops_writer one call", 1, calls);
	// Queued input plus the one still held in flight
	ASSERT_EQUAL("test_transform_slow_reader_stops_writer input queued", static_cast<std::size_t>(8), transform->WritableBytes());

	auto first = transform->Read();
	ASSERT_EQUAL("test_transform_slow_reader_stops_writer first read", std::string("ABCD"), first.value()->ToString());
	scheduler->Run();
	ASSERT_EQUAL("test_transform_slow_reader_stops_writer resumed", 2, calls);
	ASSERT_EQUAL("test_transform_slow_reader_stops_writer drain once", 1, drains);
	auto second = transform->Read();
	ASSERT_EQUAL("test_transform_slow_reader_stops_writer second read", std::string("EFGH"), second.value()->ToString());
	RETURN_TEST("test_transform_slow_reader_stops_writer", 0);
}

int test_transform_double_completion_ignored() {
	auto scheduler = std::make_shared<Scheduler>();
	auto transform = std::make_shared<Transform>(scheduler, [](const Chunk& chunk, TransformCallback done) {
		done(std::vector<Chunk>{chunk});
		done(std::vector<Chunk>{Chunk("duplicate")});
	});
	std::string output;
	transform->OnData([&output](const Chunk& chunk) { output += chunk.ToString(); });
	(void)transform->Write(Chunk("x"));
	(void)transform->Write(Chunk("y"));
	(void)transform->End();
	scheduler->Run();
	ASSERT_EQUAL("test_transform_double_completion_ignored", std::string("xy"), output);
	ASSERT_TRUE("test_transform_double_completion_ignored ended", transform->IsEnded());
	RETURN_TEST("test_transform_double_completion_ignored", 0);
}

int main() {
	int result = 0;
	result += test_transform_uppercase();
	result += test_transform_async_completion();
	result += test_transform_zero_or_many_outputs();
	result += test_transform_flush();
	result += test_transform_error_destroys();
	result += test_transform_flush_error_destroys();
	result += test_transform_slow_reader_stops_writer();
	result += test_transform_double_completion_ignored();

	if (result == 0) {
		std::cout << "Transform tests passed!" << std::endl;
	} else {
		std::cout << result << " Transform tests failed." << std::endl;
	}
	return result;
}
