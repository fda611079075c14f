#include <StormByte/stream/scheduler.hxx>

using namespace StormByte::Stream;

bool Scheduler::IsStopped() const noexcept {
	std::scoped_lock<std::mutex> lock(m_mutex);
	return m_stopped;
}

std::size_t Scheduler::Pending() const noexcept {
	std::scoped_lock<std::mutex> lock(m_mutex);
	return m_tasks.size();
}

void Scheduler::Post(Task&& task) {
	{
		std::scoped_lock<std::mutex> lock(m_mutex);
		m_tasks.push_back(std::move(task));
	}
	m_cv.notify_all();
}

void Scheduler::Post(const Task& task) {
	Post(Task(task));
}

void Scheduler::Restart() noexcept {
	std::scoped_lock<std::mutex> lock(m_mutex);
	m_stopped = false;
}

std::size_t Scheduler::Run() {
	std::size_t executed = 0;
	Task task;
	while (Next(task, false)) {
		task();
		++executed;
	}
	return executed;
}

bool Scheduler::RunOne() {
	Task task;
	if (!Next(task, false))
		return false;
	task();
	return true;
}

std::size_t Scheduler::RunUntil(const std::function<bool()>& done) {
	std::size_t executed = 0;
	Task task;
	while (!done()) {
		if (!Next(task, true))
			break;
		task();
		++executed;
	}
	return executed;
}

void Scheduler::Stop() noexcept {
	{
		std::scoped_lock<std::mutex> lock(m_mutex);
		m_stopped = true;
	}
	m_cv.notify_all();
}

bool Scheduler::Next(Task& task, bool wait) {
	std::unique_lock<std::mutex> lock(m_mutex);
	if (wait)
		m_cv.wait(lock, [this] { return m_stopped || !m_tasks.empty(); });

	if (m_tasks.empty() || (wait && m_stopped))
		return false;

	task = std::move(m_tasks.front());
	m_tasks.pop_front();
	return true;
}
