#pragma once

#include <thread>
#include <atomic>
#include <mutex>
#include <chrono>
#include <list>
#include <time.h>
#include "timer.hpp"

class LinuxTimer : public Timer {
public:
	LinuxTimer() : m_counter_value(0), m_is_running(false), m_unique_id(0) {}
	~LinuxTimer() {
		stop();
	}

	void start() override
	{
		if (!m_is_running)
		{
			m_is_running = true;
			m_counter_value = 0;
			m_counter_thread = std::thread(timer_thread_func, this);
		}
	}

	void stop() override
	{
		if (m_is_running)
		{
			m_is_running = false;
			m_counter_thread.join();
			std::lock_guard<std::mutex> lock(m_mtx_schedules);
			m_schedules.clear();
		}
	}

	uint64_t get_counter() override
	{
		return m_counter_value;
	}

	TimerHandle add_schedule(TimerTask const &task_func, uint64_t target_count) override
	{
		std::lock_guard<std::mutex> lock(m_mtx_schedules);

		Schedule schedule;
		schedule.m_id = m_unique_id++;
		schedule.m_func = task_func;
		schedule.m_target_counter_value = target_count;

		// Keep the list in time order
		auto iter = m_schedules.begin();
		while (iter != m_schedules.end() && iter->m_target_counter_value <= target_count)
			iter++;
		m_schedules.insert(iter, schedule);

		return TimerHandle(schedule.m_id);
	}

	void cancel_schedule(TimerHandle &handle) override
	{
		if (!handle.has_value())
			return;

		std::lock_guard<std::mutex> lock(m_mtx_schedules);

		for (auto iter = m_schedules.begin(); iter != m_schedules.end(); iter++)
		{
			if (iter->m_id == *handle)
			{
				m_schedules.erase(iter);
				break;
			}
		}

		// Already fired schedules are no longer in the list
		handle.reset();
	}

private:
	static uint64_t time_now_ns() {
		struct timespec tp;
		clock_gettime(CLOCK_MONOTONIC, &tp);
		return (static_cast<uint64_t>(tp.tv_sec) * NS_PER_SEC) + tp.tv_nsec;
	}

	void run_due_schedules() {
		while (true)
		{
			// Release the lock before calling out so the task may add or cancel schedules
			Schedule schedule;
			{
				std::lock_guard<std::mutex> lock(m_mtx_schedules);
				if (m_schedules.empty() || m_schedules.front().m_target_counter_value > m_counter_value)
					break;
				schedule = m_schedules.front();
				m_schedules.pop_front();
			}

			if (schedule.m_func)
				schedule.m_func();
		}
	}

	static void timer_thread_func(LinuxTimer *parent) {
		uint64_t last_t = time_now_ns();

		while (parent->m_is_running) {
			uint64_t t = time_now_ns();
			unsigned int msec = (t - last_t) / NS_PER_MSEC;

			// More than one tick may have elapsed since the last wake-up
			for (unsigned int k = 0; k < msec; k++)
			{
				parent->m_counter_value++;
				parent->run_due_schedules();
			}
			last_t += static_cast<uint64_t>(msec) * NS_PER_MSEC;

			std::this_thread::sleep_for(std::chrono::milliseconds(1));
		}
	}

	static constexpr uint64_t NS_PER_SEC  = 1000000000UL;
	static constexpr uint64_t NS_PER_MSEC = (NS_PER_SEC/1000);

	std::thread m_counter_thread;
	std::atomic<uint64_t> m_counter_value;
	std::atomic<bool> m_is_running;

	struct Schedule
	{
		TimerTask m_func;
		unsigned int m_id;
		uint64_t m_target_counter_value;
	};

	std::list<Schedule> m_schedules;
	std::mutex m_mtx_schedules;
	unsigned int m_unique_id;
};
