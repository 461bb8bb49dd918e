/*
 * MemoryJobStore.cpp
 *
 *  Created on: 2026年10月16日
 */

#include "MemoryJobStore.hpp"

#include <algorithm>

MemoryJobStore::MemoryJobStore(std::chrono::seconds retention) :
		retention(retention)
{
	if (retention.count() <= 0) {
		throw std::invalid_argument("result retention must be positive");
	}
}

void MemoryJobStore::purge_expired_locked(clock::time_point now)
{
	for (auto it = jobs.begin(); it != jobs.end();) {
		if (it->second.expires_at.has_value() && it->second.expires_at.value() <= now) {
			it = jobs.erase(it);
		} else {
			++it;
		}
	}
}

void MemoryJobStore::create(const Job & job)
{
	{
		std::lock_guard<std::mutex> lck(mtx);
		if (closed) {
			throw std::runtime_error("job store is closed");
		}
		purge_expired_locked(clock::now());
		if (jobs.count(job.id) != 0) {
			throw std::invalid_argument("duplicate job id: " + job.id);
		}
		Entry entry;
		entry.job = job;
		jobs.emplace(job.id, std::move(entry));
		queue.push_back(job.id);
	}
	queue_cond.notify_one();
}

JobStore::optional<std::string> MemoryJobStore::dequeue(std::chrono::milliseconds wait)
{
	std::unique_lock<std::mutex> lck(mtx);
	queue_cond.wait_for(lck, wait, [this]() {
		return closed || !queue.empty();
	});
	if (closed || queue.empty()) {
		return optional<std::string>();
	}
	std::string job_id = std::move(queue.front());
	queue.pop_front();
	return optional<std::string>(std::move(job_id));
}

bool MemoryJobStore::remove_from_queue(const std::string & job_id)
{
	std::lock_guard<std::mutex> lck(mtx);
	auto it = std::find(queue.begin(), queue.end(), job_id);
	if (it == queue.end()) {
		return false;
	}
	queue.erase(it);
	return true;
}

void MemoryJobStore::requeue(const std::string & job_id)
{
	{
		std::lock_guard<std::mutex> lck(mtx);
		if (closed) {
			throw std::runtime_error("job store is closed");
		}
		queue.push_front(job_id);
	}
	queue_cond.notify_one();
}

JobStore::optional<Job> MemoryJobStore::load(const std::string & job_id)
{
	std::lock_guard<std::mutex> lck(mtx);
	purge_expired_locked(clock::now());
	auto it = jobs.find(job_id);
	if (it == jobs.end()) {
		return optional<Job>();
	}
	return optional<Job>(it->second.job);
}

bool MemoryJobStore::transition(const std::string & job_id, JobState from, const JobTransition & transition)
{
	std::lock_guard<std::mutex> lck(mtx);
	const clock::time_point now = clock::now();
	purge_expired_locked(now);
	auto it = jobs.find(job_id);
	if (it == jobs.end() || it->second.job.state != from) {
		return false;
	}
	apply_transition(it->second.job, transition);
	if (is_terminal(transition.to)) {
		it->second.expires_at = now + retention;
	}
	return true;
}

void MemoryJobStore::request_cancel(const std::string & job_id)
{
	std::lock_guard<std::mutex> lck(mtx);
	auto it = jobs.find(job_id);
	if (it != jobs.end()) {
		it->second.cancel_requested = true;
	}
}

bool MemoryJobStore::cancel_requested(const std::string & job_id)
{
	std::lock_guard<std::mutex> lck(mtx);
	auto it = jobs.find(job_id);
	return it != jobs.end() && it->second.cancel_requested;
}

size_t MemoryJobStore::queued_count()
{
	std::lock_guard<std::mutex> lck(mtx);
	return queue.size();
}

void MemoryJobStore::close()
{
	{
		std::lock_guard<std::mutex> lck(mtx);
		closed = true;
	}
	queue_cond.notify_all();
}

size_t MemoryJobStore::size()
{
	std::lock_guard<std::mutex> lck(mtx);
	purge_expired_locked(clock::now());
	return jobs.size();
}
