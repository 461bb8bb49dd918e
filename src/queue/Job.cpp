/*
 * Job.cpp
 *
 *  Created on: 2026年10月16日
 */

#include "Job.hpp"

#include <ctime>

#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace
{
	const std::string & required_field(const std::map<std::string, std::string> & fields, const char * name)
	{
		auto it = fields.find(name);
		if (it == fields.end()) {
			throw std::invalid_argument(std::string("job record has no field: ") + name);
		}
		return it->second;
	}

	template <typename Type>
	Type numeric_field(const std::map<std::string, std::string> & fields, const char * name)
	{
		try {
			return boost::lexical_cast<Type>(required_field(fields, name));
		} catch (const boost::bad_lexical_cast &) {
			throw std::invalid_argument(std::string("job record field is not a number: ") + name);
		}
	}

	Job::optional<Job::clock::time_point> optional_time_field(const std::map<std::string, std::string> & fields, const char * name)
	{
		auto it = fields.find(name);
		if (it == fields.end() || it->second.empty()) {
			return Job::optional<Job::clock::time_point>();
		}
		return Job::optional<Job::clock::time_point>(from_epoch_ms(numeric_field<long long>(fields, name)));
	}

} /* namespace */

long long to_epoch_ms(Job::clock::time_point time)
{
	return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

Job::clock::time_point from_epoch_ms(long long ms)
{
	return Job::clock::time_point(std::chrono::duration_cast<Job::clock::duration>(std::chrono::milliseconds(ms)));
}

std::string format_timestamp(Job::clock::time_point time)
{
	const long long ms = to_epoch_ms(time);
	std::time_t seconds = static_cast<std::time_t>(ms / 1000);
	std::tm tm;
	gmtime_r(&seconds, &tm);
	char buf[32];
	std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
	return (boost::format("%s.%03dZ") % buf % (ms % 1000)).str();
}

nlohmann::json Job::status_json() const
{
	nlohmann::json j = {
		{ "jobId", id },
		{ "state", getJobStateName(state) },
		{ "language", language },
		{ "enqueuedAt", format_timestamp(enqueued_at) },
	};
	if (started_at.has_value()) {
		j["startedAt"] = format_timestamp(started_at.value());
	}
	if (ended_at.has_value()) {
		j["endedAt"] = format_timestamp(ended_at.value());
	}
	if (!worker.empty()) {
		j["worker"] = worker;
	}
	if (error_category != ErrorCategory::NONE) {
		j["errorCategory"] = getErrorCategoryName(error_category);
		j["error"] = error;
	}
	return j;
}

std::map<std::string, std::string> Job::to_fields() const
{
	std::map<std::string, std::string> fields = {
		{ "id", id },
		{ "language", language },
		{ "code", code },
		{ "stdin", stdin_data },
		{ "timeout", boost::lexical_cast<std::string>(limits.timeout.count()) },
		{ "memory_mb", boost::lexical_cast<std::string>(limits.memory_mb) },
		{ "state", getJobStateName(state) },
		{ "enqueued_at", boost::lexical_cast<std::string>(to_epoch_ms(enqueued_at)) },
		{ "error_category", getErrorCategoryName(error_category) },
		{ "error", error },
		{ "worker", worker },
	};
	if (started_at.has_value()) {
		fields["started_at"] = boost::lexical_cast<std::string>(to_epoch_ms(started_at.value()));
	}
	if (ended_at.has_value()) {
		fields["ended_at"] = boost::lexical_cast<std::string>(to_epoch_ms(ended_at.value()));
	}
	if (result.has_value()) {
		fields["result"] = result.value().to_json().dump();
	}
	return fields;
}

Job Job::from_fields(const std::map<std::string, std::string> & fields)
{
	Job job;
	job.id = required_field(fields, "id");
	job.language = required_field(fields, "language");
	job.code = required_field(fields, "code");
	job.stdin_data = required_field(fields, "stdin");
	job.limits.timeout = std::chrono::seconds(numeric_field<long long>(fields, "timeout"));
	job.limits.memory_mb = numeric_field<int>(fields, "memory_mb");
	job.state = parseJobState(required_field(fields, "state"));
	job.enqueued_at = from_epoch_ms(numeric_field<long long>(fields, "enqueued_at"));
	job.started_at = optional_time_field(fields, "started_at");
	job.ended_at = optional_time_field(fields, "ended_at");

	auto result_it = fields.find("result");
	if (result_it != fields.end() && !result_it->second.empty()) {
		try {
			job.result = optional<ExecutionResult>(ExecutionResult::from_json(nlohmann::json::parse(result_it->second)));
		} catch (const nlohmann::json::exception & e) {
			throw std::invalid_argument(std::string("job record has a malformed result: ") + e.what());
		}
	}

	auto category_it = fields.find("error_category");
	if (category_it != fields.end()) {
		job.error_category = parseErrorCategory(category_it->second);
	}
	auto error_it = fields.find("error");
	if (error_it != fields.end()) {
		job.error = error_it->second;
	}
	auto worker_it = fields.find("worker");
	if (worker_it != fields.end()) {
		job.worker = worker_it->second;
	}
	return job;
}

std::string Job::generate_id()
{
	static thread_local boost::uuids::random_generator generator;
	return boost::uuids::to_string(generator());
}

void apply_transition(Job & job, const JobTransition & transition)
{
	job.state = transition.to;
	if (transition.to == JobState::STARTED) {
		job.started_at = Job::optional<Job::clock::time_point>(transition.at);
	}
	if (is_terminal(transition.to)) {
		job.ended_at = Job::optional<Job::clock::time_point>(transition.at);
	}
	if (transition.result.has_value()) {
		job.result = transition.result;
	}
	if (transition.error_category != ErrorCategory::NONE) {
		job.error_category = transition.error_category;
		job.error = transition.error;
	}
	if (!transition.worker.empty()) {
		job.worker = transition.worker;
	}
}
