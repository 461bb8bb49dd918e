/*
 * RedisJobStore.cpp
 *
 *  Created on: 2026年10月16日
 */

#include "RedisJobStore.hpp"
#include "logger.hpp"

#include <algorithm>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>
#include <kerbal/redis_v2/all.hpp>

namespace
{
	/// 不存在同名记录时写入 job 记录并入队
	const char create_script[] = R"===(
		if redis.call('exists', KEYS[1]) == 1 then
			return 0
		end
		local fields = {}
		for i = 2, #ARGV do
			fields[#fields + 1] = ARGV[i]
		end
		redis.call('hmset', KEYS[1], unpack(fields))
		redis.call('rpush', KEYS[2], ARGV[1])
		return 1
	)===";

	/// 当前状态等于 ARGV[1] 时写入字段, ARGV[2] 大于 0 时设置保留期
	const char transition_script[] = R"===(
		if redis.call('hget', KEYS[1], 'state') ~= ARGV[1] then
			return 0
		end
		local fields = {}
		for i = 3, #ARGV do
			fields[#fields + 1] = ARGV[i]
		end
		redis.call('hmset', KEYS[1], unpack(fields))
		local ttl = tonumber(ARGV[2])
		if ttl > 0 then
			redis.call('expire', KEYS[1], ttl)
			redis.call('expire', KEYS[2], ttl)
		end
		return 1
	)===";

	/// job 存在时才记录取消请求
	const char cancel_script[] = R"===(
		if redis.call('exists', KEYS[1]) == 0 then
			return 0
		end
		redis.call('set', KEYS[2], '1', 'EX', ARGV[1])
		return 1
	)===";

	/// 取消请求至少保留这么久, 足够覆盖任何一次执行
	constexpr std::chrono::seconds cancel_flag_ttl(3600);

	std::string reply_string(const redisReply * r)
	{
		return std::string(r->str, r->len);
	}

	void append_fields(std::vector<std::string> & argv, const std::map<std::string, std::string> & fields)
	{
		for (const auto & [name, value] : fields) {
			argv.push_back(name);
			argv.push_back(value);
		}
	}

	std::map<std::string, std::string> transition_fields(const JobTransition & transition)
	{
		const std::string at = boost::lexical_cast<std::string>(to_epoch_ms(transition.at));
		std::map<std::string, std::string> fields = {
			{ "state", getJobStateName(transition.to) },
		};
		if (transition.to == JobState::STARTED) {
			fields["started_at"] = at;
		}
		if (is_terminal(transition.to)) {
			fields["ended_at"] = at;
		}
		if (transition.result.has_value()) {
			fields["result"] = transition.result.value().to_json().dump();
		}
		if (transition.error_category != ErrorCategory::NONE) {
			fields["error_category"] = getErrorCategoryName(transition.error_category);
			fields["error"] = transition.error;
		}
		if (!transition.worker.empty()) {
			fields["worker"] = transition.worker;
		}
		return fields;
	}

} /* namespace */

RedisEndpoint RedisEndpoint::parse(const std::string & url)
{
	static const std::string scheme = "redis://";
	if (!boost::algorithm::starts_with(url, scheme)) {
		throw std::invalid_argument("redis url must start with redis://, got: " + url);
	}
	RedisEndpoint endpoint;
	std::string rest = url.substr(scheme.size());

	std::string::size_type at = rest.rfind('@');
	if (at != std::string::npos) {
		std::string credentials = rest.substr(0, at);
		rest = rest.substr(at + 1);
		std::string::size_type colon = credentials.find(':');
		endpoint.password = colon == std::string::npos ? credentials : credentials.substr(colon + 1);
	}

	std::string::size_type slash = rest.find('/');
	if (slash != std::string::npos) {
		std::string db = rest.substr(slash + 1);
		rest = rest.substr(0, slash);
		if (!db.empty()) {
			try {
				endpoint.db = boost::lexical_cast<int>(db);
			} catch (const boost::bad_lexical_cast &) {
				throw std::invalid_argument("invalid redis database index: " + db);
			}
		}
	}

	std::string::size_type colon = rest.rfind(':');
	if (colon != std::string::npos) {
		std::string port = rest.substr(colon + 1);
		rest = rest.substr(0, colon);
		try {
			endpoint.port = boost::lexical_cast<int>(port);
		} catch (const boost::bad_lexical_cast &) {
			throw std::invalid_argument("invalid redis port: " + port);
		}
		if (endpoint.port <= 0 || endpoint.port > 65535) {
			throw std::invalid_argument("invalid redis port: " + port);
		}
	}
	if (!rest.empty()) {
		endpoint.host = rest;
	}
	return endpoint;
}

RedisJobStore::RedisJobStore(const RedisEndpoint & endpoint, const std::string & queue_name, std::chrono::seconds retention, size_t pool_size) :
		endpoint(endpoint), queue_name(queue_name), retention(retention), fetch_timeout(std::chrono::seconds(10)),
		pool(pool_size, [this]() {
			return this->connect();
		}), closed(false)
{
	if (queue_name.empty()) {
		throw std::invalid_argument("queue name is empty");
	}
	if (retention.count() <= 0) {
		throw std::invalid_argument("result retention must be positive");
	}
	// 启动时即确认 redis 可用
	this->execute({ "PING" });
}

std::string RedisJobStore::job_key(const std::string & job_id) const
{
	return queue_name + ":job:" + job_id;
}

std::string RedisJobStore::queue_key() const
{
	return queue_name + ":queue";
}

std::string RedisJobStore::cancel_key(const std::string & job_id) const
{
	return queue_name + ":cancel:" + job_id;
}

std::unique_ptr<kerbal::redis_v2::connection> RedisJobStore::connect() const
{
	std::unique_ptr<kerbal::redis_v2::connection> conn(new kerbal::redis_v2::connection(endpoint.host, endpoint.port));
	if (!*conn) {
		throw std::runtime_error("failed connect to redis at " + endpoint.host + ":" + std::to_string(endpoint.port));
	}
	if (!endpoint.password.empty()) {
		std::vector<std::string> argv = { "AUTH", endpoint.password };
		kerbal::redis_v2::reply reply = conn->argv_execute(argv.begin(), argv.end());
		if (reply.type() == kerbal::redis_v2::reply_type::ERROR) {
			throw std::runtime_error("redis authentication failed: " + std::string(reply->str, reply->len));
		}
	}
	if (endpoint.db != 0) {
		std::vector<std::string> argv = { "SELECT", std::to_string(endpoint.db) };
		kerbal::redis_v2::reply reply = conn->argv_execute(argv.begin(), argv.end());
		if (reply.type() == kerbal::redis_v2::reply_type::ERROR) {
			throw std::runtime_error("redis select failed: " + std::string(reply->str, reply->len));
		}
	}
	return conn;
}

kerbal::redis_v2::reply RedisJobStore::execute(const std::vector<std::string> & argv)
{
	constexpr int max_reconnect = 3;
	for (int attempt = 1;; ++attempt) {
		connection_pool::auto_revert_handle conn = pool.sync_fetch(fetch_timeout);
		if (!*conn) {
			conn.abandon();
			LOG_WARNING("", "Abandon broken redis connection, attempt: ", attempt);
			if (attempt >= max_reconnect) {
				throw std::runtime_error("redis connection lost");
			}
			continue;
		}
		kerbal::redis_v2::reply reply;
		try {
			reply = conn->argv_execute(argv.begin(), argv.end());
		} catch (...) {
			conn.abandon();
			throw;
		}
		if (reply.type() == kerbal::redis_v2::reply_type::ERROR) {
			throw std::runtime_error("redis command " + argv[0] + " failed: " + std::string(reply->str, reply->len));
		}
		return reply;
	}
}

void RedisJobStore::create(const Job & job)
{
	std::vector<std::string> argv = { "EVAL", create_script, "2", job_key(job.id), queue_key(), job.id };
	append_fields(argv, job.to_fields());
	kerbal::redis_v2::reply reply = this->execute(argv);
	if (reply.type() != kerbal::redis_v2::reply_type::INTEGER) {
		throw kerbal::redis_v2::unexpected_case_exception(reply.type(), argv.begin(), argv.begin() + 1);
	}
	if (reply->integer == 0) {
		throw std::invalid_argument("duplicate job id: " + job.id);
	}
}

JobStore::optional<std::string> RedisJobStore::dequeue(std::chrono::milliseconds wait)
{
	if (closed) {
		return optional<std::string>();
	}
	long long seconds = (wait.count() + 999) / 1000;
	if (seconds < 1) {
		seconds = 1;
	}
	std::vector<std::string> argv = { "BLPOP", queue_key(), std::to_string(seconds) };
	kerbal::redis_v2::reply reply = this->execute(argv);
	switch (reply.type()) {
		case kerbal::redis_v2::reply_type::NIL:
			return optional<std::string>();
		case kerbal::redis_v2::reply_type::ARRAY:
			if (reply->elements == 2) {
				return optional<std::string>(reply_string(reply->element[1]));
			}
			break;
		default:
			break;
	}
	throw kerbal::redis_v2::unexpected_case_exception(reply.type(), argv.begin(), argv.end());
}

bool RedisJobStore::remove_from_queue(const std::string & job_id)
{
	kerbal::redis_v2::reply reply = this->execute({ "LREM", queue_key(), "0", job_id });
	return reply.type() == kerbal::redis_v2::reply_type::INTEGER && reply->integer > 0;
}

void RedisJobStore::requeue(const std::string & job_id)
{
	// BLPOP 从左端取出, 放回左端即回到队首
	this->execute({ "LPUSH", queue_key(), job_id });
}

JobStore::optional<Job> RedisJobStore::load(const std::string & job_id)
{
	std::vector<std::string> argv = { "HGETALL", job_key(job_id) };
	kerbal::redis_v2::reply reply = this->execute(argv);
	if (reply.type() != kerbal::redis_v2::reply_type::ARRAY) {
		throw kerbal::redis_v2::unexpected_case_exception(reply.type(), argv.begin(), argv.end());
	}
	if (reply->elements == 0) {
		return optional<Job>();
	}
	std::map<std::string, std::string> fields;
	for (size_t i = 0; i + 1 < reply->elements; i += 2) {
		fields[reply_string(reply->element[i])] = reply_string(reply->element[i + 1]);
	}
	return optional<Job>(Job::from_fields(fields));
}

bool RedisJobStore::transition(const std::string & job_id, JobState from, const JobTransition & transition)
{
	const long long ttl = is_terminal(transition.to) ? retention.count() : 0;
	std::vector<std::string> argv = {
		"EVAL", transition_script, "2", job_key(job_id), cancel_key(job_id),
		getJobStateName(from), std::to_string(ttl)
	};
	append_fields(argv, transition_fields(transition));
	kerbal::redis_v2::reply reply = this->execute(argv);
	if (reply.type() != kerbal::redis_v2::reply_type::INTEGER) {
		throw kerbal::redis_v2::unexpected_case_exception(reply.type(), argv.begin(), argv.begin() + 1);
	}
	return reply->integer == 1;
}

void RedisJobStore::request_cancel(const std::string & job_id)
{
	const long long ttl = std::max(retention, cancel_flag_ttl).count();
	this->execute({ "EVAL", cancel_script, "2", job_key(job_id), cancel_key(job_id), std::to_string(ttl) });
}

bool RedisJobStore::cancel_requested(const std::string & job_id)
{
	kerbal::redis_v2::reply reply = this->execute({ "EXISTS", cancel_key(job_id) });
	return reply.type() == kerbal::redis_v2::reply_type::INTEGER && reply->integer > 0;
}

size_t RedisJobStore::queued_count()
{
	kerbal::redis_v2::reply reply = this->execute({ "LLEN", queue_key() });
	if (reply.type() != kerbal::redis_v2::reply_type::INTEGER) {
		return 0;
	}
	return static_cast<size_t>(reply->integer);
}

void RedisJobStore::close()
{
	closed = true;
}
