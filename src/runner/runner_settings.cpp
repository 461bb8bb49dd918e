/*
 * runner_settings.cpp
 *
 *  Created on: 2026年10月17日
 */

#include "runner_settings.hpp"
#include "RedisJobStore.hpp"

#include <fstream>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/lexical_cast.hpp>

namespace
{
	template <typename Type>
	bool read_if_present(const nlohmann::json & node, const char * key, Type & target)
	{
		auto it = node.find(key);
		if (it == node.end() || it->is_null()) {
			return false;
		}
		try {
			target = it->get<Type>();
		} catch (const nlohmann::json::exception & e) {
			throw std::invalid_argument(std::string("Invalid configuration value for ") + key + ": " + e.what());
		}
		return true;
	}

	template <typename Duration>
	void read_duration_if_present(const nlohmann::json & node, const char * key, Duration & target)
	{
		long long count = 0;
		if (read_if_present(node, key, count)) {
			target = Duration(count);
		}
	}

	template <typename IdType>
	void read_id_if_present(const nlohmann::json & node, const char * key, kerbal::data_struct::optional<IdType> & target)
	{
		long long id = -1;
		if (read_if_present(node, key, id)) {
			if (id < 0) {
				throw std::invalid_argument(std::string("Invalid configuration value for ") + key + ": must not be negative");
			}
			target = kerbal::data_struct::optional<IdType>(static_cast<IdType>(id));
		}
	}

	const nlohmann::json & child(const nlohmann::json & node, const char * key)
	{
		static const nlohmann::json empty = nlohmann::json::object();
		auto it = node.find(key);
		if (it == node.end() || it->is_null()) {
			return empty;
		}
		if (!it->is_object()) {
			throw std::invalid_argument(std::string("Configuration section must be an object: ") + key);
		}
		return *it;
	}

	template <typename Type>
	Type env_number(const char * name, const char * value)
	{
		try {
			return boost::lexical_cast<Type>(value);
		} catch (const boost::bad_lexical_cast &) {
			throw std::invalid_argument(std::string("Invalid value for ") + name + ": " + value);
		}
	}

	bool env_flag(const char * value)
	{
		const std::string flag = boost::algorithm::to_lower_copy(std::string(value));
		return flag == "1" || flag == "true" || flag == "yes" || flag == "on";
	}

} /* namespace */

const char * getBackendKindName(BackendKind kind)
{
	switch (kind) {
		case BackendKind::HOST:
			return "host";
		case BackendKind::CONTAINER:
			return "container";
	}
	return "unknown";
}

BackendKind parseBackendKind(const std::string & name)
{
	const std::string lower = boost::algorithm::to_lower_copy(name);
	if (lower == "host" || lower == "local") {
		return BackendKind::HOST;
	}
	if (lower == "container" || lower == "docker") {
		return BackendKind::CONTAINER;
	}
	throw std::invalid_argument("Unknown sandbox backend: " + name);
}

const char * getStoreKindName(StoreKind kind)
{
	switch (kind) {
		case StoreKind::MEMORY:
			return "memory";
		case StoreKind::REDIS:
			return "redis";
	}
	return "unknown";
}

StoreKind parseStoreKind(const std::string & name)
{
	const std::string lower = boost::algorithm::to_lower_copy(name);
	if (lower == "memory") {
		return StoreKind::MEMORY;
	}
	if (lower == "redis") {
		return StoreKind::REDIS;
	}
	throw std::invalid_argument("Unknown queue backend: " + name);
}

void Settings::parse(const boost::filesystem::path & config_file)
{
	nlohmann::json json_obj;
	{
		std::ifstream config_file_stream { config_file.string() };
		if (!config_file_stream) {
			throw std::runtime_error("Open configuration file failed: " + config_file.string());
		}
		try {
			config_file_stream >> json_obj;
		} catch (const nlohmann::json::exception & e) {
			throw std::invalid_argument("Malformed configuration file " + config_file.string() + ": " + e.what());
		}
	}
	this->parse(json_obj);
}

void Settings::parse(const nlohmann::json & json_obj)
{
	if (!json_obj.is_object()) {
		throw std::invalid_argument("Configuration must be a json object");
	}

	{
		const auto & runtime_node = child(json_obj, "runtime");
		std::string log_file_path;
		if (read_if_present(runtime_node, "log_file_path", log_file_path)) {
			runtime.log_file_path = log_file_path;
		}
		std::string log_level;
		if (read_if_present(runtime_node, "log_level", log_level)) {
			runtime.log_level = parse_log_level(log_level);
		}
	}

	{
		std::string backend_name;
		if (read_if_present(json_obj, "backend", backend_name)) {
			backend = parseBackendKind(backend_name);
		}
	}

	{
		const auto & queue_node = child(json_obj, "queue");
		std::string store_name;
		if (read_if_present(queue_node, "store", store_name)) {
			queue.store = parseStoreKind(store_name);
		}
		read_if_present(queue_node, "redis_url", queue.redis_url);
		read_if_present(queue_node, "name", queue.name);
		read_duration_if_present(queue_node, "result_ttl", queue.result_ttl);
		read_if_present(queue_node, "redis_pool_size", queue.redis_pool_size);
		read_if_present(queue_node, "workers", job_queue.workers);
		read_if_present(queue_node, "store_retry_attempts", job_queue.store_retry.max_attempts);
		read_duration_if_present(queue_node, "store_retry_backoff_ms", job_queue.store_retry.initial_backoff);
		read_duration_if_present(queue_node, "execute_queue_wait", job_queue.execute_queue_wait);
	}

	{
		const auto & limits_node = child(json_obj, "limits");
		read_duration_if_present(limits_node, "timeout_interpreted", job_queue.timeout_interpreted);
		read_duration_if_present(limits_node, "timeout_compiled", job_queue.timeout_compiled);
		read_if_present(limits_node, "memory_mb", job_queue.memory_mb);
		read_duration_if_present(limits_node, "max_timeout", job_queue.max_timeout);
		read_if_present(limits_node, "max_memory_mb", job_queue.max_memory_mb);
		read_if_present(limits_node, "max_code_bytes", job_queue.max_code_bytes);
		read_if_present(limits_node, "max_output_bytes", limiter.max_output_bytes);
		read_if_present(limits_node, "max_processes", limiter.max_processes);
		read_if_present(limits_node, "max_file_size_mb", limiter.max_file_size_mb);
		read_if_present(limits_node, "os_limits", limiter.os_limits_supported);
		read_duration_if_present(limits_node, "cancel_grace_ms", cancel_grace);
	}

	{
		const auto & workspace_node = child(json_obj, "workspace");
		std::string root;
		if (read_if_present(workspace_node, "root", root)) {
			workspace.root = root;
		}
		read_if_present(workspace_node, "cleanup_attempts", workspace.cleanup_retry.max_attempts);
		read_duration_if_present(workspace_node, "cleanup_backoff_ms", workspace.cleanup_retry.initial_backoff);
	}

	{
		const auto & host_node = child(json_obj, "host");
		read_if_present(host_node, "search_path", host.search_path);
		std::string seccomp;
		if (read_if_present(host_node, "seccomp", seccomp)) {
			host.seccomp_policy = parseSeccompPolicy(seccomp);
		}
		read_id_if_present(host_node, "uid", host.uid);
		read_id_if_present(host_node, "gid", host.gid);
	}

	{
		const auto & container_node = child(json_obj, "container");
		read_if_present(container_node, "docker_path", container.docker_path);
		read_if_present(container_node, "search_path", container.search_path);
		read_if_present(container_node, "user", container.user);
		read_if_present(container_node, "cpus", container.cpus);
		read_if_present(container_node, "tmpfs_size_mb", container.tmpfs_size_mb);
		read_duration_if_present(container_node, "start_timeout", container.start_timeout);

		const auto & images_node = child(container_node, "images");
		for (auto it = images_node.begin(); it != images_node.end(); ++it) {
			if (!it.value().is_string()) {
				throw std::invalid_argument("Container image must be a string, language: " + it.key());
			}
			container.images[LanguageRegistry::normalize_id(it.key())] = it.value().get<std::string>();
		}
	}
}

void Settings::apply_environment(const getenv_type & getenv)
{
	const char * value = nullptr;

	if ((value = getenv("DOCKER_SANDBOX")) != nullptr && env_flag(value)) {
		backend = BackendKind::CONTAINER;
	}
	if ((value = getenv("RUNNER_BACKEND")) != nullptr) {
		backend = parseBackendKind(value);
	}

	if ((value = getenv("REDIS_URL")) != nullptr) {
		queue.redis_url = value;
	}
	if ((value = getenv("RUNNER_REDIS_URL")) != nullptr) {
		queue.redis_url = value;
	}
	if ((value = getenv("RUNNER_QUEUE_BACKEND")) != nullptr) {
		queue.store = parseStoreKind(value);
	}
	if ((value = getenv("RUNNER_QUEUE_NAME")) != nullptr) {
		queue.name = value;
	}
	if ((value = getenv("RUNNER_RESULT_TTL")) != nullptr) {
		queue.result_ttl = std::chrono::seconds(env_number<long long>("RUNNER_RESULT_TTL", value));
	}
	if ((value = getenv("RUNNER_WORKERS")) != nullptr) {
		const long long workers = env_number<long long>("RUNNER_WORKERS", value);
		if (workers <= 0) {
			throw std::invalid_argument(std::string("Invalid value for RUNNER_WORKERS: ") + value);
		}
		job_queue.workers = static_cast<size_t>(workers);
	}

	if ((value = getenv("RUNNER_TIMEOUT_INTERPRETED")) != nullptr) {
		job_queue.timeout_interpreted = std::chrono::seconds(env_number<long long>("RUNNER_TIMEOUT_INTERPRETED", value));
	}
	if ((value = getenv("RUNNER_TIMEOUT_COMPILED")) != nullptr) {
		job_queue.timeout_compiled = std::chrono::seconds(env_number<long long>("RUNNER_TIMEOUT_COMPILED", value));
	}
	if ((value = getenv("RUNNER_MEMORY_MB")) != nullptr) {
		job_queue.memory_mb = env_number<int>("RUNNER_MEMORY_MB", value);
	}

	if ((value = getenv("RUNNER_WORKSPACE_DIR")) != nullptr) {
		workspace.root = value;
	}
	if ((value = getenv("RUNNER_LOG_LEVEL")) != nullptr) {
		runtime.log_level = parse_log_level(value);
	}

	for (const std::string & id : LanguageRegistry::builtin().language_ids()) {
		const std::string name = "RUNNER_IMAGE_" + boost::algorithm::to_upper_copy(id);
		if ((value = getenv(name.c_str())) != nullptr && *value != '\0') {
			container.images[id] = value;
		}
	}
}

void Settings::finalize()
{
	if (job_queue.workers == 0) {
		throw std::invalid_argument("worker count must be positive");
	}
	if (job_queue.timeout_interpreted.count() <= 0 || job_queue.timeout_compiled.count() <= 0) {
		throw std::invalid_argument("default timeouts must be positive");
	}
	if (job_queue.max_timeout.count() <= 0 || job_queue.timeout_interpreted > job_queue.max_timeout ||
		job_queue.timeout_compiled > job_queue.max_timeout) {
		throw std::invalid_argument("default timeouts must not exceed max_timeout");
	}
	if (job_queue.memory_mb <= 0 || job_queue.max_memory_mb <= 0 || job_queue.memory_mb > job_queue.max_memory_mb) {
		throw std::invalid_argument("memory limits must be positive and the default must not exceed max_memory_mb");
	}
	if (job_queue.max_code_bytes == 0) {
		throw std::invalid_argument("max_code_bytes must be positive");
	}
	if (queue.result_ttl.count() <= 0) {
		throw std::invalid_argument("result_ttl must be positive");
	}
	if (queue.name.empty()) {
		throw std::invalid_argument("queue name is empty");
	}
	if (job_queue.store_retry.max_attempts <= 0 || job_queue.store_retry.initial_backoff.count() < 0) {
		throw std::invalid_argument("job store retry policy is invalid");
	}
	if (job_queue.execute_queue_wait.count() <= 0) {
		throw std::invalid_argument("execute_queue_wait must be positive");
	}
	if (limiter.max_output_bytes == 0 || limiter.max_processes == 0 || limiter.max_file_size_mb == 0) {
		throw std::invalid_argument("output, process and file size limits must be positive");
	}
	if (cancel_grace.count() < 0) {
		throw std::invalid_argument("cancel_grace_ms must not be negative");
	}
	if (workspace.cleanup_retry.max_attempts <= 0 || workspace.cleanup_retry.initial_backoff.count() < 0) {
		throw std::invalid_argument("workspace cleanup retry policy is invalid");
	}
	if (workspace.root.empty()) {
		throw std::invalid_argument("workspace root is empty");
	}
	if (container.tmpfs_size_mb <= 0 || container.start_timeout.count() <= 0) {
		throw std::invalid_argument("container tmpfs size and start timeout must be positive");
	}
	if (queue.store == StoreKind::REDIS) {
		RedisEndpoint::parse(queue.redis_url);
	}

	host.cancel_grace = cancel_grace;
	container.cancel_grace = cancel_grace;
	container.remove_retry = workspace.cleanup_retry;

	// 以专用 uid 运行时工作区归该 uid 所有, 且可以安全地施加 RLIMIT_NPROC
	workspace.owner_uid = host.uid;
	workspace.owner_gid = host.gid;
	limiter.process_cap_supported = backend == BackendKind::HOST && host.uid.has_value();
	workspace.shared_with_container = backend == BackendKind::CONTAINER;

	if (queue.redis_pool_size == 0) {
		queue.redis_pool_size = job_queue.workers + 4;
	}
}

Settings Settings::load(const boost::filesystem::path & config_file, const getenv_type & getenv)
{
	Settings settings;
	if (!config_file.empty()) {
		settings.parse(config_file);
	}
	settings.apply_environment(getenv);
	settings.finalize();
	return settings;
}
