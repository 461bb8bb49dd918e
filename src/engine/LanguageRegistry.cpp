/*
 * LanguageRegistry.cpp
 *
 *  Created on: 2026年10月13日
 */

#include "LanguageRegistry.hpp"
#include "runner_exceptions.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

namespace
{
	LanguageSpec interpreted(Language language, const std::string & id, const std::string & source_filename,
							 CommandTemplate run_command, bool cap_address_space, EnvironmentTemplate environment = { })
	{
		LanguageSpec spec;
		spec.language = language;
		spec.id = id;
		spec.source_filename = source_filename;
		spec.filename_bound_to_entry_point = false;
		spec.run_command = std::move(run_command);
		spec.environment = std::move(environment);
		spec.timeout_class = TimeoutClass::INTERPRETED;
		spec.cap_address_space = cap_address_space;
		spec.cap_cpu_and_processes = true;
		spec.runs_native_binary = false;
		return spec;
	}

	LanguageSpec compiled(Language language, const std::string & id, const std::string & source_filename,
						  CommandTemplate build_command, CommandTemplate run_command, bool cap_address_space,
						  bool runs_native_binary, EnvironmentTemplate environment = { })
	{
		LanguageSpec spec;
		spec.language = language;
		spec.id = id;
		spec.source_filename = source_filename;
		spec.filename_bound_to_entry_point = false;
		spec.build_command = std::move(build_command);
		spec.run_command = std::move(run_command);
		spec.environment = std::move(environment);
		spec.timeout_class = TimeoutClass::COMPILED;
		spec.cap_address_space = cap_address_space;
		spec.cap_cpu_and_processes = true;
		spec.runs_native_binary = runs_native_binary;
		return spec;
	}

	std::vector<LanguageSpec> builtin_specs()
	{
		std::vector<LanguageSpec> specs;

		specs.push_back(interpreted(Language::PYTHON, "python", "main.py",
									{ "python3", "{source}" }, true,
									{ { "PYTHONUNBUFFERED", "1" }, { "PYTHONDONTWRITEBYTECODE", "1" }, { "OMP_NUM_THREADS", "1" } }));

		// V8 预留的虚拟地址空间远大于堆上限, 堆大小改由 --max-old-space-size 控制
		specs.push_back(interpreted(Language::JAVASCRIPT, "javascript", "main.js",
									{ "node", "{source}" }, false,
									{ { "NODE_OPTIONS", "--max-old-space-size={memory_mb}" } }));

		specs.push_back(interpreted(Language::R, "r", "main.R",
									{ "Rscript", "{source}" }, true,
									{ { "OMP_NUM_THREADS", "1" } }));

		specs.push_back(interpreted(Language::BASH, "bash", "main.sh",
									{ "bash", "{source}" }, true));

		specs.push_back(interpreted(Language::JULIA, "julia", "main.jl",
									{ "julia", "--startup-file=no", "--history-file=no", "{source}" }, false,
									{ { "JULIA_NUM_THREADS", "1" }, { "JULIA_DEPOT_PATH", "{tmpdir}/.julia:" } }));

		specs.push_back(compiled(Language::C, "c", "main.c",
								 { "gcc", "-O2", "-std=gnu11", "-o", "{binary}", "{source}", "-lm" },
								 { "{binary}" }, true, true));

		specs.push_back(compiled(Language::CPP, "cpp", "main.cpp",
								 { "g++", "-O2", "-std=gnu++17", "-o", "{binary}", "{source}" },
								 { "{binary}" }, true, true));

		LanguageSpec java = compiled(Language::JAVA, "java", "Main.java",
									 { "javac", "-J-Xms64m", "-J-Xmx512m", "-encoding", "UTF-8", "-d", "{builddir}", "{source}" },
									 { "java", "-Xmx{memory_mb}m", "-XX:+UseSerialGC", "-Xss64m", "-cp", "{builddir}", "Main" }, false, false);
		java.filename_bound_to_entry_point = true;
		specs.push_back(java);

		specs.push_back(compiled(Language::GO, "go", "main.go",
								 { "go", "build", "-o", "{binary}", "{source}" },
								 { "{binary}" }, false, true,
								 { { "GOCACHE", "{tmpdir}/.gocache" }, { "GOPATH", "{tmpdir}/go" }, { "HOME", "{tmpdir}" },
								   { "GOMAXPROCS", "1" }, { "GO111MODULE", "off" }, { "CGO_ENABLED", "0" } }));

		return specs;
	}

} /* namespace */

LanguageRegistry::LanguageRegistry(const std::vector<LanguageSpec> & specs)
{
	for (const LanguageSpec & spec : specs) {
		std::string id = normalize_id(spec.id);
		if (!this->specs.emplace(id, spec).second) {
			throw std::invalid_argument("Duplicated language id: " + id);
		}
	}
}

const LanguageRegistry & LanguageRegistry::builtin()
{
	static const LanguageRegistry registry(builtin_specs());
	return registry;
}

std::string LanguageRegistry::normalize_id(const std::string & language_id)
{
	return boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(language_id));
}

const LanguageSpec * LanguageRegistry::find(const std::string & language_id) const noexcept
{
	try {
		auto it = specs.find(normalize_id(language_id));
		if (it == specs.end()) {
			return nullptr;
		}
		return &it->second;
	} catch (const std::exception & e) {
		return nullptr;
	}
}

const LanguageSpec & LanguageRegistry::lookup(const std::string & language_id) const
{
	const LanguageSpec * spec = this->find(language_id);
	if (spec == nullptr) {
		throw UnsupportedLanguageException(language_id);
	}
	return *spec;
}

std::vector<std::string> LanguageRegistry::language_ids() const
{
	std::vector<std::string> ids;
	ids.reserve(specs.size());
	for (const auto & [id, spec] : specs) {
		ids.push_back(id);
	}
	return ids;
}
