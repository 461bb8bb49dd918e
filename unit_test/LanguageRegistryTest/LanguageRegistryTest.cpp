/*
 * LanguageRegistryTest.cpp
 *
 *  Created on: 2026年10月18日
 */

#define BOOST_TEST_MODULE LanguageRegistryTest
#include <boost/test/unit_test.hpp>

#include <algorithm>

#include "LanguageRegistry.hpp"
#include "runner_exceptions.hpp"

BOOST_AUTO_TEST_CASE(builtin_contains_all_languages)
{
	const LanguageRegistry & registry = LanguageRegistry::builtin();
	const std::vector<std::string> ids = registry.language_ids();

	BOOST_CHECK_EQUAL(registry.size(), 9u);
	for (const char * id : { "python", "javascript", "r", "bash", "julia", "c", "cpp", "java", "go" }) {
		BOOST_CHECK_MESSAGE(std::find(ids.begin(), ids.end(), id) != ids.end(), "missing language: " << id);
	}
}

BOOST_AUTO_TEST_CASE(lookup_ignores_case_and_whitespace)
{
	const LanguageRegistry & registry = LanguageRegistry::builtin();

	BOOST_CHECK_EQUAL(registry.lookup("Python").id, "python");
	BOOST_CHECK_EQUAL(registry.lookup("  CPP\n").id, "cpp");
	BOOST_CHECK(registry.lookup("JavaScript").language == Language::JAVASCRIPT);
}

BOOST_AUTO_TEST_CASE(unknown_language_is_rejected)
{
	const LanguageRegistry & registry = LanguageRegistry::builtin();

	BOOST_CHECK(registry.find("cobol") == nullptr);
	BOOST_CHECK(registry.find("") == nullptr);
	BOOST_CHECK_THROW(registry.lookup("brainfuck"), UnsupportedLanguageException);

	try {
		registry.lookup("cobol");
		BOOST_FAIL("lookup of an unknown language should throw");
	} catch (const UnsupportedLanguageException & e) {
		BOOST_CHECK_EQUAL(e.language, "cobol");
		BOOST_CHECK_EQUAL(std::string(e.what()), "Unsupported language: cobol");
	}
}

BOOST_AUTO_TEST_CASE(timeout_class_follows_build_step)
{
	const LanguageRegistry & registry = LanguageRegistry::builtin();

	for (const std::string & id : registry.language_ids()) {
		const LanguageSpec & spec = registry.lookup(id);
		BOOST_CHECK_EQUAL(spec.is_compiled(), spec.timeout_class == TimeoutClass::COMPILED);
		BOOST_CHECK(!spec.run_command.empty());
		BOOST_CHECK(!spec.source_filename.empty());
	}

	BOOST_CHECK(!registry.lookup("python").is_compiled());
	BOOST_CHECK(!registry.lookup("bash").is_compiled());
	BOOST_CHECK(registry.lookup("c").is_compiled());
	BOOST_CHECK(registry.lookup("go").is_compiled());
}

BOOST_AUTO_TEST_CASE(java_source_name_is_bound_to_entry_class)
{
	const LanguageSpec & java = LanguageRegistry::builtin().lookup("java");

	BOOST_CHECK_EQUAL(java.source_filename, "Main.java");
	BOOST_CHECK(java.filename_bound_to_entry_point);
	BOOST_CHECK(!java.runs_native_binary);
	BOOST_CHECK_EQUAL(java.run_command.back(), "Main");
}

BOOST_AUTO_TEST_CASE(runtimes_with_large_reservations_are_exempt_from_address_space_cap)
{
	const LanguageRegistry & registry = LanguageRegistry::builtin();

	for (const char * id : { "javascript", "julia", "java", "go" }) {
		BOOST_CHECK_MESSAGE(!registry.lookup(id).cap_address_space, id << " should not be capped");
	}
	for (const char * id : { "python", "r", "bash", "c", "cpp" }) {
		BOOST_CHECK_MESSAGE(registry.lookup(id).cap_address_space, id << " should be capped");
	}
}

BOOST_AUTO_TEST_CASE(duplicated_ids_are_rejected)
{
	LanguageSpec spec = LanguageRegistry::builtin().lookup("bash");
	LanguageSpec upper = spec;
	upper.id = "BASH";

	BOOST_CHECK_THROW(LanguageRegistry( { spec, upper }), std::invalid_argument);
}
