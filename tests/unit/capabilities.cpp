#include <catch2/catch_test_macros.hpp>

#include <tinyhv/capabilities.hpp>
#include <set>
#include <string>
using namespace tinyhv;

static check_extension_func host_with(std::set<Cap> caps)
{
	return [caps] (Cap cap) { return caps.count(cap) > 0; };
}
static std::set<Cap> all_required()
{
	return { REQUIRED_CAPABILITIES.begin(), REQUIRED_CAPABILITIES.end() };
}

TEST_CASE("A complete host passes", "[Capabilities]")
{
	REQUIRE(!first_missing_capability(host_with(all_required())).has_value());
	REQUIRE_NOTHROW(check_required_capabilities(host_with(all_required())));
}

TEST_CASE("Guest debug is not required", "[Capabilities]")
{
	auto caps = all_required();
	caps.erase(Cap::SetGuestDebug);
	REQUIRE_NOTHROW(check_required_capabilities(host_with(caps)));
}

TEST_CASE("Each missing capability is named", "[Capabilities]")
{
	for (const Cap missing : REQUIRED_CAPABILITIES)
	{
		auto caps = all_required();
		caps.erase(missing);
		REQUIRE(first_missing_capability(host_with(caps)) == missing);
		try {
			check_required_capabilities(host_with(caps));
			FAIL("Expected a CapabilityException");
		} catch (const CapabilityException& e) {
			REQUIRE(e.capability() == uint64_t(missing));
		}
	}
}

TEST_CASE("The first missing capability is reported", "[Capabilities]")
{
	// Nothing is available: the first entry in the list is reported
	REQUIRE(first_missing_capability(host_with({})) == REQUIRED_CAPABILITIES.front());

	auto caps = all_required();
	caps.erase(Cap::UserMemory);
	caps.erase(Cap::Irqchip);
	REQUIRE(first_missing_capability(host_with(caps)) == Cap::Irqchip);
}

TEST_CASE("Checking stops at the first missing capability", "[Capabilities]")
{
	std::vector<Cap> checked;
	auto caps = all_required();
	caps.erase(Cap::Irqfd);
	const check_extension_func func = [&] (Cap cap) {
		checked.push_back(cap);
		return caps.count(cap) > 0;
	};
	REQUIRE_THROWS_AS(check_required_capabilities(func), CapabilityException);
	REQUIRE(checked.back() == Cap::Irqfd);
	REQUIRE(checked.size() == 4);
}

TEST_CASE("Verbose capability checks go to the printer", "[Capabilities]")
{
	std::string output;
	const HypervisorOptions options {
		.verbose_capabilities = true,
		.printer = [&] (const char* buffer, size_t len) {
			output.append(buffer, len);
		},
	};
	check_required_capabilities(host_with(all_required()), options);
	REQUIRE(output.find(to_string(Cap::OneReg)) != std::string::npos);
}
