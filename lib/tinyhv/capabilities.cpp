#include "capabilities.hpp"

#include <cstdio>

namespace tinyhv {

const char* to_string(Cap cap) noexcept
{
	switch (cap) {
	case Cap::Irqchip:
		return "Irqchip";
	case Cap::UserMemory:
		return "UserMemory";
	case Cap::MpState:
		return "MpState";
	case Cap::SetGuestDebug:
		return "SetGuestDebug";
	case Cap::IrqRouting:
		return "IrqRouting";
	case Cap::Irqfd:
		return "Irqfd";
	case Cap::Ioeventfd:
		return "Ioeventfd";
	case Cap::OneReg:
		return "OneReg";
	case Cap::ImmediateExit:
		return "ImmediateExit";
	}
	return "Unknown";
}

std::optional<Cap> first_missing_capability(const check_extension_func& check_extension)
{
	for (const Cap cap : REQUIRED_CAPABILITIES) {
		if (!check_extension(cap))
			return cap;
	}
	return std::nullopt;
}

TINYHV_COLD()
void check_required_capabilities(const check_extension_func& check_extension,
	const HypervisorOptions& options)
{
	for (const Cap cap : REQUIRED_CAPABILITIES)
	{
		const bool present = check_extension(cap);
		if (options.verbose_capabilities) {
			char buffer[128];
			const int len = snprintf(buffer, sizeof(buffer),
				"Capability %s (%u): %s\n", to_string(cap), unsigned(cap),
				present ? "present" : "MISSING");
			if (options.printer)
				options.printer(buffer, len);
			else
				printf("%.*s", len, buffer);
		}
		if (UNLIKELY(!present)) {
			fprintf(stderr, "Missing required hypervisor capability: %s\n", to_string(cap));
			throw CapabilityException("Required hypervisor capability is missing", uint64_t(cap));
		}
	}
}

} // tinyhv
