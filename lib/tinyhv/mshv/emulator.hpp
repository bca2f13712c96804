#pragma once
#include "../hypervisor.hpp"
#include <array>
#include <utility>

namespace tinyhv {

/* Everything known about one trapped access. Built by the run loop
   from the intercept message, and dropped once emulation is done. */
struct MshvEmulatorContext {
	Vcpu& vcpu;
	/* Guest-virtual to guest-physical mapping of the faulting access */
	std::pair<uint64_t, uint64_t> map {};
	uint64_t syndrome = 0;
	std::array<uint8_t, 4> instruction_bytes {};
	uint8_t instruction_byte_count = 0;
	bool interruption_pending = false;
	uint64_t pc = 0;
};

/**
 * Replays a data abort that the hypervisor could not complete
 * against the device models of the VM. Only aborts with a valid
 * instruction syndrome are handled: there is no instruction decoder.
**/
struct MshvEmulator {
	/* Returns false when the syndrome does not describe the access,
	   in which case nothing was changed. Exceptions from the device
	   callbacks are propagated, and leave the registers unchanged. */
	bool decode_with_syndrome();

	/* Throws UnsupportedException when an interruption is pending. */
	bool emulate();

	explicit MshvEmulator(MshvEmulatorContext ctx) : m_ctx{ctx} {}

	const MshvEmulatorContext& context() const noexcept { return m_ctx; }
private:
	MshvEmulatorContext m_ctx;
};

} // tinyhv
