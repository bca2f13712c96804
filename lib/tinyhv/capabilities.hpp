#pragma once
#include "common.hpp"
#include <array>
#include <linux/kvm.h>
#include <optional>

namespace tinyhv {

enum class Cap : uint32_t {
	Irqchip        = KVM_CAP_IRQCHIP,
	UserMemory     = KVM_CAP_USER_MEMORY,
	MpState        = KVM_CAP_MP_STATE,
	SetGuestDebug  = KVM_CAP_SET_GUEST_DEBUG,
	IrqRouting     = KVM_CAP_IRQ_ROUTING,
	Irqfd          = KVM_CAP_IRQFD,
	Ioeventfd      = KVM_CAP_IOEVENTFD,
	OneReg         = KVM_CAP_ONE_REG,
	ImmediateExit  = KVM_CAP_IMMEDIATE_EXIT,
};
const char* to_string(Cap) noexcept;

/* Capabilities the rest of the system depends on, in the order they
   are checked. SetGuestDebug is required as well, but some kernels
   implement it without advertising the capability, so it is left out. */
static constexpr std::array<Cap, 8> REQUIRED_CAPABILITIES {
	Cap::ImmediateExit,
	Cap::Ioeventfd,
	Cap::Irqchip,
	Cap::Irqfd,
	Cap::IrqRouting,
	Cap::MpState,
	Cap::OneReg,
	Cap::UserMemory,
};

using check_extension_func = std::function<bool(Cap)>;

/* The first required capability the host does not have, if any. */
std::optional<Cap> first_missing_capability(const check_extension_func&);
/* Throws CapabilityException naming the first missing capability. */
void check_required_capabilities(const check_extension_func&, const HypervisorOptions& = {});

} // tinyhv
