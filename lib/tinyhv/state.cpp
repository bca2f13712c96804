#include "state.hpp"

namespace tinyhv {

template <typename T, HypervisorType Expected, typename Variant>
static auto& variant_get(Variant& v, const char* msg)
{
	if (auto* p = std::get_if<T>(&v))
		return *p;
	throw TypeConfusionException(msg, Expected,
		Expected == HypervisorType::Kvm ? HypervisorType::Mshv : HypervisorType::Kvm);
}
/* The first alternative is always KVM, the second MSHV. */
template <typename Variant>
static HypervisorType variant_type(const Variant& v) noexcept
{
	return v.index() == 0 ? HypervisorType::Kvm : HypervisorType::Mshv;
}

const char* to_string(HypervisorType type) noexcept
{
	switch (type) {
	case HypervisorType::Kvm:
		return "KVM";
	case HypervisorType::Mshv:
		return "MSHV";
	}
	return "Unknown";
}

HypervisorType StandardRegisters::hypervisor_type() const noexcept {
	return variant_type(regs);
}
tinyhv_kvm_arm64regs& StandardRegisters::kvm() {
	return variant_get<tinyhv_kvm_arm64regs, HypervisorType::Kvm>(regs, "Unwrapping KVM registers failed");
}
const tinyhv_kvm_arm64regs& StandardRegisters::kvm() const {
	return variant_get<tinyhv_kvm_arm64regs, HypervisorType::Kvm>(regs, "Unwrapping KVM registers failed");
}
tinyhv_mshv_arm64regs& StandardRegisters::mshv() {
	return variant_get<tinyhv_mshv_arm64regs, HypervisorType::Mshv>(regs, "Unwrapping MSHV registers failed");
}
const tinyhv_mshv_arm64regs& StandardRegisters::mshv() const {
	return variant_get<tinyhv_mshv_arm64regs, HypervisorType::Mshv>(regs, "Unwrapping MSHV registers failed");
}

arm64::Registers StandardRegisters::to_registers() const
{
	return std::visit([] (const auto& native) -> arm64::Registers {
		using T = std::decay_t<decltype(native)>;
		if constexpr (std::is_same_v<T, tinyhv_kvm_arm64regs>)
			return arm64::from_kvm(native);
		else if constexpr (std::is_same_v<T, tinyhv_mshv_arm64regs>)
			return arm64::from_mshv(native);
		else
			static_assert(always_false<T>, "Unhandled register layout");
	}, regs);
}

StandardRegisters StandardRegisters::from_registers(const arm64::Registers& r, HypervisorType type)
{
	switch (type) {
	case HypervisorType::Kvm:
		return { arm64::to_kvm(r) };
	case HypervisorType::Mshv:
		return { arm64::to_mshv(r) };
	}
	hypervisor_exception("Unknown hypervisor type", uint64_t(type));
}

HypervisorType MpState::hypervisor_type() const noexcept {
	return variant_type(state);
}
kvm_mp_state& MpState::kvm() {
	return variant_get<kvm_mp_state, HypervisorType::Kvm>(state, "Unwrapping KVM MP state failed");
}
const kvm_mp_state& MpState::kvm() const {
	return variant_get<kvm_mp_state, HypervisorType::Kvm>(state, "Unwrapping KVM MP state failed");
}

bool KvmVcpuState::operator==(const KvmVcpuState& other) const
{
	if (mp_state.mp_state != other.mp_state.mp_state)
		return false;
	/* Field by field, since the native layout has padding */
	if (arm64::from_kvm(core_regs) != arm64::from_kvm(other.core_regs))
		return false;
	if (sys_regs.size() != other.sys_regs.size())
		return false;
	for (size_t i = 0; i < sys_regs.size(); i++) {
		if (sys_regs[i].id != other.sys_regs[i].id || sys_regs[i].addr != other.sys_regs[i].addr)
			return false;
	}
	return true;
}
bool MshvVcpuState::operator==(const MshvVcpuState& other) const
{
	return arm64::from_mshv(regs) == arm64::from_mshv(other.regs);
}

HypervisorType CpuState::hypervisor_type() const noexcept {
	return variant_type(state);
}
KvmVcpuState& CpuState::kvm() {
	return variant_get<KvmVcpuState, HypervisorType::Kvm>(state, "Unwrapping KVM vCPU state failed");
}
const KvmVcpuState& CpuState::kvm() const {
	return variant_get<KvmVcpuState, HypervisorType::Kvm>(state, "Unwrapping KVM vCPU state failed");
}
MshvVcpuState& CpuState::mshv() {
	return variant_get<MshvVcpuState, HypervisorType::Mshv>(state, "Unwrapping MSHV vCPU state failed");
}
const MshvVcpuState& CpuState::mshv() const {
	return variant_get<MshvVcpuState, HypervisorType::Mshv>(state, "Unwrapping MSHV vCPU state failed");
}

std::optional<uint64_t> CpuState::mpidr() const
{
	if (const auto* kstate = std::get_if<KvmVcpuState>(&state)) {
		for (const auto& reg : kstate->sys_regs) {
			if (reg.id == arm64::MPIDR_EL1_ID)
				return reg.addr;
		}
	}
	return std::nullopt;
}

HypervisorType ClockData::hypervisor_type() const noexcept {
	return variant_type(data);
}
kvm_clock_data& ClockData::kvm() {
	return variant_get<kvm_clock_data, HypervisorType::Kvm>(data, "Unwrapping KVM clock failed");
}
const kvm_clock_data& ClockData::kvm() const {
	return variant_get<kvm_clock_data, HypervisorType::Kvm>(data, "Unwrapping KVM clock failed");
}
MshvClockData& ClockData::mshv() {
	return variant_get<MshvClockData, HypervisorType::Mshv>(data, "Unwrapping MSHV clock failed");
}
const MshvClockData& ClockData::mshv() const {
	return variant_get<MshvClockData, HypervisorType::Mshv>(data, "Unwrapping MSHV clock failed");
}
void ClockData::reset_flags() noexcept
{
	if (auto* kclock = std::get_if<kvm_clock_data>(&data))
		kclock->flags = 0;
}

HypervisorType GicState::hypervisor_type() const noexcept {
	return variant_type(state);
}
KvmGicState& GicState::kvm() {
	return variant_get<KvmGicState, HypervisorType::Kvm>(state, "Unwrapping KVM GIC state failed");
}
const KvmGicState& GicState::kvm() const {
	return variant_get<KvmGicState, HypervisorType::Kvm>(state, "Unwrapping KVM GIC state failed");
}

HypervisorType IrqRoutingEntry::hypervisor_type() const noexcept {
	return variant_type(entry);
}

} // tinyhv
