#include "kvm.hpp"

#include <cerrno>
#include <sys/ioctl.h>
#include <unistd.h>

namespace tinyhv {

KvmVcpu::KvmVcpu(int fd, int id, VmOps* vm_ops)
	: Vcpu{id, vm_ops}, m_fd{fd}
{
}

KvmVcpu::~KvmVcpu()
{
	if (m_fd >= 0)
		close(m_fd);
}

void KvmVcpu::get_one_reg(uint64_t id, void* data) const
{
	kvm_one_reg reg {
		.id = id,
		.addr = (uintptr_t)data,
	};
	if (UNLIKELY(ioctl(m_fd, KVM_GET_ONE_REG, &reg) < 0)) {
		throw RegisterException("KVM_GET_ONE_REG failed", id);
	}
}
void KvmVcpu::set_one_reg(uint64_t id, const void* data)
{
	const kvm_one_reg reg {
		.id = id,
		.addr = (uintptr_t)data,
	};
	if (UNLIKELY(ioctl(m_fd, KVM_SET_ONE_REG, &reg) < 0)) {
		throw RegisterException("KVM_SET_ONE_REG failed", id);
	}
}

/* There is no KVM_GET_REGS on AArch64. Every core register is
   fetched separately, straight into its place in struct kvm_regs. */
StandardRegisters KvmVcpu::get_regs() const
{
	tinyhv_kvm_arm64regs regs {};
	auto* base = reinterpret_cast<char*>(&regs);
	for (const uint64_t id : arm64::core_register_ids()) {
		this->get_one_reg(id, base + arm64::core_reg_offset(id));
	}
	return StandardRegisters{regs};
}
void KvmVcpu::set_regs(const StandardRegisters& sregs)
{
	const tinyhv_kvm_arm64regs& regs = sregs.kvm();
	const auto* base = reinterpret_cast<const char*>(&regs);
	for (const uint64_t id : arm64::core_register_ids()) {
		this->set_one_reg(id, base + arm64::core_reg_offset(id));
	}
}

uint64_t KvmVcpu::get_reg(uint64_t id) const
{
	if (UNLIKELY(arm64::reg_size(id) > sizeof(uint64_t))) {
		throw RegisterException("Register is wider than 64 bits", id);
	}
	uint64_t value = 0;
	this->get_one_reg(id, &value);
	return value;
}
void KvmVcpu::set_reg(uint64_t id, uint64_t value)
{
	if (UNLIKELY(arm64::reg_size(id) > sizeof(uint64_t))) {
		throw RegisterException("Register is wider than 64 bits", id);
	}
	this->set_one_reg(id, &value);
}

std::vector<uint64_t> KvmVcpu::get_reg_list() const
{
	/* The first call only tells us how many registers there are */
	kvm_reg_list header {};
	header.n = 0;
	if (ioctl(m_fd, KVM_GET_REG_LIST, &header) < 0 && errno != E2BIG) {
		hypervisor_exception("KVM_GET_REG_LIST failed", errno);
	}

	std::vector<uint64_t> buffer(header.n + 1);
	buffer[0] = header.n;
	if (ioctl(m_fd, KVM_GET_REG_LIST, buffer.data()) < 0) {
		hypervisor_exception("KVM_GET_REG_LIST failed", errno);
	}
	const size_t count = buffer[0];
	return std::vector<uint64_t>(buffer.begin() + 1, buffer.begin() + 1 + count);
}

void KvmVcpu::vcpu_init(const arm64::VcpuInit& init)
{
	const tinyhv_kvm_vcpu_init kinit = arm64::to_kvm(init);
	if (ioctl(m_fd, TINYHV_KVM_ARM_VCPU_INIT, &kinit) < 0) {
		hypervisor_exception("KVM_ARM_VCPU_INIT failed", errno);
	}
}

MpState KvmVcpu::get_mp_state() const
{
	kvm_mp_state state {};
	if (ioctl(m_fd, KVM_GET_MP_STATE, &state) < 0) {
		hypervisor_exception("KVM_GET_MP_STATE failed", errno);
	}
	return MpState{state};
}
void KvmVcpu::set_mp_state(const MpState& mp_state)
{
	const kvm_mp_state& state = mp_state.kvm();
	if (ioctl(m_fd, KVM_SET_MP_STATE, &state) < 0) {
		hypervisor_exception("KVM_SET_MP_STATE failed", errno);
	}
}

CpuState KvmVcpu::state() const
{
	KvmVcpuState state;
	state.mp_state = this->get_mp_state().kvm();
	state.core_regs = this->get_regs().kvm();

	/* Core registers are already in core_regs */
	for (const uint64_t id : this->get_reg_list()) {
		if (!arm64::is_system_register(id))
			continue;
		state.sys_regs.push_back(kvm_one_reg {
			.id = id,
			.addr = this->get_reg(id),
		});
	}
	return CpuState{std::move(state)};
}

void KvmVcpu::set_state(const CpuState& cpu_state)
{
	const KvmVcpuState& state = cpu_state.kvm();
	/* Verify the register list before touching the vCPU */
	for (const auto& reg : state.sys_regs) {
		if (UNLIKELY(!arm64::is_system_register(reg.id))) {
			throw RegisterException("Core register in the system register list", reg.id);
		}
	}

	this->set_regs(StandardRegisters{state.core_regs});
	for (const auto& reg : state.sys_regs) {
		this->set_reg(reg.id, reg.addr);
	}
	this->set_mp_state(MpState{state.mp_state});
}

} // tinyhv
