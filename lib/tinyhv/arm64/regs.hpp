#pragma once
#include "../common.hpp"
#include "kvm_abi.hpp"
#include <array>
#include <vector>

namespace tinyhv::arm64 {

/* Backend-neutral AArch64 register state. */
struct Registers {
	std::array<uint64_t, NR_GPRS> gpr {};
	uint64_t sp = 0;
	uint64_t pc = 0;
	uint64_t pstate = 0;
	uint64_t sp_el1 = 0;
	uint64_t elr_el1 = 0;
	std::array<uint64_t, NR_SPSR> spsr {};
	std::array<__uint128_t, NR_VREGS> vregs {};
	uint64_t fpsr = 0;
	uint64_t fpcr = 0;

	/* General-purpose register by index, where 31 is XZR. */
	uint64_t x(unsigned idx) const;
	/* Writes to XZR (31) are discarded. */
	void set_x(unsigned idx, uint64_t value);

	bool operator==(const Registers&) const = default;
};

/* A single register access. For KVM_{GET,SET}_ONE_REG the address
   points at the value. Saved system registers keep the value itself. */
struct Register {
	uint64_t id = 0;
	uint64_t addr = 0;

	bool operator==(const Register&) const = default;
};

struct VcpuInit {
	uint32_t target = 0;
	std::array<uint32_t, 7> features {};

	void set_feature(unsigned feature) { features.at(feature / 32) |= 1u << (feature % 32); }
	bool has_feature(unsigned feature) const { return features.at(feature / 32) & (1u << (feature % 32)); }

	bool operator==(const VcpuInit&) const = default;
};

/* Identifier of a core register living at byte @offset
   within struct kvm_regs. */
constexpr uint64_t core_reg_id(uint64_t size, size_t offset) noexcept {
	return KVM_REG_ARM64 | REG_CORE | size | uint64_t(offset / sizeof(uint32_t));
}
constexpr uint64_t gpr_id(unsigned idx) noexcept {
	return core_reg_id(KVM_REG_SIZE_U64, OFF_REGS + idx * sizeof(uint64_t));
}
constexpr uint64_t spsr_id(unsigned idx) noexcept {
	return core_reg_id(KVM_REG_SIZE_U64, OFF_SPSR + idx * sizeof(uint64_t));
}
constexpr uint64_t vreg_id(unsigned idx) noexcept {
	return core_reg_id(KVM_REG_SIZE_U128, OFF_VREGS + idx * sizeof(__uint128_t));
}
static constexpr uint64_t SP_ID      = core_reg_id(KVM_REG_SIZE_U64, OFF_SP);
static constexpr uint64_t PC_ID      = core_reg_id(KVM_REG_SIZE_U64, OFF_PC);
static constexpr uint64_t PSTATE_ID  = core_reg_id(KVM_REG_SIZE_U64, OFF_PSTATE);
static constexpr uint64_t SP_EL1_ID  = core_reg_id(KVM_REG_SIZE_U64, OFF_SP_EL1);
static constexpr uint64_t ELR_EL1_ID = core_reg_id(KVM_REG_SIZE_U64, OFF_ELR_EL1);
static constexpr uint64_t FPSR_ID    = core_reg_id(KVM_REG_SIZE_U32, OFF_FPSR);
static constexpr uint64_t FPCR_ID    = core_reg_id(KVM_REG_SIZE_U32, OFF_FPCR);

/* Identifier of a system register from its instruction encoding. */
constexpr uint64_t sys_reg_id(unsigned op0, unsigned op1, unsigned crn, unsigned crm, unsigned op2) noexcept {
	return KVM_REG_ARM64 | KVM_REG_SIZE_U64 | REG_SYSREG
		| (uint64_t(op0) << SYSREG_OP0_SHIFT)
		| (uint64_t(op1) << SYSREG_OP1_SHIFT)
		| (uint64_t(crn) << SYSREG_CRN_SHIFT)
		| (uint64_t(crm) << SYSREG_CRM_SHIFT)
		| (uint64_t(op2) << SYSREG_OP2_SHIFT);
}
static constexpr uint64_t MPIDR_EL1_ID = sys_reg_id(3, 0, 0, 0, 5);

/* Byte offset within struct kvm_regs of a core register */
constexpr size_t core_reg_offset(uint64_t regid) noexcept {
	return size_t(regid & ~(KVM_REG_ARCH_MASK | KVM_REG_SIZE_MASK | REG_CORE)) * sizeof(uint32_t);
}
/* Every core register identifier, in struct kvm_regs order */
std::vector<uint64_t> core_register_ids();

constexpr bool is_core_register(uint64_t regid) noexcept {
	return (regid & REG_COPROC_MASK) == REG_CORE;
}
/* The kernel splits the registers into core and system registers.
   Throws RegisterException when a system register has a size other
   than 32 or 64 bits, since the host then broke its own ABI. */
bool is_system_register(uint64_t regid);

/* Width in bytes encoded in a register identifier. */
constexpr size_t reg_size(uint64_t regid) noexcept {
	return size_t(1) << ((regid & KVM_REG_SIZE_MASK) >> KVM_REG_SIZE_SHIFT);
}

/* Lossless conversions to and from the native layouts. */
tinyhv_kvm_arm64regs to_kvm(const Registers&);
Registers from_kvm(const tinyhv_kvm_arm64regs&);
tinyhv_mshv_arm64regs to_mshv(const Registers&);
Registers from_mshv(const tinyhv_mshv_arm64regs&);

kvm_one_reg to_kvm(const Register&);
Register from_kvm(const kvm_one_reg&);

tinyhv_kvm_vcpu_init to_kvm(const VcpuInit&);
VcpuInit from_kvm(const tinyhv_kvm_vcpu_init&);

} // tinyhv::arm64
