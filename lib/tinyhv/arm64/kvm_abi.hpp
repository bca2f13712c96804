#pragma once
#include <cstddef>
#include <cstdint>
#include <linux/kvm.h>
#include <linux/types.h>

/**
 * AArch64 KVM register layouts and constants.
 *
 * <linux/kvm.h> only pulls in the register structures of the host
 * architecture, so the AArch64 layouts from arch/arm64/include/uapi/asm/kvm.h
 * and ptrace.h are mirrored here. The field offsets below are part of the
 * kernel ABI (they are encoded into KVM_{GET,SET}_ONE_REG identifiers) and
 * are verified at compile time, against the kernel's own structures when
 * building on an AArch64 host.
**/
namespace tinyhv {

struct tinyhv_kvm_arm64regs {
	/* struct user_pt_regs */
	__u64 regs[31];
	__u64 sp;
	__u64 pc;
	__u64 pstate;

	__u64 sp_el1;
	__u64 elr_el1;
	__u64 spsr[5]; /* KVM_NR_SPSR */

	/* struct user_fpsimd_state */
	alignas(16) __uint128_t vregs[32];
	__u32 fpsr;
	__u32 fpcr;
	__u32 reserved[2];
};

struct tinyhv_kvm_vcpu_init {
	__u32 target;
	__u32 features[7];
};

/* The register block the MSHV run loop publishes for a virtual processor.
   Hyper-V exposes every register as a 64-bit (or 128-bit) value, so the
   floating-point status fields are full width here. */
struct tinyhv_mshv_arm64regs {
	__u64 regs[31];
	__u64 sp;
	__u64 pc;
	__u64 pstate;
	__u64 sp_el1;
	__u64 elr_el1;
	__u64 spsr[5];
	alignas(16) __uint128_t vregs[32];
	__u64 fpsr;
	__u64 fpcr;
};

namespace arm64 {
	static constexpr unsigned NR_GPRS = 31;
	static constexpr unsigned NR_SPSR = 5;
	static constexpr unsigned NR_VREGS = 32;

	/* Byte offsets within struct kvm_regs */
	static constexpr size_t OFF_REGS    = 0;
	static constexpr size_t OFF_SP      = 248;
	static constexpr size_t OFF_PC      = 256;
	static constexpr size_t OFF_PSTATE  = 264;
	static constexpr size_t OFF_SP_EL1  = 272;
	static constexpr size_t OFF_ELR_EL1 = 280;
	static constexpr size_t OFF_SPSR    = 288;
	static constexpr size_t OFF_VREGS   = 336;
	static constexpr size_t OFF_FPSR    = 848;
	static constexpr size_t OFF_FPCR    = 852;

	static_assert(offsetof(tinyhv_kvm_arm64regs, regs)    == OFF_REGS);
	static_assert(offsetof(tinyhv_kvm_arm64regs, sp)      == OFF_SP);
	static_assert(offsetof(tinyhv_kvm_arm64regs, pc)      == OFF_PC);
	static_assert(offsetof(tinyhv_kvm_arm64regs, pstate)  == OFF_PSTATE);
	static_assert(offsetof(tinyhv_kvm_arm64regs, sp_el1)  == OFF_SP_EL1);
	static_assert(offsetof(tinyhv_kvm_arm64regs, elr_el1) == OFF_ELR_EL1);
	static_assert(offsetof(tinyhv_kvm_arm64regs, spsr)    == OFF_SPSR);
	static_assert(offsetof(tinyhv_kvm_arm64regs, vregs)   == OFF_VREGS);
	static_assert(offsetof(tinyhv_kvm_arm64regs, fpsr)    == OFF_FPSR);
	static_assert(offsetof(tinyhv_kvm_arm64regs, fpcr)    == OFF_FPCR);
	static_assert(sizeof(tinyhv_kvm_arm64regs) == 864);
	static_assert(sizeof(tinyhv_kvm_vcpu_init) == 32);

	/* Register identifier fields (asm/kvm.h) */
	static constexpr uint64_t REG_COPROC_MASK  = 0x000000000FFF0000ULL;
	static constexpr uint64_t REG_COPROC_SHIFT = 16;
	static constexpr uint64_t REG_CORE   = 0x0010ULL << REG_COPROC_SHIFT;
	static constexpr uint64_t REG_SYSREG = 0x0013ULL << REG_COPROC_SHIFT;

	static constexpr unsigned SYSREG_OP0_SHIFT = 14;
	static constexpr unsigned SYSREG_OP1_SHIFT = 11;
	static constexpr unsigned SYSREG_CRN_SHIFT = 7;
	static constexpr unsigned SYSREG_CRM_SHIFT = 3;
	static constexpr unsigned SYSREG_OP2_SHIFT = 0;

	/* kvm_vcpu_init features */
	static constexpr unsigned VCPU_POWER_OFF = 0;
	static constexpr unsigned VCPU_EL1_32BIT = 1;
	static constexpr unsigned VCPU_PSCI_0_2  = 2;
	static constexpr unsigned VCPU_PMU_V3    = 3;
	static constexpr unsigned VCPU_SVE       = 4;

	/* VGIC device attribute groups */
	static constexpr uint32_t VGIC_GRP_ADDR        = 0;
	static constexpr uint32_t VGIC_GRP_DIST_REGS   = 1;
	static constexpr uint32_t VGIC_GRP_NR_IRQS     = 3;
	static constexpr uint32_t VGIC_GRP_CTRL        = 4;
	static constexpr uint32_t VGIC_GRP_REDIST_REGS = 5;
	static constexpr uint32_t VGIC_GRP_CPU_SYSREGS = 6;
	static constexpr uint32_t VGIC_GRP_ITS_REGS    = 8;

	static constexpr uint64_t VGIC_CTRL_INIT           = 0;
	static constexpr uint64_t ITS_SAVE_TABLES          = 1;
	static constexpr uint64_t ITS_RESTORE_TABLES       = 2;
	static constexpr uint64_t VGIC_SAVE_PENDING_TABLES = 3;

	static constexpr uint64_t VGIC_V3_ADDR_TYPE_DIST   = 2;
	static constexpr uint64_t VGIC_V3_ADDR_TYPE_REDIST = 3;
	static constexpr uint64_t VGIC_ITS_ADDR_TYPE       = 4;

	static constexpr unsigned VGIC_V3_MPIDR_SHIFT = 32;
	static constexpr uint64_t VGIC_V3_MPIDR_MASK  = 0xFFFFFFFFULL << VGIC_V3_MPIDR_SHIFT;
} // arm64
} // tinyhv

#define TINYHV_KVM_ARM_VCPU_INIT        _IOW(KVMIO,  0xae, struct tinyhv::tinyhv_kvm_vcpu_init)
#define TINYHV_KVM_ARM_PREFERRED_TARGET _IOR(KVMIO,  0xaf, struct tinyhv::tinyhv_kvm_vcpu_init)

#if defined(__aarch64__)
static_assert(sizeof(struct kvm_regs) == sizeof(tinyhv::tinyhv_kvm_arm64regs));
static_assert(offsetof(struct kvm_regs, regs.pc) == tinyhv::arm64::OFF_PC);
static_assert(offsetof(struct kvm_regs, spsr) == tinyhv::arm64::OFF_SPSR);
static_assert(offsetof(struct kvm_regs, fp_regs.fpsr) == tinyhv::arm64::OFF_FPSR);
static_assert(KVM_REG_ARM_CORE == tinyhv::arm64::REG_CORE);
static_assert(KVM_REG_ARM64_SYSREG == tinyhv::arm64::REG_SYSREG);
static_assert(KVM_REG_ARM_COPROC_MASK == tinyhv::arm64::REG_COPROC_MASK);
static_assert(TINYHV_KVM_ARM_VCPU_INIT == KVM_ARM_VCPU_INIT);
static_assert(KVM_DEV_ARM_VGIC_GRP_ITS_REGS == tinyhv::arm64::VGIC_GRP_ITS_REGS);
static_assert(KVM_DEV_ARM_VGIC_SAVE_PENDING_TABLES == tinyhv::arm64::VGIC_SAVE_PENDING_TABLES);
#endif
