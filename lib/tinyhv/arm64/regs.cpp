#include "regs.hpp"

#include <cstdio>
#include <cstring>

namespace tinyhv::arm64 {

uint64_t Registers::x(unsigned idx) const
{
	if (idx < NR_GPRS)
		return gpr[idx];
	if (idx == 31)
		return 0;
	throw RegisterException("Invalid general-purpose register index", idx);
}
void Registers::set_x(unsigned idx, uint64_t value)
{
	if (idx < NR_GPRS) {
		gpr[idx] = value;
		return;
	}
	if (idx != 31)
		throw RegisterException("Invalid general-purpose register index", idx);
}

std::vector<uint64_t> core_register_ids()
{
	std::vector<uint64_t> ids;
	ids.reserve(NR_GPRS + 5 + NR_SPSR + NR_VREGS + 2);
	for (unsigned i = 0; i < NR_GPRS; i++)
		ids.push_back(gpr_id(i));
	ids.push_back(SP_ID);
	ids.push_back(PC_ID);
	ids.push_back(PSTATE_ID);
	ids.push_back(SP_EL1_ID);
	ids.push_back(ELR_EL1_ID);
	for (unsigned i = 0; i < NR_SPSR; i++)
		ids.push_back(spsr_id(i));
	for (unsigned i = 0; i < NR_VREGS; i++)
		ids.push_back(vreg_id(i));
	ids.push_back(FPSR_ID);
	ids.push_back(FPCR_ID);
	return ids;
}

bool is_system_register(uint64_t regid)
{
	if (is_core_register(regid))
		return false;

	const uint64_t size = regid & KVM_REG_SIZE_MASK;
	if (UNLIKELY(size != KVM_REG_SIZE_U32 && size != KVM_REG_SIZE_U64)) {
		fprintf(stderr, "Unexpected register size 0x%lX for system register 0x%lX\n",
			(unsigned long)size, (unsigned long)regid);
		throw RegisterException("Unexpected register size for system register", regid);
	}
	return true;
}

tinyhv_kvm_arm64regs to_kvm(const Registers& regs)
{
	tinyhv_kvm_arm64regs kregs {};
	std::memcpy(kregs.regs, regs.gpr.data(), sizeof(kregs.regs));
	kregs.sp = regs.sp;
	kregs.pc = regs.pc;
	kregs.pstate = regs.pstate;
	kregs.sp_el1 = regs.sp_el1;
	kregs.elr_el1 = regs.elr_el1;
	std::memcpy(kregs.spsr, regs.spsr.data(), sizeof(kregs.spsr));
	std::memcpy(kregs.vregs, regs.vregs.data(), sizeof(kregs.vregs));
	kregs.fpsr = uint32_t(regs.fpsr);
	kregs.fpcr = uint32_t(regs.fpcr);
	return kregs;
}

Registers from_kvm(const tinyhv_kvm_arm64regs& kregs)
{
	Registers regs;
	std::memcpy(regs.gpr.data(), kregs.regs, sizeof(kregs.regs));
	regs.sp = kregs.sp;
	regs.pc = kregs.pc;
	regs.pstate = kregs.pstate;
	regs.sp_el1 = kregs.sp_el1;
	regs.elr_el1 = kregs.elr_el1;
	std::memcpy(regs.spsr.data(), kregs.spsr, sizeof(kregs.spsr));
	std::memcpy(regs.vregs.data(), kregs.vregs, sizeof(kregs.vregs));
	/* Zero-extend, never sign-extend */
	regs.fpsr = uint64_t(kregs.fpsr);
	regs.fpcr = uint64_t(kregs.fpcr);
	return regs;
}

tinyhv_mshv_arm64regs to_mshv(const Registers& regs)
{
	tinyhv_mshv_arm64regs mregs {};
	std::memcpy(mregs.regs, regs.gpr.data(), sizeof(mregs.regs));
	mregs.sp = regs.sp;
	mregs.pc = regs.pc;
	mregs.pstate = regs.pstate;
	mregs.sp_el1 = regs.sp_el1;
	mregs.elr_el1 = regs.elr_el1;
	std::memcpy(mregs.spsr, regs.spsr.data(), sizeof(mregs.spsr));
	std::memcpy(mregs.vregs, regs.vregs.data(), sizeof(mregs.vregs));
	mregs.fpsr = regs.fpsr;
	mregs.fpcr = regs.fpcr;
	return mregs;
}

Registers from_mshv(const tinyhv_mshv_arm64regs& mregs)
{
	Registers regs;
	std::memcpy(regs.gpr.data(), mregs.regs, sizeof(mregs.regs));
	regs.sp = mregs.sp;
	regs.pc = mregs.pc;
	regs.pstate = mregs.pstate;
	regs.sp_el1 = mregs.sp_el1;
	regs.elr_el1 = mregs.elr_el1;
	std::memcpy(regs.spsr.data(), mregs.spsr, sizeof(mregs.spsr));
	std::memcpy(regs.vregs.data(), mregs.vregs, sizeof(mregs.vregs));
	regs.fpsr = mregs.fpsr;
	regs.fpcr = mregs.fpcr;
	return regs;
}

kvm_one_reg to_kvm(const Register& reg)
{
	return kvm_one_reg {
		.id = reg.id,
		.addr = reg.addr,
	};
}
Register from_kvm(const kvm_one_reg& reg)
{
	return Register {
		.id = reg.id,
		.addr = reg.addr,
	};
}

tinyhv_kvm_vcpu_init to_kvm(const VcpuInit& init)
{
	tinyhv_kvm_vcpu_init kinit {};
	kinit.target = init.target;
	std::memcpy(kinit.features, init.features.data(), sizeof(kinit.features));
	return kinit;
}
VcpuInit from_kvm(const tinyhv_kvm_vcpu_init& kinit)
{
	VcpuInit init;
	init.target = kinit.target;
	std::memcpy(init.features.data(), kinit.features, sizeof(kinit.features));
	return init;
}

} // tinyhv::arm64
