#include "mshv.hpp"

namespace tinyhv {

MshvVcpu::MshvVcpu(int id, VmOps* vm_ops)
	: Vcpu{id, vm_ops}
{
}

StandardRegisters MshvVcpu::get_regs() const
{
	return StandardRegisters{m_regs};
}
void MshvVcpu::set_regs(const StandardRegisters& regs)
{
	this->m_regs = regs.mshv();
	this->m_dirty = true;
}

uint64_t MshvVcpu::get_reg(uint64_t) const
{
	unsupported_exception("Single register access", TYPE);
}
void MshvVcpu::set_reg(uint64_t, uint64_t)
{
	unsupported_exception("Single register access", TYPE);
}
std::vector<uint64_t> MshvVcpu::get_reg_list() const
{
	unsupported_exception("Register list", TYPE);
}

void MshvVcpu::vcpu_init(const arm64::VcpuInit&)
{
	unsupported_exception("vCPU init", TYPE);
}
MpState MshvVcpu::get_mp_state() const
{
	unsupported_exception("MP state", TYPE);
}
void MshvVcpu::set_mp_state(const MpState&)
{
	unsupported_exception("MP state", TYPE);
}

CpuState MshvVcpu::state() const
{
	return CpuState{MshvVcpuState{m_regs}};
}
void MshvVcpu::set_state(const CpuState& state)
{
	this->m_regs = state.mshv().regs;
	this->m_dirty = true;
}

void MshvVcpu::sync_registers(const tinyhv_mshv_arm64regs& regs)
{
	this->m_regs = regs;
	this->m_dirty = false;
}

bool MshvVcpu::take_dirty_registers(tinyhv_mshv_arm64regs& regs)
{
	if (!m_dirty)
		return false;
	regs = m_regs;
	this->m_dirty = false;
	return true;
}

} // tinyhv
