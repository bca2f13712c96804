#include "gic.hpp"

#include "gic_regs.hpp"

namespace tinyhv {
using namespace tinyhv::arm64;

KvmGicV3Its::KvmGicV3Its(KvmDevice gic, KvmDevice its, const VgicConfig& config)
	: m_gic{std::move(gic)}, m_its{std::move(its)}, m_config{config}
{
}

TINYHV_COLD()
std::unique_ptr<KvmGicV3Its> KvmGicV3Its::create(Vm& base_vm, const VgicConfig& config)
{
	auto& vm = vm_cast<KvmVm>(base_vm);

	KvmDevice gic = vm.create_device(KVM_DEV_TYPE_ARM_VGIC_V3);
	gic.set_attr(VGIC_GRP_ADDR, VGIC_V3_ADDR_TYPE_DIST, &config.dist_addr);
	gic.set_attr(VGIC_GRP_ADDR, VGIC_V3_ADDR_TYPE_REDIST, &config.redists_addr);

	KvmDevice its = vm.create_device(KVM_DEV_TYPE_ARM_VGIC_ITS);
	its.set_attr(VGIC_GRP_ADDR, VGIC_ITS_ADDR_TYPE, &config.msi_addr);
	its.set_attr(VGIC_GRP_CTRL, VGIC_CTRL_INIT);

	/* The GIC is finalized last, once the interrupt count is known */
	const uint32_t nr_irqs = config.nr_irqs;
	gic.set_attr(VGIC_GRP_NR_IRQS, 0, &nr_irqs);
	gic.set_attr(VGIC_GRP_CTRL, VGIC_CTRL_INIT);

	return std::unique_ptr<KvmGicV3Its>(
		new KvmGicV3Its(std::move(gic), std::move(its), config));
}

std::array<uint64_t, 4> KvmGicV3Its::device_properties() const
{
	return { m_config.dist_addr, m_config.dist_size,
		m_config.redists_addr, m_config.redists_size };
}
std::array<uint64_t, 2> KvmGicV3Its::msi_properties() const
{
	return { m_config.msi_addr, m_config.msi_size };
}

std::vector<uint64_t> construct_gicr_typers(const std::vector<uint64_t>& mpidrs)
{
	std::vector<uint64_t> typers;
	typers.reserve(mpidrs.size());
	for (size_t index = 0; index < mpidrs.size(); index++) {
		const uint64_t last = (index == mpidrs.size() - 1) ? 1 : 0;
		/* Aff3 moves down next to Aff2..Aff0 */
		uint64_t aff = mpidrs[index] & 0xFF00FFFFFFULL;
		aff = ((aff & 0xFF00000000ULL) >> 8) | (aff & 0xFFFFFF);
		typers.push_back((aff << 32) | (1ULL << 24) | (uint64_t(index) << 8) | (last << 4));
	}
	return typers;
}

void KvmGicV3Its::set_gicr_typers(const std::vector<CpuState>& vcpu_states)
{
	/* One redistributor per vCPU, as sized at creation */
	if (UNLIKELY(vcpu_states.size() != m_config.vcpu_count)) {
		throw HypervisorException("Number of vCPU states does not match the GIC", vcpu_states.size());
	}
	std::vector<uint64_t> mpidrs;
	mpidrs.reserve(vcpu_states.size());
	for (const auto& state : vcpu_states) {
		const auto mpidr = state.mpidr();
		if (UNLIKELY(!mpidr.has_value())) {
			throw RegisterException("vCPU state is missing MPIDR_EL1", MPIDR_EL1_ID);
		}
		mpidrs.push_back(*mpidr);
	}
	m_gicr_typers = construct_gicr_typers(mpidrs);
}

GicState KvmGicV3Its::state() const
{
	if (UNLIKELY(m_gicr_typers.empty())) {
		throw HypervisorException("GICR_TYPER values have not been set");
	}
	KvmGicState state;
	state.gicd_ctlr = gic_regs::get_dist_ctrl_reg(m_gic);
	state.dist  = gic_regs::get_dist_regs(m_gic, m_config.nr_irqs);
	state.rdist = gic_regs::get_redist_regs(m_gic, m_gicr_typers);
	state.icc   = gic_regs::get_icc_regs(m_gic, m_gicr_typers);

	state.has_its = true;
	state.its_ctlr    = gic_regs::get_its_reg(m_its, gic_regs::GITS_CTLR);
	state.its_iidr    = gic_regs::get_its_reg(m_its, gic_regs::GITS_IIDR);
	state.its_cbaser  = gic_regs::get_its_reg(m_its, gic_regs::GITS_CBASER);
	state.its_creadr  = gic_regs::get_its_reg(m_its, gic_regs::GITS_CREADR);
	state.its_cwriter = gic_regs::get_its_reg(m_its, gic_regs::GITS_CWRITER);
	for (size_t i = 0; i < state.its_baser.size(); i++) {
		state.its_baser[i] = gic_regs::get_its_reg(m_its, gic_regs::GITS_BASER + 8 * i);
	}
	return GicState{std::move(state)};
}

void KvmGicV3Its::set_state(const GicState& gic_state)
{
	const KvmGicState& state = gic_state.kvm();
	if (UNLIKELY(m_gicr_typers.empty())) {
		throw HypervisorException("GICR_TYPER values have not been set");
	}
	/* Nothing is written unless the whole state fits this GIC */
	if (UNLIKELY(state.dist.size() != gic_regs::dist_regs_count(m_config.nr_irqs))) {
		throw HypervisorException("Distributor state has the wrong size", state.dist.size());
	}
	if (UNLIKELY(state.rdist.size() != gic_regs::redist_regs_count(m_gicr_typers))) {
		throw HypervisorException("Redistributor state has the wrong size", state.rdist.size());
	}
	if (UNLIKELY(!gic_regs::icc_regs_match(m_gicr_typers, state.icc))) {
		throw HypervisorException("CPU interface state does not match the redistributors", state.icc.size());
	}

	gic_regs::set_dist_regs(m_gic, m_config.nr_irqs, state.dist);
	gic_regs::set_redist_regs(m_gic, m_gicr_typers, state.rdist);
	gic_regs::set_icc_regs(m_gic, m_gicr_typers, state.icc);
	/* Enabling the distributor goes last */
	gic_regs::set_dist_ctrl_reg(m_gic, state.gicd_ctlr);

	if (!state.has_its)
		return;
	/* GITS_CREADR must be written after GITS_CBASER, which resets it,
	   and the tables can only be restored after every GITS_BASER. */
	gic_regs::set_its_reg(m_its, gic_regs::GITS_IIDR, state.its_iidr);
	gic_regs::set_its_reg(m_its, gic_regs::GITS_CBASER, state.its_cbaser);
	gic_regs::set_its_reg(m_its, gic_regs::GITS_CREADR, state.its_creadr);
	gic_regs::set_its_reg(m_its, gic_regs::GITS_CWRITER, state.its_cwriter);
	for (size_t i = 0; i < state.its_baser.size(); i++) {
		gic_regs::set_its_reg(m_its, gic_regs::GITS_BASER + 8 * i, state.its_baser[i]);
	}
	m_its.set_attr(VGIC_GRP_CTRL, ITS_RESTORE_TABLES);
	gic_regs::set_its_reg(m_its, gic_regs::GITS_CTLR, state.its_ctlr);
}

void KvmGicV3Its::save_data_tables() const
{
	/* Redistributor pending tables, then the ITS tables */
	m_gic.set_attr(VGIC_GRP_CTRL, VGIC_SAVE_PENDING_TABLES);
	m_its.set_attr(VGIC_GRP_CTRL, ITS_SAVE_TABLES);
}

} // tinyhv
