#include "gic.hpp"

namespace tinyhv {

std::unique_ptr<MshvGicV3Its> MshvGicV3Its::create(Vm& vm, const VgicConfig& config)
{
	vm_cast<MshvVm>(vm);
	return std::unique_ptr<MshvGicV3Its>(new MshvGicV3Its(config));
}

std::array<uint64_t, 4> MshvGicV3Its::device_properties() const
{
	return { m_config.dist_addr, m_config.dist_size,
		m_config.redists_addr, m_config.redists_size };
}
std::array<uint64_t, 2> MshvGicV3Its::msi_properties() const
{
	return { m_config.msi_addr, m_config.msi_size };
}

void MshvGicV3Its::set_gicr_typers(const std::vector<CpuState>&)
{
	unsupported_exception("GICR_TYPER", MshvVm::TYPE);
}
GicState MshvGicV3Its::state() const
{
	unsupported_exception("Saving GIC state", MshvVm::TYPE);
}
void MshvGicV3Its::set_state(const GicState&)
{
	unsupported_exception("Restoring GIC state", MshvVm::TYPE);
}
void MshvGicV3Its::save_data_tables() const
{
	unsupported_exception("Flushing GIC tables", MshvVm::TYPE);
}

} // tinyhv
