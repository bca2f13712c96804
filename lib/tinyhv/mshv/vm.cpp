#include "mshv.hpp"

#include "gic.hpp"
#include <unistd.h>

namespace tinyhv {

MshvVm::MshvVm(int partition_fd)
	: m_fd{partition_fd}
{
}

MshvVm::~MshvVm()
{
	if (m_fd >= 0)
		close(m_fd);
}

std::unique_ptr<Vcpu> MshvVm::create_vcpu(int id, VmOps* vm_ops)
{
	return std::make_unique<MshvVcpu>(id, vm_ops);
}

std::unique_ptr<Vgic> MshvVm::create_vgic(const VgicConfig& config)
{
	return MshvGicV3Its::create(*this, config);
}

/* The reference time of an AArch64 partition is not exposed */
ClockData MshvVm::get_clock() const
{
	unsupported_exception("Get clock", TYPE);
}
void MshvVm::set_clock(const ClockData&)
{
	unsupported_exception("Set clock", TYPE);
}

IrqRoutingEntry MshvVm::make_routing_entry(uint32_t gsi, const InterruptSourceConfig& config) const
{
	const auto* msi = std::get_if<MsiIrqSourceConfig>(&config);
	if (msi == nullptr) {
		unsupported_exception("Legacy interrupt routing", TYPE);
	}
	return IrqRoutingEntry{MshvMsiRoutingEntry {
		.gsi = gsi,
		.address_lo = msi->low_addr,
		.address_hi = msi->high_addr,
		.data = msi->data,
	}};
}

void MshvVm::set_gsi_routing(const std::vector<IrqRoutingEntry>&)
{
	unsupported_exception("Installing the GSI routing table", TYPE);
}

} // tinyhv
