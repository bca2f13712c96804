#pragma once
#include "state.hpp"
#include <array>
#include <vector>

namespace tinyhv {

/* Placement of the interrupt controller in guest-physical memory */
struct VgicConfig {
	uint64_t vcpu_count = 1;
	uint64_t dist_addr = 0;
	uint64_t dist_size = 0;
	uint64_t redists_addr = 0;
	uint64_t redists_size = 0;
	uint64_t msi_addr = 0;
	uint64_t msi_size = 0;
	uint32_t nr_irqs = 256;
};

/**
 * The virtual interrupt controller of a VM. One implementation per
 * backend. Operations a backend cannot perform throw UnsupportedException.
 * Mutated only from the device-attach and snapshot/restore paths.
**/
struct Vgic
{
	/* Device-tree compatible string */
	virtual const char* fdt_compatibility() const = 0;
	virtual bool msi_compatible() const = 0;
	virtual const char* msi_compatibility() const = 0;
	virtual uint32_t fdt_maint_irq() const = 0;
	virtual uint64_t vcpu_count() const = 0;
	/* Distributor address and size, followed by redistributors */
	virtual std::array<uint64_t, 4> device_properties() const = 0;
	virtual std::array<uint64_t, 2> msi_properties() const = 0;

	/* Compute each redistributor's GICR_TYPER from the vCPU states. */
	virtual void set_gicr_typers(const std::vector<CpuState>& vcpu_states) = 0;

	virtual GicState state() const = 0;
	virtual void set_state(const GicState&) = 0;
	/* Flush redistributor pending tables and ITS tables into guest RAM. */
	virtual void save_data_tables() const = 0;

	virtual ~Vgic() = default;
};

} // tinyhv
