#pragma once
#include "mshv.hpp"
#include <memory>

namespace tinyhv {

/* The interrupt controller of an MSHV partition. The hypervisor
   emulates it entirely, and only its placement is known here. */
struct MshvGicV3Its final : public Vgic
{
	static constexpr uint32_t ARCH_GIC_V3_MAINT_IRQ = 9;

	const char* fdt_compatibility() const override { return "arm,gic-v3"; }
	bool msi_compatible() const override { return true; }
	const char* msi_compatibility() const override { return "arm,gic-v2m-frame"; }
	uint32_t fdt_maint_irq() const override { return ARCH_GIC_V3_MAINT_IRQ; }
	uint64_t vcpu_count() const override { return m_config.vcpu_count; }
	std::array<uint64_t, 4> device_properties() const override;
	std::array<uint64_t, 2> msi_properties() const override;

	void set_gicr_typers(const std::vector<CpuState>&) override;
	GicState state() const override;
	void set_state(const GicState&) override;
	void save_data_tables() const override;

	/* Throws TypeConfusionException for a non-MSHV VM. */
	static std::unique_ptr<MshvGicV3Its> create(Vm&, const VgicConfig&);

private:
	explicit MshvGicV3Its(const VgicConfig& config) : m_config{config} {}

	VgicConfig m_config;
};

} // tinyhv
