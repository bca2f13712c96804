#pragma once
#include "kvm.hpp"
#include <memory>

namespace tinyhv {

/**
 * In-kernel GICv3 with an ITS, created through KVM_CREATE_DEVICE.
 * Redistributor and CPU interface state is addressed by affinity,
 * so set_gicr_typers() must run before state() and set_state().
**/
struct KvmGicV3Its final : public Vgic
{
	static constexpr uint32_t ARCH_GIC_V3_MAINT_IRQ = 9;

	const char* fdt_compatibility() const override { return "arm,gic-v3"; }
	bool msi_compatible() const override { return true; }
	const char* msi_compatibility() const override { return "arm,gic-v3-its"; }
	uint32_t fdt_maint_irq() const override { return ARCH_GIC_V3_MAINT_IRQ; }
	uint64_t vcpu_count() const override { return m_config.vcpu_count; }
	std::array<uint64_t, 4> device_properties() const override;
	std::array<uint64_t, 2> msi_properties() const override;

	void set_gicr_typers(const std::vector<CpuState>& vcpu_states) override;
	const std::vector<uint64_t>& gicr_typers() const noexcept { return m_gicr_typers; }

	GicState state() const override;
	void set_state(const GicState&) override;
	void save_data_tables() const override;

	const KvmDevice& device() const noexcept { return m_gic; }
	const KvmDevice& its_device() const noexcept { return m_its; }

	/* Create and initialize both devices. The vCPUs must already
	   exist. Throws TypeConfusionException for a non-KVM VM. */
	static std::unique_ptr<KvmGicV3Its> create(Vm&, const VgicConfig&);

private:
	KvmGicV3Its(KvmDevice gic, KvmDevice its, const VgicConfig&);

	KvmDevice m_gic;
	KvmDevice m_its;
	VgicConfig m_config;
	std::vector<uint64_t> m_gicr_typers;
};

/* GICR_TYPER of each redistributor, from the MPIDR_EL1 of its vCPU.
   The last one carries the Last bit. */
std::vector<uint64_t> construct_gicr_typers(const std::vector<uint64_t>& mpidrs);

} // tinyhv
