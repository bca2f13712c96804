#pragma once
#include "../hypervisor.hpp"

namespace tinyhv {

/**
 * A virtual processor of an MSHV partition. The run loop that owns
 * the processor publishes its register page after every exit with
 * sync_registers(), and writes back whatever take_dirty_registers()
 * hands it before resuming the guest.
**/
struct MshvVcpu final : public Vcpu
{
	static constexpr HypervisorType TYPE = HypervisorType::Mshv;
	HypervisorType hypervisor_type() const noexcept override { return TYPE; }

	StandardRegisters get_regs() const override;
	void set_regs(const StandardRegisters&) override;
	uint64_t get_reg(uint64_t id) const override;
	void set_reg(uint64_t id, uint64_t value) override;
	std::vector<uint64_t> get_reg_list() const override;

	void vcpu_init(const arm64::VcpuInit&) override;
	MpState get_mp_state() const override;
	void set_mp_state(const MpState&) override;

	CpuState state() const override;
	void set_state(const CpuState&) override;

	void sync_registers(const tinyhv_mshv_arm64regs&);
	/* Copies out the register page and clears the dirty flag.
	   Returns false when nothing was modified. */
	bool take_dirty_registers(tinyhv_mshv_arm64regs&);
	bool registers_dirty() const noexcept { return m_dirty; }

	MshvVcpu(int id, VmOps*);
private:
	tinyhv_mshv_arm64regs m_regs {};
	bool m_dirty = false;
};

struct MshvVm final : public Vm
{
	static constexpr HypervisorType TYPE = HypervisorType::Mshv;
	HypervisorType hypervisor_type() const noexcept override { return TYPE; }

	std::unique_ptr<Vcpu> create_vcpu(int id, VmOps*) override;
	std::unique_ptr<Vgic> create_vgic(const VgicConfig&) override;

	ClockData get_clock() const override;
	void set_clock(const ClockData&) override;

	IrqRoutingEntry make_routing_entry(uint32_t gsi, const InterruptSourceConfig&) const override;
	void set_gsi_routing(const std::vector<IrqRoutingEntry>&) override;

	int fd() const noexcept { return m_fd; }

	/* Adopts a partition created elsewhere. A negative
	   file descriptor means the VM owns nothing. */
	explicit MshvVm(int partition_fd);
	MshvVm(const MshvVm&) = delete;
	MshvVm& operator=(const MshvVm&) = delete;
	~MshvVm();
private:
	int m_fd = -1;
};

} // tinyhv
