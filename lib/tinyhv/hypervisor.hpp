#pragma once
#include "common.hpp"
#include "gic.hpp"
#include "state.hpp"
#include <memory>
#include <span>
#include <vector>

namespace tinyhv {

/**
 * VM-wide device access. Invoked synchronously from the vCPU thread
 * that trapped, with a buffer of exactly the access size (1, 2, 4
 * or 8 bytes). A failing device throws, and the exception reaches
 * the fault-handling caller unchanged.
**/
struct VmOps {
	using mmio_read_func  = std::function<void(uint64_t gpa, std::span<uint8_t>)>;
	using mmio_write_func = std::function<void(uint64_t gpa, std::span<const uint8_t>)>;

	mmio_read_func  mmio_read;
	mmio_write_func mmio_write;
};

struct Vcpu
{
	virtual HypervisorType hypervisor_type() const noexcept = 0;

	/* General-purpose, control and FP/SIMD registers */
	virtual StandardRegisters get_regs() const = 0;
	virtual void set_regs(const StandardRegisters&) = 0;
	/* Single register access by identifier (32- or 64-bit) */
	virtual uint64_t get_reg(uint64_t id) const = 0;
	virtual void set_reg(uint64_t id, uint64_t value) = 0;
	virtual std::vector<uint64_t> get_reg_list() const = 0;

	virtual void vcpu_init(const arm64::VcpuInit&) = 0;
	virtual MpState get_mp_state() const = 0;
	virtual void set_mp_state(const MpState&) = 0;

	virtual CpuState state() const = 0;
	virtual void set_state(const CpuState&) = 0;

	int cpu_id() const noexcept { return m_cpu_id; }
	VmOps* vm_ops() const noexcept { return m_vm_ops; }

	virtual ~Vcpu() = default;
protected:
	Vcpu(int id, VmOps* ops) : m_cpu_id{id}, m_vm_ops{ops} {}

	int    m_cpu_id = 0;
	VmOps* m_vm_ops = nullptr;
};

struct Vm
{
	virtual HypervisorType hypervisor_type() const noexcept = 0;

	virtual std::unique_ptr<Vcpu> create_vcpu(int id, VmOps*) = 0;
	virtual std::unique_ptr<Vgic> create_vgic(const VgicConfig&) = 0;

	virtual ClockData get_clock() const = 0;
	virtual void set_clock(const ClockData&) = 0;

	virtual IrqRoutingEntry make_routing_entry(uint32_t gsi, const InterruptSourceConfig&) const = 0;
	virtual void set_gsi_routing(const std::vector<IrqRoutingEntry>&) = 0;

	virtual ~Vm() = default;
};

/* Access a VM handle as a concrete backend. Throws
   TypeConfusionException when the VM belongs to another backend. */
template <typename T>
T& vm_cast(Vm& vm)
{
	if (UNLIKELY(vm.hypervisor_type() != T::TYPE)) {
		throw TypeConfusionException("Wrong VM type for this backend",
			T::TYPE, vm.hypervisor_type());
	}
	return static_cast<T&>(vm);
}

struct Hypervisor
{
	virtual HypervisorType hypervisor_type() const noexcept = 0;
	/* Throws CapabilityException for the first missing capability */
	virtual void check_required_extensions() const = 0;
	virtual std::unique_ptr<Vm> create_vm() = 0;

	virtual ~Hypervisor() = default;
};

/* Open the first hypervisor backend available on this host. */
std::unique_ptr<Hypervisor> new_hypervisor(const HypervisorOptions& = {});

} // tinyhv
