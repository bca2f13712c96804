#pragma once
#include "../capabilities.hpp"
#include "../hypervisor.hpp"
#include <linux/kvm.h>

namespace tinyhv {

/* A device created with KVM_CREATE_DEVICE. Owns the file descriptor. */
struct KvmDevice
{
	void set_attr(uint32_t group, uint64_t attr, const void* addr = nullptr, uint32_t flags = 0) const;
	void get_attr(uint32_t group, uint64_t attr, void* addr) const;
	bool has_attr(uint32_t group, uint64_t attr) const;

	int fd() const noexcept { return m_fd; }

	explicit KvmDevice(int fd) : m_fd{fd} {}
	KvmDevice(KvmDevice&& other) noexcept : m_fd{other.m_fd} { other.m_fd = -1; }
	KvmDevice& operator=(KvmDevice&&) noexcept;
	KvmDevice(const KvmDevice&) = delete;
	KvmDevice& operator=(const KvmDevice&) = delete;
	~KvmDevice();
private:
	int m_fd = -1;
};

struct KvmVcpu final : public Vcpu
{
	static constexpr HypervisorType TYPE = HypervisorType::Kvm;
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

	uint64_t mpidr() const { return get_reg(arm64::MPIDR_EL1_ID); }
	int fd() const noexcept { return m_fd; }

	KvmVcpu(int fd, int id, VmOps*);
	KvmVcpu(const KvmVcpu&) = delete;
	KvmVcpu& operator=(const KvmVcpu&) = delete;
	~KvmVcpu();
private:
	void get_one_reg(uint64_t id, void* data) const;
	void set_one_reg(uint64_t id, const void* data);

	int m_fd = -1;
};

struct KvmVm final : public Vm
{
	static constexpr HypervisorType TYPE = HypervisorType::Kvm;
	HypervisorType hypervisor_type() const noexcept override { return TYPE; }

	std::unique_ptr<Vcpu> create_vcpu(int id, VmOps*) override;
	std::unique_ptr<Vgic> create_vgic(const VgicConfig&) override;

	ClockData get_clock() const override;
	void set_clock(const ClockData&) override;

	IrqRoutingEntry make_routing_entry(uint32_t gsi, const InterruptSourceConfig&) const override;
	void set_gsi_routing(const std::vector<IrqRoutingEntry>&) override;

	/* The CPU target the host prefers for KVM_ARM_VCPU_INIT */
	arm64::VcpuInit preferred_target() const;
	KvmDevice create_device(uint32_t type, uint32_t flags = 0);

	static UserMemoryRegion make_user_memory_region(uint32_t slot, uint64_t guest_phys_addr,
		uint64_t memory_size, uint64_t userspace_addr, bool readonly, bool log_dirty_pages);
	void set_user_memory_region(const UserMemoryRegion&);
	void remove_user_memory_region(uint32_t slot);

	int fd() const noexcept { return m_fd; }

	/* Takes ownership of a VM file descriptor */
	KvmVm(int fd, const HypervisorOptions&);
	KvmVm(const KvmVm&) = delete;
	KvmVm& operator=(const KvmVm&) = delete;
	~KvmVm();
private:
	void print(const char*, size_t) const;

	int m_fd = -1;
	HypervisorOptions m_options;
};

struct KvmHypervisor final : public Hypervisor
{
	static constexpr HypervisorType TYPE = HypervisorType::Kvm;
	HypervisorType hypervisor_type() const noexcept override { return TYPE; }

	bool check_extension(Cap) const;
	void check_required_extensions() const override;
	std::unique_ptr<Vm> create_vm() override;

	int fd() const noexcept { return m_fd; }
	const HypervisorOptions& options() const noexcept { return m_options; }

	static bool is_available(const HypervisorOptions& = {});

	/* Opens the KVM device and verifies the API version and
	   every required capability. */
	KvmHypervisor(const HypervisorOptions& = {});
	KvmHypervisor(const KvmHypervisor&) = delete;
	KvmHypervisor& operator=(const KvmHypervisor&) = delete;
	~KvmHypervisor();
private:
	int m_fd = -1;
	HypervisorOptions m_options;
};

kvm_userspace_memory_region to_kvm(const UserMemoryRegion&);
UserMemoryRegion from_kvm(const kvm_userspace_memory_region&);

} // tinyhv
