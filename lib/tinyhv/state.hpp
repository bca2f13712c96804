#pragma once
#include "common.hpp"
#include "arm64/regs.hpp"
#include <array>
#include <linux/kvm.h>
#include <optional>
#include <variant>
#include <vector>

namespace tinyhv {

/* Each of the structures below holds exactly one backend's native
   layout. Accessing the wrong alternative throws TypeConfusionException. */

struct StandardRegisters {
	std::variant<tinyhv_kvm_arm64regs, tinyhv_mshv_arm64regs> regs;

	HypervisorType hypervisor_type() const noexcept;
	tinyhv_kvm_arm64regs& kvm();
	const tinyhv_kvm_arm64regs& kvm() const;
	tinyhv_mshv_arm64regs& mshv();
	const tinyhv_mshv_arm64regs& mshv() const;

	/* Conversions through the backend-neutral model */
	arm64::Registers to_registers() const;
	static StandardRegisters from_registers(const arm64::Registers&, HypervisorType);

	static StandardRegisters default_kvm() { return { tinyhv_kvm_arm64regs{} }; }
	static StandardRegisters default_mshv() { return { tinyhv_mshv_arm64regs{} }; }
};

struct MshvMpState {};
struct MpState {
	std::variant<kvm_mp_state, MshvMpState> state;

	HypervisorType hypervisor_type() const noexcept;
	kvm_mp_state& kvm();
	const kvm_mp_state& kvm() const;
};

struct KvmVcpuState {
	kvm_mp_state mp_state {};
	tinyhv_kvm_arm64regs core_regs {};
	/* System registers, the value stored in .addr */
	std::vector<kvm_one_reg> sys_regs;

	bool operator==(const KvmVcpuState&) const;
};
struct MshvVcpuState {
	tinyhv_mshv_arm64regs regs {};

	bool operator==(const MshvVcpuState&) const;
};

struct CpuState {
	std::variant<KvmVcpuState, MshvVcpuState> state;

	HypervisorType hypervisor_type() const noexcept;
	KvmVcpuState& kvm();
	const KvmVcpuState& kvm() const;
	MshvVcpuState& mshv();
	const MshvVcpuState& mshv() const;

	/* The MPIDR_EL1 value saved with the state, if any. */
	std::optional<uint64_t> mpidr() const;

	bool operator==(const CpuState&) const = default;
};

struct MshvClockData {
	uint64_t ref_time = 0;
};
struct ClockData {
	std::variant<kvm_clock_data, MshvClockData> data;

	HypervisorType hypervisor_type() const noexcept;
	kvm_clock_data& kvm();
	const kvm_clock_data& kvm() const;
	MshvClockData& mshv();
	const MshvClockData& mshv() const;

	/* Zero the transient flags before the clock is restored. */
	void reset_flags() noexcept;
};

struct KvmGicState {
	uint32_t gicd_ctlr = 0;
	std::vector<uint32_t> dist;
	std::vector<uint32_t> rdist;
	std::vector<uint64_t> icc;

	bool has_its = false;
	uint64_t its_ctlr = 0;
	uint64_t its_iidr = 0;
	uint64_t its_cbaser = 0;
	uint64_t its_creadr = 0;
	uint64_t its_cwriter = 0;
	std::array<uint64_t, 8> its_baser {};

	bool operator==(const KvmGicState&) const = default;
};
struct MshvGicState {
	bool operator==(const MshvGicState&) const = default;
};
struct GicState {
	std::variant<KvmGicState, MshvGicState> state;

	HypervisorType hypervisor_type() const noexcept;
	KvmGicState& kvm();
	const KvmGicState& kvm() const;

	bool operator==(const GicState&) const = default;
};

struct MshvMsiRoutingEntry {
	uint32_t gsi = 0;
	uint32_t address_lo = 0;
	uint32_t address_hi = 0;
	uint32_t data = 0;
};
struct IrqRoutingEntry {
	std::variant<kvm_irq_routing_entry, MshvMsiRoutingEntry> entry;

	HypervisorType hypervisor_type() const noexcept;
};

struct MsiIrqSourceConfig {
	uint32_t high_addr = 0;
	uint32_t low_addr = 0;
	uint32_t data = 0;
	uint32_t devid = 0;
};
struct LegacyIrqSourceConfig {
	uint32_t irqchip = 0;
	uint32_t pin = 0;
};
using InterruptSourceConfig = std::variant<MsiIrqSourceConfig, LegacyIrqSourceConfig>;

/* A guest-physical memory slot backed by host memory */
struct UserMemoryRegion {
	uint32_t slot = 0;
	uint64_t guest_phys_addr = 0;
	uint64_t memory_size = 0;
	uint64_t userspace_addr = 0;
	uint32_t flags = 0;

	bool operator==(const UserMemoryRegion&) const = default;
};
static constexpr uint32_t USER_MEMORY_REGION_READ       = 1;
static constexpr uint32_t USER_MEMORY_REGION_WRITE      = 1 << 1;
static constexpr uint32_t USER_MEMORY_REGION_EXECUTE    = 1 << 2;
static constexpr uint32_t USER_MEMORY_REGION_LOG_DIRTY  = 1 << 3;
static constexpr uint32_t USER_MEMORY_REGION_ADJUSTABLE = 1 << 4;

} // tinyhv
