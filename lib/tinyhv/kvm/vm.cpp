#include "kvm.hpp"

#include "gic.hpp"
#include <cerrno>
#include <cstdio>
#include <sys/ioctl.h>
#include <unistd.h>
//#define KVM_VERBOSE_ROUTING

namespace tinyhv {

KvmVm::KvmVm(int fd, const HypervisorOptions& options)
	: m_fd {fd}, m_options {options}
{
}

KvmVm::~KvmVm()
{
	if (m_fd >= 0)
		close(m_fd);
}

void KvmVm::print(const char* buffer, size_t len) const
{
	if (m_options.printer)
		m_options.printer(buffer, len);
	else
		printf("%.*s", (int)len, buffer);
}

std::unique_ptr<Vcpu> KvmVm::create_vcpu(int id, VmOps* vm_ops)
{
	const int fd = ioctl(m_fd, KVM_CREATE_VCPU, id);
	if (UNLIKELY(fd < 0)) {
		hypervisor_exception("Failed to KVM_CREATE_VCPU", errno);
	}
	return std::make_unique<KvmVcpu>(fd, id, vm_ops);
}

std::unique_ptr<Vgic> KvmVm::create_vgic(const VgicConfig& config)
{
	return KvmGicV3Its::create(*this, config);
}

/* The KVM clock ioctls only exist for kvmclock on x86. AArch64 guests
   read the generic timer, whose state travels with the vCPU registers. */
ClockData KvmVm::get_clock() const
{
#if defined(__aarch64__)
	unsupported_exception("Get clock", TYPE);
#else
	kvm_clock_data clock {};
	if (ioctl(m_fd, KVM_GET_CLOCK, &clock) < 0) {
		hypervisor_exception("KVM_GET_CLOCK failed", errno);
	}
	return ClockData{clock};
#endif
}

void KvmVm::set_clock(const ClockData& data)
{
#if defined(__aarch64__)
	(void)data;
	unsupported_exception("Set clock", TYPE);
#else
	const kvm_clock_data& clock = data.kvm();
	if (ioctl(m_fd, KVM_SET_CLOCK, &clock) < 0) {
		hypervisor_exception("KVM_SET_CLOCK failed", errno);
	}
#endif
}

IrqRoutingEntry KvmVm::make_routing_entry(uint32_t gsi, const InterruptSourceConfig& config) const
{
	kvm_irq_routing_entry entry {};
	entry.gsi = gsi;

	if (const auto* msi = std::get_if<MsiIrqSourceConfig>(&config)) {
		entry.type = KVM_IRQ_ROUTING_MSI;
		entry.u.msi.address_lo = msi->low_addr;
		entry.u.msi.address_hi = msi->high_addr;
		entry.u.msi.data = msi->data;
		/* The ITS needs to know which device sent the message */
		entry.flags = KVM_MSI_VALID_DEVID;
		entry.u.msi.devid = msi->devid;
	} else {
		const auto& legacy = std::get<LegacyIrqSourceConfig>(config);
		entry.type = KVM_IRQ_ROUTING_IRQCHIP;
		entry.u.irqchip.irqchip = legacy.irqchip;
		entry.u.irqchip.pin = legacy.pin;
	}
	return IrqRoutingEntry{entry};
}

void KvmVm::set_gsi_routing(const std::vector<IrqRoutingEntry>& entries)
{
	/* struct kvm_irq_routing is followed by its entries. Allocating
	   one extra entry makes room for the header, with the alignment
	   of the entries. */
	static_assert(sizeof(kvm_irq_routing) <= sizeof(kvm_irq_routing_entry));
	std::vector<kvm_irq_routing_entry> buffer(entries.size() + 1);
	auto* routing = reinterpret_cast<kvm_irq_routing*>(buffer.data());
	routing->nr = entries.size();
	routing->flags = 0;

	for (size_t i = 0; i < entries.size(); i++)
	{
		const auto* entry = std::get_if<kvm_irq_routing_entry>(&entries[i].entry);
		if (UNLIKELY(entry == nullptr)) {
			throw TypeConfusionException("IRQ routing entry is not a KVM entry",
				HypervisorType::Kvm, entries[i].hypervisor_type());
		}
		routing->entries[i] = *entry;
#ifdef KVM_VERBOSE_ROUTING
		printf("GSI %u: type %u flags 0x%X\n", entry->gsi, entry->type, entry->flags);
#endif
	}

	if (ioctl(m_fd, KVM_SET_GSI_ROUTING, routing) < 0) {
		hypervisor_exception("KVM_SET_GSI_ROUTING failed", errno);
	}
}

arm64::VcpuInit KvmVm::preferred_target() const
{
	tinyhv_kvm_vcpu_init kinit {};
	if (ioctl(m_fd, TINYHV_KVM_ARM_PREFERRED_TARGET, &kinit) < 0) {
		hypervisor_exception("KVM_ARM_PREFERRED_TARGET failed", errno);
	}
	return arm64::from_kvm(kinit);
}

KvmDevice KvmVm::create_device(uint32_t type, uint32_t flags)
{
	kvm_create_device device {
		.type = type,
		.fd = 0,
		.flags = flags,
	};
	if (ioctl(m_fd, KVM_CREATE_DEVICE, &device) < 0) {
		hypervisor_exception("KVM_CREATE_DEVICE failed", errno);
	}
	return KvmDevice{int(device.fd)};
}

kvm_userspace_memory_region to_kvm(const UserMemoryRegion& region)
{
	if (UNLIKELY((region.flags & USER_MEMORY_REGION_READ) == 0)) {
		throw HypervisorException("KVM mapped memory is always readable", region.slot);
	}
	uint32_t flags = 0;
	if ((region.flags & USER_MEMORY_REGION_WRITE) == 0)
		flags |= KVM_MEM_READONLY;
	if (region.flags & USER_MEMORY_REGION_LOG_DIRTY)
		flags |= KVM_MEM_LOG_DIRTY_PAGES;

	return kvm_userspace_memory_region {
		.slot = region.slot,
		.flags = flags,
		.guest_phys_addr = region.guest_phys_addr,
		.memory_size = region.memory_size,
		.userspace_addr = region.userspace_addr,
	};
}

UserMemoryRegion from_kvm(const kvm_userspace_memory_region& region)
{
	uint32_t flags = USER_MEMORY_REGION_READ;
	if ((region.flags & KVM_MEM_READONLY) == 0)
		flags |= USER_MEMORY_REGION_WRITE;
	if (region.flags & KVM_MEM_LOG_DIRTY_PAGES)
		flags |= USER_MEMORY_REGION_LOG_DIRTY;

	return UserMemoryRegion {
		.slot = region.slot,
		.guest_phys_addr = region.guest_phys_addr,
		.memory_size = region.memory_size,
		.userspace_addr = region.userspace_addr,
		.flags = flags,
	};
}

UserMemoryRegion KvmVm::make_user_memory_region(uint32_t slot, uint64_t guest_phys_addr,
	uint64_t memory_size, uint64_t userspace_addr, bool readonly, bool log_dirty_pages)
{
	return from_kvm(kvm_userspace_memory_region {
		.slot = slot,
		.flags = (readonly ? (uint32_t)KVM_MEM_READONLY : 0u)
			| (log_dirty_pages ? (uint32_t)KVM_MEM_LOG_DIRTY_PAGES : 0u),
		.guest_phys_addr = guest_phys_addr,
		.memory_size = memory_size,
		.userspace_addr = userspace_addr,
	});
}

void KvmVm::set_user_memory_region(const UserMemoryRegion& region)
{
	const auto memreg = to_kvm(region);
	if (m_options.verbose_memory) {
		char buffer[256];
		const int len = snprintf(buffer, sizeof(buffer),
			"UMR: Install slot %u with flags 0x%X at 0x%llX to 0x%llX (%llu bytes) from 0x%llX\n",
			memreg.slot, memreg.flags, memreg.guest_phys_addr,
			memreg.guest_phys_addr + memreg.memory_size, memreg.memory_size,
			memreg.userspace_addr);
		this->print(buffer, len);
	}
	if (UNLIKELY(ioctl(m_fd, KVM_SET_USER_MEMORY_REGION, &memreg) < 0)) {
		hypervisor_exception("Failed to install guest memory region", region.slot);
	}
}

void KvmVm::remove_user_memory_region(uint32_t slot)
{
	const kvm_userspace_memory_region memreg {
		.slot = slot,
		.flags = 0u,
		.guest_phys_addr = 0x0,
		.memory_size = 0x0,
		.userspace_addr = 0x0,
	};
	if (m_options.verbose_memory) {
		char buffer[64];
		const int len = snprintf(buffer, sizeof(buffer), "UMR: Remove slot %u\n", slot);
		this->print(buffer, len);
	}
	if (UNLIKELY(ioctl(m_fd, KVM_SET_USER_MEMORY_REGION, &memreg) < 0)) {
		hypervisor_exception("Failed to delete guest memory region", slot);
	}
}

} // tinyhv
