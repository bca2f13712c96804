#include "kvm.hpp"

#include <cerrno>
#include <sys/ioctl.h>
#include <unistd.h>

namespace tinyhv {

KvmDevice& KvmDevice::operator=(KvmDevice&& other) noexcept
{
	if (this != &other) {
		if (m_fd >= 0)
			close(m_fd);
		m_fd = other.m_fd;
		other.m_fd = -1;
	}
	return *this;
}

KvmDevice::~KvmDevice()
{
	if (m_fd >= 0)
		close(m_fd);
}

void KvmDevice::set_attr(uint32_t group, uint64_t attr, const void* addr, uint32_t flags) const
{
	const kvm_device_attr dattr {
		.flags = flags,
		.group = group,
		.attr  = attr,
		.addr  = (uintptr_t)addr,
	};
	if (UNLIKELY(ioctl(m_fd, KVM_SET_DEVICE_ATTR, &dattr) < 0)) {
		hypervisor_exception("KVM_SET_DEVICE_ATTR failed", errno);
	}
}

void KvmDevice::get_attr(uint32_t group, uint64_t attr, void* addr) const
{
	kvm_device_attr dattr {
		.flags = 0,
		.group = group,
		.attr  = attr,
		.addr  = (uintptr_t)addr,
	};
	if (UNLIKELY(ioctl(m_fd, KVM_GET_DEVICE_ATTR, &dattr) < 0)) {
		hypervisor_exception("KVM_GET_DEVICE_ATTR failed", errno);
	}
}

bool KvmDevice::has_attr(uint32_t group, uint64_t attr) const
{
	const kvm_device_attr dattr {
		.flags = 0,
		.group = group,
		.attr  = attr,
		.addr  = 0,
	};
	return ioctl(m_fd, KVM_HAS_DEVICE_ATTR, &dattr) == 0;
}

} // tinyhv
