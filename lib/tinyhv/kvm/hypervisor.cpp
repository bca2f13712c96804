#include "kvm.hpp"

#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace tinyhv {

bool KvmHypervisor::is_available(const HypervisorOptions& options)
{
	return access(options.kvm_device.c_str(), R_OK | W_OK) == 0;
}

TINYHV_COLD()
KvmHypervisor::KvmHypervisor(const HypervisorOptions& options)
	: m_options {options}
{
	this->m_fd = open(options.kvm_device.c_str(), O_RDWR | O_CLOEXEC);
	if (m_fd < 0) {
		hypervisor_exception("Failed to open KVM device", errno);
	}

	const int api_ver = ioctl(m_fd, KVM_GET_API_VERSION, 0);
	if (api_ver < 0) {
		close(m_fd);
		hypervisor_exception("Failed to verify KVM_GET_API_VERSION", errno);
	}
	if (api_ver != KVM_API_VERSION) {
		fprintf(stderr, "Got KVM api version %d, expected %d\n",
			api_ver, KVM_API_VERSION);
		close(m_fd);
		hypervisor_exception("Wrong KVM API version", api_ver);
	}

	/* Capabilities do not appear after boot, so fail now. */
	try {
		this->check_required_extensions();
	} catch (...) {
		close(m_fd);
		throw;
	}
}

KvmHypervisor::~KvmHypervisor()
{
	if (m_fd >= 0)
		close(m_fd);
}

bool KvmHypervisor::check_extension(Cap cap) const
{
	return ioctl(m_fd, KVM_CHECK_EXTENSION, unsigned(cap)) > 0;
}

void KvmHypervisor::check_required_extensions() const
{
	check_required_capabilities(
		[this] (Cap cap) { return this->check_extension(cap); },
		m_options);
}

TINYHV_COLD()
std::unique_ptr<Vm> KvmHypervisor::create_vm()
{
	int fd;
	do {
		fd = ioctl(m_fd, KVM_CREATE_VM, 0);
	} while (fd < 0 && errno == EINTR);

	if (UNLIKELY(fd < 0)) {
		hypervisor_exception("Failed to KVM_CREATE_VM. Is your user in the 'kvm' group?", errno);
	}
	return std::make_unique<KvmVm>(fd, m_options);
}

} // tinyhv
