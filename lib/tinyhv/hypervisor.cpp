#include "hypervisor.hpp"

#include "kvm/kvm.hpp"

namespace tinyhv {

TINYHV_COLD()
void hypervisor_exception(const char* msg, uint64_t data)
{
	throw HypervisorException(msg, data);
}

TINYHV_COLD()
void unsupported_exception(const char* msg, HypervisorType type)
{
	throw UnsupportedException(msg, uint64_t(type));
}

std::unique_ptr<Hypervisor> new_hypervisor(const HypervisorOptions& options)
{
	/* MSHV partitions are created outside of this library,
	   and adopted with MshvVm. */
	if (KvmHypervisor::is_available(options)) {
		return std::make_unique<KvmHypervisor>(options);
	}
	hypervisor_exception("No supported hypervisor");
}

} // tinyhv
