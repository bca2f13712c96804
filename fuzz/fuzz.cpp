#include <tinyhv/mshv/emulator.hpp>
#include <tinyhv/mshv/mshv.hpp>
#include <tinyhv/snapshot.hpp>
#include <algorithm>
#include <cstdlib>
#include <cstring>

static constexpr uint64_t MMIO_GPA = 0x09000000;
static tinyhv::VmOps* vm_ops;

// In order to be able to inspect a coredump we want to
// crash on every ASAN error.
extern "C" void __asan_on_error()
{
	abort();
}
extern "C" void __msan_on_error()
{
	abort();
}

static void fuzz_emulator(const uint8_t* data, size_t len)
{
	using namespace tinyhv;
	/* Syndrome, then an optional register page */
	uint64_t syndrome = 0;
	if (len < sizeof(syndrome))
		return;
	std::memcpy(&syndrome, data, sizeof(syndrome));
	data += sizeof(syndrome); len -= sizeof(syndrome);

	tinyhv_mshv_arm64regs regs {};
	std::memcpy(&regs, data, std::min(len, sizeof(regs)));

	MshvVcpu vcpu { 0, vm_ops };
	vcpu.sync_registers(regs);
	MshvEmulator emulator { MshvEmulatorContext {
		.vcpu = vcpu,
		.map = { MMIO_GPA, MMIO_GPA },
		.syndrome = syndrome,
		.pc = regs.pc,
	}};
	const bool handled = emulator.emulate();

	tinyhv_mshv_arm64regs after {};
	if (handled != vcpu.take_dirty_registers(after))
		abort();
	if (handled) {
		const uint64_t step = (syndrome & (1u << 25)) ? 4 : 2;
		if (after.pc != regs.pc + step)
			abort();
	}
}

static void fuzz_snapshot(const uint8_t* data, size_t len)
{
	using namespace tinyhv;
	const std::span<const uint8_t> blob {data, len};
	try {
		const auto cpu = deserialize_cpu_state(blob);
		// Anything accepted must survive another round
		if (!(deserialize_cpu_state(serialize(cpu)) == cpu))
			abort();
	} catch (const HypervisorException& e) {
		//printf(">>> Exception: %s\n", e.what());
	}
	try {
		deserialize_gic_state(blob);
	} catch (const HypervisorException& e) {
	}
}

extern "C"
int LLVMFuzzerTestOneInput(const uint8_t* data, size_t len)
{
	if (vm_ops == nullptr) {
		vm_ops = new tinyhv::VmOps {
			.mmio_read = [] (uint64_t, std::span<uint8_t> buffer) {
				std::memset(buffer.data(), 0xA5, buffer.size());
			},
			.mmio_write = [] (uint64_t gpa, std::span<const uint8_t> buffer) {
				if (gpa != MMIO_GPA || buffer.size() > 8)
					abort();
			},
		};
	}
#if defined(FUZZ_EMULATOR)
	fuzz_emulator(data, len);
#elif defined(FUZZ_SNAPSHOT)
	fuzz_snapshot(data, len);
#else
	#error "Unknown fuzzing mode"
#endif
	return 0;
}
