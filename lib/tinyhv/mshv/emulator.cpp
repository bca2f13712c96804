#include "emulator.hpp"

#include "../arm64/esr.hpp"
#include <cstdio>
#include <cstring>

namespace tinyhv {
using namespace tinyhv::arm64;
static constexpr bool VERBOSE_MMIO = false;

static uint64_t sign_extend(uint64_t value, unsigned len, bool sf) noexcept
{
	const unsigned shift = 64 - len * 8;
	value = uint64_t(int64_t(value << shift) >> shift);
	/* A W register destination */
	if (!sf)
		value &= 0xFFFFFFFF;
	return value;
}

bool MshvEmulator::decode_with_syndrome()
{
	const EsrEl2 esr { m_ctx.syndrome };
	if (!esr.is_data_abort())
		return false;

	const IssDataAbort iss { esr.iss() };
	if (!iss.isv())
		return false;

	const unsigned len = iss.access_size();
	const unsigned reg_index = iss.srt();
	if (UNLIKELY(reg_index > 31)) {
		throw EmulatorException("Invalid register in data abort syndrome", reg_index);
	}
	VmOps* ops = m_ctx.vcpu.vm_ops();
	if (UNLIKELY(ops == nullptr)) {
		throw EmulatorException("No device access installed for vCPU", m_ctx.vcpu.cpu_id());
	}
	const uint64_t gpa = m_ctx.map.second;

	/* Registers are committed once, after the device access */
	Registers regs = m_ctx.vcpu.get_regs().to_registers();

	if (iss.wnr()) {
		const uint64_t value = regs.x(reg_index);
		std::array<uint8_t, 8> data;
		std::memcpy(data.data(), &value, sizeof(value));
		if constexpr (VERBOSE_MMIO) {
			printf("MMIO write 0x%lX size %u value 0x%lX\n", gpa, len, value);
		}
		if (UNLIKELY(!ops->mmio_write)) {
			throw MmioException("No MMIO write handler", gpa, len);
		}
		ops->mmio_write(gpa, std::span<const uint8_t>(data.data(), len));
	} else {
		std::array<uint8_t, 8> data {};
		if (UNLIKELY(!ops->mmio_read)) {
			throw MmioException("No MMIO read handler", gpa, len);
		}
		ops->mmio_read(gpa, std::span<uint8_t>(data.data(), len));

		uint64_t value = 0;
		std::memcpy(&value, data.data(), sizeof(value));
		if (iss.sse())
			value = sign_extend(value, len, iss.sf());
		if constexpr (VERBOSE_MMIO) {
			printf("MMIO read 0x%lX size %u value 0x%lX\n", gpa, len, value);
		}
		regs.set_x(reg_index, value);
	}

	regs.pc += esr.instruction_length();
	m_ctx.vcpu.set_regs(StandardRegisters::from_registers(regs, m_ctx.vcpu.hypervisor_type()));
	return true;
}

bool MshvEmulator::emulate()
{
	/* Delivering the interrupt first would change the order
	   in which the guest observes the two events. */
	if (UNLIKELY(m_ctx.interruption_pending)) {
		throw UnsupportedException("Emulating an access with a pending interruption",
			m_ctx.syndrome);
	}
	return this->decode_with_syndrome();
}

} // tinyhv
