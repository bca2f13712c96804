#pragma once
#include <cstdint>

namespace tinyhv::arm64 {

/* Exception classes (ESR_ELx.EC) */
enum class ExceptionClass : uint8_t {
	UNKNOWN          = 0x00,
	WFx              = 0x01,
	HVC64            = 0x16,
	SMC64            = 0x17,
	SYS64            = 0x18,
	INSTR_ABORT_LOWER = 0x20,
	INSTR_ABORT      = 0x21,
	DATA_ABORT_LOWER = 0x24,
	DATA_ABORT       = 0x25,
	BRK64            = 0x3C,
};

/* Exception Syndrome Register, EL2 */
struct EsrEl2 {
	uint64_t value;

	constexpr explicit EsrEl2(uint64_t v) noexcept : value(v) {}

	constexpr ExceptionClass ec() const noexcept { return ExceptionClass((value >> 26) & 0x3F); }
	/* Instruction length: 32-bit when set, 16-bit when clear */
	constexpr bool il() const noexcept { return (value >> 25) & 0x1; }
	constexpr uint32_t iss() const noexcept { return value & 0x1FFFFFF; }

	constexpr bool is_data_abort() const noexcept {
		return ec() == ExceptionClass::DATA_ABORT || ec() == ExceptionClass::DATA_ABORT_LOWER;
	}
	constexpr unsigned instruction_length() const noexcept { return il() ? 4 : 2; }
};

/* Instruction-specific syndrome of a data abort */
struct IssDataAbort {
	uint32_t value;

	constexpr explicit IssDataAbort(uint32_t v) noexcept : value(v) {}

	/* Instruction syndrome valid: the fields below hold */
	constexpr bool isv() const noexcept { return (value >> 24) & 0x1; }
	/* Syndrome access size, log2 bytes */
	constexpr unsigned sas() const noexcept { return (value >> 22) & 0x3; }
	/* Syndrome sign extend */
	constexpr bool sse() const noexcept { return (value >> 21) & 0x1; }
	/* Syndrome register transfer */
	constexpr unsigned srt() const noexcept { return (value >> 16) & 0x1F; }
	/* 64-bit register transfer */
	constexpr bool sf() const noexcept { return (value >> 15) & 0x1; }
	/* Acquire/release semantics */
	constexpr bool ar() const noexcept { return (value >> 14) & 0x1; }
	constexpr bool s1ptw() const noexcept { return (value >> 7) & 0x1; }
	/* Write, not read */
	constexpr bool wnr() const noexcept { return (value >> 6) & 0x1; }
	constexpr unsigned dfsc() const noexcept { return value & 0x3F; }

	constexpr unsigned access_size() const noexcept { return 1u << sas(); }
};

/* Builds a data-abort syndrome. Mostly useful for tests and tools. */
struct DataAbortSyndrome {
	bool lower_el = true;
	bool il = true;
	bool isv = true;
	unsigned sas = 0;
	bool sse = false;
	unsigned srt = 0;
	bool sf = true;
	bool wnr = false;

	constexpr uint64_t encode() const noexcept {
		const auto ec = lower_el ? ExceptionClass::DATA_ABORT_LOWER : ExceptionClass::DATA_ABORT;
		return (uint64_t(ec) << 26)
			| (uint64_t(il) << 25)
			| (uint64_t(isv) << 24)
			| (uint64_t(sas & 0x3) << 22)
			| (uint64_t(sse) << 21)
			| (uint64_t(srt & 0x1F) << 16)
			| (uint64_t(sf) << 15)
			| (uint64_t(wnr) << 6);
	}
};

} // tinyhv::arm64
