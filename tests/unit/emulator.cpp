#include <catch2/catch_test_macros.hpp>

#include <tinyhv/arm64/esr.hpp>
#include <tinyhv/mshv/emulator.hpp>
#include <tinyhv/mshv/mshv.hpp>
#include <cstring>
#include <stdexcept>
using namespace tinyhv;
using arm64::DataAbortSyndrome;

static constexpr uint64_t MMIO_GVA = 0xFFFF000009000000;
static constexpr uint64_t MMIO_GPA = 0x09000000;
static constexpr uint64_t GUEST_PC = 0x40080000;

/* Records every device access, and serves reads from a fixed value */
struct TestDevice {
	uint64_t last_addr = 0;
	std::vector<uint8_t> written;
	std::vector<uint8_t> read_value { 0, 0, 0, 0, 0, 0, 0, 0 };
	size_t reads = 0;
	size_t writes = 0;
	bool fail = false;

	VmOps ops() {
		return VmOps {
			.mmio_read = [this] (uint64_t gpa, std::span<uint8_t> data) {
				if (fail) throw MmioException("Device failure", gpa, data.size());
				reads++;
				last_addr = gpa;
				std::memcpy(data.data(), read_value.data(), data.size());
			},
			.mmio_write = [this] (uint64_t gpa, std::span<const uint8_t> data) {
				if (fail) throw std::runtime_error("Device failure");
				writes++;
				last_addr = gpa;
				written.assign(data.begin(), data.end());
			},
		};
	}
};

static void setup_registers(MshvVcpu& vcpu)
{
	arm64::Registers regs;
	for (unsigned i = 0; i < arm64::NR_GPRS; i++)
		regs.gpr[i] = 0x1111111111111111ULL * (i % 15 + 1);
	regs.gpr[5] = 0xAABBCCDD11223344ULL;
	regs.pc = GUEST_PC;
	vcpu.sync_registers(arm64::to_mshv(regs));
}

static arm64::Registers registers_of(const Vcpu& vcpu)
{
	return vcpu.get_regs().to_registers();
}

static bool emulate(MshvVcpu& vcpu, uint64_t syndrome, bool interruption_pending = false)
{
	MshvEmulator emulator { MshvEmulatorContext {
		.vcpu = vcpu,
		.map = { MMIO_GVA, MMIO_GPA },
		.syndrome = syndrome,
		.interruption_pending = interruption_pending,
		.pc = GUEST_PC,
	}};
	return emulator.emulate();
}

TEST_CASE("Syndrome fields", "[Emulator]")
{
	const uint64_t esr = DataAbortSyndrome{ .sas = 2, .srt = 5, .wnr = true }.encode();
	const arm64::EsrEl2 esr_el2 { esr };
	REQUIRE(esr_el2.ec() == arm64::ExceptionClass::DATA_ABORT_LOWER);
	REQUIRE(esr_el2.is_data_abort());
	REQUIRE(esr_el2.instruction_length() == 4);

	const arm64::IssDataAbort iss { esr_el2.iss() };
	REQUIRE(iss.isv());
	REQUIRE(iss.access_size() == 4);
	REQUIRE(iss.srt() == 5);
	REQUIRE(iss.wnr());
	REQUIRE(iss.sf());
	REQUIRE(!iss.sse());
}

TEST_CASE("Store to a device", "[Emulator]")
{
	TestDevice dev;
	VmOps ops = dev.ops();
	MshvVcpu vcpu { 0, &ops };
	setup_registers(vcpu);
	const auto before = registers_of(vcpu);

	REQUIRE(emulate(vcpu, DataAbortSyndrome{ .sas = 2, .srt = 5, .wnr = true }.encode()));

	// The low 32 bits of X5, in native byte order
	REQUIRE(dev.writes == 1);
	REQUIRE(dev.last_addr == MMIO_GPA);
	REQUIRE(dev.written == std::vector<uint8_t>{ 0x44, 0x33, 0x22, 0x11 });

	auto after = registers_of(vcpu);
	REQUIRE(after.pc == GUEST_PC + 4);
	after.pc = before.pc;
	REQUIRE(after == before);
	REQUIRE(vcpu.registers_dirty());
}

TEST_CASE("Store with a 16-bit instruction", "[Emulator]")
{
	TestDevice dev;
	VmOps ops = dev.ops();
	MshvVcpu vcpu { 0, &ops };
	setup_registers(vcpu);

	REQUIRE(emulate(vcpu, DataAbortSyndrome{ .il = false, .sas = 3, .srt = 5, .wnr = true }.encode()));
	REQUIRE(dev.written.size() == 8);
	REQUIRE(registers_of(vcpu).pc == GUEST_PC + 2);
}

TEST_CASE("Load with sign extension into a W register", "[Emulator]")
{
	TestDevice dev;
	dev.read_value[0] = 0xFF;
	VmOps ops = dev.ops();
	MshvVcpu vcpu { 0, &ops };
	setup_registers(vcpu);

	REQUIRE(emulate(vcpu, DataAbortSyndrome{ .sas = 0, .sse = true, .srt = 3, .sf = false }.encode()));
	REQUIRE(dev.reads == 1);
	REQUIRE(dev.last_addr == MMIO_GPA);

	const auto regs = registers_of(vcpu);
	REQUIRE(regs.x(3) == 0xFFFFFFFFULL);
	REQUIRE(regs.pc == GUEST_PC + 4);
}

TEST_CASE("Load with sign extension into an X register", "[Emulator]")
{
	TestDevice dev;
	dev.read_value = { 0x00, 0x80, 0, 0, 0, 0, 0, 0 };
	VmOps ops = dev.ops();
	MshvVcpu vcpu { 0, &ops };
	setup_registers(vcpu);

	REQUIRE(emulate(vcpu, DataAbortSyndrome{ .sas = 1, .sse = true, .srt = 7, .sf = true }.encode()));
	REQUIRE(registers_of(vcpu).x(7) == 0xFFFFFFFFFFFF8000ULL);
}

TEST_CASE("Load without sign extension", "[Emulator]")
{
	TestDevice dev;
	dev.read_value = { 0xEF, 0xBE, 0xAD, 0xDE, 0, 0, 0, 0 };
	VmOps ops = dev.ops();
	MshvVcpu vcpu { 0, &ops };
	setup_registers(vcpu);

	REQUIRE(emulate(vcpu, DataAbortSyndrome{ .sas = 2, .srt = 0 }.encode()));
	REQUIRE(registers_of(vcpu).x(0) == 0xDEADBEEFULL);
}

TEST_CASE("Non data aborts are not handled", "[Emulator]")
{
	TestDevice dev;
	VmOps ops = dev.ops();
	MshvVcpu vcpu { 0, &ops };
	setup_registers(vcpu);
	const auto before = registers_of(vcpu);

	// An HVC, with the data-abort fields set regardless
	const uint64_t hvc = (uint64_t(arm64::ExceptionClass::HVC64) << 26)
		| (DataAbortSyndrome{ .sas = 2, .srt = 5, .wnr = true }.encode() & 0x3FFFFFF);
	REQUIRE(!emulate(vcpu, hvc));
	// An instruction abort
	const uint64_t iabt = (uint64_t(arm64::ExceptionClass::INSTR_ABORT_LOWER) << 26) | (1u << 25);
	REQUIRE(!emulate(vcpu, iabt));

	REQUIRE(dev.reads == 0);
	REQUIRE(dev.writes == 0);
	REQUIRE(registers_of(vcpu) == before);
	REQUIRE(!vcpu.registers_dirty());
}

TEST_CASE("Aborts without a valid syndrome are not handled", "[Emulator]")
{
	TestDevice dev;
	VmOps ops = dev.ops();
	MshvVcpu vcpu { 0, &ops };
	setup_registers(vcpu);

	REQUIRE(!emulate(vcpu, DataAbortSyndrome{ .isv = false, .sas = 2, .srt = 5, .wnr = true }.encode()));
	REQUIRE(dev.writes == 0);
	REQUIRE(registers_of(vcpu).pc == GUEST_PC);
}

TEST_CASE("Data aborts from the same exception level", "[Emulator]")
{
	TestDevice dev;
	VmOps ops = dev.ops();
	MshvVcpu vcpu { 0, &ops };
	setup_registers(vcpu);

	REQUIRE(emulate(vcpu, DataAbortSyndrome{ .lower_el = false, .sas = 0, .srt = 5, .wnr = true }.encode()));
	REQUIRE(dev.written == std::vector<uint8_t>{ 0x44 });
}

TEST_CASE("XZR as source and destination", "[Emulator]")
{
	TestDevice dev;
	dev.read_value = { 1, 2, 3, 4, 5, 6, 7, 8 };
	VmOps ops = dev.ops();
	MshvVcpu vcpu { 0, &ops };
	setup_registers(vcpu);
	const auto before = registers_of(vcpu);

	// Stores of XZR write zeroes
	REQUIRE(emulate(vcpu, DataAbortSyndrome{ .sas = 3, .srt = 31, .wnr = true }.encode()));
	REQUIRE(dev.written == std::vector<uint8_t>(8, 0));

	// Loads into XZR are discarded
	REQUIRE(emulate(vcpu, DataAbortSyndrome{ .sas = 3, .srt = 31 }.encode()));
	REQUIRE(dev.reads == 1);

	auto after = registers_of(vcpu);
	REQUIRE(after.pc == GUEST_PC + 8);
	after.pc = before.pc;
	REQUIRE(after == before);
}

TEST_CASE("Device failures leave the vCPU untouched", "[Emulator]")
{
	TestDevice dev;
	dev.fail = true;
	VmOps ops = dev.ops();
	MshvVcpu vcpu { 0, &ops };
	setup_registers(vcpu);
	const auto before = registers_of(vcpu);

	REQUIRE_THROWS_AS(emulate(vcpu, DataAbortSyndrome{ .sas = 2, .srt = 1 }.encode()), MmioException);
	REQUIRE_THROWS_AS(emulate(vcpu, DataAbortSyndrome{ .sas = 2, .srt = 1, .wnr = true }.encode()),
		std::runtime_error);

	REQUIRE(registers_of(vcpu) == before);
	REQUIRE(!vcpu.registers_dirty());
}

TEST_CASE("Pending interruptions are not emulated", "[Emulator]")
{
	TestDevice dev;
	VmOps ops = dev.ops();
	MshvVcpu vcpu { 0, &ops };
	setup_registers(vcpu);

	REQUIRE_THROWS_AS(emulate(vcpu, DataAbortSyndrome{ .sas = 2, .srt = 5, .wnr = true }.encode(), true),
		UnsupportedException);
	REQUIRE(dev.writes == 0);
}

TEST_CASE("Emulation needs device access", "[Emulator]")
{
	MshvVcpu vcpu { 0, nullptr };
	setup_registers(vcpu);
	REQUIRE_THROWS_AS(emulate(vcpu, DataAbortSyndrome{ .sas = 2, .srt = 5, .wnr = true }.encode()),
		EmulatorException);
}

TEST_CASE("Register page handoff", "[Emulator]")
{
	TestDevice dev;
	VmOps ops = dev.ops();
	MshvVcpu vcpu { 0, &ops };
	setup_registers(vcpu);

	tinyhv_mshv_arm64regs page {};
	REQUIRE(!vcpu.take_dirty_registers(page));

	REQUIRE(emulate(vcpu, DataAbortSyndrome{ .sas = 2, .srt = 5, .wnr = true }.encode()));
	REQUIRE(vcpu.take_dirty_registers(page));
	REQUIRE(page.pc == GUEST_PC + 4);
	REQUIRE(!vcpu.registers_dirty());
}
