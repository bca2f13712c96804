#include <catch2/catch_test_macros.hpp>

#include <tinyhv/kvm/gic.hpp>
#include <tinyhv/kvm/gic_regs.hpp>
#include <algorithm>
#include <cstdarg>
#include <cstring>
#include <iterator>
#include <sys/ioctl.h>
#include <sys/syscall.h>
#include <unistd.h>
using namespace tinyhv;
using namespace tinyhv::arm64;

/* The KVM device ioctls of this test never reach the kernel. The VM is
   descriptor -1 and devices get descriptors from FAKE_FD_BASE upward.
   Every attribute write is recorded, and reads return made-up values. */
static constexpr int FAKE_FD_BASE = 40000;

struct Access {
	int fd;
	uint32_t group;
	uint64_t attr;
	uint64_t value;
};
static std::vector<Access> writes;
static int next_fake_fd = FAKE_FD_BASE;

static constexpr uint64_t ICC_CTLR_ATTR = 0xC664;
static constexpr uint64_t icc_ap0r_attr(unsigned n) { return 0xC644 + n; }
static constexpr uint64_t icc_ap1r_attr(unsigned n) { return 0xC648 + n; }

static bool is_fake(int fd) { return fd == -1 || fd >= FAKE_FD_BASE; }
static bool is_u32_group(uint32_t group) {
	return group == VGIC_GRP_DIST_REGS || group == VGIC_GRP_REDIST_REGS
		|| group == VGIC_GRP_NR_IRQS;
}

/* What the fake GIC holds in each register */
static uint64_t fake_value(uint32_t group, uint64_t attr)
{
	if (group == VGIC_GRP_CPU_SYSREGS && (attr & 0xFFFF) == ICC_CTLR_ATTR) {
		// 5 priority bits on the first CPU, 7 on the second
		return (attr >> 32) == 0 ? (4u << 8) : (6u << 8);
	}
	if (group == VGIC_GRP_CPU_SYSREGS)
		return attr & 0xFF;
	return (attr * 2654435761u) ^ group;
}

extern "C" int ioctl(int fd, unsigned long request, ...) __THROW
{
	va_list ap;
	va_start(ap, request);
	void* arg = va_arg(ap, void*);
	va_end(ap);
	if (!is_fake(fd))
		return syscall(SYS_ioctl, fd, request, arg);

	if (request == KVM_CREATE_DEVICE) {
		static_cast<kvm_create_device*>(arg)->fd = next_fake_fd++;
		return 0;
	}
	if (request == KVM_SET_DEVICE_ATTR) {
		const auto* attr = static_cast<const kvm_device_attr*>(arg);
		uint64_t value = 0;
		if (attr->addr != 0) {
			if (is_u32_group(attr->group)) {
				uint32_t v32;
				std::memcpy(&v32, (const void*)attr->addr, sizeof(v32));
				value = v32;
			} else {
				std::memcpy(&value, (const void*)attr->addr, sizeof(value));
			}
		}
		writes.push_back(Access{fd, attr->group, attr->attr, value});
		return 0;
	}
	if (request == KVM_GET_DEVICE_ATTR) {
		const auto* attr = static_cast<const kvm_device_attr*>(arg);
		const uint64_t value = fake_value(attr->group, attr->attr);
		if (is_u32_group(attr->group)) {
			const uint32_t v32 = value;
			std::memcpy((void*)attr->addr, &v32, sizeof(v32));
		} else {
			std::memcpy((void*)attr->addr, &value, sizeof(value));
		}
		return 0;
	}
	return 0;
}

static const VgicConfig config {
	.vcpu_count = 2,
	.dist_addr = 0x08000000,
	.dist_size = 0x10000,
	.redists_addr = 0x080A0000,
	.redists_size = 2 * 0x20000,
	.msi_addr = 0x08080000,
	.msi_size = 0x20000,
	.nr_irqs = 64,
};

static CpuState cpu_with_mpidr(uint64_t mpidr)
{
	KvmVcpuState state;
	state.sys_regs.push_back(kvm_one_reg{ .id = MPIDR_EL1_ID, .addr = mpidr });
	return CpuState{state};
}

static std::unique_ptr<KvmGicV3Its> create_gic(KvmVm& vm)
{
	auto gic = KvmGicV3Its::create(vm, config);
	gic->set_gicr_typers({ cpu_with_mpidr(0x80000000), cpu_with_mpidr(0x80000001) });
	writes.clear();
	return gic;
}

static std::vector<Access> writes_to(int fd)
{
	std::vector<Access> result;
	std::copy_if(writes.begin(), writes.end(), std::back_inserter(result),
		[fd] (const Access& a) { return a.fd == fd; });
	return result;
}

TEST_CASE("GIC creation order", "[GIC]")
{
	KvmVm vm { -1, {} };
	writes.clear();
	auto gic = KvmGicV3Its::create(vm, config);
	const int gic_fd = gic->device().fd();
	const int its_fd = gic->its_device().fd();

	REQUIRE(writes.size() == 6);
	REQUIRE(writes[0].fd == gic_fd);
	REQUIRE(writes[0].value == config.dist_addr);
	REQUIRE(writes[1].value == config.redists_addr);
	REQUIRE(writes[2].fd == its_fd);
	REQUIRE(writes[2].value == config.msi_addr);
	REQUIRE(writes[3].group == VGIC_GRP_CTRL);
	// The GIC is initialized last, once the number of interrupts is known
	REQUIRE(writes[4].group == VGIC_GRP_NR_IRQS);
	REQUIRE(writes[4].value == 64);
	REQUIRE(writes[5].fd == gic_fd);
	REQUIRE(writes[5].group == VGIC_GRP_CTRL);
	REQUIRE(writes[5].attr == VGIC_CTRL_INIT);
}

TEST_CASE("GIC state is restored in dependency order", "[GIC]")
{
	KvmVm vm { -1, {} };
	auto gic = create_gic(vm);
	const int gic_fd = gic->device().fd();
	const int its_fd = gic->its_device().fd();

	const auto saved = gic->state();
	const auto& kstate = saved.kvm();
	REQUIRE(writes.empty());
	// Main registers and AP0R0/AP1R0 for 5 priority bits, all four for 7
	REQUIRE(kstate.icc.size() == (7 + 2) + (7 + 8));
	REQUIRE(kstate.dist.size() == gic_regs::dist_regs_count(64));

	gic->set_state(saved);

	// Every distributor, redistributor and CPU interface write comes first
	const auto gic_writes = writes_to(gic_fd);
	REQUIRE(gic_writes.size() == kstate.dist.size() + kstate.rdist.size() + kstate.icc.size() + 1);
	for (size_t i = 0; i < gic_writes.size(); i++)
		REQUIRE(writes[i].fd == gic_fd);

	// The distributor is enabled last
	const auto& last = gic_writes.back();
	REQUIRE(last.group == VGIC_GRP_DIST_REGS);
	REQUIRE(last.attr == 0);
	REQUIRE(last.value == kstate.gicd_ctlr);

	// Saved values are written back in the order they were read
	for (size_t i = 0; i < kstate.dist.size(); i++) {
		REQUIRE(gic_writes[i].group == VGIC_GRP_DIST_REGS);
		REQUIRE(gic_writes[i].value == kstate.dist[i]);
	}
	const size_t icc_begin = kstate.dist.size() + kstate.rdist.size();
	for (size_t i = 0; i < kstate.icc.size(); i++) {
		REQUIRE(gic_writes[icc_begin + i].group == VGIC_GRP_CPU_SYSREGS);
		REQUIRE(gic_writes[icc_begin + i].value == kstate.icc[i]);
	}

	// GICR_CTLR closes each redistributor
	const auto& rd0_last = gic_writes[kstate.dist.size() + kstate.rdist.size() / 2 - 1];
	REQUIRE(rd0_last.group == VGIC_GRP_REDIST_REGS);
	REQUIRE(rd0_last.attr == 0);

	// The ITS tables are restored after the base registers, CTLR goes last
	const auto its_writes = writes_to(its_fd);
	const uint64_t expected[] {
		gic_regs::GITS_IIDR, gic_regs::GITS_CBASER, gic_regs::GITS_CREADR, gic_regs::GITS_CWRITER,
		0x100, 0x108, 0x110, 0x118, 0x120, 0x128, 0x130, 0x138,
	};
	REQUIRE(its_writes.size() == std::size(expected) + 2);
	for (size_t i = 0; i < std::size(expected); i++) {
		REQUIRE(its_writes[i].group == VGIC_GRP_ITS_REGS);
		REQUIRE(its_writes[i].attr == expected[i]);
	}
	REQUIRE(its_writes[12].group == VGIC_GRP_CTRL);
	REQUIRE(its_writes[12].attr == ITS_RESTORE_TABLES);
	REQUIRE(its_writes[13].group == VGIC_GRP_ITS_REGS);
	REQUIRE(its_writes[13].attr == gic_regs::GITS_CTLR);
	REQUIRE(its_writes[13].value == kstate.its_ctlr);
	REQUIRE(writes.back().fd == its_fd);

	// Without an ITS, only the GIC is touched
	auto no_its = saved;
	no_its.kvm().has_its = false;
	writes.clear();
	gic->set_state(no_its);
	REQUIRE(writes_to(its_fd).empty());
}

TEST_CASE("Active priority registers follow ICC_CTLR_EL1", "[GIC]")
{
	KvmVm vm { -1, {} };
	auto gic = create_gic(vm);
	const auto saved = gic->state();
	gic->set_state(saved);

	auto count = [] (uint64_t affinity, uint64_t reg) {
		return std::count_if(writes.begin(), writes.end(), [=] (const Access& a) {
			return a.group == VGIC_GRP_CPU_SYSREGS && a.attr == ((affinity << 32) | reg);
		});
	};
	REQUIRE(count(0, ICC_CTLR_ATTR) == 1);
	REQUIRE(count(0, icc_ap0r_attr(0)) == 1);
	REQUIRE(count(0, icc_ap1r_attr(0)) == 1);
	REQUIRE(count(0, icc_ap0r_attr(1)) == 0);
	REQUIRE(count(0, icc_ap1r_attr(3)) == 0);
	for (unsigned n = 0; n < 4; n++) {
		REQUIRE(count(1, icc_ap0r_attr(n)) == 1);
		REQUIRE(count(1, icc_ap1r_attr(n)) == 1);
	}

	// 6 priority bits on both CPUs: two AP registers per group
	auto regrouped = saved;
	auto& icc = regrouped.kvm().icc;
	icc.clear();
	for (int cpu = 0; cpu < 2; cpu++) {
		icc.insert(icc.end(), { 0x7, 5u << 8, 1, 1, 0xF0, 0, 0 });
		icc.insert(icc.end(), { 0x10, 0x11, 0x20, 0x21 });
	}
	REQUIRE(gic_regs::icc_regs_match(gic->gicr_typers(), icc));

	writes.clear();
	gic->set_state(regrouped);
	REQUIRE(count(0, icc_ap0r_attr(1)) == 1);
	REQUIRE(count(0, icc_ap1r_attr(1)) == 1);
	REQUIRE(count(1, icc_ap0r_attr(2)) == 0);
	REQUIRE(count(1, icc_ap1r_attr(3)) == 0);
}

TEST_CASE("Mismatching GIC state is refused before any write", "[GIC]")
{
	KvmVm vm { -1, {} };
	auto gic = create_gic(vm);
	const auto saved = gic->state();

	auto refused = [&] (const GicState& state) {
		writes.clear();
		REQUIRE_THROWS_AS(gic->set_state(state), HypervisorException);
		REQUIRE(writes.empty());
	};

	auto short_dist = saved;
	short_dist.kvm().dist.pop_back();
	refused(short_dist);

	auto long_dist = saved;
	long_dist.kvm().dist.push_back(0);
	refused(long_dist);

	// A complete distributor does not make a short redistributor state acceptable
	auto short_rdist = saved;
	short_rdist.kvm().rdist.pop_back();
	refused(short_rdist);

	auto short_icc = saved;
	short_icc.kvm().icc.pop_back();
	refused(short_icc);

	auto long_icc = saved;
	long_icc.kvm().icc.push_back(0);
	refused(long_icc);

	// With 5 priority bits the second CPU would leave six AP registers over
	auto wrong_prio = saved;
	wrong_prio.kvm().icc[9 + 1] = 4u << 8;
	refused(wrong_prio);

	// The helpers themselves refuse just the same
	writes.clear();
	REQUIRE_THROWS_AS(gic_regs::set_icc_regs(gic->device(), gic->gicr_typers(), wrong_prio.kvm().icc),
		HypervisorException);
	REQUIRE_THROWS_AS(gic_regs::set_redist_regs(gic->device(), gic->gicr_typers(), short_rdist.kvm().rdist),
		HypervisorException);
	REQUIRE(writes.empty());

	// And the intact state still restores
	gic->set_state(saved);
	REQUIRE(!writes.empty());
}

TEST_CASE("GICR_TYPER needs one state per vCPU", "[GIC]")
{
	KvmVm vm { -1, {} };
	auto gic = KvmGicV3Its::create(vm, config);
	REQUIRE_THROWS_AS(gic->state(), HypervisorException);

	REQUIRE_THROWS_AS(gic->set_gicr_typers({ cpu_with_mpidr(0x80000000) }), HypervisorException);
	REQUIRE_THROWS_AS(gic->set_gicr_typers({ cpu_with_mpidr(0), cpu_with_mpidr(1), cpu_with_mpidr(2) }),
		HypervisorException);
	REQUIRE(gic->gicr_typers().empty());

	gic->set_gicr_typers({ cpu_with_mpidr(0x80000000), cpu_with_mpidr(0x80000001) });
	REQUIRE(gic->gicr_typers().size() == 2);
}

TEST_CASE("Pending tables are saved before the ITS tables", "[GIC]")
{
	KvmVm vm { -1, {} };
	auto gic = create_gic(vm);
	gic->save_data_tables();

	REQUIRE(writes.size() == 2);
	REQUIRE(writes[0].fd == gic->device().fd());
	REQUIRE(writes[0].attr == VGIC_SAVE_PENDING_TABLES);
	REQUIRE(writes[1].fd == gic->its_device().fd());
	REQUIRE(writes[1].attr == ITS_SAVE_TABLES);
}
