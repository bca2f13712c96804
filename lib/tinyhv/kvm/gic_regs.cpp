#include "gic_regs.hpp"

#include <cstdio>
#include <iterator>
//#define KVM_VERBOSE_GIC

namespace tinyhv::gic_regs {
using namespace tinyhv::arm64;

/* A register or register range in one of the GIC frames.
   Values move through the device in 32-bit units. */
struct GicReg {
	uint32_t base;
	uint32_t length;
};

/* Registers with one field per interrupt. The first 32 (SGIs and
   PPIs) are banked in the redistributors, so the distributor
   ranges start after them. */
struct IrqReg {
	uint32_t base;
	uint32_t bits_per_irq;

	uint32_t first() const noexcept { return base + 32 * bits_per_irq / 8; }
	uint32_t end(uint32_t nr_irqs) const noexcept { return base + nr_irqs * bits_per_irq / 8; }
};

static constexpr uint32_t GICD_CTLR = 0x0;
static constexpr GicReg GICD_STATUSR { 0x0010, 4 };

static constexpr IrqReg DIST_IRQ_REGS[] {
	{ 0x0080, 1 },  /* GICD_IGROUPR */
	{ 0x0100, 1 },  /* GICD_ISENABLER */
	{ 0x0180, 1 },  /* GICD_ICENABLER */
	{ 0x0200, 1 },  /* GICD_ISPENDR */
	{ 0x0280, 1 },  /* GICD_ICPENDR */
	{ 0x0300, 1 },  /* GICD_ISACTIVER */
	{ 0x0380, 1 },  /* GICD_ICACTIVER */
	{ 0x0400, 8 },  /* GICD_IPRIORITYR */
	{ 0x0C00, 2 },  /* GICD_ICFGR */
	{ 0x6000, 64 }, /* GICD_IROUTER */
};

/* RD_base frame, then the SGI_base frame 64KB above it.
   GICR_CTLR is restored last, since it enables LPIs. */
static constexpr uint32_t SGI_BASE = 0x10000;
static constexpr GicReg REDIST_REGS[] {
	{ 0x0010, 4 },  /* GICR_STATUSR */
	{ 0x0014, 4 },  /* GICR_WAKER */
	{ 0x0070, 8 },  /* GICR_PROPBASER */
	{ 0x0078, 8 },  /* GICR_PENDBASER */
	{ SGI_BASE + 0x0080, 4 },  /* GICR_IGROUPR0 */
	{ SGI_BASE + 0x0180, 4 },  /* GICR_ICENABLER0 */
	{ SGI_BASE + 0x0100, 4 },  /* GICR_ISENABLER0 */
	{ SGI_BASE + 0x0C00, 8 },  /* GICR_ICFGR0 */
	{ SGI_BASE + 0x0280, 4 },  /* GICR_ICPENDR0 */
	{ SGI_BASE + 0x0200, 4 },  /* GICR_ISPENDR0 */
	{ SGI_BASE + 0x0380, 4 },  /* GICR_ICACTIVER0 */
	{ SGI_BASE + 0x0300, 4 },  /* GICR_ISACTIVER0 */
	{ SGI_BASE + 0x0400, 32 }, /* GICR_IPRIORITYR */
	{ 0x0000, 4 },  /* GICR_CTLR */
};

static void access_u32(const KvmDevice& dev, uint32_t group, uint64_t attr, uint32_t* value, bool set)
{
#ifdef KVM_VERBOSE_GIC
	printf("GIC: %s group %u attr 0x%llX\n", set ? "set" : "get", group, (unsigned long long)attr);
#endif
	if (set)
		dev.set_attr(group, attr, value);
	else
		dev.get_attr(group, attr, value);
}

/* Walk every 32-bit word of the distributor, excluding GICD_CTLR.
   The order is the same for saving and restoring. */
template <typename Func>
static void for_each_dist_word(uint32_t nr_irqs, Func&& func)
{
	for (uint32_t off = GICD_STATUSR.base; off < GICD_STATUSR.base + GICD_STATUSR.length; off += 4)
		func(off);
	for (const auto& reg : DIST_IRQ_REGS) {
		for (uint32_t off = reg.first(); off < reg.end(nr_irqs); off += 4)
			func(off);
	}
}

std::vector<uint32_t> get_dist_regs(const KvmDevice& dev, uint32_t nr_irqs)
{
	std::vector<uint32_t> state;
	for_each_dist_word(nr_irqs, [&] (uint32_t off) {
		uint32_t value = 0;
		access_u32(dev, VGIC_GRP_DIST_REGS, off, &value, false);
		state.push_back(value);
	});
	return state;
}

size_t dist_regs_count(uint32_t nr_irqs)
{
	size_t count = 0;
	for_each_dist_word(nr_irqs, [&] (uint32_t) { count++; });
	return count;
}

void set_dist_regs(const KvmDevice& dev, uint32_t nr_irqs, const std::vector<uint32_t>& state)
{
	if (UNLIKELY(dist_regs_count(nr_irqs) != state.size())) {
		throw HypervisorException("Distributor state has the wrong size", state.size());
	}
	size_t idx = 0;
	for_each_dist_word(nr_irqs, [&] (uint32_t off) {
		uint32_t value = state[idx++];
		access_u32(dev, VGIC_GRP_DIST_REGS, off, &value, true);
	});
}

uint32_t get_dist_ctrl_reg(const KvmDevice& dev)
{
	uint32_t value = 0;
	access_u32(dev, VGIC_GRP_DIST_REGS, GICD_CTLR, &value, false);
	return value;
}
void set_dist_ctrl_reg(const KvmDevice& dev, uint32_t ctlr)
{
	access_u32(dev, VGIC_GRP_DIST_REGS, GICD_CTLR, &ctlr, true);
}

/* The affinity of the redistributor goes in the upper half of the
   attribute. It is the same as the upper half of its GICR_TYPER. */
static uint64_t redist_attr(uint64_t gicr_typer, uint32_t offset) noexcept
{
	return (gicr_typer & VGIC_V3_MPIDR_MASK) | offset;
}

template <typename Func>
static void for_each_redist_word(const std::vector<uint64_t>& gicr_typers, Func&& func)
{
	for (const uint64_t typer : gicr_typers) {
		for (const auto& reg : REDIST_REGS) {
			for (uint32_t off = reg.base; off < reg.base + reg.length; off += 4)
				func(redist_attr(typer, off));
		}
	}
}

size_t redist_regs_count(const std::vector<uint64_t>& gicr_typers)
{
	size_t count = 0;
	for_each_redist_word(gicr_typers, [&] (uint64_t) { count++; });
	return count;
}

std::vector<uint32_t> get_redist_regs(const KvmDevice& dev, const std::vector<uint64_t>& gicr_typers)
{
	std::vector<uint32_t> state;
	for_each_redist_word(gicr_typers, [&] (uint64_t attr) {
		uint32_t value = 0;
		access_u32(dev, VGIC_GRP_REDIST_REGS, attr, &value, false);
		state.push_back(value);
	});
	return state;
}

void set_redist_regs(const KvmDevice& dev, const std::vector<uint64_t>& gicr_typers,
	const std::vector<uint32_t>& state)
{
	if (UNLIKELY(redist_regs_count(gicr_typers) != state.size())) {
		throw HypervisorException("Redistributor state has the wrong size", state.size());
	}
	size_t idx = 0;
	for_each_redist_word(gicr_typers, [&] (uint64_t attr) {
		uint32_t value = state[idx++];
		access_u32(dev, VGIC_GRP_REDIST_REGS, attr, &value, true);
	});
}

/* 16-bit system register encoding used by KVM_DEV_ARM_VGIC_GRP_CPU_SYSREGS */
static constexpr uint64_t icc_sysreg(unsigned op0, unsigned op1, unsigned crn, unsigned crm, unsigned op2) noexcept {
	return (uint64_t(op0) << SYSREG_OP0_SHIFT) | (uint64_t(op1) << SYSREG_OP1_SHIFT)
		| (uint64_t(crn) << SYSREG_CRN_SHIFT) | (uint64_t(crm) << SYSREG_CRM_SHIFT)
		| (uint64_t(op2) << SYSREG_OP2_SHIFT);
}
static constexpr uint64_t ICC_SRE_EL1     = icc_sysreg(3, 0, 12, 12, 5);
static constexpr uint64_t ICC_CTLR_EL1    = icc_sysreg(3, 0, 12, 12, 4);
static constexpr uint64_t ICC_IGRPEN0_EL1 = icc_sysreg(3, 0, 12, 12, 6);
static constexpr uint64_t ICC_IGRPEN1_EL1 = icc_sysreg(3, 0, 12, 12, 7);
static constexpr uint64_t ICC_PMR_EL1     = icc_sysreg(3, 0, 4, 6, 0);
static constexpr uint64_t ICC_BPR0_EL1    = icc_sysreg(3, 0, 12, 8, 3);
static constexpr uint64_t ICC_BPR1_EL1    = icc_sysreg(3, 0, 12, 12, 3);
static constexpr uint64_t icc_ap0r(unsigned n) noexcept { return icc_sysreg(3, 0, 12, 8, 4 + n); }
static constexpr uint64_t icc_ap1r(unsigned n) noexcept { return icc_sysreg(3, 0, 12, 9, n); }

static constexpr uint64_t MAIN_ICC_REGS[] {
	ICC_SRE_EL1, ICC_CTLR_EL1, ICC_IGRPEN0_EL1, ICC_IGRPEN1_EL1,
	ICC_PMR_EL1, ICC_BPR0_EL1, ICC_BPR1_EL1,
};
static constexpr uint64_t ICC_CTLR_PRIBITS_SHIFT = 8;
static constexpr uint64_t ICC_CTLR_PRIBITS_MASK  = 7ULL << ICC_CTLR_PRIBITS_SHIFT;

/* Only the active-priority registers backing the
   implemented priority bits exist. */
static bool ap_reg_implemented(unsigned n, unsigned num_priority_bits) noexcept
{
	switch (n) {
	case 0:
		return true;
	case 1:
		return num_priority_bits >= 6;
	default:
		return num_priority_bits == 7;
	}
}

bool icc_regs_match(const std::vector<uint64_t>& gicr_typers, const std::vector<uint64_t>& state)
{
	constexpr size_t NR_MAIN = std::size(MAIN_ICC_REGS);
	size_t idx = 0;
	for (size_t cpu = 0; cpu < gicr_typers.size(); cpu++) {
		if (state.size() - idx < NR_MAIN)
			return false;
		/* ICC_CTLR_EL1 decides how many AP registers follow */
		const uint64_t ctlr = state[idx + 1];
		const unsigned prio_bits = ((ctlr & ICC_CTLR_PRIBITS_MASK) >> ICC_CTLR_PRIBITS_SHIFT) + 1;
		idx += NR_MAIN;
		for (unsigned n = 0; n < 4; n++) {
			if (ap_reg_implemented(n, prio_bits))
				idx += 2;
		}
		if (idx > state.size())
			return false;
	}
	return idx == state.size();
}

static uint64_t access_icc(const KvmDevice& dev, uint64_t mpidr, uint64_t reg, uint64_t* value, bool set)
{
	const uint64_t attr = mpidr | reg;
	if (set)
		dev.set_attr(VGIC_GRP_CPU_SYSREGS, attr, value);
	else
		dev.get_attr(VGIC_GRP_CPU_SYSREGS, attr, value);
	return *value;
}

std::vector<uint64_t> get_icc_regs(const KvmDevice& dev, const std::vector<uint64_t>& gicr_typers)
{
	std::vector<uint64_t> state;
	for (const uint64_t typer : gicr_typers) {
		const uint64_t mpidr = typer & VGIC_V3_MPIDR_MASK;
		uint64_t ctlr = 0;
		for (const uint64_t reg : MAIN_ICC_REGS) {
			uint64_t value = 0;
			access_icc(dev, mpidr, reg, &value, false);
			if (reg == ICC_CTLR_EL1)
				ctlr = value;
			state.push_back(value);
		}
		const unsigned prio_bits = ((ctlr & ICC_CTLR_PRIBITS_MASK) >> ICC_CTLR_PRIBITS_SHIFT) + 1;
		for (unsigned n = 0; n < 4; n++) {
			if (!ap_reg_implemented(n, prio_bits))
				continue;
			uint64_t value = 0;
			state.push_back(access_icc(dev, mpidr, icc_ap0r(n), &value, false));
		}
		for (unsigned n = 0; n < 4; n++) {
			if (!ap_reg_implemented(n, prio_bits))
				continue;
			uint64_t value = 0;
			state.push_back(access_icc(dev, mpidr, icc_ap1r(n), &value, false));
		}
	}
	return state;
}

void set_icc_regs(const KvmDevice& dev, const std::vector<uint64_t>& gicr_typers,
	const std::vector<uint64_t>& state)
{
	if (UNLIKELY(!icc_regs_match(gicr_typers, state))) {
		throw HypervisorException("CPU interface state does not match the redistributors", state.size());
	}
	size_t idx = 0;
	for (const uint64_t typer : gicr_typers) {
		const uint64_t mpidr = typer & VGIC_V3_MPIDR_MASK;
		uint64_t ctlr = 0;
		for (const uint64_t reg : MAIN_ICC_REGS) {
			uint64_t value = state[idx++];
			if (reg == ICC_CTLR_EL1)
				ctlr = value;
			access_icc(dev, mpidr, reg, &value, true);
		}
		const unsigned prio_bits = ((ctlr & ICC_CTLR_PRIBITS_MASK) >> ICC_CTLR_PRIBITS_SHIFT) + 1;
		for (unsigned n = 0; n < 4; n++) {
			if (!ap_reg_implemented(n, prio_bits))
				continue;
			uint64_t value = state[idx++];
			access_icc(dev, mpidr, icc_ap0r(n), &value, true);
		}
		for (unsigned n = 0; n < 4; n++) {
			if (!ap_reg_implemented(n, prio_bits))
				continue;
			uint64_t value = state[idx++];
			access_icc(dev, mpidr, icc_ap1r(n), &value, true);
		}
	}
}

uint64_t get_its_reg(const KvmDevice& dev, uint32_t offset)
{
	uint64_t value = 0;
	dev.get_attr(VGIC_GRP_ITS_REGS, offset, &value);
	return value;
}
void set_its_reg(const KvmDevice& dev, uint32_t offset, uint64_t value)
{
	dev.set_attr(VGIC_GRP_ITS_REGS, offset, &value);
}

} // tinyhv::gic_regs
