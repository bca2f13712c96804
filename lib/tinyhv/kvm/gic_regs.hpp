#pragma once
#include "kvm.hpp"
#include <vector>

namespace tinyhv::gic_regs {

/* Distributor. GICD_CTLR is kept apart so that it
   can be restored last, after every other register. */
size_t dist_regs_count(uint32_t nr_irqs);
std::vector<uint32_t> get_dist_regs(const KvmDevice&, uint32_t nr_irqs);
void set_dist_regs(const KvmDevice&, uint32_t nr_irqs, const std::vector<uint32_t>&);
uint32_t get_dist_ctrl_reg(const KvmDevice&);
void set_dist_ctrl_reg(const KvmDevice&, uint32_t ctlr);

/* Redistributors, one frame pair per GICR_TYPER */
size_t redist_regs_count(const std::vector<uint64_t>& gicr_typers);
std::vector<uint32_t> get_redist_regs(const KvmDevice&, const std::vector<uint64_t>& gicr_typers);
void set_redist_regs(const KvmDevice&, const std::vector<uint64_t>& gicr_typers, const std::vector<uint32_t>&);

/* GIC CPU interface system registers. The number of active priority
   registers saved per CPU follows the PRIbits of its ICC_CTLR_EL1. */
bool icc_regs_match(const std::vector<uint64_t>& gicr_typers, const std::vector<uint64_t>& state);
std::vector<uint64_t> get_icc_regs(const KvmDevice&, const std::vector<uint64_t>& gicr_typers);
void set_icc_regs(const KvmDevice&, const std::vector<uint64_t>& gicr_typers, const std::vector<uint64_t>&);

/* Interrupt Translation Service */
static constexpr uint32_t GITS_CTLR    = 0x0000;
static constexpr uint32_t GITS_IIDR    = 0x0004;
static constexpr uint32_t GITS_CBASER  = 0x0080;
static constexpr uint32_t GITS_CWRITER = 0x0088;
static constexpr uint32_t GITS_CREADR  = 0x0090;
static constexpr uint32_t GITS_BASER   = 0x0100;

uint64_t get_its_reg(const KvmDevice&, uint32_t offset);
void set_its_reg(const KvmDevice&, uint32_t offset, uint64_t value);

} // tinyhv::gic_regs
