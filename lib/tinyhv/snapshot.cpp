#include "snapshot.hpp"

#include <cstddef>
#include <cstring>

namespace tinyhv {

namespace {
struct SnapshotWriter {
	std::vector<uint8_t> data;

	SnapshotWriter(SnapshotHeader::Kind kind, HypervisorType type)
	{
		const SnapshotHeader hdr {
			.magic   = SnapshotHeader::MAGIC,
			.version = SnapshotHeader::VERSION,
			.kind    = kind,
			.backend = uint8_t(type),
			.size    = 0,
		};
		put(hdr);
	}

	template <typename T>
	void put(const T& value) {
		static_assert(std::is_trivially_copyable_v<T>);
		const auto* bytes = reinterpret_cast<const uint8_t*>(&value);
		data.insert(data.end(), bytes, bytes + sizeof(T));
	}
	template <typename T>
	void put_vector(const std::vector<T>& vec) {
		put(uint32_t(vec.size()));
		for (const auto& value : vec)
			put(value);
	}

	std::vector<uint8_t> finish() {
		const uint32_t size = data.size() - sizeof(SnapshotHeader);
		std::memcpy(data.data() + offsetof(SnapshotHeader, size), &size, sizeof(size));
		return std::move(data);
	}
};

struct SnapshotReader {
	std::span<const uint8_t> data;
	size_t current = 0;
	HypervisorType backend;

	SnapshotReader(std::span<const uint8_t> blob, SnapshotHeader::Kind kind)
		: data{blob}
	{
		const auto hdr = next<SnapshotHeader>();
		if (hdr.magic != SnapshotHeader::MAGIC) {
			throw HypervisorException("No valid snapshot found", hdr.magic);
		}
		if (hdr.version != SnapshotHeader::VERSION) {
			throw HypervisorException("Unsupported snapshot version", hdr.version);
		}
		if (hdr.kind != kind) {
			throw HypervisorException("Snapshot holds another kind of state", hdr.kind);
		}
		if (hdr.backend != uint8_t(HypervisorType::Kvm) && hdr.backend != uint8_t(HypervisorType::Mshv)) {
			throw HypervisorException("Unknown snapshot backend", hdr.backend);
		}
		if (hdr.size != data.size() - sizeof(SnapshotHeader)) {
			throw HypervisorException("Invalid snapshot size", hdr.size);
		}
		this->backend = HypervisorType(hdr.backend);
	}

	template <typename T>
	T next() {
		static_assert(std::is_trivially_copyable_v<T>);
		// Bounds-check against end-of-blob
		if (sizeof(T) > data.size() - current) {
			throw HypervisorException("Out of bounds access on snapshot", current);
		}
		T value;
		std::memcpy(&value, data.data() + current, sizeof(T));
		current += sizeof(T);
		return value;
	}
	/* For arrays, which cannot be returned by value */
	template <typename T>
	void next_into(T& value) {
		static_assert(std::is_trivially_copyable_v<T>);
		if (sizeof(T) > data.size() - current) {
			throw HypervisorException("Out of bounds access on snapshot", current);
		}
		std::memcpy(&value, data.data() + current, sizeof(T));
		current += sizeof(T);
	}
	template <typename T>
	std::vector<T> next_vector() {
		const uint32_t count = next<uint32_t>();
		if (count > (data.size() - current) / sizeof(T)) {
			throw HypervisorException("Out of bounds vector in snapshot", count);
		}
		std::vector<T> vec;
		vec.reserve(count);
		for (uint32_t i = 0; i < count; i++)
			vec.push_back(next<T>());
		return vec;
	}

	void finish() const {
		if (current != data.size()) {
			throw HypervisorException("Trailing bytes in snapshot", data.size() - current);
		}
	}
};

/* Saved system registers, as (identifier, value) pairs */
struct SavedRegister {
	uint64_t id;
	uint64_t value;
};

/* The register blocks are written member by member, so that the
   padding in front of vregs never ends up in a snapshot. */
template <typename Regs>
void put_common_regs(SnapshotWriter& w, const Regs& regs)
{
	w.put(regs.regs);
	w.put(regs.sp);
	w.put(regs.pc);
	w.put(regs.pstate);
	w.put(regs.sp_el1);
	w.put(regs.elr_el1);
	w.put(regs.spsr);
	w.put(regs.vregs);
	w.put(regs.fpsr);
	w.put(regs.fpcr);
}
template <typename Regs>
void next_common_regs(SnapshotReader& r, Regs& regs)
{
	r.next_into(regs.regs);
	r.next_into(regs.sp);
	r.next_into(regs.pc);
	r.next_into(regs.pstate);
	r.next_into(regs.sp_el1);
	r.next_into(regs.elr_el1);
	r.next_into(regs.spsr);
	r.next_into(regs.vregs);
	r.next_into(regs.fpsr);
	r.next_into(regs.fpcr);
}
} // anonymous

std::vector<uint8_t> serialize(const CpuState& state)
{
	SnapshotWriter w { SnapshotHeader::CPU, state.hypervisor_type() };
	if (const auto* kstate = std::get_if<KvmVcpuState>(&state.state)) {
		w.put(kstate->mp_state);
		put_common_regs(w, kstate->core_regs);
		w.put(kstate->core_regs.reserved);
		w.put(uint32_t(kstate->sys_regs.size()));
		for (const auto& reg : kstate->sys_regs)
			w.put(SavedRegister{reg.id, reg.addr});
	} else {
		put_common_regs(w, state.mshv().regs);
	}
	return w.finish();
}

CpuState deserialize_cpu_state(std::span<const uint8_t> blob)
{
	SnapshotReader r { blob, SnapshotHeader::CPU };
	CpuState result;
	if (r.backend == HypervisorType::Kvm) {
		KvmVcpuState kstate;
		kstate.mp_state = r.next<kvm_mp_state>();
		next_common_regs(r, kstate.core_regs);
		r.next_into(kstate.core_regs.reserved);
		for (const auto& reg : r.next_vector<SavedRegister>()) {
			if (arm64::is_core_register(reg.id)) {
				throw RegisterException("Core register in saved system registers", reg.id);
			}
			kstate.sys_regs.push_back(kvm_one_reg{ .id = reg.id, .addr = reg.value });
		}
		result.state = std::move(kstate);
	} else {
		MshvVcpuState mstate {};
		next_common_regs(r, mstate.regs);
		result.state = mstate;
	}
	r.finish();
	return result;
}

std::vector<uint8_t> serialize(const ClockData& clock)
{
	SnapshotWriter w { SnapshotHeader::CLOCK, clock.hypervisor_type() };
	if (const auto* kclock = std::get_if<kvm_clock_data>(&clock.data))
		w.put(*kclock);
	else
		w.put(clock.mshv().ref_time);
	return w.finish();
}

ClockData deserialize_clock_data(std::span<const uint8_t> blob)
{
	SnapshotReader r { blob, SnapshotHeader::CLOCK };
	ClockData result;
	if (r.backend == HypervisorType::Kvm)
		result.data = r.next<kvm_clock_data>();
	else
		result.data = MshvClockData{ r.next<uint64_t>() };
	r.finish();
	return result;
}

std::vector<uint8_t> serialize(const GicState& gic)
{
	SnapshotWriter w { SnapshotHeader::GIC, gic.hypervisor_type() };
	if (const auto* kgic = std::get_if<KvmGicState>(&gic.state)) {
		w.put(kgic->gicd_ctlr);
		w.put_vector(kgic->dist);
		w.put_vector(kgic->rdist);
		w.put_vector(kgic->icc);
		w.put(uint8_t(kgic->has_its));
		w.put(kgic->its_ctlr);
		w.put(kgic->its_iidr);
		w.put(kgic->its_cbaser);
		w.put(kgic->its_creadr);
		w.put(kgic->its_cwriter);
		w.put(kgic->its_baser);
	}
	/* The MSHV controller has no state of its own */
	return w.finish();
}

GicState deserialize_gic_state(std::span<const uint8_t> blob)
{
	SnapshotReader r { blob, SnapshotHeader::GIC };
	GicState result;
	if (r.backend == HypervisorType::Kvm) {
		KvmGicState kgic;
		kgic.gicd_ctlr = r.next<uint32_t>();
		kgic.dist  = r.next_vector<uint32_t>();
		kgic.rdist = r.next_vector<uint32_t>();
		kgic.icc   = r.next_vector<uint64_t>();
		kgic.has_its = r.next<uint8_t>() != 0;
		kgic.its_ctlr    = r.next<uint64_t>();
		kgic.its_iidr    = r.next<uint64_t>();
		kgic.its_cbaser  = r.next<uint64_t>();
		kgic.its_creadr  = r.next<uint64_t>();
		kgic.its_cwriter = r.next<uint64_t>();
		kgic.its_baser   = r.next<std::array<uint64_t, 8>>();
		result.state = std::move(kgic);
	} else {
		result.state = MshvGicState{};
	}
	r.finish();
	return result;
}

} // tinyhv
