#pragma once
#include "state.hpp"
#include <span>
#include <vector>

namespace tinyhv {

/**
 * In-memory snapshot encoding of vCPU, clock and interrupt controller
 * state. Every blob starts with a header naming what it holds and
 * which backend produced it. Loading a malformed blob, or one of the
 * wrong kind, throws HypervisorException.
**/
struct SnapshotHeader {
	static constexpr uint32_t MAGIC = 0x53564854; // 'THVS'
	static constexpr uint16_t VERSION = 2;
	enum Kind : uint8_t {
		CPU   = 1,
		CLOCK = 2,
		GIC   = 3,
	};

	uint32_t magic;
	uint16_t version;
	uint8_t  kind;
	uint8_t  backend;
	/* Payload bytes following the header */
	uint32_t size;
};

std::vector<uint8_t> serialize(const CpuState&);
std::vector<uint8_t> serialize(const ClockData&);
std::vector<uint8_t> serialize(const GicState&);

CpuState deserialize_cpu_state(std::span<const uint8_t>);
ClockData deserialize_clock_data(std::span<const uint8_t>);
GicState deserialize_gic_state(std::span<const uint8_t>);

} // tinyhv
