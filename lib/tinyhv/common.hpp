#pragma once

#ifndef LIKELY
#define LIKELY(x) __builtin_expect((x), 1)
#endif
#ifndef UNLIKELY
#define UNLIKELY(x) __builtin_expect((x), 0)
#endif

#define TINYHV_COLD()   __attribute__ ((cold))

#include <cstdint>
#include <exception>
#include <functional>
#include <string>
#include <type_traits>

namespace tinyhv
{
	enum class HypervisorType : uint8_t {
		Kvm  = 1,
		Mshv = 2,
	};
	const char* to_string(HypervisorType) noexcept;

	using printer_func = std::function<void(const char*, size_t)>;

	struct HypervisorOptions {
		std::string kvm_device = "/dev/kvm";
		/* Print every capability check at open time. */
		bool verbose_capabilities = false;
		/* Print every memory slot installed into a VM. */
		bool verbose_memory = false;
		/* Where verbose output goes. Empty means stdout. */
		printer_func printer {};
	};

	class HypervisorException : public std::exception {
	public:
	    HypervisorException(const char* msg, uint64_t data = 0)
			: m_msg(msg), m_data(data) {}
	    const char* what() const noexcept override {
	        return m_msg;
	    }
		auto data() const noexcept { return m_data; }
	protected:
		const char* m_msg;
		uint64_t m_data;
	};

	/* A capability the rest of the system depends on is missing. */
	class CapabilityException : public HypervisorException {
	public:
		using HypervisorException::HypervisorException;
		auto capability() const noexcept { return data(); }
	};

	/* An operation was invoked with a handle or state
	   belonging to another hypervisor backend. */
	class TypeConfusionException : public HypervisorException {
	public:
		TypeConfusionException(const char* msg, HypervisorType expected, HypervisorType actual)
			: HypervisorException{msg, uint64_t(actual)}, m_expected(expected) {}
		auto expected() const noexcept { return m_expected; }
		auto actual() const noexcept { return HypervisorType(data()); }
	private:
		HypervisorType m_expected;
	};

	/* The backend does not implement the operation. Not transient. */
	class UnsupportedException : public HypervisorException {
	public:
		using HypervisorException::HypervisorException;
	};

	class EmulatorException : public HypervisorException {
	public:
		using HypervisorException::HypervisorException;
	};

	class RegisterException : public HypervisorException {
	public:
		using HypervisorException::HypervisorException;
		auto register_id() const noexcept { return data(); }
	};

	class MmioException : public HypervisorException {
	public:
	    MmioException(const char* msg, uint64_t addr, uint64_t sz)
			: HypervisorException{msg, addr}, m_size(sz) {}
		auto addr() const noexcept { return data(); }
		auto size() const noexcept { return m_size; }
	private:
		uint64_t m_size;
	};

	template <class...> constexpr std::false_type always_false {};

	[[noreturn]] void hypervisor_exception(const char*, uint64_t = 0);
	[[noreturn]] void unsupported_exception(const char*, HypervisorType);
}
