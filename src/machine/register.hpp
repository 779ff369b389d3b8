#pragma once
#ifndef MACHINE_REGISTER
#define MACHINE_REGISTER
#endif

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>

#include "data_size.hpp"

namespace wit::machine {
	enum class register_id : uint8_t {
		rax = 0,
		rbx = 1,
		rcx = 2,
		rdx = 3,
		rsi = 4,
		rdi = 5,
		rbp = 6,
		rsp = 7,
		r8 = 8,
		r9 = 9,
		r10 = 10,
		r11 = 11,
		r12 = 12,
		r13 = 13,
		r14 = 14,
		r15 = 15
	};
	static constexpr uint8_t REGISTER_COUNT = 16;

	// 64-bit name of the register
	inline std::string to_string(register_id id);
	inline std::ostream& operator<<(std::ostream& os, register_id id) {
		os << to_string(id);
		return os;
	}

	// a register accessed with a specific operand size, e.g. (rax, DWORD) is eax
	struct register_t {
		register_id id;
		data_size_t size;

		constexpr register_t(register_id id, data_size_t size = data_size_t::QWORD)
			: id(id), size(size) {
		}
		[[nodiscard]] std::string to_string() const;
		bool operator==(const register_t& other) const {
			return id == other.id && size == other.size;
		}
		friend std::ostream& operator<<(std::ostream& os, const register_t& reg) {
			os << reg.to_string();
			return os;
		}
	};
} // wit::machine

#include "register.inl"
