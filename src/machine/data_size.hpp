#pragma once
#ifndef MACHINE_DATA_SIZE
#define MACHINE_DATA_SIZE
#endif

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>

namespace wit::machine {
	// operand sizes of x86-64, the value is the width in bytes
	enum class data_size_t : uint8_t {
		BYTE = 1,
		WORD = 2,
		DWORD = 4,
		QWORD = 8
	};
	inline data_size_t data_size_from_bytes(uint32_t bytes);
	inline uint32_t data_size_bytes(data_size_t ds) {
		return static_cast<uint32_t>(ds);
	}
	// NASM data definition directive for one unit of the given size (db, dw, dd, dq)
	inline std::string data_definition(data_size_t ds);
	inline std::ostream& operator<<(std::ostream& os, const data_size_t& ds);
} // wit::machine

#include "data_size.inl"
