#pragma once
#ifndef MACHINE_DATA_SIZE
#error "Include machine/data_size.hpp instead of machine/data_size.inl"
#endif

namespace wit::machine {
	inline data_size_t data_size_from_bytes(uint32_t bytes) {
		switch (bytes) {
			case 1:
				return data_size_t::BYTE;
			case 2:
				return data_size_t::WORD;
			case 4:
				return data_size_t::DWORD;
			case 8:
				return data_size_t::QWORD;
			default:
				throw std::logic_error("No operand size for " + std::to_string(bytes) + " bytes");
		}
	}
	inline std::string data_definition(data_size_t ds) {
		switch (ds) {
			case data_size_t::BYTE:
				return "db";
			case data_size_t::WORD:
				return "dw";
			case data_size_t::DWORD:
				return "dd";
			case data_size_t::QWORD:
				return "dq";
			default:
				throw std::logic_error("Invalid data size");
		}
	}
	inline std::ostream& operator<<(std::ostream& os, const data_size_t& ds) {
		switch (ds) {
			case data_size_t::BYTE:
				os << "byte";
				break;
			case data_size_t::WORD:
				os << "word";
				break;
			case data_size_t::DWORD:
				os << "dword";
				break;
			case data_size_t::QWORD:
				os << "qword";
				break;
			default:
				os << "unknown";
				break;
		}
		return os;
	}
} // wit::machine
