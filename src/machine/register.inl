#pragma once
#ifndef MACHINE_REGISTER
#error "Include machine/register.hpp instead of machine/register.inl"
#endif

namespace wit::machine {
	inline std::string to_string(register_id id) {
		return register_t(id, data_size_t::QWORD).to_string();
	}
	inline std::string register_t::to_string() const {
		const auto index = static_cast<uint8_t>(id);
		if (index >= static_cast<uint8_t>(register_id::r8)) {
			// r8 - r15 share one naming scheme: r8b, r8w, r8d, r8
			std::string name = "r" + std::to_string(index);
			switch (size) {
				case data_size_t::BYTE: return name + "b";
				case data_size_t::WORD: return name + "w";
				case data_size_t::DWORD: return name + "d";
				case data_size_t::QWORD: return name;
				default: throw std::runtime_error("Invalid access size for register");
			}
		}
		switch (id) {
			case register_id::rax:
			case register_id::rbx:
			case register_id::rcx:
			case register_id::rdx: {
				const char letter = "abcd"[index];
				switch (size) {
					case data_size_t::BYTE: return std::string(1, letter) + "l";
					case data_size_t::WORD: return std::string(1, letter) + "x";
					case data_size_t::DWORD: return std::string("e") + letter + "x";
					case data_size_t::QWORD: return std::string("r") + letter + "x";
					default: throw std::runtime_error("Invalid access size for register");
				}
			}
			case register_id::rsi:
			case register_id::rdi:
			case register_id::rbp:
			case register_id::rsp: {
				std::string base;
				switch (id) {
					case register_id::rsi: base = "si";
						break;
					case register_id::rdi: base = "di";
						break;
					case register_id::rbp: base = "bp";
						break;
					default: base = "sp";
						break;
				}
				switch (size) {
					case data_size_t::BYTE: return base + "l";
					case data_size_t::WORD: return base;
					case data_size_t::DWORD: return "e" + base;
					case data_size_t::QWORD: return "r" + base;
					default: throw std::runtime_error("Invalid access size for register");
				}
			}
			default:
				throw std::runtime_error("Invalid register id");
		}
	}
} // wit::machine
