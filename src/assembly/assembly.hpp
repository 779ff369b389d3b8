#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

#include "../machine/data_size.hpp"
#include "../machine/register.hpp"

namespace wit::assembly {
	// the subset of x86-64 instructions emitted by the compiler
	enum class operation : uint8_t {
		// Data Movement
		MOV,
		MOVZX,
		LEA,
		PUSH,
		POP,

		// Arithmetic
		ADD,
		SUB,
		NEG,
		MUL, // unsigned, implicit rax/rdx
		IMUL, // only used for index scaling
		DIV, // unsigned, implicit rax/rdx

		// Bitwise Operations
		XOR,
		SHL,
		SHR,

		// System
		SYSCALL
	};
	std::ostream& operator<<(std::ostream& os, operation op);

	struct assembly_literal {
		enum class type : uint8_t {
			NUMBER,
			LABEL
		} literal_type;
		std::variant<int64_t, std::string> value;
		explicit assembly_literal(int64_t num)
			: literal_type(type::NUMBER), value(num) {
		}
		explicit assembly_literal(const std::string& label)
			: literal_type(type::LABEL), value(label) {
		}
		[[nodiscard]] std::string to_string() const;
		bool operator==(const assembly_literal& other) const {
			return literal_type == other.literal_type && value == other.value;
		}
		friend std::ostream& operator<<(std::ostream& os, const assembly_literal& lit) {
			return os << lit.to_string();
		}
	};

	// effective address [base + index*scale + displacement]
	// the base is either a register or a label
	struct assembly_memory {
		std::variant<machine::register_id, std::string> base;
		std::optional<machine::register_id> index;
		uint8_t scale;
		int64_t displacement;

		explicit assembly_memory(machine::register_id base, int64_t displacement = 0)
			: base(base), index(std::nullopt), scale(1), displacement(displacement) {
		}
		explicit assembly_memory(const std::string& label, int64_t displacement = 0)
			: base(label), index(std::nullopt), scale(1), displacement(displacement) {
		}
		assembly_memory(machine::register_id base, machine::register_id index, uint8_t scale,
			int64_t displacement = 0)
			: base(base), index(index), scale(scale), displacement(displacement) {
		}

		[[nodiscard]] bool has_label_base() const {
			return std::holds_alternative<std::string>(base);
		}
		// registers taking part in the address computation
		[[nodiscard]] std::vector<machine::register_id> registers() const;
		[[nodiscard]] std::string to_string() const;
		bool operator==(const assembly_memory& other) const {
			return base == other.base && index == other.index && scale == other.scale &&
				displacement == other.displacement;
		}
		friend std::ostream& operator<<(std::ostream& os, const assembly_memory& mem) {
			return os << mem.to_string();
		}
	};
	struct assembly_memory_pointer {
		machine::data_size_t size;
		assembly_memory mem;
		assembly_memory_pointer(machine::data_size_t sz, assembly_memory m)
			: size(sz), mem(std::move(m)) {
		}
		friend std::ostream& operator<<(std::ostream& os, const assembly_memory_pointer& ptr) {
			os << ptr.size << " " << ptr.mem;
			return os;
		}
	};
	struct assembly_operand {
		enum class type : uint8_t {
			REGISTER,
			LITERAL,
			MEMORY_POINTER,
			MEMORY // unsized, only as the source of LEA
		} operand_type;
		std::variant<
			machine::register_t,
			assembly_literal,
			assembly_memory_pointer,
			assembly_memory
		> value;

		explicit assembly_operand(machine::register_t reg)
			: operand_type(type::REGISTER), value(reg) {
		}
		explicit assembly_operand(assembly_literal lit)
			: operand_type(type::LITERAL), value(std::move(lit)) {
		}
		explicit assembly_operand(assembly_memory_pointer mem)
			: operand_type(type::MEMORY_POINTER), value(std::move(mem)) {
		}
		explicit assembly_operand(assembly_memory mem)
			: operand_type(type::MEMORY), value(std::move(mem)) {
		}
		friend std::ostream& operator<<(std::ostream& os, const assembly_operand& op);
	};
	struct assembly_instruction {
		operation op;
		std::vector<assembly_operand> operands;

		explicit assembly_instruction(operation opr)
			: op(opr) {
		}
		assembly_instruction(operation opr, assembly_operand op1)
			: op(opr), operands{std::move(op1)} {
		}
		assembly_instruction(operation opr, assembly_operand op1, assembly_operand op2)
			: op(opr), operands{std::move(op1), std::move(op2)} {
		}
		assembly_instruction(operation opr, assembly_operand op1, assembly_operand op2, assembly_operand op3)
			: op(opr), operands{std::move(op1), std::move(op2), std::move(op3)} {
			if (opr != operation::IMUL) {
				throw std::invalid_argument("Only IMUL takes three operands");
			}
		}

		friend std::ostream& operator<<(std::ostream& os, const assembly_instruction& inst);
	};
	// section switches, global declarations and blank lines
	struct assembly_directive {
		std::string text;
		bool indented;
	};
	// storage definition in the data section, e.g. "x: dd 0" or "a: times 8 dq 0"
	struct assembly_data {
		std::string label;
		machine::data_size_t unit;
		uint32_t count;
		int64_t value;
	};
	struct assembly_component {
		enum class type : uint8_t {
			LABEL,
			INSTRUCTION,
			DIRECTIVE,
			DATA,
			RAW // a line taken verbatim from an embedded routine
		} component_type;
		std::variant<
			std::string,
			assembly_instruction,
			assembly_directive,
			assembly_data
		> value;

		static assembly_component label(const std::string& name) {
			return {type::LABEL, name};
		}
		static assembly_component raw(const std::string& line) {
			return {type::RAW, line};
		}
		assembly_component(const assembly_instruction& inst)
			: component_type(type::INSTRUCTION), value(inst) {
		}
		assembly_component(const assembly_directive& directive)
			: component_type(type::DIRECTIVE), value(directive) {
		}
		assembly_component(const assembly_data& data)
			: component_type(type::DATA), value(data) {
		}

		friend std::ostream& operator<<(std::ostream& os, const assembly_component& comp);

	private:
		assembly_component(type t, const std::string& text)
			: component_type(t), value(text) {
		}
	};
	typedef std::vector<assembly_component> assembly_program_t;

	// writes the program one component per line
	void write_program(std::ostream& os, const assembly_program_t& program);
	std::string to_string(const assembly_program_t& program);
} // wit::assembly
