#include "assembly.hpp"

#include <sstream>

namespace wit::assembly {
	std::ostream& operator<<(std::ostream& os, operation op) {
		switch (op) {
			case operation::MOV: return os << "mov";
			case operation::MOVZX: return os << "movzx";
			case operation::LEA: return os << "lea";
			case operation::PUSH: return os << "push";
			case operation::POP: return os << "pop";
			case operation::ADD: return os << "add";
			case operation::SUB: return os << "sub";
			case operation::NEG: return os << "neg";
			case operation::MUL: return os << "mul";
			case operation::IMUL: return os << "imul";
			case operation::DIV: return os << "div";
			case operation::XOR: return os << "xor";
			case operation::SHL: return os << "shl";
			case operation::SHR: return os << "shr";
			case operation::SYSCALL: return os << "syscall";
		}
		return os << "unknown";
	}

	std::string assembly_literal::to_string() const {
		switch (literal_type) {
			case type::NUMBER:
				return std::to_string(std::get<int64_t>(value));
			case type::LABEL:
				return std::get<std::string>(value);
		}
		return "";
	}

	std::vector<machine::register_id> assembly_memory::registers() const {
		std::vector<machine::register_id> regs;
		if (std::holds_alternative<machine::register_id>(base)) {
			regs.push_back(std::get<machine::register_id>(base));
		}
		if (index.has_value()) {
			regs.push_back(*index);
		}
		return regs;
	}
	std::string assembly_memory::to_string() const {
		std::ostringstream oss;
		oss << "[";
		if (std::holds_alternative<machine::register_id>(base)) {
			// address registers are always 64 bit
			oss << machine::to_string(std::get<machine::register_id>(base));
		}
		else {
			oss << std::get<std::string>(base);
		}
		if (index.has_value()) {
			oss << "+" << machine::to_string(*index);
			if (scale != 1) {
				oss << "*" << static_cast<int>(scale);
			}
		}
		if (displacement > 0) {
			oss << "+" << displacement;
		}
		else if (displacement < 0) {
			oss << displacement;
		}
		oss << "]";
		return oss.str();
	}

	std::ostream& operator<<(std::ostream& os, const assembly_operand& op) {
		switch (op.operand_type) {
			case assembly_operand::type::REGISTER:
				os << std::get<machine::register_t>(op.value);
				break;
			case assembly_operand::type::LITERAL:
				os << std::get<assembly_literal>(op.value);
				break;
			case assembly_operand::type::MEMORY_POINTER:
				os << std::get<assembly_memory_pointer>(op.value);
				break;
			case assembly_operand::type::MEMORY:
				os << std::get<assembly_memory>(op.value);
				break;
		}
		return os;
	}
	std::ostream& operator<<(std::ostream& os, const assembly_instruction& inst) {
		os << inst.op;
		for (size_t i = 0; i < inst.operands.size(); ++i) {
			os << (i == 0 ? " " : ", ") << inst.operands[i];
		}
		return os;
	}
	std::ostream& operator<<(std::ostream& os, const assembly_component& comp) {
		switch (comp.component_type) {
			case assembly_component::type::LABEL:
				os << std::get<std::string>(comp.value) << ":";
				break;
			case assembly_component::type::INSTRUCTION:
				os << "  " << std::get<assembly_instruction>(comp.value);
				break;
			case assembly_component::type::DIRECTIVE: {
				const auto& directive = std::get<assembly_directive>(comp.value);
				if (directive.indented) {
					os << "  ";
				}
				os << directive.text;
				break;
			}
			case assembly_component::type::DATA: {
				const auto& data = std::get<assembly_data>(comp.value);
				os << "  " << data.label << ": ";
				if (data.count != 1) {
					os << "times " << data.count << " ";
				}
				os << machine::data_definition(data.unit) << " " << data.value;
				break;
			}
			case assembly_component::type::RAW:
				os << std::get<std::string>(comp.value);
				break;
		}
		return os;
	}

	void write_program(std::ostream& os, const assembly_program_t& program) {
		for (const auto& component : program) {
			os << component << "\n";
		}
	}
	std::string to_string(const assembly_program_t& program) {
		std::ostringstream oss;
		write_program(oss, program);
		return oss.str();
	}
} // wit::assembly
