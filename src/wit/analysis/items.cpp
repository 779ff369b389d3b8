#include "items.hpp"

#include <algorithm>

#include "../errors.hpp"

namespace wit::analysis::items {
	item item::retype(const types::type_node& new_type) const {
		if (kind == kind_t::VOID) {
			throw internal_error("retype called on a void item");
		}
		item result = *this;
		result.type = new_type;
		return result;
	}

	std::vector<machine::register_id> item::registers() const {
		switch (kind) {
			case kind_t::REGISTER:
				return {reg()};
			case kind_t::MEMORY:
				return memory().registers();
			default:
				return {};
		}
	}
	bool item::references(machine::register_id reg) const {
		const auto regs = registers();
		return std::ranges::find(regs, reg) != regs.end();
	}

	assembly::assembly_operand item::operand() const {
		switch (kind) {
			case kind_t::CONSTANT:
				return assembly::assembly_operand(assembly::assembly_literal(constant()));
			case kind_t::REGISTER:
				return assembly::assembly_operand(machine::register_t(reg(), type.data_size()));
			case kind_t::MEMORY:
				return assembly::assembly_operand(assembly::assembly_memory_pointer(type.data_size(), memory()));
			case kind_t::VOID:
				break;
		}
		throw internal_error("void item has no operand");
	}

	std::ostream& operator<<(std::ostream& os, const item& it) {
		switch (it.kind) {
			case item::kind_t::CONSTANT:
				os << "constant " << it.constant();
				break;
			case item::kind_t::REGISTER:
				os << "register " << machine::register_t(it.reg(), it.type.data_size());
				break;
			case item::kind_t::MEMORY:
				os << "memory " << it.memory();
				break;
			case item::kind_t::VOID:
				return os << "void";
		}
		return os << " : " << it.type;
	}
} // wit::analysis::items
