#include "types.hpp"

namespace wit::analysis::types {
	std::string to_string(builtin_type bt) {
		switch (bt) {
			case builtin_type::VOID: return "Void";
			case builtin_type::BYTE: return "Byte";
			case builtin_type::CHAR: return "Char";
			case builtin_type::INT: return "Int";
			case builtin_type::LONG: return "Long";
		}
		throw std::logic_error("Unknown builtin type");
	}

	std::ostream& operator<<(std::ostream& os, binary_operator op) {
		switch (op) {
			case binary_operator::SHIFT_LEFT: return os << "<<";
			case binary_operator::SHIFT_RIGHT: return os << ">>";
			case binary_operator::ADD: return os << "+";
			case binary_operator::SUB: return os << "-";
			case binary_operator::MUL: return os << "*";
			case binary_operator::DIV: return os << "/";
			case binary_operator::MOD: return os << "%";
		}
		return os << "?";
	}

	bool pointer_type::operator==(const pointer_type& other) const {
		return *base == *other.base;
	}
	bool array_type::operator==(const array_type& other) const {
		return count == other.count && *base == *other.base;
	}

	bool type_node::operator==(const type_node& other) const {
		if (kind != other.kind) {
			return false;
		}
		switch (kind) {
			case kind_t::BUILTIN:
				return std::get<builtin_type>(value) == std::get<builtin_type>(other.value);
			case kind_t::POINTER:
				return std::get<pointer_type>(value) == std::get<pointer_type>(other.value);
			case kind_t::ARRAY:
				return std::get<array_type>(value) == std::get<array_type>(other.value);
		}
		return false;
	}

	uint32_t type_node::size() const {
		switch (kind) {
			case kind_t::BUILTIN:
				switch (std::get<builtin_type>(value)) {
					case builtin_type::VOID:
						throw std::logic_error("Void type has no size");
					case builtin_type::BYTE:
					case builtin_type::CHAR:
						return 1;
					case builtin_type::INT:
						return 4;
					case builtin_type::LONG:
						return 8;
				}
				break;
			case kind_t::POINTER:
				return POINTER_SIZE;
			case kind_t::ARRAY: {
				const auto& array = std::get<array_type>(value);
				return array.count * array.base->size();
			}
		}
		throw std::logic_error("Unknown type kind");
	}

	const type_node& type_node::innermost() const {
		if (kind == kind_t::ARRAY) {
			return std::get<array_type>(value).base->innermost();
		}
		return *this;
	}
	const type_node& type_node::element() const {
		switch (kind) {
			case kind_t::POINTER:
				return *std::get<pointer_type>(value).base;
			case kind_t::ARRAY:
				return *std::get<array_type>(value).base;
			default:
				throw std::logic_error("Type " + to_string() + " has no elements");
		}
	}

	bool type_node::indexes() const {
		return kind == kind_t::POINTER || kind == kind_t::ARRAY;
	}
	bool type_node::indexes_with(const type_node& index) const {
		return indexes() && index.is_index();
	}
	bool type_node::is_index() const {
		return kind == kind_t::BUILTIN && !is_void();
	}

	bool type_node::supports(binary_operator op) const {
		switch (kind) {
			case kind_t::BUILTIN:
				return !is_void();
			case kind_t::POINTER:
				// pointer arithmetic is plain byte arithmetic, nothing else makes sense on addresses
				return op == binary_operator::ADD || op == binary_operator::SUB;
			case kind_t::ARRAY:
				return false;
		}
		return false;
	}
	bool type_node::supports_with(binary_operator op, const type_node& other) const {
		if (!supports(op)) {
			return false;
		}
		switch (kind) {
			case kind_t::BUILTIN:
				// the narrower operand is widened, but a builtin never absorbs a pointer
				return other.kind == kind_t::BUILTIN && !other.is_void();
			case kind_t::POINTER:
				if (other.kind == kind_t::POINTER) {
					return *this == other;
				}
				return true;
			case kind_t::ARRAY:
				return false;
		}
		return false;
	}

	std::string type_node::to_string() const {
		switch (kind) {
			case kind_t::BUILTIN:
				return types::to_string(std::get<builtin_type>(value));
			case kind_t::POINTER:
				return std::get<pointer_type>(value).base->to_string() + "*";
			case kind_t::ARRAY: {
				const auto& array = std::get<array_type>(value);
				return array.base->to_string() + "[" + std::to_string(array.count) + "]";
			}
		}
		return "?";
	}
} // wit::analysis::types
