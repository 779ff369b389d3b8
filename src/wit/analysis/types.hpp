#pragma once

#include <cstdint>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <variant>

#include "../../machine/data_size.hpp"

namespace wit::analysis::types {
	enum class builtin_type : uint8_t {
		// only used for the result of procedures without a return value, no variable can have it
		VOID,
		// 1-byte integer
		BYTE,
		// 1-byte character
		CHAR,
		// 4-byte integer
		INT,
		// 8-byte integer
		LONG
	};
	std::string to_string(builtin_type bt);

	enum class binary_operator : uint8_t {
		SHIFT_LEFT,
		SHIFT_RIGHT,
		ADD,
		SUB,
		MUL,
		DIV,
		MOD
	};
	std::ostream& operator<<(std::ostream& os, binary_operator op);

	struct type_node;
	struct pointer_type {
		std::shared_ptr<type_node> base;
		bool operator==(const pointer_type& other) const;
	};
	struct array_type {
		std::shared_ptr<type_node> base;
		uint32_t count;
		bool operator==(const array_type& other) const;
	};

	// machine word size, the size of every pointer
	static constexpr uint32_t POINTER_SIZE = 8;

	struct type_node {
		enum class kind_t : uint8_t {
			BUILTIN,
			POINTER,
			ARRAY
		} kind;
		std::variant<
			builtin_type, // BUILTIN
			pointer_type, // POINTER
			array_type // ARRAY
		> value;

		type_node(builtin_type bt) : kind(kind_t::BUILTIN), value(bt) {
		}
		type_node(kind_t kind, const pointer_type& p) : kind(kind), value(p) {
			if (kind != kind_t::POINTER) {
				throw std::invalid_argument("Kind must be POINTER for pointer_type");
			}
		}
		type_node(kind_t kind, const array_type& a) : kind(kind), value(a) {
			if (kind != kind_t::ARRAY) {
				throw std::invalid_argument("Kind must be ARRAY for array_type");
			}
			if (a.count == 0) {
				throw std::invalid_argument("Array element count must be positive");
			}
		}
		static type_node pointer_to(const type_node& base) {
			return {kind_t::POINTER, pointer_type{std::make_shared<type_node>(base)}};
		}
		static type_node array_of(const type_node& base, uint32_t count) {
			return {kind_t::ARRAY, array_type{std::make_shared<type_node>(base), count}};
		}

		bool operator==(const type_node& other) const;

		[[nodiscard]] bool is_builtin() const {
			return kind == kind_t::BUILTIN;
		}
		[[nodiscard]] bool is_builtin(builtin_type bt) const {
			return kind == kind_t::BUILTIN && std::get<builtin_type>(value) == bt;
		}
		[[nodiscard]] bool is_void() const {
			return is_builtin(builtin_type::VOID);
		}
		[[nodiscard]] bool is_pointer() const {
			return kind == kind_t::POINTER;
		}
		[[nodiscard]] bool is_array() const {
			return kind == kind_t::ARRAY;
		}

		/**
		 * Size of a value of this type in bytes.
		 * @throws std::logic_error for void
		 */
		[[nodiscard]] uint32_t size() const;
		// operand size of a value of this type, only valid for sizes of 1, 2, 4 or 8 bytes
		[[nodiscard]] machine::data_size_t data_size() const {
			return machine::data_size_from_bytes(size());
		}
		// the builtin type every element of a (possibly nested) array consists of
		[[nodiscard]] const type_node& innermost() const;
		// the type of the elements reached by indexing, only valid for pointers and arrays
		[[nodiscard]] const type_node& element() const;

		// whether values of this type can be indexed
		[[nodiscard]] bool indexes() const;
		// whether values of this type can be indexed with a value of the given type
		[[nodiscard]] bool indexes_with(const type_node& index) const;
		// whether values of this type can be used as an index
		[[nodiscard]] bool is_index() const;
		// whether this type can be the left operand of op
		[[nodiscard]] bool supports(binary_operator op) const;
		// whether this type can be the left operand of op with a right operand of the given type
		[[nodiscard]] bool supports_with(binary_operator op, const type_node& other) const;

		[[nodiscard]] std::string to_string() const;
		friend std::ostream& operator<<(std::ostream& os, const type_node& t) {
			return os << t.to_string();
		}
	};
} // wit::analysis::types
