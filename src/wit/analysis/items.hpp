#pragma once

#include <cstdint>
#include <ostream>
#include <variant>
#include <vector>

#include "types.hpp"
#include "../../assembly/assembly.hpp"
#include "../../machine/register.hpp"

namespace wit::analysis::items {
	// compile-time representation of the result of an expression
	struct item {
		enum class kind_t : uint8_t {
			CONSTANT,
			REGISTER,
			MEMORY,
			VOID
		} kind;
		std::variant<
			int64_t, // CONSTANT
			machine::register_id, // REGISTER
			assembly::assembly_memory, // MEMORY
			std::monostate // VOID
		> value;
		types::type_node type;

		item(const types::type_node& type, int64_t constant)
			: kind(kind_t::CONSTANT), value(constant), type(type) {
		}
		item(const types::type_node& type, machine::register_id reg)
			: kind(kind_t::REGISTER), value(reg), type(type) {
		}
		item(const types::type_node& type, const assembly::assembly_memory& mem)
			: kind(kind_t::MEMORY), value(mem), type(type) {
		}
		static item void_item() {
			return item();
		}

		[[nodiscard]] bool is_constant() const {
			return kind == kind_t::CONSTANT;
		}
		[[nodiscard]] bool is_register() const {
			return kind == kind_t::REGISTER;
		}
		[[nodiscard]] bool is_memory() const {
			return kind == kind_t::MEMORY;
		}
		[[nodiscard]] bool is_void() const {
			return kind == kind_t::VOID;
		}
		// only memory has an address
		[[nodiscard]] bool is_addressable() const {
			return kind == kind_t::MEMORY;
		}

		[[nodiscard]] int64_t constant() const {
			return std::get<int64_t>(value);
		}
		[[nodiscard]] machine::register_id reg() const {
			return std::get<machine::register_id>(value);
		}
		[[nodiscard]] const assembly::assembly_memory& memory() const {
			return std::get<assembly::assembly_memory>(value);
		}

		/**
		 * Reinterprets the value as another type without touching its storage.
		 * @throws internal_error for void items
		 */
		[[nodiscard]] item retype(const types::type_node& new_type) const;

		// registers this item keeps occupied
		[[nodiscard]] std::vector<machine::register_id> registers() const;
		[[nodiscard]] bool references(machine::register_id reg) const;

		/**
		 * The item as an instruction operand sized by its type.
		 * @throws internal_error for void items
		 */
		[[nodiscard]] assembly::assembly_operand operand() const;

		friend std::ostream& operator<<(std::ostream& os, const item& it);

	private:
		item()
			: kind(kind_t::VOID), value(std::monostate{}), type(types::builtin_type::VOID) {
		}
	};
} // wit::analysis::items
