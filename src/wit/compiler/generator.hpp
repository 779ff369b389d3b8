#pragma once

#include <cstdint>
#include <memory>
#include <ostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "registers.hpp"
#include "../analysis/items.hpp"
#include "../analysis/symbols.hpp"
#include "../analysis/types.hpp"
#include "../../assembly/assembly.hpp"

namespace wit::compiler {
	// label prefix of non-exported globals
	inline const std::string GLOBAL_LABEL_PREFIX = "wit$global$";
	// data label of the newline byte written by write_eln
	inline const std::string NEWLINE_LABEL = "wit$newl";

	// whether the name cannot be used as a plain label, it is a register, an emitted mnemonic, a NASM keyword or _start
	bool is_reserved_label(const std::string& name);
	// displacement of base[index] for a constant index, nullopt unless it fits a signed 32-bit displacement
	std::optional<int64_t> constant_index_displacement(const analysis::items::item& base, int64_t index);

	/**
	 * Translates typed operations on items into x86-64 instructions.
	 *
	 * Every operation consumes its operand items: registers of operands that are fully used up are released,
	 * and the result item owns the registers it references. The caller is responsible for releasing results.
	 */
	class code_generator {
		assembly::assembly_program_t m_program;
		register_allocator m_registers;
		// local frame size of every active frame, innermost last
		std::vector<uint32_t> m_frame_totals;

		void emit(const assembly::assembly_instruction& inst) {
			m_program.emplace_back(inst);
		}
		// the item in a register of its own size, register items not banned are returned unchanged
		analysis::items::item load(const analysis::items::item& it, regmask ban = {});
		analysis::items::item multiplicative_operation(const analysis::items::item& lhs,
			const analysis::items::item& rhs, analysis::types::binary_operator op);
		analysis::items::item shift_operation(const analysis::items::item& lhs, const analysis::items::item& rhs,
			analysis::types::binary_operator op);
		// non-empty lines of an embedded routine, comment lines dropped
		static std::vector<std::string> builtin_body(const std::string& path);

	public:
		// "global _start" header
		void emit_program_prolog();
		// data section with the newline byte, globals are declared right after
		void emit_data_section();
		void emit_text_section();
		// reserves storage for the globals and assigns their locations
		void declare_globals(const std::vector<std::shared_ptr<analysis::symbols::variable>>& vars);

		// the program entry label, opens a frame
		void enter_main_frame();
		// assigns frame offsets to the locals, sets up the frame if it is not empty
		void declare_locals(const std::vector<std::shared_ptr<analysis::symbols::variable>>& vars);
		// tears down the frame and exits the process with code 0
		void leave_main_frame();

		/**
		 * Memory item of a declared variable.
		 * @throws internal_error if the declaration was not emitted yet
		 */
		[[nodiscard]] analysis::items::item variable_item(const analysis::symbols::variable& var) const;

		// pointer to a memory item, in a fresh register
		analysis::items::item address(const analysis::items::item& it);
		// arithmetic negation, constants must be folded by the caller
		analysis::items::item negate(const analysis::items::item& it);
		// widens the narrower item to the type of the other one
		std::pair<analysis::items::item, analysis::items::item> equalize_types(const analysis::items::item& lhs,
			const analysis::items::item& rhs);
		/**
		 * Emits lhs op rhs. The operands must have equal sizes.
		 * @return register item with the type of lhs
		 */
		analysis::items::item binary_operation(const analysis::items::item& lhs, const analysis::items::item& rhs,
			analysis::types::binary_operator op);
		// converts a non-constant item to a type of a different size by zero extension or truncation
		analysis::items::item cast(const analysis::items::item& it, const analysis::types::type_node& type);
		analysis::items::item call(const analysis::symbols::procedure& proc,
			const std::vector<analysis::items::item>& args);
		// element of a pointer or array item, addressed as [base + index*size + offset]
		analysis::items::item index(const analysis::items::item& base, const analysis::items::item& idx);
		// stores source into the memory item target and returns target
		analysis::items::item assign(const analysis::items::item& target, const analysis::items::item& source);

		void release(const analysis::items::item& it) {
			m_registers.release(it.registers());
		}

		[[nodiscard]] const assembly::assembly_program_t& program() const {
			return m_program;
		}
		[[nodiscard]] register_allocator& registers() {
			return m_registers;
		}
		[[nodiscard]] const register_allocator& registers() const {
			return m_registers;
		}
		// local frame size of the innermost frame
		[[nodiscard]] uint32_t frame_total() const;

		void write(std::ostream& os) const {
			assembly::write_program(os, m_program);
		}
	};
} // wit::compiler
