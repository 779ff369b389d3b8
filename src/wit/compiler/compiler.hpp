#pragma once

#include <exception>
#include <ostream>
#include <string>
#include <vector>

#include "../lexer.hpp"
#include "../../assembly/assembly.hpp"

namespace wit::compiler {
	/**
	 * One compilation of a Wit program into NASM text.
	 * Every call to compile starts from fresh symbol, register and frame state.
	 */
	class Compiler {
		bool m_verbose = false;

	public:
		void set_verbose(bool v) {
			m_verbose = v;
		}
		[[nodiscard]] bool is_verbose() const {
			return m_verbose;
		}

		/**
		 * Parses the token stream and generates the program as it goes.
		 * @throws compile_error on the first diagnostic, nothing is returned in that case
		 * @throws internal_error if the compiler itself is broken
		 */
		[[nodiscard]] assembly::assembly_program_t compile(const std::vector<lexer_token>& tokens) const;
		// lexes and compiles the source, returning the assembly text
		[[nodiscard]] std::string compile_source(const std::string& source) const;
	};

	/**
	 * Prints a failed compilation to err: diagnostics as "file:line:column: error: message", compiler faults
	 * and any other exception with their description.
	 * @return the exit code of the failed run
	 */
	int report_failure(const std::exception& e, const std::string& source_name, std::ostream& err);
} // wit::compiler
