#include "compiler.hpp"

#include <iostream>

#include "generator.hpp"
#include "../errors.hpp"
#include "parser.hpp"
#include "../analysis/symbols.hpp"

namespace wit::compiler {
	assembly::assembly_program_t Compiler::compile(const std::vector<lexer_token>& tokens) const {
		analysis::symbols::scope_stack scopes;
		code_generator generator;
		Parser parser(tokens, scopes, generator);
		if (m_verbose) {
			std::cerr << "Parsing " << tokens.size() << " tokens" << std::endl;
		}
		parser.parse_program();
		if (m_verbose) {
			std::cerr << "Generated " << generator.program().size() << " assembly lines" << std::endl;
		}
		return generator.program();
	}

	std::string Compiler::compile_source(const std::string& source) const {
		const auto tokens = run_lexer(source);
		if (m_verbose) {
			std::cerr << "Lexed " << tokens.size() << " tokens" << std::endl;
		}
		return assembly::to_string(compile(tokens));
	}

	int report_failure(const std::exception& e, const std::string& source_name, std::ostream& err) {
		if (const auto* diagnostic = dynamic_cast<const compile_error*>(&e)) {
			err << source_name << ":" << diagnostic->line() << ":" << diagnostic->column() << ": error: "
				<< diagnostic->message() << std::endl;
		}
		else if (dynamic_cast<const internal_error*>(&e)) {
			err << "Internal compiler error: " << e.what() << std::endl;
		}
		else {
			err << "Error compiling " << source_name << ": " << e.what() << std::endl;
		}
		return 1;
	}
} // wit::compiler
