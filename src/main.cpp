#include <filesystem>
#include <fstream>
#include <iterator>
#include <iostream>
#include <string>

#include "wit/compiler/compiler.hpp"

namespace {
	void print_usage(const char* program) {
		std::cerr << "Usage: " << program << " <input.wit> [-o <output.asm>] [-v]" << std::endl;
	}
}

int main(int argc, char* argv[]) {
	std::filesystem::path source_path;
	std::filesystem::path output_path;
	bool verbose = false;
	for (int i = 1; i < argc; ++i) {
		const std::string arg = argv[i];
		if (arg == "-v") {
			verbose = true;
		}
		else if (arg == "-o") {
			if (i + 1 >= argc) {
				std::cerr << "Missing file name after -o" << std::endl;
				print_usage(argv[0]);
				return 2;
			}
			output_path = argv[++i];
		}
		else if (!arg.empty() && arg[0] == '-') {
			std::cerr << "Unknown option: " << arg << std::endl;
			print_usage(argv[0]);
			return 2;
		}
		else if (source_path.empty()) {
			source_path = arg;
		}
		else {
			std::cerr << "Only one input file is supported" << std::endl;
			print_usage(argv[0]);
			return 2;
		}
	}
	if (source_path.empty()) {
		print_usage(argv[0]);
		return 2;
	}

	std::string source_code;
	try {
		if (!std::filesystem::exists(source_path)) {
			std::cerr << "Source file does not exist: " << source_path << std::endl;
			return 2;
		}
		std::ifstream source_file(source_path);
		if (!source_file.is_open()) {
			std::cerr << "Error opening source file: " << source_path << std::endl;
			return 2;
		}
		source_code = std::string((std::istreambuf_iterator<char>(source_file)),
			std::istreambuf_iterator<char>());
	}
	catch (const std::exception& e) {
		std::cerr << "Error reading source file: " << e.what() << std::endl;
		return 2;
	}

	wit::compiler::Compiler compilr;
	compilr.set_verbose(verbose);

	std::string assembly_text;
	try {
		assembly_text = compilr.compile_source(source_code);
	}
	catch (const std::exception& e) {
		return wit::compiler::report_failure(e, source_path.string(), std::cerr);
	}

	if (output_path.empty()) {
		std::cout << assembly_text;
		return 0;
	}
	try {
		std::ofstream output_file(output_path);
		if (!output_file.is_open()) {
			std::cerr << "Error opening output file: " << output_path << std::endl;
			return 2;
		}
		output_file << assembly_text;
		if (verbose) {
			std::cerr << "Wrote " << output_path << std::endl;
		}
	}
	catch (const std::exception& e) {
		std::cerr << "Error writing output file: " << e.what() << std::endl;
		return 2;
	}
	return 0;
}
