#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace wit {
	/**
	 * A diagnostic about the compiled program, located at the offending token.
	 * Raising one aborts the compilation, there is no recovery.
	 */
	class compile_error : public std::runtime_error {
		uint32_t m_line;
		uint32_t m_column;
		std::string m_message;

	public:
		compile_error(uint32_t line, uint32_t column, const std::string& message)
			: std::runtime_error(std::to_string(line) + ":" + std::to_string(column) + ": " + message),
			  m_line(line), m_column(column), m_message(message) {
		}

		[[nodiscard]] uint32_t line() const {
			return m_line;
		}
		[[nodiscard]] uint32_t column() const {
			return m_column;
		}
		[[nodiscard]] const std::string& message() const {
			return m_message;
		}
	};

	// a broken invariant inside the compiler, never caused by the compiled program alone
	class internal_error : public std::logic_error {
	public:
		explicit internal_error(const std::string& message)
			: std::logic_error(message) {
		}
	};
} // wit
