#pragma once
#include <algorithm>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace wit::combinator {
	/**
	 * A backtracking parser over a sequence of T producing values of type U.
	 *
	 * A parse yields every successful interpretation of a prefix of the input as a pair of the value and the
	 * number of consumed elements. No result means the parser failed.
	 */
	template<typename T, typename U>
	class Parser {
	public:
		using input_t = std::span<const T>;
		template<typename V>
		using results_t = std::vector<std::pair<V, size_t>>;
		using ParseFunction = std::function<void(input_t, results_t<U>&)>;

		std::string m_name;

		ParseFunction m_parse_func;

		explicit Parser(ParseFunction parse_func, std::string name = "?")
			: m_name(std::move(name)), m_parse_func(std::move(parse_func)) {
		}

		void parse(input_t input, results_t<U>& output) const {
			m_parse_func(input, output);
		}
		results_t<U> parse(input_t input) const {
			results_t<U> output;
			parse(input, output);
			return output;
		}

	private:
		// runs other on the rest of the input after every result of this parser, join combines both values
		template<typename V, typename W>
		Parser<T, W> sequence(const Parser<T, V>& other, std::function<W(const U&, const V&)> join,
			const std::string& separator) const {
			auto sequence_parse_func = [self=*this, other, join](input_t input, results_t<W>& output) {
				for (const auto& [left, left_length] : self.parse(input)) {
					for (const auto& [right, right_length] : other.parse(input.subspan(left_length))) {
						output.emplace_back(join(left, right), left_length + right_length);
					}
				}
			};
			return Parser<T, W>(sequence_parse_func, m_name + separator + other.m_name);
		}

	public:
		// both parsers in order, keeping both values
		template<typename V>
		Parser<T, std::pair<U, V>> then(const Parser<T, V>& other) const {
			return sequence<V, std::pair<U, V>>(other, [](const U& left, const V& right) {
				return std::make_pair(left, right);
			}, " + ");
		}
		template<typename V>
		Parser<T, std::pair<U, V>> operator+(const Parser<T, V>& other) const {
			return then(other);
		}

		// both parsers in order, keeping the value of this one
		template<typename V>
		Parser<T, U> followed_by(const Parser<T, V>& other) const {
			return sequence<V, U>(other, [](const U& left, const V&) {
				return left;
			}, " < ");
		}
		template<typename V>
		Parser<T, U> operator<(const Parser<T, V>& other) const {
			return followed_by(other);
		}

		// both parsers in order, keeping the value of the other one
		template<typename V>
		Parser<T, V> preceding(const Parser<T, V>& other) const {
			return sequence<V, V>(other, [](const U&, const V& right) {
				return right;
			}, " > ");
		}
		template<typename V>
		Parser<T, V> operator>(const Parser<T, V>& other) const {
			return preceding(other);
		}

		// results of both alternatives
		Parser<T, U> choice(const Parser<T, U>& other) const {
			auto choice_parse_func = [self=*this, other](input_t input, results_t<U>& output) {
				self.parse(input, output);
				other.parse(input, output);
			};
			return Parser<T, U>(choice_parse_func, m_name + " | " + other.m_name);
		}
		Parser<T, U> operator|(const Parser<T, U>& other) const {
			return choice(other);
		}

		// the other alternative is only tried if this one fails
		Parser<T, U> prioritized_choice(const Parser<T, U>& other) const {
			auto prioritized_parse_func = [self=*this, other](input_t input, results_t<U>& output) {
				const size_t before = output.size();
				self.parse(input, output);
				if (output.size() == before) {
					other.parse(input, output);
				}
			};
			return Parser<T, U>(prioritized_parse_func, m_name + " || " + other.m_name);
		}
		Parser<T, U> operator||(const Parser<T, U>& other) const {
			return prioritized_choice(other);
		}

		// greedy repetition, only chains that cannot be extended any further are produced
		template<bool allow_empty>
		Parser<T, std::vector<U>> repetition() const {
			auto repetition_parse_func = [self=*this](input_t input, results_t<std::vector<U>>& output) {
				results_t<std::vector<U>> pending;
				pending.emplace_back(std::vector<U>{}, 0);
				while (!pending.empty()) {
					auto [values, length] = std::move(pending.back());
					pending.pop_back();
					auto next = self.parse(input.subspan(length));
					// a match without progress would repeat forever
					std::erase_if(next, [](const auto& result) { return result.second == 0; });
					if (next.empty()) {
						if (allow_empty || !values.empty()) {
							output.emplace_back(std::move(values), length);
						}
						continue;
					}
					// the last continuation takes over the chain, only ambiguous matches copy it
					for (size_t i = 0; i + 1 < next.size(); i++) {
						auto extended = values;
						extended.push_back(next[i].first);
						pending.emplace_back(std::move(extended), length + next[i].second);
					}
					values.push_back(std::move(next.back().first));
					pending.emplace_back(std::move(values), length + next.back().second);
				}
			};
			return Parser<T, std::vector<U>>(repetition_parse_func, m_name + (allow_empty ? "*" : "+"));
		}
		Parser<T, std::vector<U>> operator*() const {
			return repetition<true>();
		}
		Parser<T, std::vector<U>> operator+() const {
			return repetition<false>();
		}

		template<typename V>
		Parser<T, V> map(std::function<V(U)> transform, std::string name = "?") const {
			auto map_parse_func = [self=*this, transform](input_t input, results_t<V>& output) {
				for (const auto& [value, length] : self.parse(input)) {
					output.emplace_back(transform(value), length);
				}
			};
			return Parser<T, V>(map_parse_func, "(" + m_name + " -> " + name + ")");
		}

		// never fails, yields nullopt without consuming anything if this parser fails
		Parser<T, std::optional<U>> optional() const {
			auto optional_parse_func = [self=*this](input_t input, results_t<std::optional<U>>& output) {
				const auto found = self.parse(input);
				for (const auto& [value, length] : found) {
					output.emplace_back(value, length);
				}
				if (found.empty()) {
					output.emplace_back(std::nullopt, 0);
				}
			};
			return Parser<T, std::optional<U>>(optional_parse_func, "(" + m_name + "?)");
		}
		Parser<T, std::optional<U>> operator~() const {
			return optional();
		}
	};

	// one element accepted by the predicate
	template<typename T>
	Parser<T, T> satisfy(std::function<bool(T)> predicate, std::string name = "?") {
		auto satisfy_parse_func = [predicate](std::span<const T> input, std::vector<std::pair<T, size_t>>& output) {
			if (!input.empty() && predicate(input[0])) {
				output.emplace_back(input[0], 1);
			}
		};
		return Parser<T, T>(satisfy_parse_func, "(satisfy " + name + ")");
	}

	template<typename T>
	Parser<T, T> symbol(T sym, std::string name) {
		return satisfy<T>([sym](T t) { return t == sym; }, "'" + name + "'");
	}
	inline Parser<char, char> symbol(char sym) {
		return symbol<char>(sym, std::string(1, sym));
	}
	template<typename T>
	Parser<T, T> symbols(std::vector<T> syms, std::string name) {
		return satisfy<T>([syms](T t) {
			return std::find(syms.begin(), syms.end(), t) != syms.end();
		}, "\"" + name + "\"");
	}
	inline Parser<char, char> symbol_range(char start, char end) {
		return satisfy<char>([start, end](char c) {
			return c >= start && c <= end;
		}, std::string("'") + start + "'-'" + end + "'");
	}

	// the longest of the given strings that starts the input
	inline Parser<char, std::string> tokens(std::vector<std::string> toks, std::string name) {
		std::ranges::sort(toks, [](const std::string& a, const std::string& b) {
			return a.size() > b.size();
		});
		auto tokens_parse_func = [toks](std::span<const char> input,
			std::vector<std::pair<std::string, size_t>>& output) {
			const auto match = std::ranges::find_if(toks, [&input](const std::string& tok) {
				return input.size() >= tok.size() && std::equal(tok.begin(), tok.end(), input.begin());
			});
			if (match != toks.end()) {
				output.emplace_back(*match, match->size());
			}
		};
		return Parser<char, std::string>(tokens_parse_func, "(tokens \"" + name + "\")");
	}
	inline Parser<char, std::string> token(std::string tok) {
		return tokens({tok}, tok);
	}
} // wit::combinator
