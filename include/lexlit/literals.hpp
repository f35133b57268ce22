// literals.hpp - leaf parsers for string, number and regexp literals
#pragma once
#include "lexlit/delimiters.hpp"
#include "lexlit/escapes.hpp"
#include "lexlit/node.hpp"
#include "lexlit/state.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace lexlit {

// A leaf parser run by the enclosing grammar at st.pos. Each parse skips
// whitespace once, then either fills `out`, advances st.pos and returns
// true, or records the furthest error in st.error and returns false
// leaving `out` untouched.
class literal_parser {
public:
    explicit literal_parser(std::string name) : name_(std::move(name)) {}
    virtual ~literal_parser() = default;

    const std::string& name() const { return name_; }
    virtual bool parse(scan_state& st, literal_node& out) const = 0;

protected:
    void trace_failure(const scan_state& st) const;

private:
    std::string name_;
};

using literal_parser_ptr = std::unique_ptr<literal_parser>;

// Single-segment string literal. With a quote_set_policy the scanner error is
// surfaced as is; any other policy also records policy.expected() at the
// opener (the later scanner error still wins).
class string_literal_parser : public literal_parser {
public:
    string_literal_parser(std::shared_ptr<const delimiter_policy> policy, escape_table escapes);
    bool parse(scan_state& st, literal_node& out) const override;
    const delimiter_policy& policy() const { return *policy_; }
private:
    std::shared_ptr<const delimiter_policy> policy_;
    escape_table escapes_;
    bool fixed_quotes_;
};

// [+-]digits[.digits][(e|E)[+-]digits]; int64 unless a '.' or exponent is seen.
class number_literal_parser : public literal_parser {
public:
    number_literal_parser() : literal_parser("number literal") {}
    bool parse(scan_state& st, literal_node& out) const override;
};

// One delimited segment, e.g. /a+b/ or {a+b}.
class regexp_match_parser : public literal_parser {
public:
    regexp_match_parser(std::shared_ptr<const delimiter_policy> policy, escape_table escapes);
    bool parse(scan_state& st, literal_node& out) const override;
private:
    std::shared_ptr<const delimiter_policy> policy_;
    escape_table escapes_;
};

// Two segments, pattern then replacement: /a/b/ reuses the closer as the
// second opener, (a)[b] requires a second opener validated by
// regexp_delimiter(). The replacement always uses default_escapes().
// The cursor keeps every fully consumed step on failure.
class regexp_replace_parser : public literal_parser {
public:
    regexp_replace_parser(std::shared_ptr<const delimiter_policy> policy, escape_table escapes);
    bool parse(scan_state& st, literal_node& out) const override;
private:
    std::shared_ptr<const delimiter_policy> policy_;
    escape_table escapes_;
};

inline constexpr const char* string_delimiter_expected = "string delimiter";
inline constexpr const char* regexp_delimiter_expected = "regexp delimiter";
inline constexpr const char* number_expected = "number";

// Factories
literal_parser_ptr string_lit(std::string_view allowed_quotes);
literal_parser_ptr unicode_string_lit();
literal_parser_ptr custom_string_lit(delimiter_fn is_valid, escape_table escapes = default_escapes());
literal_parser_ptr number_lit();
literal_parser_ptr unicode_regexp_match_lit();
literal_parser_ptr custom_regexp_match_lit(delimiter_fn is_valid, escape_table escapes = default_escapes());
literal_parser_ptr unicode_regexp_replace_lit();
literal_parser_ptr custom_regexp_replace_lit(delimiter_fn is_valid, escape_table escapes = default_escapes());

} // namespace lexlit
