#include "lexlit/literals.hpp"
#include "lexlit/segment.hpp"
#include "lexlit/utf8.hpp"

#include <llvm/Support/raw_ostream.h>

#include <charconv>
#include <stdexcept>

namespace lexlit {

void literal_parser::trace_failure(const scan_state& st) const {
    if(!st.trace) return;
    line_col lc = locate(st.input, st.error.pos);
    llvm::errs() << "[lexlit][trace] " << name_ << " failed: expected " << st.error.expected
                 << " at byte " << st.error.pos << " (" << lc.line << ":" << lc.col << ")\n";
}

static std::shared_ptr<const delimiter_policy> require_policy(std::shared_ptr<const delimiter_policy> p){
    if(!p) throw std::invalid_argument("literal parser: null delimiter policy");
    return p;
}

// ---- strings ----

string_literal_parser::string_literal_parser(std::shared_ptr<const delimiter_policy> policy, escape_table escapes)
    : literal_parser("string literal"), policy_(require_policy(std::move(policy))), escapes_(std::move(escapes)) {
    fixed_quotes_ = dynamic_cast<const quote_set_policy*>(policy_.get()) != nullptr;
}

bool string_literal_parser::parse(scan_state& st, literal_node& out) const {
    const std::size_t origin = st.pos;
    st.skip_ws();

    rune opener = decode_rune(st.input, st.pos);
    delimiter_match m = opener.size ? policy_->match(opener.cp) : delimiter_match{};
    if(!m.valid){
        st.error_here(policy_->expected());
        st.pos = origin;
        trace_failure(st);
        return false;
    }
    if(!scan_segment(st, st.pos + opener.size, m.closer, escapes_, out)){
        if(!fixed_quotes_) st.error_here(policy_->expected());
        st.pos = origin;
        trace_failure(st);
        return false;
    }
    return true;
}

// ---- numbers ----

static bool is_digit(char c){ return c >= '0' && c <= '9'; }

// Decimal order of magnitude of a well-formed float literal with a nonzero
// mantissa: 1.5e3 -> 3, 0.02 -> -2, 1e-400 -> -400. The exponent saturates.
static long decimal_order(std::string_view s){
    std::size_t i = 0;
    if(i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
    long order = 0;
    bool seen = false;
    for(; i < s.size() && is_digit(s[i]); ++i){
        if(seen) ++order;
        else if(s[i] != '0') seen = true;
    }
    if(i < s.size() && s[i] == '.'){
        ++i;
        for(; i < s.size() && is_digit(s[i]); ++i){
            if(seen) continue;
            --order;
            if(s[i] != '0') seen = true;
        }
    }
    if(i < s.size() && (s[i] == 'e' || s[i] == 'E')){
        ++i;
        bool negative = false;
        if(i < s.size() && (s[i] == '-' || s[i] == '+')) negative = s[i++] == '-';
        long exp = 0;
        for(; i < s.size() && is_digit(s[i]); ++i) if(exp < 1000000) exp = exp * 10 + (s[i] - '0');
        order += negative ? -exp : exp;
    }
    return order;
}

bool number_literal_parser::parse(scan_state& st, literal_node& out) const {
    const std::size_t origin = st.pos;
    st.skip_ws();

    const std::string_view in = st.input;
    const std::size_t begin = st.pos;
    std::size_t end = begin;
    std::size_t digits = 0;
    bool is_float = false;

    auto digit_run = [&]{ while(end < in.size() && is_digit(in[end])){ ++end; ++digits; } };

    if(end < in.size() && (in[end] == '-' || in[end] == '+')) ++end;
    digit_run();
    if(end < in.size() && in[end] == '.'){
        is_float = true;
        ++end;
        digit_run();
    }
    if(end < in.size() && (in[end] == 'e' || in[end] == 'E')){
        is_float = true;
        ++end;
        if(end < in.size() && (in[end] == '-' || in[end] == '+')) ++end;
        digit_run();
    }

    auto fail = [&]{
        st.error_at(number_expected, begin);
        st.pos = origin;
        trace_failure(st);
        return false;
    };
    if(digits == 0) return fail();

    std::string_view slice = in.substr(begin, end - begin);
    std::string_view digits_view = (slice.front() == '+') ? slice.substr(1) : slice;
    const char *first = digits_view.data();
    const char *last = first + digits_view.size();
    if(is_float){
        double v = 0;
        auto [ptr, ec] = std::from_chars(first, last, v);
        if(ptr != last) return fail();
        if(ec == std::errc::result_out_of_range){
            // too small to represent: reads as zero; too large: rejected
            if(decimal_order(digits_view) >= 0) return fail();
            v = digits_view.front() == '-' ? -0.0 : 0.0;
        } else if(ec != std::errc()){
            return fail();
        }
        out.value = v;
    } else {
        int64_t v = 0;
        auto [ptr, ec] = std::from_chars(first, last, v);
        if(ec != std::errc() || ptr != last) return fail();
        out.value = v;
    }
    out.start = begin;
    out.end = end;
    st.pos = end;
    return true;
}

// ---- regexps ----

regexp_match_parser::regexp_match_parser(std::shared_ptr<const delimiter_policy> policy, escape_table escapes)
    : literal_parser("regexp match literal"), policy_(require_policy(std::move(policy))), escapes_(std::move(escapes)) {}

bool regexp_match_parser::parse(scan_state& st, literal_node& out) const {
    const std::size_t origin = st.pos;
    st.skip_ws();

    rune opener = decode_rune(st.input, st.pos);
    delimiter_match m = opener.size ? policy_->match(opener.cp) : delimiter_match{};
    if(!m.valid){
        st.error_here(policy_->expected());
        st.pos = origin;
        trace_failure(st);
        return false;
    }
    if(!scan_segment(st, st.pos + opener.size, m.closer, escapes_, out)){
        st.error_here(encode_rune(m.closer));
        st.pos = origin;
        trace_failure(st);
        return false;
    }
    return true;
}

regexp_replace_parser::regexp_replace_parser(std::shared_ptr<const delimiter_policy> policy, escape_table escapes)
    : literal_parser("regexp replace literal"), policy_(require_policy(std::move(policy))), escapes_(std::move(escapes)) {}

bool regexp_replace_parser::parse(scan_state& st, literal_node& out) const {
    const std::size_t origin = st.pos;
    st.skip_ws();

    rune opener = decode_rune(st.input, st.pos);
    delimiter_match m = opener.size ? policy_->match(opener.cp) : delimiter_match{};
    if(!m.valid){
        st.error_here(policy_->expected());
        st.pos = origin;
        trace_failure(st);
        return false;
    }
    st.pos += opener.size;

    literal_node pattern;
    if(!scan_segment(st, st.pos, m.closer, escapes_, pattern)){
        st.error_here(encode_rune(m.closer));
        trace_failure(st);
        return false;
    }

    char32_t closer = m.closer;
    if(closer != opener.cp){
        rune second = decode_rune(st.input, st.pos);
        delimiter_match m2 = second.size ? regexp_delimiter(second.cp) : delimiter_match{};
        if(!m2.valid){
            st.error_here(regexp_delimiter_expected);
            trace_failure(st);
            return false;
        }
        st.pos += second.size;
        closer = m2.closer;
    }

    literal_node replacement;
    if(!scan_segment(st, st.pos, closer, default_escapes(), replacement)){
        st.error_here(encode_rune(closer));
        trace_failure(st);
        return false;
    }

    out.start = pattern.start;
    out.end = replacement.end;
    out.value = literal_children{std::move(pattern), std::move(replacement)};
    return true;
}

// ---- factories ----

static std::shared_ptr<const delimiter_policy> regexp_policy(delimiter_fn fn){
    return std::make_shared<predicate_policy>(std::move(fn), regexp_delimiter_expected);
}

literal_parser_ptr string_lit(std::string_view allowed_quotes){
    return std::make_unique<string_literal_parser>(std::make_shared<quote_set_policy>(std::string(allowed_quotes)), default_escapes());
}

literal_parser_ptr unicode_string_lit(){
    return custom_string_lit(regexp_delimiter, default_escapes());
}

literal_parser_ptr custom_string_lit(delimiter_fn is_valid, escape_table escapes){
    return std::make_unique<string_literal_parser>(std::make_shared<predicate_policy>(std::move(is_valid), string_delimiter_expected), std::move(escapes));
}

literal_parser_ptr number_lit(){ return std::make_unique<number_literal_parser>(); }

literal_parser_ptr unicode_regexp_match_lit(){ return custom_regexp_match_lit(regexp_delimiter, default_escapes()); }

literal_parser_ptr custom_regexp_match_lit(delimiter_fn is_valid, escape_table escapes){
    return std::make_unique<regexp_match_parser>(regexp_policy(std::move(is_valid)), std::move(escapes));
}

literal_parser_ptr unicode_regexp_replace_lit(){ return custom_regexp_replace_lit(regexp_delimiter, default_escapes()); }

literal_parser_ptr custom_regexp_replace_lit(delimiter_fn is_valid, escape_table escapes){
    return std::make_unique<regexp_replace_parser>(regexp_policy(std::move(is_valid)), std::move(escapes));
}

} // namespace lexlit
