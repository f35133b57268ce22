// delimiters.hpp - opener validation and closer pairing for delimited literals
#pragma once
#include <functional>
#include <string>
#include <string_view>

namespace lexlit {

struct delimiter_match {
    bool valid = false;
    char32_t closer = 0;
};

// Built-in matcher. Pairs initial/final quotes (« », “ ”, ...), low-9 quotes
// (‚ ’, „ ”), open/close punctuation ((), [], {}, 「」, ...) and < >. Any
// other Unicode punctuation code point, or '>', closes with itself.
delimiter_match regexp_delimiter(char32_t opener);

// Unicode general category P* (ICU).
bool is_punct(char32_t cp);

using delimiter_fn = std::function<delimiter_match(char32_t)>;

class delimiter_policy {
public:
    virtual ~delimiter_policy() = default;
    virtual delimiter_match match(char32_t opener) const = 0;
    // Label recorded when an opener is rejected.
    virtual std::string expected() const = 0;
};

// Opener must be one of a fixed set of quotes; closes with itself.
class quote_set_policy : public delimiter_policy {
public:
    explicit quote_set_policy(std::string allowed) : allowed_(std::move(allowed)) {}
    delimiter_match match(char32_t opener) const override;
    std::string expected() const override { return allowed_; }
    const std::string& allowed() const { return allowed_; }
private:
    std::string allowed_;
};

// Opener validated (and closer chosen) by an arbitrary function.
class predicate_policy : public delimiter_policy {
public:
    explicit predicate_policy(delimiter_fn fn, std::string label = "string delimiter");
    delimiter_match match(char32_t opener) const override { return fn_(opener); }
    std::string expected() const override { return label_; }
private:
    delimiter_fn fn_;
    std::string label_;
};

} // namespace lexlit
