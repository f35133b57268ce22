// node.hpp - literal node produced by the literal parsers
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace lexlit
{

    // Token text of a string/regexp segment. Borrowed (a view into the source)
    // until the first escape forces a decoded copy.
    struct token_text
    {
        std::string_view raw;
        std::string decoded;
        bool owned = false;

        static token_text borrow(std::string_view s) { return token_text{s, {}, false}; }
        static token_text own(std::string s) { return token_text{{}, std::move(s), true}; }

        std::string_view view() const { return owned ? std::string_view(decoded) : raw; }
        bool borrowed() const { return !owned; }
    };

    enum class number_kind
    {
        integer,
        floating
    };

    struct literal_node;
    using literal_children = std::vector<literal_node>;

    // monostate until a parser succeeds; children hold (pattern, replacement)
    using literal_value = std::variant<std::monostate, token_text, int64_t, double, literal_children>;

    struct literal_node
    {
        std::size_t start = 0; // first content byte
        std::size_t end = 0;   // one past the last content byte (offset of the closer)
        literal_value value;
    };

    inline bool is_text(const literal_node &n) { return std::holds_alternative<token_text>(n.value); }
    inline bool is_number(const literal_node &n) { return std::holds_alternative<int64_t>(n.value) || std::holds_alternative<double>(n.value); }
    inline bool is_compound(const literal_node &n) { return std::holds_alternative<literal_children>(n.value); }
    inline bool is_empty(const literal_node &n) { return std::holds_alternative<std::monostate>(n.value); }

    inline const token_text *as_text(const literal_node &n) { return is_text(n) ? &std::get<token_text>(n.value) : nullptr; }
    inline const literal_children *as_children(const literal_node &n) { return is_compound(n) ? &std::get<literal_children>(n.value) : nullptr; }
    inline std::optional<int64_t> as_int(const literal_node &n)
    {
        if (std::holds_alternative<int64_t>(n.value))
            return std::get<int64_t>(n.value);
        return std::nullopt;
    }
    inline std::optional<double> as_float(const literal_node &n)
    {
        if (std::holds_alternative<double>(n.value))
            return std::get<double>(n.value);
        return std::nullopt;
    }
    inline std::optional<number_kind> kind_of(const literal_node &n)
    {
        if (std::holds_alternative<int64_t>(n.value))
            return number_kind::integer;
        if (std::holds_alternative<double>(n.value))
            return number_kind::floating;
        return std::nullopt;
    }

    // Text of a text node, empty for anything else.
    inline std::string_view text(const literal_node &n)
    {
        auto *t = as_text(n);
        return t ? t->view() : std::string_view{};
    }

    // "text" / 42 / -3.14 / [/pattern/ /replacement/]
    std::string to_string(const literal_node &n);

} // namespace lexlit
