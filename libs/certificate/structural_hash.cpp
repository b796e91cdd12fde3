/**
 * @file structural_hash.cpp
 * @brief Tokenizer and token tree builder for structural hashing
 */

#include "axiom/structural_hash.hpp"

#include "axiom/canonical_json.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace axiom::certificate {

namespace {

constexpr std::size_t kTabWidth = 4;

[[nodiscard]] bool is_ident_start(unsigned char c) noexcept
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '$' || c >= 0x80;
}

[[nodiscard]] bool is_digit(unsigned char c) noexcept
{
    return c >= '0' && c <= '9';
}

[[nodiscard]] bool is_ident_char(unsigned char c) noexcept
{
    return is_ident_start(c) || is_digit(c);
}

[[nodiscard]] bool is_space(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

[[nodiscard]] bool is_open(char c) noexcept
{
    return c == '(' || c == '[' || c == '{';
}

[[nodiscard]] bool is_close(char c) noexcept
{
    return c == ')' || c == ']' || c == '}';
}

[[nodiscard]] char matching_open(char close) noexcept
{
    switch (close) {
        case ')':
            return '(';
        case ']':
            return '[';
        default:
            return '{';
    }
}

[[nodiscard]] bool is_quote(char c) noexcept
{
    return c == '"' || c == '\'' || c == '`';
}

[[nodiscard]] bool is_operator_char(char c) noexcept
{
    const auto u = static_cast<unsigned char>(c);
    return !is_ident_char(u) && !is_space(c) && c != '\n' && !is_open(c) && !is_close(c)
           && !is_quote(c);
}

/**
 * @brief Builds the nested token tree while scanning
 */
class TreeBuilder
{
public:
    TreeBuilder() { m_stack.push_back(Frame{.open = '\0', .children = nlohmann::json::array()}); }

    [[nodiscard]] bool inside_brackets() const noexcept { return m_stack.size() > 1; }

    void leaf(std::string_view prefix, std::string_view text)
    {
        std::string value(prefix);
        value.append(text);
        m_stack.back().children.push_back(std::move(value));
    }

    void marker(std::string_view name) { m_stack.back().children.push_back(std::string(name)); }

    void open(char c) { m_stack.push_back(Frame{.open = c, .children = nlohmann::json::array()}); }

    void close(char c)
    {
        if (!inside_brackets() || m_stack.back().open != matching_open(c)) {
            leaf("o:", std::string_view(&c, 1));
            return;
        }
        pop();
    }

    [[nodiscard]] nlohmann::json finish()
    {
        while (inside_brackets()) {
            pop();
        }
        return std::move(m_stack.back().children);
    }

private:
    struct Frame
    {
        char open;
        nlohmann::json children;
    };

    void pop()
    {
        Frame frame = std::move(m_stack.back());
        m_stack.pop_back();
        m_stack.back().children.push_back(
            nlohmann::json{{"g", std::string(1, frame.open)}, {"c", std::move(frame.children)}});
    }

    std::vector<Frame> m_stack;
};

/// Width of the leading whitespace starting at pos (tabs count as kTabWidth)
[[nodiscard]] std::size_t indent_width(std::string_view code, std::size_t pos) noexcept
{
    std::size_t width = 0;
    while (pos < code.size() && (code[pos] == ' ' || code[pos] == '\t')) {
        width += code[pos] == '\t' ? kTabWidth : 1;
        ++pos;
    }
    return width;
}

/// '#' glued to a name, '[' or '!': #include, #define, #[derive(..)], #![..], #!/bin/sh
[[nodiscard]] bool starts_directive(std::string_view code, std::size_t pos) noexcept
{
    if (pos + 1 >= code.size() || code[pos] != '#') {
        return false;
    }
    const char next = code[pos + 1];
    return is_ident_start(static_cast<unsigned char>(next)) || next == '[' || next == '!';
}

/**
 * @brief Scan a directive line from pos, following backslash continuations
 *
 * Whitespace runs collapse to one space. Comments outside quotes count as
 * whitespace, as they do for the C preprocessor.
 * @return The normalized text; pos is left on the terminating newline
 */
[[nodiscard]] std::string scan_directive(std::string_view code, std::size_t& pos)
{
    std::string text;
    char quote = '\0';
    bool pending_space = false;
    while (pos < code.size() && code[pos] != '\n') {
        const char c = code[pos];
        if (c == '\\' && pos + 1 < code.size() && (code[pos + 1] == '\n' || code[pos + 1] == '\r')) {
            pos = code.find('\n', pos + 1);
            pos = pos == std::string_view::npos ? code.size() : pos + 1;
            pending_space = true;
            continue;
        }
        if (quote == '\0' && code.substr(pos).starts_with("//")) {
            pos = code.find('\n', pos);
            pos = pos == std::string_view::npos ? code.size() : pos;
            break;
        }
        if (quote == '\0' && code.substr(pos).starts_with("/*")) {
            const auto end = code.find("*/", pos + 2);
            pos = end == std::string_view::npos ? code.size() : end + 2;
            pending_space = true;
            continue;
        }
        if (is_space(c)) {
            pending_space = !text.empty();
            ++pos;
            continue;
        }
        if (pending_space) {
            text.push_back(' ');
            pending_space = false;
        }
        if (quote != '\0' && c == '\\' && pos + 1 < code.size() && code[pos + 1] != '\n') {
            text.append(code.substr(pos, 2));
            pos += 2;
            continue;
        }
        if (quote == '\0' && is_quote(c)) {
            quote = c;
        } else if (c == quote) {
            quote = '\0';
        }
        text.push_back(c);
        ++pos;
    }
    return text;
}

}  // namespace

nlohmann::json structural_tree(std::string_view code)
{
    TreeBuilder builder;
    std::vector<std::size_t> indents{0};
    bool at_line_start = true;
    std::size_t line_indent = indent_width(code, 0);
    std::size_t pos = 0;

    // Emits indent/dedent markers lazily, when the first token of a line appears
    auto begin_token = [&] {
        if (!at_line_start) {
            return;
        }
        at_line_start = false;
        if (builder.inside_brackets()) {
            return;
        }
        if (line_indent > indents.back()) {
            indents.push_back(line_indent);
            builder.marker("indent");
            return;
        }
        while (line_indent < indents.back()) {
            indents.pop_back();
            builder.marker("dedent");
        }
    };

    while (pos < code.size()) {
        const char c = code[pos];
        const auto u = static_cast<unsigned char>(c);

        if (c == '\n') {
            at_line_start = true;
            line_indent = indent_width(code, pos + 1);
            ++pos;
            continue;
        }
        if (is_space(c)) {
            ++pos;
            continue;
        }
        if (at_line_start && starts_directive(code, pos)) {
            begin_token();
            builder.leaf("p:", scan_directive(code, pos));
            continue;
        }
        if (c == '#' || code.substr(pos).starts_with("//")) {
            while (pos < code.size() && code[pos] != '\n') {
                ++pos;
            }
            continue;
        }
        if (code.substr(pos).starts_with("/*")) {
            const auto end = code.find("*/", pos + 2);
            pos = end == std::string_view::npos ? code.size() : end + 2;
            continue;
        }

        begin_token();

        if (is_open(c)) {
            builder.open(c);
            ++pos;
        } else if (is_close(c)) {
            builder.close(c);
            ++pos;
        } else if (is_quote(c)) {
            const std::size_t start = pos++;
            while (pos < code.size() && code[pos] != c) {
                pos += code[pos] == '\\' && pos + 1 < code.size() ? 2 : 1;
            }
            pos = pos < code.size() ? pos + 1 : pos;
            builder.leaf("s:", code.substr(start, pos - start));
        } else if (is_digit(u)) {
            const std::size_t start = pos;
            while (pos < code.size()
                   && (is_ident_char(static_cast<unsigned char>(code[pos])) || code[pos] == '.')) {
                ++pos;
            }
            builder.leaf("n:", code.substr(start, pos - start));
        } else if (is_ident_start(u)) {
            const std::size_t start = pos;
            while (pos < code.size() && is_ident_char(static_cast<unsigned char>(code[pos]))) {
                ++pos;
            }
            builder.leaf("i:", code.substr(start, pos - start));
        } else {
            const std::size_t start = pos;
            while (pos < code.size() && is_operator_char(code[pos])
                   && !code.substr(pos).starts_with("//") && !code.substr(pos).starts_with("/*")
                   && code[pos] != '#') {
                ++pos;
            }
            builder.leaf("o:", code.substr(start, pos - start));
        }
    }

    nlohmann::json tree = builder.finish();
    for (std::size_t i = 1; i < indents.size(); ++i) {
        tree.push_back("dedent");
    }
    return tree;
}

axiom::Result<std::string> structural_hash(std::string_view code)
{
    auto digest = canonical::digest_canonical(structural_tree(code));
    if (!digest) {
        return std::unexpected(Error::make(errc::kValidation,
                                           "code cannot be hashed structurally: " + digest.error().message));
    }
    return digest;
}

}  // namespace axiom::certificate
