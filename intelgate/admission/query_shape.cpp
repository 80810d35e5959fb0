#include "query_shape.h"
#include "../shared/text_util.h"

#include <cstdio>

static bool is_name_start(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

static bool is_name_char(char c)
{
    return is_name_start(c) || (c >= '0' && c <= '9');
}

bool field_node::int_arg(std::string_view key, int64_t& out) const
{
    const std::string* v = arg(key);
    return v && parse_int64(*v, out);
}

bool query_parser::fail(const char* what)
{
    char buf[96];
    std::snprintf(buf, sizeof(buf), "%s at offset %zu", what, m_pos);
    m_error = buf;
    return false;
}

// Whitespace, commas and # comments carry no meaning
void query_parser::skip_ignored()
{
    while (!at_end())
    {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == ',')
        {
            ++m_pos;
        }
        else if (c == '#')
        {
            while (!at_end() && peek() != '\n')
                ++m_pos;
        }
        else
        {
            break;
        }
    }
}

bool query_parser::read_name(std::string& out)
{
    skip_ignored();
    if (at_end() || !is_name_start(peek()))
        return fail("expected name");
    size_t start = m_pos;
    while (!at_end() && is_name_char(peek()))
        ++m_pos;
    out.assign(m_text.data() + start, m_pos - start);
    return true;
}

bool query_parser::parse(std::string_view text, query_shape& out)
{
    m_text = text;
    m_pos = 0;
    m_fields = 0;
    m_error.clear();
    out.roots.clear();
    out.operation = "query";

    skip_ignored();
    if (at_end())
        return fail("empty query");

    // Optional operation keyword and name
    if (is_name_start(peek()))
    {
        size_t save = m_pos;
        std::string word;
        read_name(word);
        switch (fnv1a(word))
        {
            case fnv1a("query"):
            case fnv1a("mutation"):
            case fnv1a("subscription"):
                out.operation = word;
                skip_ignored();
                if (!at_end() && is_name_start(peek()))
                {
                    std::string op_name;
                    read_name(op_name);
                }
                skip_ignored();
                if (!at_end() && peek() == '(')
                    return fail("variables are not supported");
                break;
            default:
                m_pos = save;
                break;
        }
    }

    skip_ignored();
    bool braced = !at_end() && peek() == '{';
    if (braced)
        ++m_pos;

    if (!parse_selection_set(out.roots, 1, braced))
        return false;

    skip_ignored();
    if (!at_end())
        return fail("unexpected trailing input");
    if (out.roots.empty())
        return fail("empty selection");
    return true;
}

bool query_parser::parse_selection_set(std::vector<field_node>& out, int nesting, bool braced)
{
    if (nesting > MAX_NESTING)
        return fail("selection nested too deeply");

    while (true)
    {
        skip_ignored();
        if (at_end())
        {
            if (braced)
                return fail("unterminated selection set");
            return true;
        }

        char c = peek();
        if (c == '}')
        {
            if (!braced)
                return fail("unbalanced '}'");
            ++m_pos;
            return true;
        }
        if (c == '.')
            return fail("fragments are not supported");

        field_node field;
        if (!parse_field(field, nesting))
            return false;
        out.push_back(std::move(field));
    }
}

bool query_parser::parse_field(field_node& out, int nesting)
{
    if (++m_fields > MAX_FIELDS)
        return fail("too many fields");

    if (!read_name(out.name))
        return false;

    skip_ignored();
    if (!at_end() && peek() == ':')
    {
        ++m_pos;
        out.alias = std::move(out.name);
        if (!read_name(out.name))
            return false;
        skip_ignored();
    }

    if (!at_end() && peek() == '(')
    {
        ++m_pos;
        if (!parse_arguments(out))
            return false;
        skip_ignored();
    }

    if (!at_end() && peek() == '@')
        return fail("directives are not supported");

    if (!at_end() && peek() == '{')
    {
        ++m_pos;
        if (!parse_selection_set(out.children, nesting + 1, true))
            return false;
        if (out.children.empty())
            return fail("empty selection set");
    }
    return true;
}

bool query_parser::parse_arguments(field_node& out)
{
    while (true)
    {
        skip_ignored();
        if (at_end())
            return fail("unterminated arguments");
        if (peek() == ')')
        {
            ++m_pos;
            return true;
        }

        std::string key;
        if (!read_name(key))
            return false;
        skip_ignored();
        if (at_end() || peek() != ':')
            return fail("expected ':'");
        ++m_pos;

        std::string value;
        if (!parse_value(value))
            return false;
        out.args.emplace_back(std::move(key), std::move(value));
    }
}

// Scalars only: numbers, strings, enum names and booleans. Lists and input
// objects are skipped with their nesting balanced.
bool query_parser::parse_value(std::string& out)
{
    skip_ignored();
    if (at_end())
        return fail("expected value");

    char c = peek();
    if (c == '$')
        return fail("variables are not supported");

    if (c == '"')
    {
        ++m_pos;
        while (!at_end() && peek() != '"')
        {
            if (peek() == '\\' && m_pos + 1 < m_text.size())
                ++m_pos;
            out += m_text[m_pos++];
        }
        if (at_end())
            return fail("unterminated string");
        ++m_pos;
        return true;
    }

    if (c == '[' || c == '{')
    {
        size_t start = m_pos;
        int balance = 0;
        while (!at_end())
        {
            char ch = m_text[m_pos++];
            if (ch == '[' || ch == '{')
                ++balance;
            else if (ch == ']' || ch == '}')
            {
                if (--balance == 0)
                {
                    out.assign(m_text.data() + start, m_pos - start);
                    return true;
                }
            }
        }
        return fail("unterminated value");
    }

    size_t start = m_pos;
    while (!at_end() && (is_name_char(peek()) || peek() == '-' || peek() == '.' || peek() == '+'))
        ++m_pos;
    if (m_pos == start)
        return fail("expected value");
    out.assign(m_text.data() + start, m_pos - start);
    return true;
}
