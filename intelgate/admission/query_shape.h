#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// One requested field and its sub-selection
struct field_node
{
    std::string name;
    std::string alias;
    std::vector<std::pair<std::string, std::string>> args;
    std::vector<field_node> children;

    const std::string* arg(std::string_view key) const
    {
        for (const auto& [k, v] : args)
        {
            if (k == key)
                return &v;
        }
        return nullptr;
    }

    // Integer argument; false when absent or not an integer
    bool int_arg(std::string_view key, int64_t& out) const;
};

// Request shape: operation kind plus the root selection set
struct query_shape
{
    std::string operation = "query";
    std::vector<field_node> roots;
};

// Parses a GraphQL-style selection such as
//   query { threats(first: 10) { id iocs(first: 20) { value } } }
// The leading `query`/`mutation`/`subscription` keyword and operation name
// are optional; without a keyword the outer braces are optional too.
// Fragments, directives and variables are rejected.
class query_parser
{
public:
    static constexpr int MAX_NESTING = 64;
    static constexpr size_t MAX_FIELDS = 10000;

    bool parse(std::string_view text, query_shape& out);
    const std::string& error() const { return m_error; }

private:
    bool parse_selection_set(std::vector<field_node>& out, int nesting, bool braced);
    bool parse_field(field_node& out, int nesting);
    bool parse_arguments(field_node& out);
    bool parse_value(std::string& out);
    bool read_name(std::string& out);

    void skip_ignored();
    bool at_end() const { return m_pos >= m_text.size(); }
    char peek() const { return m_text[m_pos]; }
    bool fail(const char* what);

    std::string_view m_text;
    size_t m_pos = 0;
    size_t m_fields = 0;
    std::string m_error;
};
