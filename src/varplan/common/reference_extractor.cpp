/**
 * @file reference_extractor.cpp
 */
#include "varplan/common/reference_extractor.hpp"

namespace varplan
{

namespace
{

constexpr char k_sigil = '$';
constexpr char k_open_brace = '{';
constexpr char k_close_brace = '}';

bool is_digit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

bool is_word_char(char c) noexcept
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || is_digit(c) || c == '_';
}

/**
 * @brief A referenceable name: non-empty and not starting with a digit.
 *
 * @details
 * This is the only filter applied to scanned tokens. It discards the
 * all-digit capture-group back-references of query languages (`$1`, `${42}`)
 * together with every other token that starts with a digit (`$1abc`).
 */
bool is_variable_name(std::string_view token) noexcept
{
    return !token.empty() && !is_digit(token.front());
}

/**
 * @brief Accumulates distinct names while walking one payload.
 */
class ReferenceCollector
{
public:
    explicit ReferenceCollector(std::vector<std::string>& names)
        : m_names{names}
        , m_seen(names.begin(), names.end())
    {}

    void add(std::string_view token)
    {
        if (!is_variable_name(token))
        {
            return;
        }
        std::string name{token};
        if (m_seen.insert(name).second)
        {
            m_names.push_back(std::move(name));
        }
    }

    void scan(std::string_view text)
    {
        const size_t size = text.size();
        size_t pos = 0;
        while (pos < size)
        {
            size_t sigil = text.find(k_sigil, pos);
            if (sigil == std::string_view::npos)
            {
                break;
            }

            size_t cursor = sigil + 1;
            bool delimited = cursor < size && text[cursor] == k_open_brace;
            if (delimited)
            {
                ++cursor;
            }

            size_t begin = cursor;
            while (cursor < size && is_word_char(text[cursor]))
            {
                ++cursor;
            }
            std::string_view token = text.substr(begin, cursor - begin);

            if (delimited)
            {
                // "${name" without the closing brace is plain text.
                if (cursor >= size || text[cursor] != k_close_brace)
                {
                    pos = cursor;
                    continue;
                }
                ++cursor;
            }

            add(token);
            pos = cursor;
        }
    }

    /// Walks the payload with an explicit stack; nesting depth is unbounded.
    void walk(const SpecJson& root)
    {
        std::vector<const SpecJson*> pending{&root};
        while (!pending.empty())
        {
            const SpecJson* value = pending.back();
            pending.pop_back();
            if (value->is_string())
            {
                scan(value->get_ref<const std::string&>());
            }
            else if (value->is_array() || value->is_object())
            {
                // Pushed in reverse so children are visited in payload order.
                for (auto it = value->crbegin(); it != value->crend(); ++it)
                {
                    pending.push_back(&*it);
                }
            }
        }
    }

private:
    std::vector<std::string>& m_names;
    std::unordered_set<std::string> m_seen;
};

} // namespace

void scan_references(std::string_view text, std::vector<std::string>& names)
{
    ReferenceCollector collector{names};
    collector.scan(text);
}

std::vector<std::string> extract_references(const SpecJson& spec)
{
    std::vector<std::string> names;
    ReferenceCollector collector{names};
    collector.walk(spec);
    return names;
}

} // namespace varplan
