#include "Diagnostics.hpp"

#include <atomic>

namespace processing::diagnostics
{

namespace
{

std::atomic<bool> g_verbose{ false };

bool is_continuation_byte(char c)
{
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

void append_escaped(std::string& out, char c)
{
    switch (c)
    {
    case '\n':
        out += "\\n";
        return;
    case '\r':
        out += "\\r";
        return;
    case '\t':
        out += "\\t";
        return;
    default:
        break;
    }

    const auto byte = static_cast<unsigned char>(c);
    out.push_back(byte < 0x20 || byte == 0x7F ? '?' : c);
}

} // anonymous namespace

void set_verbose(bool enabled) noexcept { g_verbose.store(enabled, std::memory_order_relaxed); }

bool verbose() noexcept { return g_verbose.load(std::memory_order_relaxed); }

std::string preview(std::string_view text, std::size_t max_bytes)
{
    std::size_t cut = text.size();
    if (cut > max_bytes)
    {
        cut = max_bytes;
        while (cut > 0 && is_continuation_byte(text[cut]))
            --cut;
    }

    std::string out = "\"";
    for (char c : text.substr(0, cut))
        append_escaped(out, c);
    out.push_back('"');

    if (cut < text.size())
        out += "... (" + std::to_string(text.size()) + " bytes)";
    return out;
}

} // namespace processing::diagnostics
