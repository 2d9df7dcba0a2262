#pragma once
#include "config.hpp"
#include <functional>
#include <string>

namespace chitin {

struct RebrandContext {
    BrandConfig brand;
    std::string wrapper_version;
    std::string wrapped_version;
};

// Replace standalone occurrences of `from` with `to`. An occurrence is
// standalone when neither neighbour is a name character, so
// "openclaw-gateway", "openclaw.mjs" and "@openclaw/sdk" are left alone.
std::string replace_brand_tokens(const std::string& line,
                                 const std::string& from,
                                 const std::string& to);

// Rebrand a complete block of help text:
//  - the banner line becomes "<to> <wrapper> (<from> <wrapped>)"
//  - "Usage:" lines and lines in the "Examples:" section (up to "Docs:")
//    get the command name replaced
//  - everything else is left untouched
// Idempotent: rebrand_help(rebrand_help(x)) == rebrand_help(x).
std::string rebrand_help(const std::string& text, const RebrandContext& ctx);

// Streaming form of rebrand_help. Chunks are split into lines; each completed
// line is rebranded and handed to the sink immediately. The concatenation of
// everything sent to the sink equals rebrand_help() of the concatenated input.
class LineRebrander {
public:
    using Sink = std::function<void(const std::string& text)>;

    explicit LineRebrander(RebrandContext ctx, Sink sink = nullptr);

    void feed(const char* data, size_t len);
    void feed(const std::string& chunk) { feed(chunk.data(), chunk.size()); }

    // Flush a trailing line that has no newline.
    void finish();

    // Everything emitted so far
    const std::string& output() const { return output_; }

private:
    std::string rebrand_line(const std::string& line);
    std::string rebranded_banner() const;
    void emit(const std::string& text);

    RebrandContext ctx_;
    Sink sink_;
    std::string pending_;
    std::string output_;
    bool in_examples_ = false;
};

} // namespace chitin
